#include "thread_slices.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace urlfeat {

namespace {

class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}

    ~ThreadJoiner() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

private:
    std::vector<std::thread>& threads_;
};

}

ThreadSpawner default_thread_spawner() {
    return [](std::function<void()> task) { return std::thread(std::move(task)); };
}

void run_in_slices(size_t count, size_t workers, const SliceBody& body,
                   const ThreadSpawner& spawn) {
    if (count == 0) return;

    workers = std::min(workers, count);
    if (workers <= 1) {
        body(0, count);
        return;
    }

    const size_t chunk = (count + workers - 1) / workers;
    std::vector<std::thread> threads;
    threads.reserve(workers);
    ThreadJoiner joiner(threads);

    size_t inline_begin = count;
    for (size_t begin = 0; begin < count; begin += chunk) {
        const size_t end = std::min(begin + chunk, count);
        try {
            threads.push_back(spawn([&body, begin, end]() { body(begin, end); }));
        } catch (const std::system_error& e) {
            spdlog::warn("Cannot start worker thread, running items {}..{} inline: {}",
                         begin, count, e.what());
            inline_begin = begin;
            break;
        }
    }

    if (inline_begin < count) {
        body(inline_begin, count);
    }
}

}
