#pragma once

#include <cstddef>
#include <functional>
#include <thread>

namespace urlfeat {

// Processes items [begin, end)
using SliceBody = std::function<void(size_t begin, size_t end)>;

// Starts a thread running the task; may throw std::system_error
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

ThreadSpawner default_thread_spawner();

/**
 * Splits [0, count) into at most `workers` contiguous slices and runs each
 * on its own thread. Slices whose thread cannot be started run on the
 * calling thread. Every started thread is joined before returning, also
 * when the body throws on the calling thread.
 */
void run_in_slices(size_t count, size_t workers, const SliceBody& body,
                   const ThreadSpawner& spawn = default_thread_spawner());

}
