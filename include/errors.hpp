#pragma once

#include <stdexcept>
#include <string>

namespace urlfeat {

class MalformedUrlError : public std::runtime_error {
public:
    explicit MalformedUrlError(const std::string& url)
        : std::runtime_error("Error matching url: " + url), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

class InvalidEmbeddingChoiceError : public std::invalid_argument {
public:
    explicit InvalidEmbeddingChoiceError(const std::string& choice)
        : std::invalid_argument(choice + " is not a valid embedding choice."),
          choice_(choice) {}

    const std::string& choice() const { return choice_; }

private:
    std::string choice_;
};

}
