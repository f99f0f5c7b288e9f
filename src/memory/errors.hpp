#pragma once
#include <stdexcept>
#include <string>

namespace hybridmem {

// Malformed input to EventLog::log
class InvalidEvent : public std::invalid_argument {
public:
    explicit InvalidEvent(const std::string& what)
        : std::invalid_argument("invalid event: " + what) {}
};

// VectorStore::upsert called with empty text
class MissingText : public std::invalid_argument {
public:
    explicit MissingText(const std::string& what)
        : std::invalid_argument("missing text: " + what) {}
};

// Raised by Embedder implementations. The stores never catch it.
class EncoderError : public std::runtime_error {
public:
    explicit EncoderError(const std::string& what)
        : std::runtime_error("encoder failure: " + what) {}
};

} // namespace hybridmem
