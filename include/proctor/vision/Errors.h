#pragma once
#include <stdexcept>
#include <string>

namespace proctor::vision {

// Base of every error the engine raises on purpose.
class ProctorError : public std::runtime_error {
public:
    explicit ProctorError(const std::string& what) : std::runtime_error(what) {}
};

// Decoder input does not have the declared shape. Per-frame, recoverable: the
// pipeline logs it and skips the frame.
class ShapeMismatch : public ProctorError {
public:
    explicit ShapeMismatch(const std::string& what) : ProctorError(what) {}
};

// Out-of-range configuration. Fatal to pipeline construction.
class ConfigError : public ProctorError {
public:
    explicit ConfigError(const std::string& what) : ProctorError(what) {}
};

} // namespace proctor::vision
