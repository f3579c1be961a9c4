#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace kbengine {

// Base class for every error the engine raises.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing or invalid credential/model configuration. Never retried.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Non-2xx (or unreadable) response from the embedding provider.
class ProviderError : public Error {
public:
    ProviderError(long status, std::string body)
        : Error("embedding provider returned status " + std::to_string(status) + ": " + body),
          status_(status),
          body_(std::move(body)) {}

    long status() const noexcept { return status_; }
    const std::string& body() const noexcept { return body_; }

    // 429 and 5xx are worth another attempt; other statuses are final.
    bool retryable() const noexcept { return status_ == 429 || status_ >= 500; }

private:
    long status_;
    std::string body_;
};

// Timeout or connection failure reaching the embedding provider.
class ProviderUnavailable : public Error {
public:
    using Error::Error;
};

// Two vectors of different length were compared; they come from different embedding models.
class DimensionMismatchError : public Error {
public:
    DimensionMismatchError(std::size_t expected, std::size_t actual)
        : Error("vector dimension mismatch: expected " + std::to_string(expected) + ", got " +
                std::to_string(actual)),
          expected_(expected),
          actual_(actual) {}

    std::size_t expected() const noexcept { return expected_; }
    std::size_t actual() const noexcept { return actual_; }

private:
    std::size_t expected_;
    std::size_t actual_;
};

// A request option fell outside its documented bounds.
class InvalidOptionError : public Error {
public:
    using Error::Error;
};

class OperationCancelled : public Error {
public:
    OperationCancelled() : Error("operation cancelled") {}
};

}  // namespace kbengine
