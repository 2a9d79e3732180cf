#pragma once
#include <string>
#include <stdexcept>

namespace polygate {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fatal at startup: unknown provider identifier, malformed config file, bad hook event name.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Upstream rejected the request, or the transport failed (status 0).
class UpstreamError : public Error {
public:
    UpstreamError(std::string provider, int status, std::string body)
        : Error("Upstream '" + provider + "' returned status " + std::to_string(status) +
                (body.empty() ? std::string() : ": " + body.substr(0, 500)))
        , provider_(std::move(provider))
        , status_(status)
        , body_(std::move(body)) {}

    const std::string& provider() const { return provider_; }
    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    std::string provider_;
    int status_;
    std::string body_;
};

// The gateway could not speak the upstream's protocol (malformed wire payload).
class TranslationError : public Error {
public:
    TranslationError(std::string provider, const std::string& detail)
        : Error("Cannot translate '" + provider + "' payload: " + detail)
        , provider_(std::move(provider)) {}

    const std::string& provider() const { return provider_; }

private:
    std::string provider_;
};

class HookTimeoutError : public Error {
public:
    using Error::Error;
};

class HookCrash : public Error {
public:
    using Error::Error;
};

class CompactionFailure : public Error {
public:
    using Error::Error;
};

class MemoryCapacityError : public Error {
public:
    MemoryCapacityError(const std::string& block, size_t size, size_t limit)
        : Error("Core memory block '" + block + "' is " + std::to_string(size) +
                " chars, limit is " + std::to_string(limit)) {}
};

class Cancelled : public Error {
public:
    Cancelled() : Error("exchange cancelled") {}
};

} // namespace polygate
