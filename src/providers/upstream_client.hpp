#pragma once
#include "adapter.hpp"
#include "../cancel.hpp"
#include <functional>
#include <string>

namespace polygate {

struct Endpoint {
    std::string provider;
    std::string base_url;       // scheme://host[:port][/prefix]
    int connect_timeout = 30;   // seconds
    int read_timeout = 300;     // seconds
};

using ByteSink = std::function<void(const std::string& bytes)>;

// Moves WireRequests to an upstream. The gateway talks only to this seam.
class Transport {
public:
    virtual ~Transport() = default;

    // Throws UpstreamError{status 0} when no response arrived
    virtual WireResponse send(const Endpoint& ep, const WireRequest& req) = 0;

    // Streams a 2xx body into on_bytes; a non-2xx body is returned whole.
    // Throws Cancelled as soon as the token fires.
    virtual WireResponse stream(const Endpoint& ep, const WireRequest& req,
                                const ByteSink& on_bytes, const CancelToken& cancel) = 0;
};

class UpstreamClient : public Transport {
public:
    WireResponse send(const Endpoint& ep, const WireRequest& req) override;
    WireResponse stream(const Endpoint& ep, const WireRequest& req,
                        const ByteSink& on_bytes, const CancelToken& cancel) override;
};

struct ParsedUrl {
    std::string scheme = "http";
    std::string host = "127.0.0.1";
    int port = 80;
    std::string path_prefix;
    std::string origin() const { return scheme + "://" + host + ":" + std::to_string(port); }
};

ParsedUrl parse_url(const std::string& url);

} // namespace polygate
