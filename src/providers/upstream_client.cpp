#include "upstream_client.hpp"
#include "../errors.hpp"
#include "../log.hpp"
#include <httplib.h>
#include <exception>

namespace polygate {

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl u;
    size_t pos = 0;
    if (url.compare(0, 8, "https://") == 0) {
        u.scheme = "https"; pos = 8; u.port = 443;
    } else if (url.compare(0, 7, "http://") == 0) {
        u.scheme = "http"; pos = 7; u.port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        u.path_prefix = url.substr(slash);
        while (!u.path_prefix.empty() && u.path_prefix.back() == '/') u.path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        u.host = host_port.substr(0, colon);
        try {
            u.port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            throw ConfigurationError("Invalid port in URL: " + url);
        }
    } else if (!host_port.empty()) {
        u.host = host_port;
    }
    return u;
}

static httplib::Headers to_headers(const WireRequest& req) {
    httplib::Headers headers;
    for (auto& [k, v] : req.headers) headers.emplace(k, v);
    return headers;
}

WireResponse UpstreamClient::send(const Endpoint& ep, const WireRequest& req) {
    ParsedUrl u = parse_url(ep.base_url);
    httplib::Client cli(u.origin());
    cli.set_connection_timeout(ep.connect_timeout);
    cli.set_read_timeout(ep.read_timeout);

    log_debug(ep.provider, "POST " + u.origin() + u.path_prefix + req.path);
    auto res = cli.Post(u.path_prefix + req.path, to_headers(req), req.body.dump(), "application/json");
    if (!res) {
        throw UpstreamError(ep.provider, 0, "transport error: " + httplib::to_string(res.error()));
    }
    return WireResponse{res->status, res->body};
}

WireResponse UpstreamClient::stream(const Endpoint& ep, const WireRequest& req,
                                    const ByteSink& on_bytes, const CancelToken& cancel) {
    ParsedUrl u = parse_url(ep.base_url);
    httplib::Client cli(u.origin());
    cli.set_connection_timeout(ep.connect_timeout);
    cli.set_read_timeout(ep.read_timeout);

    httplib::Request hreq;
    hreq.method = "POST";
    hreq.path = u.path_prefix + req.path;
    hreq.headers = to_headers(req);
    hreq.headers.emplace("Content-Type", "application/json");
    hreq.headers.emplace("Accept", "text/event-stream");
    hreq.body = req.body.dump();

    int status = 0;
    std::string error_body;
    std::exception_ptr sink_error;

    hreq.response_handler = [&](const httplib::Response& r) {
        status = r.status;
        return !cancel.cancelled();
    };
    hreq.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (cancel.cancelled()) return false;
        if (status < 200 || status >= 300) {
            error_body.append(data, len);
            return true;
        }
        try {
            on_bytes(std::string(data, len));
        } catch (...) {
            // rethrown below, once httplib has unwound
            sink_error = std::current_exception();
            return false;
        }
        return true;
    };

    log_debug(ep.provider, "POST (stream) " + u.origin() + hreq.path);
    auto res = cli.send(hreq);
    if (sink_error) std::rethrow_exception(sink_error);
    if (cancel.cancelled()) throw Cancelled();
    if (!res) {
        throw UpstreamError(ep.provider, 0, "transport error: " + httplib::to_string(res.error()));
    }
    return WireResponse{status, error_body};
}

} // namespace polygate
