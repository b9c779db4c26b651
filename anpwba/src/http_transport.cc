#include "http_transport.h"

#include "anpwba_util.h"

#include <iostream>

namespace anpwba {

bool split_url(const std::string& url, std::string* origin, std::string* path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return false;

    const auto host_start = scheme_end + 3;
    auto path_start = url.find_first_of("/?#", host_start);
    if (path_start == std::string::npos) path_start = url.size();
    if (path_start == host_start) return false;

    if (origin) *origin = url.substr(0, path_start);
    if (path) {
        std::string p = url.substr(path_start);
        const auto frag = p.find('#');
        if (frag != std::string::npos) p.erase(frag);
        if (p.empty() || p[0] != '/') p = "/" + p;
        *path = p;
    }
    return true;
}

std::string url_host(const std::string& url) {
    std::string origin;
    if (!split_url(url, &origin, nullptr)) return "";

    std::string authority = origin.substr(origin.find("://") + 3);
    const auto at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    if (!authority.empty() && authority[0] == '[') {
        const auto rb = authority.find(']');
        if (rb == std::string::npos) return "";
        return lower_ascii(authority.substr(0, rb + 1));
    }

    const auto colon = authority.find(':');
    if (colon != std::string::npos) authority.erase(colon);
    return lower_ascii(authority);
}

std::string header_value(const httplib::Headers& h, const std::string& name) {
    for (const auto& kv : h) {
        if (iequals(kv.first, name)) return kv.second;
    }
    return "";
}

static httplib::Result dispatch(httplib::Client& cli,
                                const HttpRequest& req,
                                const std::string& path,
                                httplib::Headers& headers,
                                const std::string& content_type) {
    const std::string method = lower_ascii(req.method);
    if (method == "get") {
        headers.emplace("Content-Type", content_type);
        return cli.Get(path, headers);
    }
    if (method == "post") return cli.Post(path, headers, req.body, content_type);
    if (method == "put") return cli.Put(path, headers, req.body, content_type);
    if (method == "patch") return cli.Patch(path, headers, req.body, content_type);
    if (method == "delete") return cli.Delete(path, headers, req.body, content_type);
    throw TransportError("unsupported method: " + req.method);
}

Transport httplib_transport(int timeout_sec) {
    return [timeout_sec](const HttpRequest& req) -> HttpResponse {
        std::string origin, path;
        if (!split_url(req.url, &origin, &path)) {
            throw TransportError("malformed URL: " + req.url);
        }

        httplib::Client cli(origin);
        cli.set_connection_timeout(timeout_sec, 0);
        cli.set_read_timeout(timeout_sec, 0);
        cli.set_write_timeout(timeout_sec, 0);

        // httplib sets Content-Type from its own argument on bodies.
        httplib::Headers headers;
        std::string content_type = "application/json";
        for (const auto& kv : req.headers) {
            if (iequals(kv.first, "Content-Type")) content_type = kv.second;
            else headers.emplace(kv.first, kv.second);
        }

        httplib::Result res = dispatch(cli, req, path, headers, content_type);
        if (!res) {
            std::cerr << "[http] " << req.method << " " << req.url << " failed: "
                      << httplib::to_string(res.error()) << std::endl;
            throw TransportError(req.method + " " + req.url + ": " + httplib::to_string(res.error()));
        }

        HttpResponse out;
        out.status = res->status;
        out.headers = res->headers;
        out.body = res->body;
        return out;
    };
}

} // namespace anpwba
