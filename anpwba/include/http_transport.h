#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <httplib.h>

namespace anpwba {

// Connection failure, timeout, DNS, malformed URL. Anything that yields no
// HTTP status at all.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;               // absolute: scheme://host[:port]/path?query
    httplib::Headers headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    httplib::Headers headers;
    std::string body;
};

// Outbound seam used by AuthInitiator. Implementations throw TransportError
// when no response was received.
using Transport = std::function<HttpResponse(const HttpRequest&)>;

// cpp-httplib client, one connection per request.
// Supports GET, POST, PUT, PATCH, DELETE; anything else throws TransportError.
Transport httplib_transport(int timeout_sec);

// "http://Host:8080/a?b" -> origin "http://Host:8080", path "/a?b".
// Returns false when the URL has no scheme or host.
bool split_url(const std::string& url, std::string* origin, std::string* path);

// Host part of an absolute URL, lowercased, without port. IPv6 keeps its
// brackets ("[::1]"). "" when the URL cannot be parsed.
std::string url_host(const std::string& url);

// First value of a header, case-insensitive name match. "" when absent.
std::string header_value(const httplib::Headers& h, const std::string& name);

} // namespace anpwba
