#include "did_document.h"

#include "anpwba_util.h"

#include <iostream>

#include <httplib.h>

namespace anpwba {
using json = nlohmann::json;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Optional string member: absent => def, present but not a string => false.
static bool opt_string(const json& j, const char* key, const std::string& def, std::string* out) {
    if (!j.contains(key)) {
        *out = def;
        return true;
    }
    if (!j[key].is_string()) return false;
    *out = j[key].get<std::string>();
    return true;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t p = s.find(sep, start);
        if (p == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, p - start));
        start = p + 1;
    }
    return out;
}

static bool all_digits(const std::string& s) {
    if (s.empty() || s.size() > 5) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    return true;
}

static bool is_ip_literal(const std::string& h) {
    if (h.find(':') != std::string::npos) return true; // IPv6
    int dots = 0;
    for (char c : h) {
        if (c == '.') dots++;
        else if (c < '0' || c > '9') return false;
    }
    return dots == 3;
}

static bool is_local_host(const std::string& h) {
    return h == "localhost" || ends_with(h, ".localhost") || is_ip_literal(h);
}

// Only %3A / %3a needs decoding in a did:wba host part.
static std::string decode_host_part(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '%' && i + 2 < s.size() && s[i + 1] == '3' && (s[i + 2] == 'A' || s[i + 2] == 'a')) {
            out.push_back(':');
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

//------------------------------------------------------------------------------
// Documents
//------------------------------------------------------------------------------

bool parse_did_document(const json& j, DidDocument* out, std::string* err) {
    if (!out) return false;
    if (!j.is_object()) {
        if (err) *err = "did document must be object";
        return false;
    }
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        if (err) *err = "did document missing id";
        return false;
    }

    DidDocument doc;
    doc.id = j["id"].get<std::string>();
    doc.raw = j;

    if (j.contains("verificationMethod") && j["verificationMethod"].is_array()) {
        for (const auto& it : j["verificationMethod"]) {
            if (!it.is_object()) continue;
            if (!it.contains("publicKeyJwk") || !it["publicKeyJwk"].is_object()) continue;

            VerificationMethod vm;
            if (!opt_string(it, "id", "", &vm.id) ||
                !opt_string(it, "type", "", &vm.type) ||
                !opt_string(it, "controller", doc.id, &vm.controller)) {
                continue;
            }
            vm.public_key_jwk = it["publicKeyJwk"];
            if (vm.id.empty()) continue;
            doc.verification_methods.push_back(std::move(vm));
        }
    }

    if (doc.verification_methods.empty()) {
        if (err) *err = "did document has no usable verificationMethod";
        return false;
    }

    if (j.contains("authentication") && j["authentication"].is_array()) {
        for (const auto& a : j["authentication"]) {
            if (a.is_string()) doc.authentication.push_back(a.get<std::string>());
            else if (a.is_object() && a.contains("id") && a["id"].is_string())
                doc.authentication.push_back(a["id"].get<std::string>());
        }
    }

    *out = std::move(doc);
    return true;
}

DidDocument make_did_document(const std::string& did,
                              const std::string& key_fragment,
                              const std::string& type,
                              const json& public_key_jwk) {
    const std::string key_id = did + "#" + key_fragment;

    json j;
    j["@context"] = json::array({
        "https://www.w3.org/ns/did/v1",
        "https://w3id.org/security/suites/jws-2020/v1",
        "https://w3id.org/security/suites/secp256k1-2019/v1",
    });
    j["id"] = did;
    j["verificationMethod"] = json::array({
        json{{"id", key_id}, {"type", type}, {"controller", did}, {"publicKeyJwk", public_key_jwk}},
    });
    j["authentication"] = json::array({key_id});

    DidDocument doc;
    doc.id = did;
    doc.verification_methods.push_back(VerificationMethod{key_id, type, did, public_key_jwk});
    doc.authentication.push_back(key_id);
    doc.raw = std::move(j);
    return doc;
}

const VerificationMethod& resolve_verification_method(const DidDocument& doc, const std::string& fragment) {
    const std::string suffix = "#" + fragment;
    for (const auto& vm : doc.verification_methods) {
        if (ends_with(vm.id, suffix)) return vm;
    }
    throw VerificationMethodNotFound(fragment);
}

bool supports_method(const std::string& did) {
    return did.compare(0, 8, "did:wba:") == 0 && did.size() > 8;
}

//------------------------------------------------------------------------------
// DID parsing / URLs
//------------------------------------------------------------------------------

std::optional<ParsedDid> parse_did(const std::string& did) {
    if (!supports_method(did)) return std::nullopt;

    const std::vector<std::string> parts = split(did, ':');
    if (parts.size() < 3 || parts[2].empty()) return std::nullopt;

    ParsedDid d;
    d.method = parts[1];

    const std::string& host_part = parts[2];
    const bool colon_form = parts.size() > 3 || decode_host_part(host_part) != host_part;

    if (colon_form) {
        const std::string decoded = decode_host_part(host_part);
        const auto colon = decoded.rfind(':');
        if (colon != std::string::npos) {
            const std::string port = decoded.substr(colon + 1);
            if (!all_digits(port)) return std::nullopt;
            d.host = decoded.substr(0, colon);
            d.port = std::stoi(port);
            d.port_explicit = true;
        } else {
            d.host = decoded;
        }
        for (size_t i = 3; i < parts.size(); i++) {
            if (parts[i].empty()) return std::nullopt;
            d.segments.push_back(parts[i]);
        }
    } else {
        // host_port[_seg_seg...]; first "_<digits>" boundary wins
        d.host = host_part;
        size_t pos = host_part.find('_');
        while (pos != std::string::npos && pos > 0) {
            size_t end = host_part.find('_', pos + 1);
            const std::string digits = host_part.substr(pos + 1, end == std::string::npos ? std::string::npos : end - pos - 1);
            if (all_digits(digits)) {
                d.host = host_part.substr(0, pos);
                d.port = std::stoi(digits);
                d.port_explicit = true;
                if (end != std::string::npos) {
                    for (const auto& seg : split(host_part.substr(end + 1), '_')) {
                        if (!seg.empty()) d.segments.push_back(seg);
                    }
                }
                break;
            }
            pos = end;
        }
    }

    if (d.host.empty()) return std::nullopt;
    if (!d.port_explicit) d.port = is_local_host(d.host) ? 9527 : 443;
    if (d.port <= 0 || d.port > 65535) return std::nullopt;
    if (!d.segments.empty()) d.unique_id = d.segments.back();
    return d;
}

std::string did_document_url(const ParsedDid& d) {
    const bool https = (d.port == 443) && !is_local_host(d.host);
    std::string url = https ? "https://" : "http://";
    url += (d.host.find(':') != std::string::npos) ? ("[" + d.host + "]") : d.host;
    if (!(https && d.port == 443)) url += ":" + std::to_string(d.port);
    for (const auto& seg : d.segments) url += "/" + seg;
    url += "/did.json";
    return url;
}

bool is_insecure_local_did(const std::string& did) {
    const std::string l = lower_ascii(did);
    return l.compare(0, 18, "did:wba:localhost:") == 0 ||
           l.compare(0, 20, "did:wba:localhost%3a") == 0;
}

//------------------------------------------------------------------------------
// Fetchers
//------------------------------------------------------------------------------

void DidDocumentRegistry::put(const DidDocument& doc) {
    std::lock_guard<std::mutex> lk(mu_);
    docs_[doc.id] = doc;
}

bool DidDocumentRegistry::remove(const std::string& did) {
    std::lock_guard<std::mutex> lk(mu_);
    return docs_.erase(did) > 0;
}

std::optional<DidDocument> DidDocumentRegistry::find(const std::string& did) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = docs_.find(did);
    if (it == docs_.end()) return std::nullopt;
    return it->second;
}

size_t DidDocumentRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return docs_.size();
}

DidFetcher DidDocumentRegistry::fetcher() const {
    return [this](const std::string& did) { return find(did); };
}

static std::optional<DidDocument> fetch_did_document(const std::string& did, int timeout_sec) {
    auto parsed = parse_did(did);
    if (!parsed) {
        std::cerr << "[did] cannot parse DID: " << did << std::endl;
        return std::nullopt;
    }

    const std::string url = did_document_url(*parsed);
    const auto scheme_end = url.find("://");
    const auto path_start = url.find('/', scheme_end + 3);
    const std::string origin = url.substr(0, path_start);
    const std::string path = url.substr(path_start);

    httplib::Client cli(origin);
    cli.set_connection_timeout(timeout_sec, 0);
    cli.set_read_timeout(timeout_sec, 0);

    auto res = cli.Get(path);
    if (!res) {
        std::cerr << "[did] GET " << url << " failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[did] GET " << url << " status=" << res->status << std::endl;
        return std::nullopt;
    }

    json j = json::parse(res->body, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[did] GET " << url << " returned invalid JSON" << std::endl;
        return std::nullopt;
    }

    DidDocument doc;
    std::string err;
    if (!parse_did_document(j, &doc, &err)) {
        std::cerr << "[did] " << url << ": " << err << std::endl;
        return std::nullopt;
    }
    if (doc.id != did) {
        std::cerr << "[did] " << url << ": document id does not match requested DID" << std::endl;
        return std::nullopt;
    }
    return doc;
}

DidFetcher http_did_fetcher(int timeout_sec) {
    return [timeout_sec](const std::string& did) -> std::optional<DidDocument> {
        // A remote document is peer input: nothing it contains may escape as an exception.
        try {
            return fetch_did_document(did, timeout_sec);
        } catch (const std::exception& e) {
            std::cerr << "[did] fetch " << did << " failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    };
}

DidFetcher chain_fetchers(std::vector<DidFetcher> fetchers) {
    return [fetchers = std::move(fetchers)](const std::string& did) -> std::optional<DidDocument> {
        for (const auto& f : fetchers) {
            if (!f) continue;
            if (auto doc = f(did)) return doc;
        }
        return std::nullopt;
    };
}

} // namespace anpwba
