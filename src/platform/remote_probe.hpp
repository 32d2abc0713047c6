#ifndef REMOTE_PROBE_HPP
#define REMOTE_PROBE_HPP

#include "core/models.hpp"

#include <functional>
#include <string>
#include <vector>

struct HttpResponse {
    bool transport_ok = false;
    long status_code = 0;
    std::string body;
    std::string error;
};

using HttpGet = std::function<HttpResponse(const std::string& url, int timeout_seconds)>;

namespace teddycloud {
std::string build_api_url(const std::string& base_url, const std::string& endpoint);
std::string body_excerpt(const std::string& body);
std::string format_status_error(long status_code, const std::string& body);
// Empty unless the body is a JSON array of objects.
std::vector<BoxInfo> parse_boxes(const std::string& body);

HttpResponse curl_http_get(const std::string& url, int timeout_seconds);
}

struct PrimaryCheck {
    enum class Outcome { Ok, BadStatus, Unreachable };

    Outcome outcome = Outcome::Unreachable;
    long status_code = 0;
    std::string detail;
};

class RemoteProbe {
public:
    explicit RemoteProbe(HttpGet http_get = teddycloud::curl_http_get);

    PrimaryCheck check(const std::string& base_url, int timeout_seconds) const;
    ProbeResult probe(const std::string& base_url, int timeout_seconds) const;

private:
    std::vector<BoxInfo> fetch_boxes(const std::string& base_url, int timeout_seconds) const;

    HttpGet m_http_get;
};

#endif
