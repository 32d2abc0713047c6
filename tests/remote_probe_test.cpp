#include "platform/remote_probe.hpp"

#include <glib.h>

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
struct FakeServer {
    HttpResponse primary;
    HttpResponse boxes;
    bool throw_on_boxes = false;
    std::vector<std::string> requested;
};

HttpResponse ok(const std::string& body) {
    HttpResponse response;
    response.transport_ok = true;
    response.status_code = 200;
    response.body = body;
    return response;
}

HttpResponse status(long code, const std::string& body) {
    HttpResponse response = ok(body);
    response.status_code = code;
    return response;
}

HttpResponse unreachable(const std::string& error) {
    HttpResponse response;
    response.error = error;
    return response;
}

HttpGet serve(FakeServer& server) {
    return [&server](const std::string& url, int) {
        server.requested.push_back(url);
        if (url.find("/api/tonieboxes") != std::string::npos) {
            if (server.throw_on_boxes) {
                throw std::runtime_error("socket closed");
            }
            return server.boxes;
        }
        return server.primary;
    };
}
}

int main() {
    {
        assert(teddycloud::build_api_url("http://docker", "/api/toniesCustomJson") ==
               "http://docker/api/toniesCustomJson");
        assert(teddycloud::build_api_url("http://docker//", "/api/tonieboxes") ==
               "http://docker/api/tonieboxes");
    }

    {
        std::string body(500, 'x');
        std::string error = teddycloud::format_status_error(503, body);
        assert(error == "HTTP 503: " + std::string(100, 'x'));
        assert(teddycloud::format_status_error(404, "gone") == "HTTP 404: gone");
    }

    {
        // "\xc3\xa9" is one character, so the cut must keep or drop both bytes.
        const std::string accent = "\xc3\xa9";
        std::string fits = std::string(99, 'x') + accent;
        assert(teddycloud::body_excerpt(fits) == fits);

        std::string excerpt = teddycloud::body_excerpt(std::string(100, 'x') + accent + "tail");
        assert(excerpt == std::string(100, 'x'));

        excerpt = teddycloud::body_excerpt(std::string(150, 'y') + accent);
        assert(excerpt == std::string(100, 'y'));

        excerpt = teddycloud::body_excerpt(std::string(60, 'z') + std::string(60, 'z').replace(0, 1, accent));
        assert(g_utf8_validate(excerpt.c_str(), static_cast<gssize>(excerpt.size()), nullptr));
        assert(g_utf8_strlen(excerpt.c_str(), -1) == 100);

        excerpt = teddycloud::body_excerpt("bad \xff byte");
        assert(g_utf8_validate(excerpt.c_str(), static_cast<gssize>(excerpt.size()), nullptr));
        assert(excerpt.rfind("bad ", 0) == 0);

        std::string error = teddycloud::format_status_error(502, std::string(99, 'x') + accent + accent);
        assert(g_utf8_validate(error.c_str(), static_cast<gssize>(error.size()), nullptr));
        assert(error == "HTTP 502: " + std::string(99, 'x') + accent);
    }

    {
        auto boxes = teddycloud::parse_boxes(R"([{"id":"abc","name":"Kitchen"},{"id":7}])");
        assert(boxes.size() == 2);
        assert(boxes[0].id == "abc" && boxes[0].name == "Kitchen");
        assert(boxes[1].id == "7" && boxes[1].name == "Unknown");

        assert(teddycloud::parse_boxes(R"({"boxes":[]})").empty());
        assert(teddycloud::parse_boxes("not json").empty());
        assert(teddycloud::parse_boxes(R"([{"id":"a"}, 3])").empty());

        boxes = teddycloud::parse_boxes(R"([{"id":1.5},{"id":true},{"id":false},{"id":null},{"name":"NoId"}])");
        assert(boxes.size() == 5);
        assert(boxes[0].id == "1.5");
        assert(boxes[1].id == "true");
        assert(boxes[2].id == "false");
        assert(boxes[3].id.empty());
        assert(boxes[4].id.empty() && boxes[4].name == "NoId");
    }

    {
        FakeServer server;
        server.primary = ok("[]");
        server.boxes = ok(R"([{"id":"box-1","name":"Nursery"}])");
        RemoteProbe probe(serve(server));

        ProbeResult result = probe.probe("http://teddycloud.local", 10);
        assert(result.success);
        assert(!result.error.has_value());
        assert(result.boxes.size() == 1);
        assert(result.boxes[0].id == "box-1");
        assert(server.requested.size() == 2);
        assert(server.requested[0] == "http://teddycloud.local/api/toniesCustomJson");
        assert(server.requested[1] == "http://teddycloud.local/api/tonieboxes");
    }

    {
        FakeServer server;
        server.primary = status(500, "Internal Server Error");
        RemoteProbe probe(serve(server));

        ProbeResult result = probe.probe("http://teddycloud.local", 10);
        assert(!result.success);
        assert(result.error.has_value());
        assert(result.error->find("500") != std::string::npos);
        assert(result.boxes.empty());
        assert(server.requested.size() == 1);
    }

    {
        FakeServer server;
        server.primary = unreachable("Could not resolve host: nowhere");
        RemoteProbe probe(serve(server));

        ProbeResult result = probe.probe("http://nowhere", 10);
        assert(!result.success);
        assert(*result.error == "Could not resolve host: nowhere");
        assert(result.boxes.empty());
    }

    {
        FakeServer server;
        server.primary = ok("[]");
        server.throw_on_boxes = true;
        RemoteProbe probe(serve(server));

        ProbeResult result = probe.probe("http://teddycloud.local", 10);
        assert(result.success);
        assert(result.boxes.empty());
    }

    {
        FakeServer server;
        server.primary = ok("[]");
        server.boxes = status(401, "unauthorized");
        RemoteProbe probe(serve(server));

        ProbeResult result = probe.probe("http://teddycloud.local", 10);
        assert(result.success);
        assert(result.boxes.empty());
    }

    {
        RemoteProbe probe([](const std::string&, int) -> HttpResponse {
            throw std::runtime_error("transport exploded");
        });
        PrimaryCheck check = probe.check("http://docker", 5);
        assert(check.outcome == PrimaryCheck::Outcome::Unreachable);
        assert(check.detail == "transport exploded");

        ProbeResult result = probe.probe("http://docker", 5);
        assert(!result.success);
        assert(result.boxes.empty());
    }

    {
        int seen_timeout = 0;
        RemoteProbe probe([&seen_timeout](const std::string&, int timeout) {
            seen_timeout = timeout;
            return status(404, "");
        });
        PrimaryCheck check = probe.check("http://docker", 5);
        assert(seen_timeout == 5);
        assert(check.outcome == PrimaryCheck::Outcome::BadStatus);
        assert(check.status_code == 404);
    }

    return 0;
}
