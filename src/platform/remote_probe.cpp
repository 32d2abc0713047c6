#include "platform/remote_probe.hpp"

#include "core/setup_defaults.hpp"

#include <curl/curl.h>
#include <json-glib/json-glib.h>

#include <cstring>
#include <exception>
#include <iostream>
#include <utility>

namespace {
size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::string json_member_to_string(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return "";
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        return "";
    }

    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_STRING) {
        return json_object_get_string_member(obj, member);
    }
    if (type == G_TYPE_INT64) {
        return std::to_string(json_object_get_int_member(obj, member));
    }
    if (type == G_TYPE_DOUBLE) {
        gchar buffer[G_ASCII_DTOSTR_BUF_SIZE];
        return g_ascii_dtostr(buffer, sizeof(buffer), json_object_get_double_member(obj, member));
    }
    if (type == G_TYPE_BOOLEAN) {
        return json_object_get_boolean_member(obj, member) ? "true" : "false";
    }
    return "";
}

bool json_member_is_string(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return false;
    }
    JsonNode* node = json_object_get_member(obj, member);
    return node && JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING;
}
}

std::string teddycloud::build_api_url(const std::string& base_url, const std::string& endpoint) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

std::string teddycloud::body_excerpt(const std::string& body) {
    // Counted in characters; invalid sequences become U+FFFD so the cut never splits one.
    gchar* valid = g_utf8_make_valid(body.data(), static_cast<gssize>(body.size()));
    const gchar* end = valid + std::strlen(valid);
    if (g_utf8_strlen(valid, -1) > static_cast<glong>(defaults::kErrorBodyExcerptLength)) {
        end = g_utf8_offset_to_pointer(valid, static_cast<glong>(defaults::kErrorBodyExcerptLength));
    }
    std::string excerpt(valid, end);
    g_free(valid);
    return excerpt;
}

std::string teddycloud::format_status_error(long status_code, const std::string& body) {
    return "HTTP " + std::to_string(status_code) + ": " + body_excerpt(body);
}

std::vector<BoxInfo> teddycloud::parse_boxes(const std::string& body) {
    std::vector<BoxInfo> boxes;

    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    bool parsed = json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &error);
    if (!parsed) {
        if (error) {
            g_error_free(error);
        }
        g_object_unref(parser);
        return boxes;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_ARRAY(root)) {
        g_object_unref(parser);
        return boxes;
    }

    JsonArray* array = json_node_get_array(root);
    guint length = json_array_get_length(array);

    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (!element || !JSON_NODE_HOLDS_OBJECT(element)) {
            // One malformed entry invalidates the whole list.
            boxes.clear();
            break;
        }

        JsonObject* obj = json_node_get_object(element);
        BoxInfo box;
        box.id = json_member_to_string(obj, "id");
        box.name = json_member_is_string(obj, "name") ? json_object_get_string_member(obj, "name")
                                                      : defaults::kUnknownBoxName;
        boxes.push_back(std::move(box));
    }

    g_object_unref(parser);
    return boxes;
}

HttpResponse teddycloud::curl_http_get(const std::string& url, int timeout_seconds) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialise HTTP client";
        return response;
    }

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_OK) {
        response.transport_ok = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        response.error = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
    }

    curl_easy_cleanup(curl);
    return response;
}

RemoteProbe::RemoteProbe(HttpGet http_get)
    : m_http_get(std::move(http_get)) {}

PrimaryCheck RemoteProbe::check(const std::string& base_url, int timeout_seconds) const {
    PrimaryCheck result;

    HttpResponse response;
    try {
        response = m_http_get(teddycloud::build_api_url(base_url, defaults::kPrimaryEndpoint), timeout_seconds);
    } catch (const std::exception& e) {
        result.detail = e.what();
        return result;
    }

    if (!response.transport_ok) {
        result.detail = response.error.empty() ? "No response from " + base_url : response.error;
        return result;
    }

    result.status_code = response.status_code;
    if (response.status_code != 200) {
        result.outcome = PrimaryCheck::Outcome::BadStatus;
        result.detail = teddycloud::format_status_error(response.status_code, response.body);
        return result;
    }

    result.outcome = PrimaryCheck::Outcome::Ok;
    return result;
}

ProbeResult RemoteProbe::probe(const std::string& base_url, int timeout_seconds) const {
    ProbeResult result;

    PrimaryCheck primary = check(base_url, timeout_seconds);
    if (primary.outcome != PrimaryCheck::Outcome::Ok) {
        std::cerr << "TeddyCloud connection test failed: " << primary.detail << std::endl;
        result.error = primary.detail;
        return result;
    }

    result.success = true;
    result.boxes = fetch_boxes(base_url, timeout_seconds);
    return result;
}

std::vector<BoxInfo> RemoteProbe::fetch_boxes(const std::string& base_url, int timeout_seconds) const {
    HttpResponse response;
    try {
        response = m_http_get(teddycloud::build_api_url(base_url, defaults::kBoxesEndpoint), timeout_seconds);
    } catch (const std::exception& e) {
        std::cerr << "Box listing unavailable: " << e.what() << std::endl;
        return {};
    }

    if (!response.transport_ok || response.status_code != 200) {
        return {};
    }
    return teddycloud::parse_boxes(response.body);
}
