#ifndef CORE_JSON_CODEC_HPP
#define CORE_JSON_CODEC_HPP

#include "core/models.hpp"

#include <string>

namespace json_codec {
std::string to_json(const SetupStatus& status);
std::string to_json(const DetectionResult& detection);
std::string to_json(const ProbeResult& probe);
std::string to_json(const SaveResult& save);

// Only member types are checked; values are taken as given.
bool parse_setup_input(const std::string& json, SetupInput& input, std::string& error);
bool parse_probe_request(const std::string& json, std::string& base_url, std::string& error);
}

#endif
