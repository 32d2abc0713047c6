#include "core/json_codec.hpp"

#include <cassert>
#include <string>

int main() {
    {
        SetupInput input;
        std::string error;
        bool ok = json_codec::parse_setup_input(R"({
            "teddycloud_url": "http://teddycloud.local",
            "custom_img_path": "/data/library/own/pics",
            "custom_img_json_path": "/data/www/custom_img",
            "use_smb": true,
            "ui_language": "de",
            "default_language": "en-gb",
            "auto_parse_taf": false,
            "selected_box": "box-1"
        })", input, error);
        assert(ok);
        assert(error.empty());
        assert(input.teddycloud_url == "http://teddycloud.local");
        assert(input.use_smb);
        assert(input.ui_language == "de");
        assert(input.default_language == "en-gb");
        assert(!input.auto_parse_taf);
        assert(input.selected_box == std::optional<std::string>("box-1"));
    }

    {
        SetupInput input;
        std::string error;
        bool ok = json_codec::parse_setup_input(R"({
            "teddycloud_url": "http://teddycloud.local",
            "custom_img_path": "",
            "custom_img_json_path": "",
            "selected_box": null
        })", input, error);
        assert(ok);
        assert(!input.use_smb);
        assert(input.ui_language == "en");
        assert(input.default_language == "de-de");
        assert(input.auto_parse_taf);
        assert(!input.selected_box.has_value());
    }

    {
        SetupInput input;
        input.teddycloud_url = "untouched";
        std::string error;
        bool ok = json_codec::parse_setup_input(R"({
            "teddycloud_url": "http://teddycloud.local",
            "custom_img_path": "a",
            "custom_img_json_path": "b",
            "use_smb": "yes"
        })", input, error);
        assert(!ok);
        assert(error.find("use_smb") != std::string::npos);
        assert(input.teddycloud_url == "untouched");
    }

    {
        SetupInput input;
        std::string error;
        assert(!json_codec::parse_setup_input(R"({"custom_img_path": "a", "custom_img_json_path": "b"})",
                                              input, error));
        assert(error.find("teddycloud_url") != std::string::npos);
        assert(!json_codec::parse_setup_input("[1, 2]", input, error));
        assert(!json_codec::parse_setup_input("{", input, error));
    }

    {
        std::string url;
        std::string error;
        assert(json_codec::parse_probe_request(R"({"url": "http://docker"})", url, error));
        assert(url == "http://docker");
        assert(!json_codec::parse_probe_request(R"({"url": 5})", url, error));
    }

    {
        SetupStatus status;
        status.setup_required = true;
        status.reason = std::string("Configuration file not found");
        std::string json = json_codec::to_json(status);
        assert(json.find("\"setup_required\" : true") != std::string::npos);
        assert(json.find("Configuration file not found") != std::string::npos);

        status = SetupStatus();
        assert(json_codec::to_json(status).find("\"reason\" : null") != std::string::npos);
    }

    {
        ProbeResult probe;
        probe.success = true;
        probe.boxes.push_back({"box-1", "Kitchen"});
        std::string json = json_codec::to_json(probe);
        assert(json.find("\"success\" : true") != std::string::npos);
        assert(json.find("\"Kitchen\"") != std::string::npos);
    }

    {
        DetectionResult detection;
        detection.volume_available = true;
        detection.volume_path = std::string("/data");
        detection.taf_file_count = 12;
        detection.image_directory_paths.push_back("/data/www/custom_img");
        std::string json = json_codec::to_json(detection);
        assert(json.find("\"taf_files_found\" : 12") != std::string::npos);
        assert(json.find("/data/www/custom_img") != std::string::npos);
    }

    return 0;
}
