#include "config_io.hpp"
#include "features/config_writer.hpp"
#include "features/settings_loader.hpp"

#include <unistd.h>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {
std::string read_all(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

SetupInput sample_input() {
    SetupInput input;
    input.teddycloud_url = "http://teddycloud.local";
    input.custom_img_path = "/data/library/own/pics";
    input.custom_img_json_path = "/data/www/custom_img";
    return input;
}

std::string rendered(const SetupInput& input) {
    std::string text;
    for (const auto& line : config_document::render_yaml(config_document::build(input))) {
        text += line + '\n';
    }
    return text;
}

size_t entries_in(const fs::path& directory) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(directory)) {
        (void)entry;
        ++count;
    }
    return count;
}
}

int main() {
    const fs::path dir = fs::temp_directory_path() / ("teddy-setup-writer-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    const fs::path config = dir / "nested" / "config.yaml";

    {
        assert(ConfigIO::quote("plain") == "\"plain\"");
        assert(ConfigIO::quote("a\"b\\c") == "\"a\\\"b\\\\c\"");
        assert(ConfigIO::unquote(ConfigIO::quote("tab\there \"q\"")) == "tab\there \"q\"");
        assert(ConfigIO::unquote("'it''s'") == "it's");
        assert(ConfigIO::unquote("bare") == "bare");

        assert(ConfigIO::quote("/pics\x01") == "\"/pics\\x01\"");
        assert(ConfigIO::quote(std::string("\x00\x1f\x7f", 3)) == "\"\\x00\\x1F\\x7F\"");
        const std::string controls("a\x01" "b\x1b[0m\x7f\x00" "z", 10);
        assert(ConfigIO::unquote(ConfigIO::quote(controls)) == controls);
        assert(ConfigIO::unquote("\"\\x4a\"") == "J");
        assert(ConfigIO::unquote("\"\\xZZ\"") == "xZZ");
    }

    {
        SetupInput input = sample_input();
        input.use_smb = true;
        PersistedConfig doc = config_document::build(input);
        assert(!doc.volumes.enabled);

        input.use_smb = false;
        doc = config_document::build(input);
        assert(doc.volumes.enabled);
        assert(doc.remote.api_base == "/api");
        assert(doc.remote.timeout == 30);
        assert(doc.app.max_image_size_mb == 5);
        assert(doc.app.allowed_image_formats.size() == 4);
        assert(doc.advanced.log_level == "INFO");
        assert(doc.advanced.cache_ttl_seconds == 300);
        assert(!doc.app.selected_box.has_value());

        input.selected_box = std::string();
        assert(!config_document::build(input).app.selected_box.has_value());
    }

    {
        SetupInput input = sample_input();
        input.use_smb = true;
        input.default_language = "en-us";
        input.auto_parse_taf = false;
        input.selected_box = std::string("box-42");

        ConfigWriter writer(config.string());
        SaveResult result = writer.save(input);
        assert(result.success);
        assert(result.message == "Configuration saved. Please restart the application.");
        assert(fs::exists(config));
        assert(entries_in(config.parent_path()) == 1);

        const std::string path = config.string();
        assert(ConfigIO::readOption(path, "remote:url") == std::optional<std::string>("http://teddycloud.local"));
        assert(ConfigIO::readOption(path, "remote:api_base") == std::optional<std::string>("/api"));
        assert(ConfigIO::readOption(path, "volumes:enabled") == std::optional<std::string>("false"));
        assert(ConfigIO::readOption(path, "volumes:library_path") == std::optional<std::string>("/data/library"));
        assert(ConfigIO::readOption(path, "app:auto_parse_taf") == std::optional<std::string>("false"));
        assert(ConfigIO::readOption(path, "app:default_language") == std::optional<std::string>("en-us"));
        assert(ConfigIO::readOption(path, "app:selected_box") == std::optional<std::string>("box-42"));
        assert(ConfigIO::readOption(path, "app:recursive_scan") == std::optional<std::string>("true"));
        assert(ConfigIO::readOption(path, "advanced:cache_ttl_seconds") == std::optional<std::string>("300"));
        assert(!ConfigIO::readOption(path, "app:ui_language").has_value());

        const std::string text = read_all(config);
        assert(text.find("allowed_image_formats:\n    - \"jpg\"\n    - \"jpeg\"\n    - \"png\"\n    - \"webp\"\n") !=
               std::string::npos);
        assert(text.rfind("remote:", 0) == 0);
        assert(text.find("\nvolumes:\n") != std::string::npos);
        assert(text.find("\napp:\n") != std::string::npos);
        assert(text.find("\nadvanced:\n") != std::string::npos);
    }

    {
        SetupInput input = sample_input();
        input.teddycloud_url = "http://second.local";

        SaveResult result = ConfigWriter(config.string()).save(input);
        assert(result.success);

        const std::string path = config.string();
        assert(ConfigIO::readOption(path, "remote:url") == std::optional<std::string>("http://second.local"));
        assert(ConfigIO::readOption(path, "volumes:enabled") == std::optional<std::string>("true"));
        assert(!ConfigIO::readOption(path, "app:selected_box").has_value());
        assert(read_all(config).find("selected_box") == std::string::npos);
        assert(read_all(config).find("box-42") == std::string::npos);
    }

    {
        unsetenv("TEDDYCLOUD_URL");
        assert(load_current_settings(config.string()).teddycloud_url == "http://second.local");
        assert(load_current_settings((dir / "missing.yaml").string()).teddycloud_url == "http://docker");

        setenv("TEDDYCLOUD_URL", "http://from-env", 1);
        assert(load_current_settings(config.string()).teddycloud_url == "http://from-env");
        unsetenv("TEDDYCLOUD_URL");
    }

    {
        SetupInput input = sample_input();
        input.custom_img_path = "/pics\x01";
        input.custom_img_json_path = "/json\x7f\tend";

        assert(ConfigWriter(config.string()).save(input).success);
        const std::string path = config.string();
        assert(ConfigIO::readOption(path, "volumes:custom_img_path") == std::optional<std::string>("/pics\x01"));
        assert(ConfigIO::readOption(path, "volumes:custom_img_json_path") ==
               std::optional<std::string>("/json\x7f\tend"));

        for (char c : read_all(config)) {
            unsigned char byte = static_cast<unsigned char>(c);
            assert(c == '\n' || (byte >= 0x20 && byte != 0x7F));
        }
    }

    {
        // Overlapping saves must each land a complete document.
        SetupInput long_input = sample_input();
        long_input.teddycloud_url = "http://" + std::string(4000, 'a');
        SetupInput short_input = sample_input();
        short_input.teddycloud_url = "http://b";
        const std::string long_text = rendered(long_input);
        const std::string short_text = rendered(short_input);

        const fs::path shared = dir / "shared" / "config.yaml";
        bool long_ok = true;
        bool short_ok = true;
        auto hammer = [&shared](const SetupInput& input, bool& all_ok) {
            ConfigWriter writer(shared.string());
            for (int i = 0; i < 200; ++i) {
                if (!writer.save(input).success) {
                    all_ok = false;
                }
            }
        };
        std::thread first(hammer, std::cref(long_input), std::ref(long_ok));
        std::thread second(hammer, std::cref(short_input), std::ref(short_ok));
        first.join();
        second.join();

        assert(long_ok);
        assert(short_ok);
        const std::string text = read_all(shared);
        assert(text == long_text || text == short_text);
        assert(entries_in(shared.parent_path()) == 1);
    }

    {
        // The parent "directory" is a regular file, so neither mkdir nor the write can succeed.
        const fs::path blocker = dir / "blocker";
        std::ofstream(blocker) << "file";
        ConfigWriter writer((blocker / "config.yaml").string());
        SaveResult result = writer.save(sample_input());
        assert(!result.success);
        assert(!result.error.empty());
        assert(result.message.empty());
    }

    fs::remove_all(dir);
    return 0;
}
