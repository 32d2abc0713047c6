#include "features/config_writer.hpp"

#include "config_io.hpp"
#include "core/setup_defaults.hpp"

#include <iostream>
#include <utility>

namespace {
std::string yaml_bool(bool value) {
    return value ? "true" : "false";
}

std::string entry(const std::string& key, const std::string& value) {
    return "  " + key + ": " + value;
}
}

PersistedConfig config_document::build(const SetupInput& input) {
    PersistedConfig config;

    config.remote.url = input.teddycloud_url;
    config.remote.api_base = defaults::kApiBase;
    config.remote.timeout = defaults::kRemoteTimeoutSeconds;

    // Local volume access is the alternative to the network share.
    config.volumes.enabled = !input.use_smb;
    config.volumes.config_path = defaults::kVolumeConfigPath;
    config.volumes.custom_img_path = input.custom_img_path;
    config.volumes.custom_img_json_path = input.custom_img_json_path;
    config.volumes.library_path = defaults::kVolumeLibraryPath;

    config.app.auto_parse_taf = input.auto_parse_taf;
    config.app.confirm_before_save = defaults::kConfirmBeforeSave;
    config.app.auto_reload_config = defaults::kAutoReloadConfig;
    config.app.default_language = input.default_language;
    config.app.max_image_size_mb = defaults::kMaxImageSizeMb;
    config.app.allowed_image_formats.assign(defaults::kAllowedImageFormats.begin(),
                                            defaults::kAllowedImageFormats.end());
    config.app.show_hidden_files = defaults::kShowHiddenFiles;
    config.app.recursive_scan = defaults::kRecursiveScan;
    if (input.selected_box && !input.selected_box->empty()) {
        config.app.selected_box = input.selected_box;
    }

    config.advanced.parse_cover_from_taf = defaults::kParseCoverFromTaf;
    config.advanced.extract_track_names = defaults::kExtractTrackNames;
    config.advanced.log_level = defaults::kLogLevel;
    config.advanced.cache_taf_metadata = defaults::kCacheTafMetadata;
    config.advanced.cache_ttl_seconds = defaults::kCacheTtlSeconds;

    return config;
}

std::vector<std::string> config_document::render_yaml(const PersistedConfig& config) {
    std::vector<std::string> lines;

    lines.push_back("remote:");
    lines.push_back(entry("url", ConfigIO::quote(config.remote.url)));
    lines.push_back(entry("api_base", ConfigIO::quote(config.remote.api_base)));
    lines.push_back(entry("timeout", std::to_string(config.remote.timeout)));

    lines.push_back("volumes:");
    lines.push_back(entry("enabled", yaml_bool(config.volumes.enabled)));
    lines.push_back(entry("config_path", ConfigIO::quote(config.volumes.config_path)));
    lines.push_back(entry("custom_img_path", ConfigIO::quote(config.volumes.custom_img_path)));
    lines.push_back(entry("custom_img_json_path", ConfigIO::quote(config.volumes.custom_img_json_path)));
    lines.push_back(entry("library_path", ConfigIO::quote(config.volumes.library_path)));

    lines.push_back("app:");
    lines.push_back(entry("auto_parse_taf", yaml_bool(config.app.auto_parse_taf)));
    lines.push_back(entry("confirm_before_save", yaml_bool(config.app.confirm_before_save)));
    lines.push_back(entry("auto_reload_config", yaml_bool(config.app.auto_reload_config)));
    lines.push_back(entry("default_language", ConfigIO::quote(config.app.default_language)));
    lines.push_back(entry("max_image_size_mb", std::to_string(config.app.max_image_size_mb)));
    lines.push_back("  allowed_image_formats:");
    for (const auto& format : config.app.allowed_image_formats) {
        lines.push_back("    - " + ConfigIO::quote(format));
    }
    lines.push_back(entry("show_hidden_files", yaml_bool(config.app.show_hidden_files)));
    lines.push_back(entry("recursive_scan", yaml_bool(config.app.recursive_scan)));
    if (config.app.selected_box) {
        lines.push_back(entry("selected_box", ConfigIO::quote(*config.app.selected_box)));
    }

    lines.push_back("advanced:");
    lines.push_back(entry("parse_cover_from_taf", yaml_bool(config.advanced.parse_cover_from_taf)));
    lines.push_back(entry("extract_track_names", yaml_bool(config.advanced.extract_track_names)));
    lines.push_back(entry("log_level", ConfigIO::quote(config.advanced.log_level)));
    lines.push_back(entry("cache_taf_metadata", yaml_bool(config.advanced.cache_taf_metadata)));
    lines.push_back(entry("cache_ttl_seconds", std::to_string(config.advanced.cache_ttl_seconds)));

    return lines;
}

ConfigWriter::ConfigWriter(std::string config_file_path)
    : m_config_file_path(std::move(config_file_path)) {}

const std::string& ConfigWriter::config_file_path() const {
    return m_config_file_path;
}

SaveResult ConfigWriter::save(const SetupInput& input) const {
    SaveResult result;
    result.file_path = m_config_file_path;

    const auto lines = config_document::render_yaml(config_document::build(input));
    if (!ConfigIO::writeDocument(m_config_file_path, lines, result.error)) {
        std::cerr << "Failed to save configuration: " << result.error << std::endl;
        return result;
    }

    std::cout << "Setup configuration saved to " << m_config_file_path << std::endl;
    result.success = true;
    result.message = defaults::kSaveSuccessMessage;
    return result;
}
