#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SetupStatus {
    bool setup_required = false;
    std::optional<std::string> reason;
};

struct DetectionResult {
    bool volume_available = false;
    std::optional<std::string> volume_path;
    std::size_t taf_file_count = 0;
    std::size_t catalog_entry_count = 0;
    std::vector<std::string> image_directory_paths;
};

struct BoxInfo {
    std::string id;
    std::string name;
};

struct ProbeResult {
    bool success = false;
    std::optional<std::string> error;
    std::optional<std::string> version;
    std::vector<BoxInfo> boxes;
};

// Operator choices submitted by the wizard. Only types are checked.
struct SetupInput {
    std::string teddycloud_url;
    std::string custom_img_path;
    std::string custom_img_json_path;
    bool use_smb = false;
    std::string ui_language = "en";
    std::string default_language = "de-de";
    bool auto_parse_taf = true;
    std::optional<std::string> selected_box;
};

struct SaveResult {
    bool success = false;
    std::string message;
    std::string error;
    std::string file_path;
};

// Read-only view of the settings the running application currently uses.
struct CurrentSettings {
    std::string teddycloud_url;
};

struct RemoteSection {
    std::string url;
    std::string api_base;
    int timeout = 0;
};

struct VolumesSection {
    bool enabled = true;
    std::string config_path;
    std::string custom_img_path;
    std::string custom_img_json_path;
    std::string library_path;
};

struct AppSection {
    bool auto_parse_taf = true;
    bool confirm_before_save = true;
    bool auto_reload_config = true;
    std::string default_language;
    int max_image_size_mb = 0;
    std::vector<std::string> allowed_image_formats;
    bool show_hidden_files = false;
    bool recursive_scan = true;
    std::optional<std::string> selected_box;
};

struct AdvancedSection {
    bool parse_cover_from_taf = true;
    bool extract_track_names = true;
    std::string log_level;
    bool cache_taf_metadata = true;
    int cache_ttl_seconds = 0;
};

struct PersistedConfig {
    RemoteSection remote;
    VolumesSection volumes;
    AppSection app;
    AdvancedSection advanced;
};

#endif
