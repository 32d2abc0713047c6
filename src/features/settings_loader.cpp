#include "features/settings_loader.hpp"

#include "config_io.hpp"
#include "core/setup_defaults.hpp"

#include <cstdlib>

namespace {
std::string env_or(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return fallback;
}
}

AppPaths load_app_paths() {
    AppPaths paths;
    paths.config_file = env_or("TEDDY_SETUP_CONFIG_FILE", defaults::kConfigFilePath);
    paths.data_root = env_or("TEDDY_SETUP_DATA_ROOT", defaults::kDataRoot);
    return paths;
}

CurrentSettings load_current_settings(const std::string& config_file) {
    CurrentSettings settings;
    settings.teddycloud_url = defaults::kFactoryTeddyCloudUrl;

    const char* env_url = std::getenv("TEDDYCLOUD_URL");
    if (env_url && *env_url) {
        settings.teddycloud_url = env_url;
        return settings;
    }

    auto persisted = ConfigIO::readOption(config_file, "remote:url");
    if (persisted && !persisted->empty()) {
        settings.teddycloud_url = *persisted;
    }
    return settings;
}
