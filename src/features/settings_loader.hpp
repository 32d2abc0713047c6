#ifndef SETTINGS_LOADER_HPP
#define SETTINGS_LOADER_HPP

#include "core/models.hpp"

#include <string>

struct AppPaths {
    std::string config_file;
    std::string data_root;
};

// TEDDY_SETUP_CONFIG_FILE and TEDDY_SETUP_DATA_ROOT override the built-in locations.
AppPaths load_app_paths();

// TEDDYCLOUD_URL wins over the persisted remote.url, which wins over the factory default.
CurrentSettings load_current_settings(const std::string& config_file);

#endif
