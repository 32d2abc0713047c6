#include "platform/environment_detector.hpp"

#include "core/setup_defaults.hpp"

#include <json-glib/json-glib.h>

#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {
bool is_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}
}

std::optional<std::size_t> detection::count_files_with_extension(const fs::path& root,
                                                                 const std::string& extension) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::nullopt;
    }

    std::size_t count = 0;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::nullopt;
        }

        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == extension) {
            ++count;
        }
    }
    if (ec) {
        return std::nullopt;
    }
    return count;
}

std::optional<std::size_t> detection::count_catalog_entries(const fs::path& catalog_file) {
    std::error_code ec;
    if (!fs::is_regular_file(catalog_file, ec)) {
        return std::nullopt;
    }

    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    bool parsed = json_parser_load_from_file(parser, catalog_file.c_str(), &error);
    if (!parsed) {
        if (error) {
            std::cerr << "Ignoring unreadable catalog " << catalog_file << ": " << error->message << std::endl;
            g_error_free(error);
        }
        g_object_unref(parser);
        return std::nullopt;
    }

    JsonNode* root = json_parser_get_root(parser);
    std::size_t count = 0;
    if (root && JSON_NODE_HOLDS_ARRAY(root)) {
        count = json_array_get_length(json_node_get_array(root));
    }

    g_object_unref(parser);
    return count;
}

std::vector<std::string> detection::existing_directories(const fs::path& root,
                                                         const std::vector<std::string>& candidates) {
    std::vector<std::string> found;
    for (const auto& candidate : candidates) {
        fs::path path = root / candidate;
        if (is_directory(path)) {
            found.push_back(path.string());
        }
    }
    return found;
}

EnvironmentDetector::EnvironmentDetector(fs::path data_root)
    : m_data_root(std::move(data_root)) {}

const fs::path& EnvironmentDetector::data_root() const {
    return m_data_root;
}

DetectionResult EnvironmentDetector::detect() const {
    DetectionResult result;

    if (!is_directory(m_data_root)) {
        return result;
    }

    const fs::path config_dir = m_data_root / defaults::kConfigSubdir;
    const fs::path library_dir = m_data_root / defaults::kLibrarySubdir;
    if (!is_directory(config_dir) || !is_directory(library_dir)) {
        return result;
    }

    result.volume_available = true;
    result.volume_path = m_data_root.string();

    auto taf_count = detection::count_files_with_extension(library_dir, defaults::kTafExtension);
    if (!taf_count) {
        std::cerr << "Could not scan " << library_dir << " for TAF files" << std::endl;
    }
    result.taf_file_count = taf_count.value_or(0);

    result.catalog_entry_count =
        detection::count_catalog_entries(config_dir / defaults::kCatalogFile).value_or(0);

    std::vector<std::string> candidates(defaults::kImageDirCandidates.begin(),
                                        defaults::kImageDirCandidates.end());
    result.image_directory_paths = detection::existing_directories(m_data_root, candidates);

    return result;
}
