#ifndef ENVIRONMENT_DETECTOR_HPP
#define ENVIRONMENT_DETECTOR_HPP

#include "core/models.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace detection {
// Each helper returns std::nullopt when its sub-check could not be completed.
std::optional<std::size_t> count_files_with_extension(const std::filesystem::path& root,
                                                      const std::string& extension);
std::optional<std::size_t> count_catalog_entries(const std::filesystem::path& catalog_file);
std::vector<std::string> existing_directories(const std::filesystem::path& root,
                                              const std::vector<std::string>& candidates);
}

class EnvironmentDetector {
public:
    explicit EnvironmentDetector(std::filesystem::path data_root);

    DetectionResult detect() const;
    const std::filesystem::path& data_root() const;

private:
    std::filesystem::path m_data_root;
};

#endif
