#ifndef CONFIG_WRITER_HPP
#define CONFIG_WRITER_HPP

#include "core/models.hpp"

#include <string>
#include <vector>

namespace config_document {
PersistedConfig build(const SetupInput& input);
std::vector<std::string> render_yaml(const PersistedConfig& config);
}

class ConfigWriter {
public:
    explicit ConfigWriter(std::string config_file_path);

    SaveResult save(const SetupInput& input) const;
    const std::string& config_file_path() const;

private:
    std::string m_config_file_path;
};

#endif
