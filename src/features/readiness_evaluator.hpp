#ifndef READINESS_EVALUATOR_HPP
#define READINESS_EVALUATOR_HPP

#include "core/models.hpp"
#include "platform/remote_probe.hpp"

#include <string>

namespace readiness {
inline constexpr const char* kConfigMissing = "Configuration file not found";
inline constexpr const char* kNotConfigured = "TeddyCloud connection not configured";
inline constexpr const char* kCannotConnect = "Cannot connect to TeddyCloud";
}

// Decides whether the first-run wizard must be shown. Gates, first match wins:
// missing config file, then an unreachable factory-default endpoint. Failures
// during evaluation resolve to "setup required".
class ReadinessEvaluator {
public:
    ReadinessEvaluator(std::string config_file_path, RemoteProbe probe = RemoteProbe());

    SetupStatus is_setup_required(const CurrentSettings& current) const;

private:
    SetupStatus evaluate(const CurrentSettings& current) const;

    std::string m_config_file_path;
    RemoteProbe m_probe;
};

#endif
