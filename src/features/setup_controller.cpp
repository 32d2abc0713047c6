#include "features/setup_controller.hpp"

#include "core/setup_defaults.hpp"

#include <utility>

SetupController::SetupController(AppPaths paths, RemoteProbe probe)
    : m_paths(std::move(paths)),
      m_probe(std::move(probe)),
      m_detector(m_paths.data_root),
      m_readiness(m_paths.config_file, m_probe),
      m_writer(m_paths.config_file) {}

SetupStatus SetupController::status() const {
    return m_readiness.is_setup_required(load_current_settings(m_paths.config_file));
}

DetectionResult SetupController::detect() const {
    return m_detector.detect();
}

ProbeResult SetupController::test_connection(const std::string& base_url) const {
    return m_probe.probe(base_url, defaults::kTestProbeTimeoutSeconds);
}

SaveResult SetupController::save(const SetupInput& input) const {
    return m_writer.save(input);
}

const AppPaths& SetupController::paths() const {
    return m_paths;
}
