#ifndef SETUP_CONTROLLER_HPP
#define SETUP_CONTROLLER_HPP

#include "core/models.hpp"
#include "features/config_writer.hpp"
#include "features/readiness_evaluator.hpp"
#include "features/settings_loader.hpp"
#include "platform/environment_detector.hpp"
#include "platform/remote_probe.hpp"

#include <string>

class SetupController {
public:
    explicit SetupController(AppPaths paths = load_app_paths(), RemoteProbe probe = RemoteProbe());

    SetupStatus status() const;
    DetectionResult detect() const;
    ProbeResult test_connection(const std::string& base_url) const;
    SaveResult save(const SetupInput& input) const;

    const AppPaths& paths() const;

private:
    AppPaths m_paths;
    RemoteProbe m_probe;
    EnvironmentDetector m_detector;
    ReadinessEvaluator m_readiness;
    ConfigWriter m_writer;
};

#endif
