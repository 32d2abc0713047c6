#include "features/readiness_evaluator.hpp"

#include "core/setup_defaults.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

ReadinessEvaluator::ReadinessEvaluator(std::string config_file_path, RemoteProbe probe)
    : m_config_file_path(std::move(config_file_path)),
      m_probe(std::move(probe)) {}

SetupStatus ReadinessEvaluator::is_setup_required(const CurrentSettings& current) const {
    try {
        return evaluate(current);
    } catch (const std::exception& e) {
        std::cerr << "Error checking setup status: " << e.what() << std::endl;
        SetupStatus status;
        status.setup_required = true;
        status.reason = e.what();
        return status;
    }
}

SetupStatus ReadinessEvaluator::evaluate(const CurrentSettings& current) const {
    SetupStatus status;

    if (!std::filesystem::exists(m_config_file_path)) {
        status.setup_required = true;
        status.reason = readiness::kConfigMissing;
        return status;
    }

    if (current.teddycloud_url == defaults::kFactoryTeddyCloudUrl) {
        PrimaryCheck check = m_probe.check(current.teddycloud_url, defaults::kStatusProbeTimeoutSeconds);
        if (check.outcome == PrimaryCheck::Outcome::BadStatus) {
            status.setup_required = true;
            status.reason = readiness::kNotConfigured;
            return status;
        }
        if (check.outcome == PrimaryCheck::Outcome::Unreachable) {
            status.setup_required = true;
            status.reason = readiness::kCannotConnect;
            return status;
        }
    }

    return status;
}
