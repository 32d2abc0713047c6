#include "setup_window.hpp"

#include "ui/connection_panel.hpp"
#include "ui/detection_panel.hpp"
#include "ui/preferences_panel.hpp"
#include "ui/status_panel.hpp"

void SetupWindow::run_status_check() {
    bool started = m_BackgroundTask.start([this]() -> features::BackgroundTask::Continuation {
        SetupStatus status = m_SetupController.status();
        return [this, status]() {
            m_StatusPanel->show_status(status);
            if (status.setup_required) {
                set_status_message("Setup required: " + status.reason.value_or("unknown reason"), true);
            } else {
                set_status_message("Configuration found at " + m_SetupController.paths().config_file, false);
            }
        };
    });
    if (!started) {
        set_status_message("Another check is still running", true);
        return;
    }
    set_status_message("Checking setup status...", false);
}

void SetupWindow::run_detection() {
    DetectionResult result = m_SetupController.detect();
    m_DetectionPanel->show_result(result);

    m_ImagePathStore->remove_all();
    for (const auto& path : result.image_directory_paths) {
        m_ImagePathStore->append(ImagePathItem::create(path));
    }
    m_PreferencesPanel->suggest_image_paths(result.image_directory_paths);
}

void SetupWindow::run_connection_test(const std::string& url) {
    bool started = m_BackgroundTask.start([this, url]() -> features::BackgroundTask::Continuation {
        ProbeResult result = m_SetupController.test_connection(url);
        return [this, url, result]() {
            m_ConnectionPanel->show_result(result);

            m_BoxStore->remove_all();
            for (const auto& box : result.boxes) {
                m_BoxStore->append(BoxItem::create(box.id, box.name));
            }

            if (result.success) {
                set_status_message("Connected to " + url, false);
            } else {
                set_status_message("Connection to " + url + " failed", true);
            }
        };
    });
    if (!started) {
        set_status_message("Another check is still running", true);
        return;
    }
    set_status_message("Testing connection to " + url + "...", false);
}

SetupInput SetupWindow::collect_input() const {
    SetupInput input;
    input.teddycloud_url = m_ConnectionPanel->url();
    input.custom_img_path = m_PreferencesPanel->custom_img_path();
    input.custom_img_json_path = m_PreferencesPanel->custom_img_json_path();
    input.use_smb = m_DetectionPanel->use_smb();
    input.ui_language = m_PreferencesPanel->ui_language();
    input.default_language = m_PreferencesPanel->default_language();
    input.auto_parse_taf = m_PreferencesPanel->auto_parse_taf();
    input.selected_box = m_ConnectionPanel->selected_box();
    return input;
}

void SetupWindow::save_configuration() {
    SaveResult result = m_SetupController.save(collect_input());
    if (result.success) {
        set_status_message(result.message, false);
        run_status_check();
    } else {
        set_status_message("Failed to save configuration: " + result.error, true);
    }
}
