#include "setup_window.hpp"

#include "features/navigation_feature.hpp"
#include "ui/connection_panel.hpp"
#include "ui/detection_panel.hpp"
#include "ui/preferences_panel.hpp"
#include "ui/status_panel.hpp"

namespace {
const ui::LanguageChoices kUiLanguages = {
    {"en", "English"},
    {"de", "Deutsch"},
};

const ui::LanguageChoices kContentLanguages = {
    {"de-de", "German (de-de)"},
    {"en-us", "English US (en-us)"},
    {"en-gb", "English UK (en-gb)"},
    {"fr-fr", "French (fr-fr)"},
};
}

void SetupWindow::create_status_view() {
    m_StatusPanel = std::make_unique<ui::StatusPanel>(
        [this]() { run_status_check(); },
        [this]() {
            features::go_to_step("detection", m_selecting_programmatically, m_StepIters, m_TreeView, m_StepStack);
        });
    add_step("status", "Status", *m_StatusPanel->widget());
}

void SetupWindow::create_detection_view() {
    m_DetectionPanel = std::make_unique<ui::DetectionPanel>(
        m_ImagePathStore,
        [this]() { run_detection(); },
        sigc::mem_fun(*this, &SetupWindow::setup_label_cell),
        sigc::mem_fun(*this, &SetupWindow::bind_image_path));
    add_step("detection", "Data Access", *m_DetectionPanel->widget());
}

void SetupWindow::create_connection_view() {
    const CurrentSettings current = load_current_settings(m_SetupController.paths().config_file);
    m_ConnectionPanel = std::make_unique<ui::ConnectionPanel>(
        current.teddycloud_url,
        m_BoxStore,
        [this](const std::string& url) { run_connection_test(url); },
        sigc::mem_fun(*this, &SetupWindow::setup_label_cell),
        sigc::mem_fun(*this, &SetupWindow::setup_label_cell),
        sigc::mem_fun(*this, &SetupWindow::bind_box_id),
        sigc::mem_fun(*this, &SetupWindow::bind_box_name));
    add_step("connection", "TeddyCloud", *m_ConnectionPanel->widget());
}

void SetupWindow::create_preferences_view() {
    m_PreferencesPanel = std::make_unique<ui::PreferencesPanel>(
        kUiLanguages,
        kContentLanguages,
        [this]() { save_configuration(); });
    add_step("preferences", "Preferences", *m_PreferencesPanel->widget());
}

void SetupWindow::setup_label_cell(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto label = Gtk::make_managed<Gtk::Label>();
    label->set_halign(Gtk::Align::START);
    label->set_ellipsize(Pango::EllipsizeMode::END);
    list_item->set_child(*label);
}

void SetupWindow::bind_box_id(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto item = std::dynamic_pointer_cast<BoxItem>(list_item->get_item());
    auto label = dynamic_cast<Gtk::Label*>(list_item->get_child());
    if (item && label) {
        label->set_text(item->m_id);
    }
}

void SetupWindow::bind_box_name(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto item = std::dynamic_pointer_cast<BoxItem>(list_item->get_item());
    auto label = dynamic_cast<Gtk::Label*>(list_item->get_child());
    if (item && label) {
        label->set_text(item->m_name);
    }
}

void SetupWindow::bind_image_path(const Glib::RefPtr<Gtk::ListItem>& list_item) {
    auto item = std::dynamic_pointer_cast<ImagePathItem>(list_item->get_item());
    auto label = dynamic_cast<Gtk::Label*>(list_item->get_child());
    if (item && label) {
        label->set_text(item->m_path);
    }
}
