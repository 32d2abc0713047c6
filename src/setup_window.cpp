#include "setup_window.hpp"

#include "features/navigation_feature.hpp"
#include "ui/connection_panel.hpp"
#include "ui/detection_panel.hpp"
#include "ui/preferences_panel.hpp"
#include "ui/status_panel.hpp"

#include <filesystem>
#include <iostream>
#include <gtkmm/settings.h>

SetupWindow::SetupWindow()
: m_MainVBox(Gtk::Orientation::VERTICAL),
  m_HBox(Gtk::Orientation::HORIZONTAL)
{
    // Force Adwaita theme to avoid system theme interference
    auto settings = Gtk::Settings::get_default();
    if (settings) {
        settings->property_gtk_theme_name().set_value("Adwaita");
    }

    set_title("TeddyCloud Setup");
    set_default_size(900, 620);

    set_titlebar(m_HeaderBar);
    m_HeaderBar.set_show_title_buttons(true);

    m_Button_Refresh.set_icon_name("view-refresh-symbolic");
    m_Button_Refresh.set_tooltip_text("Check Status and Detect Again");
    m_Button_Refresh.signal_clicked().connect(sigc::mem_fun(*this, &SetupWindow::on_button_refresh));
    m_HeaderBar.pack_start(m_Button_Refresh);

    set_child(m_MainVBox);

    auto css_provider = Gtk::CssProvider::create();
    if (std::filesystem::exists("style.css")) {
        css_provider->load_from_path("style.css");
    } else if (std::filesystem::exists("src/style.css")) {
        css_provider->load_from_path("src/style.css");
    } else {
        std::cerr << "Warning: style.css not found! UI might look unstyled.\n";
    }

    auto display = Gdk::Display::get_default();
    if (display) {
        Gtk::StyleContext::add_provider_for_display(display, css_provider, GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    } else {
        std::cerr << "Warning: No default display found for CSS!\n";
    }

    m_HBox.set_expand(true);
    m_MainVBox.append(m_HBox);

    m_StepTreeStore = Gtk::TreeStore::create(m_StepColumns);
    m_TreeView.set_model(m_StepTreeStore);
    m_TreeView.append_column("Step", m_StepColumns.m_col_title);
    m_TreeView.set_headers_visible(false);
    m_TreeView.get_selection()->signal_changed().connect(sigc::mem_fun(*this, &SetupWindow::on_step_selected));
    m_TreeView.add_css_class("sidebar");

    auto sidebarScroll = Gtk::make_managed<Gtk::ScrolledWindow>();
    sidebarScroll->set_child(m_TreeView);
    sidebarScroll->set_policy(Gtk::PolicyType::NEVER, Gtk::PolicyType::AUTOMATIC);
    sidebarScroll->set_size_request(200, -1);
    sidebarScroll->add_css_class("sidebar-scroll");
    m_HBox.append(*sidebarScroll);

    m_StepStack.set_expand(true);
    m_StepStack.set_transition_type(Gtk::StackTransitionType::SLIDE_UP_DOWN);
    m_HBox.append(m_StepStack);

    m_StatusLabel.set_halign(Gtk::Align::START);
    m_StatusLabel.set_margin_start(12);
    m_StatusLabel.set_margin_end(12);
    m_StatusLabel.set_margin_bottom(8);
    m_StatusLabel.set_text("Ready");
    m_MainVBox.append(m_StatusLabel);

    m_BoxStore = Gio::ListStore<BoxItem>::create();
    m_ImagePathStore = Gio::ListStore<ImagePathItem>::create();

    create_status_view();
    create_detection_view();
    create_connection_view();
    create_preferences_view();

    run_status_check();
    run_detection();
    features::go_to_step("status", m_selecting_programmatically, m_StepIters, m_TreeView, m_StepStack);
}

SetupWindow::~SetupWindow() = default;

void SetupWindow::on_step_selected() {
    features::handle_step_selected(
        m_selecting_programmatically,
        m_TreeView,
        m_StepColumns.m_col_step_id,
        m_StepStack);
}

void SetupWindow::on_button_refresh() {
    run_status_check();
    run_detection();
}

void SetupWindow::add_step(const std::string& step_id, const std::string& title, Gtk::Widget& page) {
    auto scroll = Gtk::make_managed<Gtk::ScrolledWindow>();
    scroll->set_policy(Gtk::PolicyType::NEVER, Gtk::PolicyType::AUTOMATIC);
    page.set_margin(20);
    scroll->set_child(page);
    m_StepStack.add(*scroll, step_id, title);

    auto iter = m_StepTreeStore->append();
    (*iter)[m_StepColumns.m_col_title] = title;
    (*iter)[m_StepColumns.m_col_step_id] = step_id;
    m_StepIters[step_id] = iter;
}

void SetupWindow::set_status_message(const std::string& text, bool is_error) {
    m_StatusLabel.set_text(text);
    if (is_error) {
        m_StatusLabel.remove_css_class("status-ok");
        m_StatusLabel.add_css_class("status-error");
    } else {
        m_StatusLabel.remove_css_class("status-error");
        m_StatusLabel.add_css_class("status-ok");
    }
}
