#include "ui/status_panel.hpp"

namespace ui {
StatusPanel::StatusPanel(const std::function<void()>& on_check, const std::function<void()>& on_start) {
    m_root = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    m_root->set_spacing(10);

    auto label = Gtk::make_managed<Gtk::Label>("Setup Status");
    label->add_css_class("section-title");
    label->set_halign(Gtk::Align::START);
    m_root->append(*label);

    m_verdict = Gtk::make_managed<Gtk::Label>("Not checked yet");
    m_verdict->set_halign(Gtk::Align::START);
    m_verdict->add_css_class("status-verdict");
    m_root->append(*m_verdict);

    m_reason = Gtk::make_managed<Gtk::Label>();
    m_reason->set_halign(Gtk::Align::START);
    m_reason->set_wrap(true);
    m_root->append(*m_reason);

    auto buttonBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
    buttonBox->set_spacing(5);

    auto checkButton = Gtk::make_managed<Gtk::Button>("Check Again");
    checkButton->signal_clicked().connect([on_check]() { on_check(); });
    buttonBox->append(*checkButton);

    auto startButton = Gtk::make_managed<Gtk::Button>("Start Setup");
    startButton->add_css_class("suggested-action");
    startButton->signal_clicked().connect([on_start]() { on_start(); });
    buttonBox->append(*startButton);

    m_root->append(*buttonBox);
}

void StatusPanel::show_status(const SetupStatus& status) {
    if (status.setup_required) {
        m_verdict->set_text("Initial setup is required");
        m_verdict->remove_css_class("status-ok");
        m_verdict->add_css_class("status-error");
    } else {
        m_verdict->set_text("TeddyCloud is configured");
        m_verdict->remove_css_class("status-error");
        m_verdict->add_css_class("status-ok");
    }
    m_reason->set_text(status.reason.value_or(""));
}

Gtk::Box* StatusPanel::widget() const {
    return m_root;
}
}  // namespace ui
