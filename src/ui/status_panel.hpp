#ifndef UI_STATUS_PANEL_HPP
#define UI_STATUS_PANEL_HPP

#include "core/models.hpp"

#include <gtkmm.h>

#include <functional>

namespace ui {
class StatusPanel {
public:
    StatusPanel(const std::function<void()>& on_check, const std::function<void()>& on_start);

    void show_status(const SetupStatus& status);
    Gtk::Box* widget() const;

private:
    Gtk::Box* m_root = nullptr;
    Gtk::Label* m_verdict = nullptr;
    Gtk::Label* m_reason = nullptr;
};
}  // namespace ui

#endif
