#ifndef UI_CONNECTION_PANEL_HPP
#define UI_CONNECTION_PANEL_HPP

#include "core/models.hpp"
#include "ui/item_models.hpp"

#include <gtkmm.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ui {
class ConnectionPanel {
public:
    ConnectionPanel(
        const std::string& initial_url,
        const Glib::RefPtr<Gio::ListStore<BoxItem>>& box_store,
        const std::function<void(const std::string&)>& on_test_connection,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_box_id,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_box_name,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_box_id,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_box_name);

    void show_result(const ProbeResult& result);
    std::string url() const;
    std::optional<std::string> selected_box() const;
    Gtk::Box* widget() const;

private:
    Gtk::Box* m_root = nullptr;
    Gtk::Entry* m_url_entry = nullptr;
    Gtk::Label* m_result_label = nullptr;
    Gtk::DropDown* m_box_combo = nullptr;
    Glib::RefPtr<Gtk::StringList> m_box_model;
    std::vector<std::string> m_box_ids;
};
}  // namespace ui

#endif
