#ifndef UI_DETECTION_PANEL_HPP
#define UI_DETECTION_PANEL_HPP

#include "core/models.hpp"
#include "ui/item_models.hpp"

#include <gtkmm.h>

#include <functional>

namespace ui {
class DetectionPanel {
public:
    DetectionPanel(
        const Glib::RefPtr<Gio::ListStore<ImagePathItem>>& image_path_store,
        const std::function<void()>& on_detect,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_image_path,
        const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_image_path);

    void show_result(const DetectionResult& result);
    bool use_smb() const;
    Gtk::Box* widget() const;

private:
    Gtk::Box* m_root = nullptr;
    Gtk::Label* m_volume_label = nullptr;
    Gtk::Label* m_taf_label = nullptr;
    Gtk::Label* m_tonies_label = nullptr;
    Gtk::CheckButton* m_smb_check = nullptr;
};
}  // namespace ui

#endif
