#ifndef SETUP_WINDOW_HPP
#define SETUP_WINDOW_HPP

#include "features/background_task.hpp"
#include "features/setup_controller.hpp"
#include "ui/item_models.hpp"

#include <gtkmm.h>

#include <map>
#include <memory>
#include <string>

namespace ui {
class StatusPanel;
class DetectionPanel;
class ConnectionPanel;
class PreferencesPanel;
}

class SetupWindow : public Gtk::Window
{
public:
    using BoxItem = ui::BoxItem;
    using ImagePathItem = ui::ImagePathItem;

    class StepColumns : public Gtk::TreeModel::ColumnRecord {
    public:
        StepColumns() { add(m_col_title); add(m_col_step_id); }
        Gtk::TreeModelColumn<Glib::ustring> m_col_title;
        Gtk::TreeModelColumn<Glib::ustring> m_col_step_id;
    };

    SetupWindow();
    virtual ~SetupWindow();

protected:
    void on_button_refresh();
    void on_step_selected();

    Gtk::HeaderBar m_HeaderBar;
    Gtk::Box m_MainVBox;
    Gtk::Box m_HBox;
    Gtk::TreeView m_TreeView;
    Gtk::Stack m_StepStack;
    Gtk::Label m_StatusLabel;
    Gtk::Button m_Button_Refresh;

    StepColumns m_StepColumns;
    Glib::RefPtr<Gtk::TreeStore> m_StepTreeStore;
    std::map<std::string, Gtk::TreeModel::iterator> m_StepIters;

    Glib::RefPtr<Gio::ListStore<BoxItem>> m_BoxStore;
    Glib::RefPtr<Gio::ListStore<ImagePathItem>> m_ImagePathStore;
    std::unique_ptr<ui::StatusPanel> m_StatusPanel;
    std::unique_ptr<ui::DetectionPanel> m_DetectionPanel;
    std::unique_ptr<ui::ConnectionPanel> m_ConnectionPanel;
    std::unique_ptr<ui::PreferencesPanel> m_PreferencesPanel;
    SetupController m_SetupController;
    bool m_selecting_programmatically = false;
    // Declared last so a running check is joined while the controller is still alive.
    features::BackgroundTask m_BackgroundTask;

    void setup_label_cell(const Glib::RefPtr<Gtk::ListItem>& list_item);
    void bind_box_id(const Glib::RefPtr<Gtk::ListItem>& list_item);
    void bind_box_name(const Glib::RefPtr<Gtk::ListItem>& list_item);
    void bind_image_path(const Glib::RefPtr<Gtk::ListItem>& list_item);

    void add_step(const std::string& step_id, const std::string& title, Gtk::Widget& page);
    void create_status_view();
    void create_detection_view();
    void create_connection_view();
    void create_preferences_view();

    void run_status_check();
    void run_detection();
    void run_connection_test(const std::string& url);
    void save_configuration();
    SetupInput collect_input() const;
    void set_status_message(const std::string& text, bool is_error);
};

#endif
