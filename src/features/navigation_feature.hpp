#ifndef FEATURES_NAVIGATION_FEATURE_HPP
#define FEATURES_NAVIGATION_FEATURE_HPP

#include <gtkmm.h>

#include <map>
#include <string>

namespace features {
void handle_step_selected(
    bool& selecting_programmatically,
    Gtk::TreeView& tree_view,
    const Gtk::TreeModelColumn<Glib::ustring>& step_id_column,
    Gtk::Stack& step_stack);

void go_to_step(
    const std::string& step_id,
    bool& selecting_programmatically,
    const std::map<std::string, Gtk::TreeModel::iterator>& step_iters,
    Gtk::TreeView& tree_view,
    Gtk::Stack& step_stack);
}

#endif
