#include "features/navigation_feature.hpp"

namespace features {
void handle_step_selected(
    bool& selecting_programmatically,
    Gtk::TreeView& tree_view,
    const Gtk::TreeModelColumn<Glib::ustring>& step_id_column,
    Gtk::Stack& step_stack) {
    if (selecting_programmatically) {
        return;
    }

    auto iter = tree_view.get_selection()->get_selected();
    if (!iter) {
        return;
    }

    Glib::ustring stepId = (*iter)[step_id_column];
    if (!step_stack.get_child_by_name(stepId)) {
        return;
    }
    step_stack.set_visible_child(stepId);
}

void go_to_step(
    const std::string& step_id,
    bool& selecting_programmatically,
    const std::map<std::string, Gtk::TreeModel::iterator>& step_iters,
    Gtk::TreeView& tree_view,
    Gtk::Stack& step_stack) {
    auto iterIt = step_iters.find(step_id);
    if (iterIt == step_iters.end() || !step_stack.get_child_by_name(step_id)) {
        return;
    }

    step_stack.set_visible_child(step_id);

    selecting_programmatically = true;
    tree_view.get_selection()->select(iterIt->second);
    selecting_programmatically = false;
}
}  // namespace features
