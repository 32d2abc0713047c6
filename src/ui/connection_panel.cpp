#include "ui/connection_panel.hpp"

namespace ui {
ConnectionPanel::ConnectionPanel(
    const std::string& initial_url,
    const Glib::RefPtr<Gio::ListStore<BoxItem>>& box_store,
    const std::function<void(const std::string&)>& on_test_connection,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_box_id,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_box_name,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_box_id,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_box_name) {
    m_root = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    m_root->set_spacing(10);

    auto label = Gtk::make_managed<Gtk::Label>("TeddyCloud Server");
    label->add_css_class("section-title");
    label->set_halign(Gtk::Align::START);
    m_root->append(*label);

    auto testFrame = Gtk::make_managed<Gtk::Frame>("Connection");
    auto testBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
    testBox->set_spacing(5);
    testBox->set_margin(10);

    m_url_entry = Gtk::make_managed<Gtk::Entry>();
    m_url_entry->set_placeholder_text("http://teddycloud.local");
    m_url_entry->set_text(initial_url);
    m_url_entry->set_hexpand(true);

    auto testButton = Gtk::make_managed<Gtk::Button>("Test Connection");
    auto* entry = m_url_entry;
    testButton->signal_clicked().connect([on_test_connection, entry]() {
        const std::string url = entry->get_text();
        if (url.empty()) {
            return;
        }
        on_test_connection(url);
    });

    testBox->append(*m_url_entry);
    testBox->append(*testButton);
    testFrame->set_child(*testBox);
    m_root->append(*testFrame);

    m_result_label = Gtk::make_managed<Gtk::Label>();
    m_result_label->set_halign(Gtk::Align::START);
    m_result_label->set_wrap(true);
    m_root->append(*m_result_label);

    auto selectionModel = Gtk::SingleSelection::create(box_store);
    auto columnView = Gtk::make_managed<Gtk::ColumnView>();
    columnView->set_model(selectionModel);
    columnView->add_css_class("data-table");

    auto factory_id = Gtk::SignalListItemFactory::create();
    factory_id->signal_setup().connect(setup_box_id);
    factory_id->signal_bind().connect(bind_box_id);
    auto col_id = Gtk::ColumnViewColumn::create("Box ID", factory_id);
    col_id->set_fixed_width(240);
    columnView->append_column(col_id);

    auto factory_name = Gtk::SignalListItemFactory::create();
    factory_name->signal_setup().connect(setup_box_name);
    factory_name->signal_bind().connect(bind_box_name);
    auto col_name = Gtk::ColumnViewColumn::create("Name", factory_name);
    col_name->set_expand(true);
    columnView->append_column(col_name);

    m_root->append(*columnView);

    auto selectBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
    selectBox->set_spacing(5);
    auto selectLabel = Gtk::make_managed<Gtk::Label>("Default Toniebox");
    selectBox->append(*selectLabel);

    m_box_combo = Gtk::make_managed<Gtk::DropDown>();
    m_box_model = Gtk::StringList::create({"(none)"});
    m_box_combo->set_model(m_box_model);
    m_box_combo->set_selected(0);
    selectBox->append(*m_box_combo);
    m_root->append(*selectBox);
}

void ConnectionPanel::show_result(const ProbeResult& result) {
    m_box_ids.clear();
    m_box_model->splice(0, m_box_model->get_n_items(), {"(none)"});

    if (!result.success) {
        m_result_label->set_text("Connection failed: " + result.error.value_or("unknown error"));
        m_result_label->remove_css_class("status-ok");
        m_result_label->add_css_class("status-error");
        m_box_combo->set_selected(0);
        return;
    }

    m_result_label->set_text("Connected. Found " + std::to_string(result.boxes.size()) + " Toniebox(es).");
    m_result_label->remove_css_class("status-error");
    m_result_label->add_css_class("status-ok");

    for (const auto& box : result.boxes) {
        m_box_ids.push_back(box.id);
        m_box_model->append(box.name + " (" + box.id + ")");
    }
    m_box_combo->set_selected(0);
}

std::string ConnectionPanel::url() const {
    return m_url_entry->get_text();
}

std::optional<std::string> ConnectionPanel::selected_box() const {
    auto idx = m_box_combo->get_selected();
    if (idx == GTK_INVALID_LIST_POSITION || idx == 0 || idx > m_box_ids.size()) {
        return std::nullopt;
    }
    return m_box_ids[idx - 1];
}

Gtk::Box* ConnectionPanel::widget() const {
    return m_root;
}
}  // namespace ui
