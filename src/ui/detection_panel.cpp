#include "ui/detection_panel.hpp"

#include <string>

namespace ui {
DetectionPanel::DetectionPanel(
    const Glib::RefPtr<Gio::ListStore<ImagePathItem>>& image_path_store,
    const std::function<void()>& on_detect,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& setup_image_path,
    const sigc::slot<void(const Glib::RefPtr<Gtk::ListItem>&)>& bind_image_path) {
    m_root = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    m_root->set_spacing(10);

    auto label = Gtk::make_managed<Gtk::Label>("Data Access");
    label->add_css_class("section-title");
    label->set_halign(Gtk::Align::START);
    m_root->append(*label);

    auto infoFrame = Gtk::make_managed<Gtk::Frame>("Detected Volume");
    auto infoBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    infoBox->set_spacing(5);
    infoBox->set_margin(10);

    m_volume_label = Gtk::make_managed<Gtk::Label>("Not detected yet");
    m_volume_label->set_halign(Gtk::Align::START);
    infoBox->append(*m_volume_label);

    m_taf_label = Gtk::make_managed<Gtk::Label>();
    m_taf_label->set_halign(Gtk::Align::START);
    infoBox->append(*m_taf_label);

    m_tonies_label = Gtk::make_managed<Gtk::Label>();
    m_tonies_label->set_halign(Gtk::Align::START);
    infoBox->append(*m_tonies_label);

    auto detectButton = Gtk::make_managed<Gtk::Button>("Detect Again");
    detectButton->set_halign(Gtk::Align::START);
    detectButton->signal_clicked().connect([on_detect]() { on_detect(); });
    infoBox->append(*detectButton);

    infoFrame->set_child(*infoBox);
    m_root->append(*infoFrame);

    auto pathsLabel = Gtk::make_managed<Gtk::Label>("Image Directories");
    pathsLabel->set_halign(Gtk::Align::START);
    m_root->append(*pathsLabel);

    auto selectionModel = Gtk::NoSelection::create(image_path_store);
    auto columnView = Gtk::make_managed<Gtk::ColumnView>();
    columnView->set_model(selectionModel);
    columnView->add_css_class("data-table");

    auto factory_path = Gtk::SignalListItemFactory::create();
    factory_path->signal_setup().connect(setup_image_path);
    factory_path->signal_bind().connect(bind_image_path);
    auto col_path = Gtk::ColumnViewColumn::create("Path", factory_path);
    col_path->set_expand(true);
    columnView->append_column(col_path);
    m_root->append(*columnView);

    m_smb_check = Gtk::make_managed<Gtk::CheckButton>("Access TeddyCloud data over a network share (SMB)");
    m_root->append(*m_smb_check);
}

void DetectionPanel::show_result(const DetectionResult& result) {
    if (result.volume_available) {
        m_volume_label->set_text("Volume mounted at " + result.volume_path.value_or(""));
    } else {
        m_volume_label->set_text("No TeddyCloud data volume found");
    }
    m_taf_label->set_text("TAF files: " + std::to_string(result.taf_file_count));
    m_tonies_label->set_text("Custom tonies: " + std::to_string(result.catalog_entry_count));

    // Without a local volume the network share is the only way in.
    m_smb_check->set_active(!result.volume_available);
}

bool DetectionPanel::use_smb() const {
    return m_smb_check->get_active();
}

Gtk::Box* DetectionPanel::widget() const {
    return m_root;
}
}  // namespace ui
