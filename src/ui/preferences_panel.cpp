#include "ui/preferences_panel.hpp"

namespace ui {
namespace {
Gtk::DropDown* make_language_combo(const LanguageChoices& choices) {
    auto combo = Gtk::make_managed<Gtk::DropDown>();
    auto model = Gtk::StringList::create({});
    for (const auto& choice : choices) {
        model->append(choice.second);
    }
    combo->set_model(model);
    if (!choices.empty()) {
        combo->set_selected(0);
    }
    return combo;
}

std::string selected_code(const Gtk::DropDown* combo, const LanguageChoices& choices) {
    auto idx = combo->get_selected();
    if (idx == GTK_INVALID_LIST_POSITION || idx >= choices.size()) {
        return choices.empty() ? "" : choices.front().first;
    }
    return choices[idx].first;
}

Gtk::Box* labeled_row(const std::string& text, Gtk::Widget& field) {
    auto row = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL);
    row->set_spacing(10);
    auto label = Gtk::make_managed<Gtk::Label>(text);
    label->set_size_request(200, -1);
    label->set_halign(Gtk::Align::START);
    label->set_xalign(0.0f);
    row->append(*label);
    row->append(field);
    return row;
}
}  // namespace

PreferencesPanel::PreferencesPanel(const LanguageChoices& ui_languages,
                                   const LanguageChoices& content_languages,
                                   const std::function<void()>& on_save)
    : m_ui_languages(ui_languages),
      m_content_languages(content_languages) {
    m_root = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    m_root->set_spacing(10);

    auto label = Gtk::make_managed<Gtk::Label>("Preferences");
    label->add_css_class("section-title");
    label->set_halign(Gtk::Align::START);
    m_root->append(*label);

    auto pathsFrame = Gtk::make_managed<Gtk::Frame>("Custom Images");
    auto pathsBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    pathsBox->set_spacing(5);
    pathsBox->set_margin(10);

    m_img_path_entry = Gtk::make_managed<Gtk::Entry>();
    m_img_path_entry->set_placeholder_text("/data/library/own/pics");
    m_img_path_entry->set_hexpand(true);
    pathsBox->append(*labeled_row("Image directory", *m_img_path_entry));

    m_img_json_path_entry = Gtk::make_managed<Gtk::Entry>();
    m_img_json_path_entry->set_placeholder_text("/data/www/custom_img");
    m_img_json_path_entry->set_hexpand(true);
    pathsBox->append(*labeled_row("Image path in tonies.custom.json", *m_img_json_path_entry));

    pathsFrame->set_child(*pathsBox);
    m_root->append(*pathsFrame);

    auto prefsFrame = Gtk::make_managed<Gtk::Frame>("Application");
    auto prefsBox = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::VERTICAL);
    prefsBox->set_spacing(5);
    prefsBox->set_margin(10);

    m_ui_language_combo = make_language_combo(m_ui_languages);
    prefsBox->append(*labeled_row("Interface language", *m_ui_language_combo));

    m_content_language_combo = make_language_combo(m_content_languages);
    prefsBox->append(*labeled_row("Default tonie language", *m_content_language_combo));

    m_auto_parse_check = Gtk::make_managed<Gtk::CheckButton>("Parse TAF files automatically");
    m_auto_parse_check->set_active(true);
    prefsBox->append(*m_auto_parse_check);

    prefsFrame->set_child(*prefsBox);
    m_root->append(*prefsFrame);

    auto saveButton = Gtk::make_managed<Gtk::Button>("Save Configuration");
    saveButton->add_css_class("suggested-action");
    saveButton->set_halign(Gtk::Align::END);
    saveButton->signal_clicked().connect([on_save]() { on_save(); });
    m_root->append(*saveButton);
}

void PreferencesPanel::suggest_image_paths(const std::vector<std::string>& image_directories) {
    if (image_directories.empty()) {
        return;
    }
    if (m_img_path_entry->get_text().empty()) {
        m_img_path_entry->set_text(image_directories.front());
    }
    if (m_img_json_path_entry->get_text().empty()) {
        m_img_json_path_entry->set_text(image_directories.back());
    }
}

std::string PreferencesPanel::custom_img_path() const {
    return m_img_path_entry->get_text();
}

std::string PreferencesPanel::custom_img_json_path() const {
    return m_img_json_path_entry->get_text();
}

std::string PreferencesPanel::ui_language() const {
    return selected_code(m_ui_language_combo, m_ui_languages);
}

std::string PreferencesPanel::default_language() const {
    return selected_code(m_content_language_combo, m_content_languages);
}

bool PreferencesPanel::auto_parse_taf() const {
    return m_auto_parse_check->get_active();
}

Gtk::Box* PreferencesPanel::widget() const {
    return m_root;
}
}  // namespace ui
