#ifndef UI_PREFERENCES_PANEL_HPP
#define UI_PREFERENCES_PANEL_HPP

#include <gtkmm.h>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace ui {
// Code/label pairs offered in the language drop-downs.
using LanguageChoices = std::vector<std::pair<std::string, std::string>>;

class PreferencesPanel {
public:
    PreferencesPanel(const LanguageChoices& ui_languages,
                     const LanguageChoices& content_languages,
                     const std::function<void()>& on_save);

    void suggest_image_paths(const std::vector<std::string>& image_directories);

    std::string custom_img_path() const;
    std::string custom_img_json_path() const;
    std::string ui_language() const;
    std::string default_language() const;
    bool auto_parse_taf() const;

    Gtk::Box* widget() const;

private:
    Gtk::Box* m_root = nullptr;
    Gtk::Entry* m_img_path_entry = nullptr;
    Gtk::Entry* m_img_json_path_entry = nullptr;
    Gtk::DropDown* m_ui_language_combo = nullptr;
    Gtk::DropDown* m_content_language_combo = nullptr;
    Gtk::CheckButton* m_auto_parse_check = nullptr;
    LanguageChoices m_ui_languages;
    LanguageChoices m_content_languages;
};
}  // namespace ui

#endif
