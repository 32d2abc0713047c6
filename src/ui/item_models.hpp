#ifndef UI_ITEM_MODELS_HPP
#define UI_ITEM_MODELS_HPP

#include <gtkmm.h>

#include <string>

namespace ui {
class BoxItem : public Glib::Object {
public:
    std::string m_id;
    std::string m_name;

    static Glib::RefPtr<BoxItem> create(const std::string& id, const std::string& name) {
        return Glib::make_refptr_for_instance<BoxItem>(new BoxItem(id, name));
    }

protected:
    BoxItem(const std::string& id, const std::string& name)
        : m_id(id), m_name(name) {}
};

class ImagePathItem : public Glib::Object {
public:
    std::string m_path;

    static Glib::RefPtr<ImagePathItem> create(const std::string& path) {
        return Glib::make_refptr_for_instance<ImagePathItem>(new ImagePathItem(path));
    }

protected:
    explicit ImagePathItem(const std::string& path)
        : m_path(path) {}
};
}  // namespace ui

#endif
