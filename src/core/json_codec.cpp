#include "core/json_codec.hpp"

#include <json-glib/json-glib.h>

#include <utility>

namespace {
void add_optional_string(JsonBuilder* builder, const char* member, const std::optional<std::string>& value) {
    json_builder_set_member_name(builder, member);
    if (value) {
        json_builder_add_string_value(builder, value->c_str());
    } else {
        json_builder_add_null_value(builder);
    }
}

std::string finish(JsonBuilder* builder) {
    JsonNode* root = json_builder_get_root(builder);
    JsonGenerator* generator = json_generator_new();
    json_generator_set_root(generator, root);
    json_generator_set_pretty(generator, TRUE);

    gchar* data = json_generator_to_data(generator, nullptr);
    std::string out = data ? data : "";

    g_free(data);
    g_object_unref(generator);
    json_node_unref(root);
    g_object_unref(builder);
    return out;
}

enum class MemberType { Missing, Null, String, Boolean, Other };

MemberType member_type(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return MemberType::Missing;
    }
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || JSON_NODE_HOLDS_NULL(node)) {
        return MemberType::Null;
    }
    if (!JSON_NODE_HOLDS_VALUE(node)) {
        return MemberType::Other;
    }
    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_STRING) {
        return MemberType::String;
    }
    if (type == G_TYPE_BOOLEAN) {
        return MemberType::Boolean;
    }
    return MemberType::Other;
}

bool read_string(JsonObject* obj, const char* member, bool required, std::string& out, std::string& error) {
    MemberType type = member_type(obj, member);
    if (type == MemberType::Missing) {
        if (required) {
            error = std::string("missing field '") + member + "'";
            return false;
        }
        return true;
    }
    if (type != MemberType::String) {
        error = std::string("field '") + member + "' must be a string";
        return false;
    }
    out = json_object_get_string_member(obj, member);
    return true;
}

bool read_bool(JsonObject* obj, const char* member, bool& out, std::string& error) {
    MemberType type = member_type(obj, member);
    if (type == MemberType::Missing) {
        return true;
    }
    if (type != MemberType::Boolean) {
        error = std::string("field '") + member + "' must be a boolean";
        return false;
    }
    out = json_object_get_boolean_member(obj, member);
    return true;
}

// Returns nullptr and fills error unless the document is a JSON object.
JsonParser* parse_object(const std::string& json, JsonObject*& obj, std::string& error) {
    GError* gerror = nullptr;
    JsonParser* parser = json_parser_new();
    if (!json_parser_load_from_data(parser, json.c_str(), static_cast<gssize>(json.size()), &gerror)) {
        error = gerror ? gerror->message : "invalid JSON";
        if (gerror) {
            g_error_free(gerror);
        }
        g_object_unref(parser);
        return nullptr;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        error = "expected a JSON object";
        g_object_unref(parser);
        return nullptr;
    }

    obj = json_node_get_object(root);
    return parser;
}
}

std::string json_codec::to_json(const SetupStatus& status) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "setup_required");
    json_builder_add_boolean_value(builder, status.setup_required);
    add_optional_string(builder, "reason", status.reason);
    json_builder_end_object(builder);
    return finish(builder);
}

std::string json_codec::to_json(const DetectionResult& detection) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "volume_available");
    json_builder_add_boolean_value(builder, detection.volume_available);
    add_optional_string(builder, "volume_path", detection.volume_path);
    json_builder_set_member_name(builder, "taf_files_found");
    json_builder_add_int_value(builder, static_cast<gint64>(detection.taf_file_count));
    json_builder_set_member_name(builder, "tonies_found");
    json_builder_add_int_value(builder, static_cast<gint64>(detection.catalog_entry_count));
    json_builder_set_member_name(builder, "image_paths");
    json_builder_begin_array(builder);
    for (const auto& path : detection.image_directory_paths) {
        json_builder_add_string_value(builder, path.c_str());
    }
    json_builder_end_array(builder);
    json_builder_end_object(builder);
    return finish(builder);
}

std::string json_codec::to_json(const ProbeResult& probe) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "success");
    json_builder_add_boolean_value(builder, probe.success);
    add_optional_string(builder, "error", probe.error);
    add_optional_string(builder, "version", probe.version);
    json_builder_set_member_name(builder, "boxes");
    json_builder_begin_array(builder);
    for (const auto& box : probe.boxes) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "id");
        json_builder_add_string_value(builder, box.id.c_str());
        json_builder_set_member_name(builder, "name");
        json_builder_add_string_value(builder, box.name.c_str());
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);
    json_builder_end_object(builder);
    return finish(builder);
}

std::string json_codec::to_json(const SaveResult& save) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "success");
    json_builder_add_boolean_value(builder, save.success);
    if (save.success) {
        json_builder_set_member_name(builder, "message");
        json_builder_add_string_value(builder, save.message.c_str());
    } else {
        json_builder_set_member_name(builder, "detail");
        json_builder_add_string_value(builder, save.error.c_str());
    }
    json_builder_end_object(builder);
    return finish(builder);
}

bool json_codec::parse_setup_input(const std::string& json, SetupInput& input, std::string& error) {
    JsonObject* obj = nullptr;
    JsonParser* parser = parse_object(json, obj, error);
    if (!parser) {
        return false;
    }

    SetupInput parsed;
    bool ok = read_string(obj, "teddycloud_url", true, parsed.teddycloud_url, error) &&
              read_string(obj, "custom_img_path", true, parsed.custom_img_path, error) &&
              read_string(obj, "custom_img_json_path", true, parsed.custom_img_json_path, error) &&
              read_bool(obj, "use_smb", parsed.use_smb, error) &&
              read_string(obj, "ui_language", false, parsed.ui_language, error) &&
              read_string(obj, "default_language", false, parsed.default_language, error) &&
              read_bool(obj, "auto_parse_taf", parsed.auto_parse_taf, error);

    if (ok) {
        MemberType box_type = member_type(obj, "selected_box");
        if (box_type == MemberType::String) {
            parsed.selected_box = std::string(json_object_get_string_member(obj, "selected_box"));
        } else if (box_type != MemberType::Missing && box_type != MemberType::Null) {
            error = "field 'selected_box' must be a string or null";
            ok = false;
        }
    }

    g_object_unref(parser);
    if (ok) {
        input = std::move(parsed);
    }
    return ok;
}

bool json_codec::parse_probe_request(const std::string& json, std::string& base_url, std::string& error) {
    JsonObject* obj = nullptr;
    JsonParser* parser = parse_object(json, obj, error);
    if (!parser) {
        return false;
    }

    std::string url;
    bool ok = read_string(obj, "url", true, url, error);
    g_object_unref(parser);
    if (ok) {
        base_url = url;
    }
    return ok;
}
