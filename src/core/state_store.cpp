#include "core/state_store.hpp"

#include "core/clock.hpp"

#include <glib.h>
#include <glibmm/fileutils.h>
#include <json-glib/json-glib.h>

#include <filesystem>
#include <utility>

namespace {
const char* const kMemberCameraName = "camera_name";
const char* const kMemberPrivacyEnabled = "privacy_enabled";
const char* const kMemberStartTime = "privacy_start_time";
const char* const kMemberCameras = "cameras";

std::string file_safe_name(const std::string& camera_name) {
    std::string safe = camera_name;
    for (char& c : safe) {
        if (c == '/' || c == '\0') {
            c = '_';
        }
    }
    return safe;
}

JsonNode* build_record(const PrivacyState& state) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, kMemberPrivacyEnabled);
    json_builder_add_boolean_value(builder, state.privacy_enabled);

    json_builder_set_member_name(builder, kMemberStartTime);
    if (state.enabled_at) {
        json_builder_add_string_value(builder, timestamps::to_iso8601(*state.enabled_at).c_str());
    } else {
        json_builder_add_null_value(builder);
    }

    json_builder_set_member_name(builder, kMemberCameraName);
    json_builder_add_string_value(builder, state.camera_name.c_str());

    json_builder_end_object(builder);
    JsonNode* root = json_builder_get_root(builder);
    g_object_unref(builder);
    return root;
}

std::string to_json_text(JsonNode* root) {
    JsonGenerator* generator = json_generator_new();
    json_generator_set_pretty(generator, TRUE);
    json_generator_set_indent(generator, 2);
    json_generator_set_root(generator, root);

    gchar* data = json_generator_to_data(generator, nullptr);
    std::string text = data ? data : "";
    g_free(data);
    g_object_unref(generator);
    return text + "\n";
}

bool write_atomically(const std::string& path, const std::string& text) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            g_warning("Cannot create state directory %s: %s", parent.c_str(), ec.message().c_str());
            return false;
        }
    }

    try {
        Glib::file_set_contents(path, text);
    } catch (const Glib::FileError& e) {
        g_warning("Cannot write state file %s: %s", path.c_str(), e.what());
        return false;
    }
    return true;
}

// Returns a parser holding an object root, or nullptr. A missing file is silent.
JsonParser* read_object_document(const std::string& path) {
    if (!Glib::file_test(path, Glib::FileTest::EXISTS)) {
        return nullptr;
    }

    std::string contents;
    try {
        contents = Glib::file_get_contents(path);
    } catch (const Glib::FileError& e) {
        g_warning("Cannot read state file %s: %s", path.c_str(), e.what());
        return nullptr;
    }

    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    if (!json_parser_load_from_data(parser, contents.c_str(), static_cast<gssize>(contents.size()), &error)) {
        g_warning("Ignoring malformed state file %s: %s", path.c_str(), error ? error->message : "parse error");
        if (error) {
            g_error_free(error);
        }
        g_object_unref(parser);
        return nullptr;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_warning("Ignoring state file %s: top level is not an object", path.c_str());
        g_object_unref(parser);
        return nullptr;
    }
    return parser;
}

bool member_holds(JsonObject* obj, const char* member, GType type) {
    if (!json_object_has_member(obj, member)) {
        return false;
    }
    JsonNode* node = json_object_get_member(obj, member);
    return node && JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == type;
}

// Returns false for a record that belongs to another camera.
bool parse_record(JsonObject* obj, const std::string& camera_name, TimePoint loaded_at, const std::string& source,
                  PrivacyState& state) {
    if (member_holds(obj, kMemberCameraName, G_TYPE_STRING)) {
        std::string owner = json_object_get_string_member(obj, kMemberCameraName);
        if (owner != camera_name) {
            g_warning("%s: record belongs to camera '%s', not '%s'; ignoring it", source.c_str(), owner.c_str(),
                      camera_name.c_str());
            return false;
        }
    }

    state = PrivacyState();
    state.camera_name = camera_name;

    if (member_holds(obj, kMemberPrivacyEnabled, G_TYPE_BOOLEAN)) {
        state.privacy_enabled = json_object_get_boolean_member(obj, kMemberPrivacyEnabled);
    }

    if (member_holds(obj, kMemberStartTime, G_TYPE_STRING)) {
        TimePoint started;
        std::string text = json_object_get_string_member(obj, kMemberStartTime);
        if (timestamps::from_iso8601(text, started)) {
            state.enabled_at = started;
        } else {
            g_warning("%s: unreadable %s '%s'", source.c_str(), kMemberStartTime, text.c_str());
        }
    }

    if (state.privacy_enabled && !state.enabled_at) {
        g_warning("%s: privacy enabled without a start time, timing from now", source.c_str());
        state.enabled_at = loaded_at;
    } else if (!state.privacy_enabled && state.enabled_at) {
        g_warning("%s: start time recorded while privacy is off, dropping it", source.c_str());
        state.enabled_at.reset();
    }
    return true;
}
}

StateStore::StateStore(std::string path_template) : m_template(std::move(path_template)) {}

bool StateStore::per_camera_files() const {
    return m_template.find(kCameraPlaceholder) != std::string::npos;
}

std::string StateStore::describe() const {
    if (per_camera_files()) {
        return "one file per camera, " + m_template;
    }
    return "shared file " + m_template + " (per-camera privacy_state_<name>.json files are not read; add " +
           kCameraPlaceholder + " to state_file_path to keep using them)";
}

std::string StateStore::path_for(const std::string& camera_name) const {
    std::string path = m_template;
    const std::string placeholder = kCameraPlaceholder;
    const std::string safe = file_safe_name(camera_name);
    size_t pos = 0;
    while ((pos = path.find(placeholder, pos)) != std::string::npos) {
        path.replace(pos, placeholder.size(), safe);
        pos += safe.size();
    }
    return path;
}

std::map<std::string, PrivacyState> StateStore::load(const std::vector<std::string>& camera_names,
                                                     TimePoint loaded_at) const {
    std::map<std::string, PrivacyState> states;

    if (per_camera_files()) {
        for (const auto& name : camera_names) {
            std::string path = path_for(name);
            JsonParser* parser = read_object_document(path);
            if (!parser) {
                continue;
            }
            JsonObject* obj = json_node_get_object(json_parser_get_root(parser));
            PrivacyState state;
            if (parse_record(obj, name, loaded_at, path, state)) {
                states[name] = state;
            }
            g_object_unref(parser);
        }
        return states;
    }

    JsonParser* parser = read_object_document(m_template);
    if (!parser) {
        return states;
    }

    JsonObject* root = json_node_get_object(json_parser_get_root(parser));
    JsonNode* cameras_node = json_object_has_member(root, kMemberCameras)
                                 ? json_object_get_member(root, kMemberCameras)
                                 : nullptr;
    if (cameras_node && JSON_NODE_HOLDS_OBJECT(cameras_node)) {
        JsonObject* cameras = json_node_get_object(cameras_node);
        for (const auto& name : camera_names) {
            if (!json_object_has_member(cameras, name.c_str())) {
                continue;
            }
            JsonNode* record = json_object_get_member(cameras, name.c_str());
            if (!record || !JSON_NODE_HOLDS_OBJECT(record)) {
                g_warning("%s: record for '%s' is not an object", m_template.c_str(), name.c_str());
                continue;
            }
            PrivacyState state;
            if (parse_record(json_node_get_object(record), name, loaded_at, m_template + " [" + name + "]",
                             state)) {
                states[name] = state;
            }
        }
    }

    g_object_unref(parser);
    return states;
}

bool StateStore::save(const PrivacyState& state) {
    if (per_camera_files()) {
        JsonNode* record = build_record(state);
        std::string text = to_json_text(record);
        json_node_unref(record);
        return write_atomically(path_for(state.camera_name), text);
    }

    std::lock_guard<std::mutex> lock(m_shared_document_mutex);

    // Read-modify-write keeps the other cameras' records, and any members this
    // version does not know about, untouched.
    JsonParser* parser = read_object_document(m_template);
    JsonNode* root = nullptr;
    if (parser) {
        root = json_node_copy(json_parser_get_root(parser));
        g_object_unref(parser);
    } else {
        root = json_node_new(JSON_NODE_OBJECT);
        json_node_take_object(root, json_object_new());
    }

    JsonObject* root_obj = json_node_get_object(root);
    JsonNode* cameras_node = json_object_has_member(root_obj, kMemberCameras)
                                 ? json_object_get_member(root_obj, kMemberCameras)
                                 : nullptr;
    if (!cameras_node || !JSON_NODE_HOLDS_OBJECT(cameras_node)) {
        json_object_set_object_member(root_obj, kMemberCameras, json_object_new());
        cameras_node = json_object_get_member(root_obj, kMemberCameras);
    }

    json_object_set_member(json_node_get_object(cameras_node), state.camera_name.c_str(), build_record(state));

    std::string text = to_json_text(root);
    json_node_unref(root);
    return write_atomically(m_template, text);
}
