#include "config_io.hpp"

#include "core/errors.hpp"
#include "core/state_store.hpp"

#include <glib.h>
#include <glibmm/fileutils.h>
#include <json-glib/json-glib.h>

#include <map>
#include <set>

namespace {
const std::set<std::string> kTopLevelMembers = {"cameras", "global_settings"};
const std::set<std::string> kCameraMembers = {"name", "gpio_pin", "led_pin", "timeout_minutes", "enabled"};
const std::set<std::string> kGlobalMembers = {
    "debounce_time",         "polling_interval",       "startup_delay",  "state_file_path",
    "gpio_chip",             "shutdown_grace_period",  "timeout_retry_interval",
    "remote_command",        "remote_command_timeout",
};

constexpr double kMaxDebounceSeconds = 10.0;
constexpr double kMaxPollingIntervalSeconds = 60.0;
constexpr int kMaxStartupDelaySeconds = 3600;
constexpr double kMaxShutdownGraceSeconds = 300.0;
constexpr int kMaxTimeoutRetrySeconds = 24 * 60 * 60;
constexpr int kMaxRemoteCommandTimeoutSeconds = 3600;
constexpr int kMaxTimeoutMinutes = 7 * 24 * 60;

void reject_unknown_members(JsonObject* obj, const std::set<std::string>& known, const std::string& where) {
    GList* members = json_object_get_members(obj);
    std::string unknown;
    for (GList* it = members; it != nullptr; it = it->next) {
        const char* name = static_cast<const char*>(it->data);
        if (known.count(name) == 0) {
            unknown = name;
            break;
        }
    }
    g_list_free(members);

    if (!unknown.empty()) {
        throw ConfigurationError(where + ": unknown field '" + unknown + "'");
    }
}

JsonNode* value_member(JsonObject* obj, const char* member, const std::string& where) {
    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        throw ConfigurationError(where + "." + member + " must be a scalar value");
    }
    return node;
}

std::string string_member(JsonObject* obj, const char* member, const std::string& where) {
    JsonNode* node = value_member(obj, member, where);
    if (json_node_get_value_type(node) != G_TYPE_STRING) {
        throw ConfigurationError(where + "." + member + " must be a string");
    }
    return json_node_get_string(node);
}

long long int_member(JsonObject* obj, const char* member, const std::string& where) {
    JsonNode* node = value_member(obj, member, where);
    if (json_node_get_value_type(node) != G_TYPE_INT64) {
        throw ConfigurationError(where + "." + member + " must be an integer");
    }
    return json_node_get_int(node);
}

double number_member(JsonObject* obj, const char* member, const std::string& where) {
    JsonNode* node = value_member(obj, member, where);
    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_DOUBLE) {
        return json_node_get_double(node);
    }
    if (type == G_TYPE_INT64) {
        return static_cast<double>(json_node_get_int(node));
    }
    throw ConfigurationError(where + "." + member + " must be a number");
}

bool bool_member(JsonObject* obj, const char* member, const std::string& where) {
    JsonNode* node = value_member(obj, member, where);
    if (json_node_get_value_type(node) != G_TYPE_BOOLEAN) {
        throw ConfigurationError(where + "." + member + " must be true or false");
    }
    return json_node_get_boolean(node);
}

int bounded_int_member(JsonObject* obj, const char* member, const std::string& where, long long min,
                       long long max) {
    long long value = int_member(obj, member, where);
    if (value < min || value > max) {
        throw ConfigurationError(where + "." + member + " out of range [" + std::to_string(min) + ", " +
                                 std::to_string(max) + "]: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

std::string number_text(double value) {
    gchar buffer[G_ASCII_DTOSTR_BUF_SIZE];
    return g_ascii_dtostr(buffer, sizeof(buffer), value);
}

// The lower bound is exclusive when min_exclusive is set.
void check_range(const std::string& name, double value, double min, double max, bool min_exclusive = false) {
    bool below = min_exclusive ? !(value > min) : !(value >= min);
    if (below || !(value <= max)) {
        throw ConfigurationError(name + " out of range " + (min_exclusive ? "(" : "[") + number_text(min) + ", " +
                                 number_text(max) + "]: " + number_text(value));
    }
}

void check_range(const std::string& name, int value, int min, int max) {
    if (value < min || value > max) {
        throw ConfigurationError(name + " out of range [" + std::to_string(min) + ", " + std::to_string(max) +
                                 "]: " + std::to_string(value));
    }
}

int pin_value(long long value, const std::string& where) {
    if (value < 0 || value > 1023) {
        throw ConfigurationError(where + " is not a valid GPIO line: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

CameraSpec parse_camera(JsonNode* node, size_t index) {
    std::string where = "cameras[" + std::to_string(index) + "]";
    if (!JSON_NODE_HOLDS_OBJECT(node)) {
        throw ConfigurationError(where + " must be an object");
    }

    JsonObject* obj = json_node_get_object(node);
    reject_unknown_members(obj, kCameraMembers, where);

    CameraSpec camera;
    if (!json_object_has_member(obj, "name")) {
        throw ConfigurationError(where + ".name is required");
    }
    camera.name = string_member(obj, "name", where);
    if (camera.name.empty()) {
        throw ConfigurationError(where + ".name must not be empty");
    }
    where = "camera '" + camera.name + "'";

    if (!json_object_has_member(obj, "gpio_pin")) {
        throw ConfigurationError(where + ": gpio_pin is required");
    }
    camera.input_pin = pin_value(int_member(obj, "gpio_pin", where), where + " gpio_pin");

    if (json_object_has_member(obj, "led_pin") && !json_object_get_null_member(obj, "led_pin")) {
        camera.led_pin = pin_value(int_member(obj, "led_pin", where), where + " led_pin");
    }

    if (json_object_has_member(obj, "timeout_minutes")) {
        camera.timeout_minutes = bounded_int_member(obj, "timeout_minutes", where, 0, kMaxTimeoutMinutes);
    }

    if (json_object_has_member(obj, "enabled")) {
        camera.enabled = bool_member(obj, "enabled", where);
    }
    return camera;
}

void parse_global_settings(JsonNode* node, GlobalSettings& settings) {
    const std::string where = "global_settings";
    if (!JSON_NODE_HOLDS_OBJECT(node)) {
        throw ConfigurationError(where + " must be an object");
    }

    JsonObject* obj = json_node_get_object(node);
    reject_unknown_members(obj, kGlobalMembers, where);

    if (json_object_has_member(obj, "debounce_time")) {
        settings.debounce_seconds = number_member(obj, "debounce_time", where);
    }
    if (json_object_has_member(obj, "polling_interval")) {
        settings.polling_interval_seconds = number_member(obj, "polling_interval", where);
    }
    if (json_object_has_member(obj, "startup_delay")) {
        settings.startup_delay_seconds = bounded_int_member(obj, "startup_delay", where, 0, kMaxStartupDelaySeconds);
    }
    if (json_object_has_member(obj, "state_file_path")) {
        settings.state_file_template = string_member(obj, "state_file_path", where);
    }
    if (json_object_has_member(obj, "gpio_chip")) {
        settings.gpio_chip = string_member(obj, "gpio_chip", where);
    }
    if (json_object_has_member(obj, "shutdown_grace_period")) {
        settings.shutdown_grace_seconds = number_member(obj, "shutdown_grace_period", where);
    }
    if (json_object_has_member(obj, "timeout_retry_interval")) {
        settings.timeout_retry_seconds =
            bounded_int_member(obj, "timeout_retry_interval", where, 1, kMaxTimeoutRetrySeconds);
    }
    if (json_object_has_member(obj, "remote_command")) {
        settings.remote_command = string_member(obj, "remote_command", where);
    }
    if (json_object_has_member(obj, "remote_command_timeout")) {
        settings.remote_command_timeout_seconds =
            bounded_int_member(obj, "remote_command_timeout", where, 1, kMaxRemoteCommandTimeoutSeconds);
    }
}
}  // namespace

DaemonConfig ConfigIO::loadFile(const std::string& filePath) {
    std::string text;
    try {
        text = Glib::file_get_contents(filePath);
    } catch (const Glib::FileError& e) {
        throw ConfigurationError("Could not read config file " + filePath + ": " + e.what());
    }
    return parse(text);
}

DaemonConfig ConfigIO::parse(const std::string& text) {
    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    if (!json_parser_load_from_data(parser, text.c_str(), static_cast<gssize>(text.size()), &error)) {
        std::string message = error ? error->message : "parse error";
        if (error) {
            g_error_free(error);
        }
        g_object_unref(parser);
        throw ConfigurationError("Invalid JSON in config: " + message);
    }

    DaemonConfig config;
    try {
        JsonNode* root = json_parser_get_root(parser);
        if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
            throw ConfigurationError("Config must be a JSON object");
        }

        JsonObject* obj = json_node_get_object(root);
        reject_unknown_members(obj, kTopLevelMembers, "config");

        JsonNode* cameras = json_object_get_member(obj, "cameras");
        if (!cameras || !JSON_NODE_HOLDS_ARRAY(cameras)) {
            throw ConfigurationError("Config must contain a 'cameras' array");
        }

        JsonArray* array = json_node_get_array(cameras);
        guint length = json_array_get_length(array);
        for (guint i = 0; i < length; ++i) {
            config.cameras.push_back(parse_camera(json_array_get_element(array, i), i));
        }

        if (json_object_has_member(obj, "global_settings")) {
            parse_global_settings(json_object_get_member(obj, "global_settings"), config.settings);
        }
    } catch (...) {
        g_object_unref(parser);
        throw;
    }

    g_object_unref(parser);
    validate(config);
    return config;
}

void ConfigIO::validate(const DaemonConfig& config) {
    const GlobalSettings& settings = config.settings;
    check_range("global_settings.debounce_time", settings.debounce_seconds, 0.0, kMaxDebounceSeconds);
    check_range("global_settings.polling_interval", settings.polling_interval_seconds, 0.0,
                kMaxPollingIntervalSeconds, true);
    check_range("global_settings.startup_delay", settings.startup_delay_seconds, 0, kMaxStartupDelaySeconds);
    check_range("global_settings.shutdown_grace_period", settings.shutdown_grace_seconds, 0.0,
                kMaxShutdownGraceSeconds);
    check_range("global_settings.timeout_retry_interval", settings.timeout_retry_seconds, 1,
                kMaxTimeoutRetrySeconds);
    // Every helper call runs under a timeout.
    check_range("global_settings.remote_command_timeout", settings.remote_command_timeout_seconds, 1,
                kMaxRemoteCommandTimeoutSeconds);
    if (settings.state_file_template.empty()) {
        throw ConfigurationError("global_settings.state_file_path must not be empty");
    }
    if (settings.gpio_chip.empty()) {
        throw ConfigurationError("global_settings.gpio_chip must not be empty");
    }

    std::set<std::string> names;
    for (const auto& camera : config.cameras) {
        if (!names.insert(camera.name).second) {
            throw ConfigurationError("Duplicate camera name '" + camera.name + "'");
        }
    }

    // Button and LED lines share one namespace on the chip.
    std::map<int, std::string> claimed;
    auto claim = [&claimed](int pin, const std::string& owner) {
        auto it = claimed.find(pin);
        if (it != claimed.end()) {
            throw ConfigurationError("GPIO " + std::to_string(pin) + " is used by both " + it->second +
                                     " and " + owner);
        }
        claimed[pin] = owner;
    };

    // Distinct names can still collapse onto one state file once sanitised.
    StateStore store(settings.state_file_template);
    std::map<std::string, std::string> state_files;

    size_t enabled = 0;
    for (const auto& camera : config.cameras) {
        if (!camera.enabled) {
            continue;
        }
        ++enabled;
        check_range("camera '" + camera.name + "' timeout_minutes", camera.timeout_minutes, 0, kMaxTimeoutMinutes);
        if (store.per_camera_files()) {
            const std::string path = store.path_for(camera.name);
            auto existing = state_files.find(path);
            if (existing != state_files.end()) {
                throw ConfigurationError("Cameras '" + existing->second + "' and '" + camera.name +
                                         "' would share the state file " + path);
            }
            state_files[path] = camera.name;
        }
        claim(camera.input_pin, "the button of '" + camera.name + "'");
        if (camera.led_pin) {
            claim(*camera.led_pin, "the LED of '" + camera.name + "'");
        }
    }

    if (enabled == 0) {
        throw ConfigurationError("No enabled cameras in config");
    }
}
