#include "platform/command_remote_control.hpp"

#include <glib.h>
#include <json-glib/json-glib.h>

#include <cstdio>
#include <sys/wait.h>
#include <utility>

namespace {
constexpr int kExitCameraNotFound = 2;
constexpr int kExitUnsupported = 3;
// Grace between timeout's SIGTERM and its SIGKILL.
constexpr int kKillAfterSeconds = 5;

int run_capture(const std::string& cmd, std::string& output) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return -1;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

std::string json_string_member_if_string(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return "";
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        return "";
    }

    if (json_node_get_value_type(node) != G_TYPE_STRING) {
        return "";
    }

    return json_object_get_string_member(obj, member);
}
}

std::string remote_command::shell_quote(const std::string& value) {
    std::string quoted = "'";
    quoted.reserve(value.size() + 2);
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string remote_command::build_command(const std::string& program, int timeout_seconds,
                                          const std::vector<std::string>& args) {
    std::string cmd;
    if (timeout_seconds > 0) {
        cmd = "timeout -k " + std::to_string(kKillAfterSeconds) + " " + std::to_string(timeout_seconds) + " ";
    }
    cmd += shell_quote(program);
    for (const auto& arg : args) {
        cmd += " " + shell_quote(arg);
    }
    return cmd;
}

RemoteResult remote_command::result_from_exit_code(int exit_code) {
    switch (exit_code) {
        case 0: return RemoteResult::Ok;
        case kExitCameraNotFound: return RemoteResult::CameraNotFound;
        case kExitUnsupported: return RemoteResult::Unsupported;
        default: return RemoteResult::TransientFailure;
    }
}

bool remote_command::parse_camera_list(const std::string& json, std::vector<RemoteCamera>& cameras) {
    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    bool parsed = json_parser_load_from_data(parser, json.c_str(), -1, &error);
    if (!parsed) {
        if (error) {
            g_warning("Camera listing is not valid JSON: %s", error->message);
            g_error_free(error);
        }
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_ARRAY(root)) {
        g_object_unref(parser);
        return false;
    }

    JsonArray* array = json_node_get_array(root);
    guint length = json_array_get_length(array);

    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (!element || !JSON_NODE_HOLDS_OBJECT(element)) {
            continue;
        }

        JsonObject* obj = json_node_get_object(element);
        RemoteCamera camera;
        camera.id = json_string_member_if_string(obj, "id");
        camera.name = json_string_member_if_string(obj, "name");
        if (camera.name.empty() && camera.id.empty()) {
            continue;
        }
        cameras.push_back(std::move(camera));
    }

    g_object_unref(parser);
    return true;
}

CommandRemoteControl::CommandRemoteControl(std::string program, int timeout_seconds)
    : m_program(std::move(program)), m_timeout_seconds(timeout_seconds) {}

RemoteResult CommandRemoteControl::set_privacy(const std::string& camera, bool enabled) {
    return run_verb("privacy", camera, enabled ? "on" : "off");
}

RemoteResult CommandRemoteControl::set_led(const std::string& camera, bool on) {
    return run_verb("led", camera, on ? "on" : "off");
}

RemoteResult CommandRemoteControl::set_ir(const std::string& camera, IrMode mode) {
    return run_verb("ir", camera, ir_mode_name(mode));
}

RemoteResult CommandRemoteControl::set_mic(const std::string& camera, bool on) {
    return run_verb("mic", camera, on ? "on" : "off");
}

std::optional<std::vector<RemoteCamera>> CommandRemoteControl::list_cameras() {
    std::string output;
    int exit_code = run_capture(remote_command::build_command(m_program, m_timeout_seconds, {"list"}), output);
    if (exit_code != 0) {
        g_warning("Camera listing failed (exit code %d)", exit_code);
        return std::nullopt;
    }

    std::vector<RemoteCamera> cameras;
    if (!remote_command::parse_camera_list(output, cameras)) {
        return std::nullopt;
    }
    return cameras;
}

RemoteResult CommandRemoteControl::run_verb(const std::string& verb, const std::string& camera,
                                            const std::string& arg) const {
    std::string output;
    int exit_code = run_capture(remote_command::build_command(m_program, m_timeout_seconds, {verb, camera, arg}),
                                output);
    RemoteResult result = remote_command::result_from_exit_code(exit_code);
    if (result != RemoteResult::Ok) {
        g_debug("%s %s %s exited with %d: %s", verb.c_str(), camera.c_str(), arg.c_str(), exit_code,
                output.c_str());
    }
    return result;
}
