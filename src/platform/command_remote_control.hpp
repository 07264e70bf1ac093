#ifndef PLATFORM_COMMAND_REMOTE_CONTROL_HPP
#define PLATFORM_COMMAND_REMOTE_CONTROL_HPP

#include "platform/remote_control.hpp"

#include <string>
#include <vector>

namespace remote_command {
std::string shell_quote(const std::string& value);
std::string build_command(const std::string& program, int timeout_seconds,
                          const std::vector<std::string>& args);
RemoteResult result_from_exit_code(int exit_code);
bool parse_camera_list(const std::string& json, std::vector<RemoteCamera>& cameras);
}

// Delegates every capability to an external helper program:
//   <program> privacy <camera> on|off
//   <program> led <camera> on|off
//   <program> ir <camera> off|auto
//   <program> mic <camera> on|off
//   <program> list                    -> JSON array of {"id", "name"}
// Exit codes: 0 ok, 2 camera not found, 3 unsupported, anything else transient.
class CommandRemoteControl : public RemoteControl {
public:
    CommandRemoteControl(std::string program, int timeout_seconds);

    RemoteResult set_privacy(const std::string& camera, bool enabled) override;
    RemoteResult set_led(const std::string& camera, bool on) override;
    RemoteResult set_ir(const std::string& camera, IrMode mode) override;
    RemoteResult set_mic(const std::string& camera, bool on) override;
    std::optional<std::vector<RemoteCamera>> list_cameras() override;

private:
    RemoteResult run_verb(const std::string& verb, const std::string& camera, const std::string& arg) const;

    std::string m_program;
    int m_timeout_seconds;
};

#endif
