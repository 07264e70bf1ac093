#ifndef PLATFORM_REMOTE_CONTROL_HPP
#define PLATFORM_REMOTE_CONTROL_HPP

#include <optional>
#include <string>
#include <vector>

enum class RemoteResult {
    Ok,
    CameraNotFound,
    TransientFailure,
    Unsupported
};

enum class IrMode { Off, Auto };

struct RemoteCamera {
    std::string id;
    std::string name;
};

const char* remote_result_name(RemoteResult result);
const char* ir_mode_name(IrMode mode);

// Capabilities of the camera-management service. One instance is shared by every
// camera and may be called from several worker threads at once.
class RemoteControl {
public:
    virtual ~RemoteControl() = default;

    virtual RemoteResult set_privacy(const std::string& camera, bool enabled) = 0;
    virtual RemoteResult set_led(const std::string& camera, bool on) = 0;
    virtual RemoteResult set_ir(const std::string& camera, IrMode mode) = 0;
    virtual RemoteResult set_mic(const std::string& camera, bool on) = 0;

    // std::nullopt when the service cannot be reached.
    virtual std::optional<std::vector<RemoteCamera>> list_cameras() = 0;
};

// Exact, case-sensitive match on name first, then on id.
std::optional<RemoteCamera> find_remote_camera(const std::vector<RemoteCamera>& cameras,
                                               const std::string& name_or_id);

#endif
