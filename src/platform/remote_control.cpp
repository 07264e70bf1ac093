#include "platform/remote_control.hpp"

const char* remote_result_name(RemoteResult result) {
    switch (result) {
        case RemoteResult::Ok: return "ok";
        case RemoteResult::CameraNotFound: return "camera not found";
        case RemoteResult::TransientFailure: return "transient failure";
        case RemoteResult::Unsupported: return "unsupported";
    }
    return "unknown";
}

const char* ir_mode_name(IrMode mode) {
    return mode == IrMode::Off ? "off" : "auto";
}

std::optional<RemoteCamera> find_remote_camera(const std::vector<RemoteCamera>& cameras,
                                               const std::string& name_or_id) {
    for (const auto& camera : cameras) {
        if (camera.name == name_or_id) {
            return camera;
        }
    }
    for (const auto& camera : cameras) {
        if (camera.id == name_or_id) {
            return camera;
        }
    }
    return std::nullopt;
}
