#include "core/privacy_state_machine.hpp"

#include "core/state_store.hpp"

#include <glib.h>

#include <utility>

const char* transition_reason_name(TransitionReason reason) {
    return reason == TransitionReason::Timeout ? "timeout" : "button press";
}

TransitionOutcome execute_transition(RemoteControl& remote, const TransitionRequest& request) {
    TransitionOutcome outcome;
    outcome.request = request;

    const std::string& camera = request.camera_name;
    const bool enable = request.enable_privacy;

    outcome.privacy = remote.set_privacy(camera, enable);
    if (!outcome.confirmed()) {
        return outcome;
    }

    outcome.led = remote.set_led(camera, !enable);
    outcome.ir = remote.set_ir(camera, enable ? IrMode::Off : IrMode::Auto);
    outcome.mic = remote.set_mic(camera, !enable);
    return outcome;
}

CameraStateMachine::CameraStateMachine(CameraSpec spec, PrivacyState initial, StateStore& store,
                                       int timeout_retry_seconds)
    : m_spec(std::move(spec)),
      m_state(std::move(initial)),
      m_store(store),
      m_timeout_retry(timeout_retry_seconds) {
    m_state.camera_name = m_spec.name;
    if (!m_state.privacy_enabled) {
        m_state.enabled_at.reset();
    }
}

std::optional<TimePoint> CameraStateMachine::timeout_deadline() const {
    if (!m_state.privacy_enabled || !m_state.enabled_at || m_spec.timeout_minutes <= 0) {
        return std::nullopt;
    }
    return *m_state.enabled_at + std::chrono::minutes(m_spec.timeout_minutes);
}

TransitionRequest CameraStateMachine::make_request(bool enable, TransitionReason reason, TimePoint now) {
    TransitionRequest request;
    request.camera_name = m_spec.name;
    request.enable_privacy = enable;
    request.reason = reason;
    request.requested_at = now;
    m_pending = request;
    return request;
}

std::optional<TransitionRequest> CameraStateMachine::on_press(TimePoint now) {
    if (m_pending) {
        g_debug("[%s] Press ignored, %s of privacy still in flight", m_spec.name.c_str(),
                m_pending->enable_privacy ? "enable" : "disable");
        return std::nullopt;
    }

    g_info("[%s] Button pressed, %s privacy", m_spec.name.c_str(),
           m_state.privacy_enabled ? "disabling" : "enabling");
    return make_request(!m_state.privacy_enabled, TransitionReason::ButtonPress, now);
}

std::optional<TransitionRequest> CameraStateMachine::on_timeout_check(TimePoint now) {
    if (m_pending) {
        return std::nullopt;
    }

    std::optional<TimePoint> deadline = timeout_deadline();
    if (!deadline || now < *deadline) {
        return std::nullopt;
    }
    if (m_next_timeout_attempt && now < *m_next_timeout_attempt) {
        return std::nullopt;
    }

    g_message("[%s] Privacy timeout reached (%d minutes), disabling", m_spec.name.c_str(),
              m_spec.timeout_minutes);
    return make_request(false, TransitionReason::Timeout, now);
}

void CameraStateMachine::log_secondary(const char* what, const std::optional<RemoteResult>& result) const {
    if (result && *result != RemoteResult::Ok) {
        g_warning("[%s] %s failed: %s", m_spec.name.c_str(), what, remote_result_name(*result));
    }
}

bool CameraStateMachine::on_transition_complete(const TransitionOutcome& outcome, TimePoint now) {
    if (!m_pending || m_pending->enable_privacy != outcome.request.enable_privacy ||
        m_pending->requested_at != outcome.request.requested_at) {
        g_debug("[%s] Ignoring stale transition result", m_spec.name.c_str());
        return false;
    }

    const TransitionRequest request = *m_pending;
    m_pending.reset();

    if (!outcome.confirmed()) {
        g_warning("[%s] Failed to %s privacy (%s, %s); state stays %s", m_spec.name.c_str(),
                  request.enable_privacy ? "enable" : "disable", transition_reason_name(request.reason),
                  remote_result_name(outcome.privacy), m_state.privacy_enabled ? "ON" : "OFF");
        if (request.reason == TransitionReason::Timeout) {
            m_next_timeout_attempt = now + m_timeout_retry;
        }
        return false;
    }

    const bool enable = request.enable_privacy;
    log_secondary(enable ? "Camera LED off" : "Camera LED on", outcome.led);
    log_secondary(enable ? "IR off" : "IR auto", outcome.ir);
    log_secondary(enable ? "Microphone off" : "Microphone on", outcome.mic);

    if (m_state.privacy_enabled == enable) {
        return false;
    }

    m_state.privacy_enabled = enable;
    if (enable) {
        m_state.enabled_at = now;
    } else {
        m_state.enabled_at.reset();
    }
    m_next_timeout_attempt.reset();

    if (enable) {
        if (m_spec.timeout_minutes > 0) {
            g_message("[%s] Privacy ENABLED, auto-disable in %d minutes", m_spec.name.c_str(),
                      m_spec.timeout_minutes);
        } else {
            g_message("[%s] Privacy ENABLED", m_spec.name.c_str());
        }
    } else {
        g_message("[%s] Privacy DISABLED (%s)", m_spec.name.c_str(), transition_reason_name(request.reason));
    }

    if (!m_store.save(m_state)) {
        g_warning("[%s] Could not persist privacy state; it will be lost on restart", m_spec.name.c_str());
    }
    return true;
}
