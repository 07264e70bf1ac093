#ifndef CORE_PRIVACY_STATE_MACHINE_HPP
#define CORE_PRIVACY_STATE_MACHINE_HPP

#include "core/models.hpp"
#include "platform/remote_control.hpp"

#include <optional>
#include <string>

class StateStore;

enum class TransitionReason { ButtonPress, Timeout };

const char* transition_reason_name(TransitionReason reason);

struct TransitionRequest {
    std::string camera_name;
    bool enable_privacy = false;
    TransitionReason reason = TransitionReason::ButtonPress;
    TimePoint requested_at{};
};

struct TransitionOutcome {
    TransitionRequest request;
    RemoteResult privacy = RemoteResult::TransientFailure;
    std::optional<RemoteResult> led;
    std::optional<RemoteResult> ir;
    std::optional<RemoteResult> mic;

    bool confirmed() const { return privacy == RemoteResult::Ok; }
};

// Remote half of a transition. The privacy toggle goes first; LED, IR and mic are
// only attempted once the remote side has confirmed it.
TransitionOutcome execute_transition(RemoteControl& remote, const TransitionRequest& request);

// Per-camera PrivacyOff/PrivacyOn machine. Events produce a TransitionRequest that
// the caller executes against the remote; the state only changes, and is only
// persisted, when on_transition_complete receives a confirmed outcome. While a
// request is outstanding every further event is coalesced into it.
class CameraStateMachine {
public:
    CameraStateMachine(CameraSpec spec, PrivacyState initial, StateStore& store, int timeout_retry_seconds = 30);

    std::optional<TransitionRequest> on_press(TimePoint now);
    std::optional<TransitionRequest> on_timeout_check(TimePoint now);

    // Returns true when the state changed.
    bool on_transition_complete(const TransitionOutcome& outcome, TimePoint now);

    const CameraSpec& spec() const { return m_spec; }
    const PrivacyState& state() const { return m_state; }
    bool privacy_enabled() const { return m_state.privacy_enabled; }
    bool transition_pending() const { return m_pending.has_value(); }
    std::optional<TimePoint> timeout_deadline() const;

private:
    TransitionRequest make_request(bool enable, TransitionReason reason, TimePoint now);
    void log_secondary(const char* what, const std::optional<RemoteResult>& result) const;

    CameraSpec m_spec;
    PrivacyState m_state;
    StateStore& m_store;
    std::chrono::seconds m_timeout_retry;
    std::optional<TransitionRequest> m_pending;
    std::optional<TimePoint> m_next_timeout_attempt;
};

#endif
