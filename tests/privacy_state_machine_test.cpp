#undef NDEBUG
#include "core/privacy_state_machine.hpp"
#include "core/state_store.hpp"

#include "test_support.hpp"

#include <cassert>

namespace {
CameraSpec camera(const std::string& name, int timeout_minutes) {
    CameraSpec spec;
    spec.name = name;
    spec.input_pin = 18;
    spec.timeout_minutes = timeout_minutes;
    return spec;
}

PrivacyState off_state(const std::string& name) {
    PrivacyState state;
    state.camera_name = name;
    return state;
}

bool run(CameraStateMachine& machine, FakeRemote& remote, const std::optional<TransitionRequest>& request,
         TimePoint now) {
    assert(request);
    return machine.on_transition_complete(execute_transition(remote, *request), now);
}
}

int main() {
    TempDir dir;
    ManualClock clock;
    const TimePoint t0 = clock.now();

    {
        // Press enables with the full set of remote effects, then disables.
        FakeRemote remote;
        StateStore store(dir.file("a_{camera}.json"));
        CameraStateMachine machine(camera("Bedroom", 60), off_state("Bedroom"), store);

        assert(run(machine, remote, machine.on_press(t0), t0));
        assert(machine.privacy_enabled());
        assert(machine.state().enabled_at == t0);
        assert(privacy_state_consistent(machine.state()));

        auto calls = remote.calls();
        assert(calls.size() == 4);
        assert(calls[0].capability == "privacy" && calls[0].value == "on");
        assert(calls[1].capability == "led" && calls[1].value == "off");
        assert(calls[2].capability == "ir" && calls[2].value == "off");
        assert(calls[3].capability == "mic" && calls[3].value == "off");

        auto stored = store.load({"Bedroom"}, t0);
        assert(stored.at("Bedroom") == machine.state());

        assert(run(machine, remote, machine.on_press(t0 + millis(5000)), t0 + millis(5000)));
        assert(!machine.privacy_enabled());
        assert(!machine.state().enabled_at);
        calls = remote.calls();
        assert(calls[4].value == "off" && calls[5].value == "on" && calls[6].value == "auto" &&
               calls[7].value == "on");
        assert(!store.load({"Bedroom"}, t0).at("Bedroom").privacy_enabled);
    }

    {
        // A failed privacy toggle leaves state and store untouched; the next press retries.
        FakeRemote remote;
        StateStore store(dir.file("b_{camera}.json"));
        CameraStateMachine machine(camera("Kitchen", 0), off_state("Kitchen"), store);

        remote.fail("privacy", "Kitchen", RemoteResult::TransientFailure);
        assert(!run(machine, remote, machine.on_press(t0), t0));
        assert(!machine.privacy_enabled());
        assert(!machine.transition_pending());
        assert(remote.count("led", "Kitchen") == 0);
        assert(store.load({"Kitchen"}, t0).empty());

        remote.heal("privacy", "Kitchen");
        assert(run(machine, remote, machine.on_press(t0 + millis(1000)), t0 + millis(1000)));
        assert(machine.privacy_enabled());
        assert(remote.count("privacy", "Kitchen") == 2);
    }

    {
        // Secondary failures are tolerated.
        FakeRemote remote;
        StateStore store(dir.file("c_{camera}.json"));
        CameraStateMachine machine(camera("Kitchen", 0), off_state("Kitchen"), store);
        remote.fail("led", "Kitchen", RemoteResult::Unsupported);
        remote.fail("ir", "Kitchen", RemoteResult::TransientFailure);
        remote.fail("mic", "Kitchen", RemoteResult::CameraNotFound);
        assert(run(machine, remote, machine.on_press(t0), t0));
        assert(machine.privacy_enabled());
    }

    {
        // Duplicate events while a transition is outstanding are coalesced.
        FakeRemote remote;
        StateStore store(dir.file("d_{camera}.json"));
        CameraStateMachine machine(camera("Bedroom", 1), off_state("Bedroom"), store);

        auto first = machine.on_press(t0);
        assert(first && first->enable_privacy);
        assert(machine.transition_pending());
        assert(!machine.on_press(t0 + millis(10)));
        assert(!machine.on_press(t0 + millis(20)));

        TransitionOutcome outcome = execute_transition(remote, *first);
        assert(machine.on_transition_complete(outcome, t0 + millis(30)));
        // Delivering the same outcome again is a no-op.
        assert(!machine.on_transition_complete(outcome, t0 + millis(40)));
        assert(remote.count("privacy", "Bedroom") == 1);
        assert(machine.state().enabled_at == t0 + millis(30));
    }

    {
        // Timeout fires at the first check with now >= t0 + T minutes, never earlier.
        FakeRemote remote;
        StateStore store(dir.file("e_{camera}.json"));
        CameraStateMachine machine(camera("Bedroom", 60), off_state("Bedroom"), store);
        run(machine, remote, machine.on_press(t0), t0);

        const TimePoint deadline = t0 + std::chrono::minutes(60);
        assert(machine.timeout_deadline() == deadline);
        assert(!machine.on_timeout_check(deadline - millis(1)));
        auto request = machine.on_timeout_check(deadline);
        assert(request && !request->enable_privacy && request->reason == TransitionReason::Timeout);
        assert(!machine.on_timeout_check(deadline + millis(100)));
        assert(machine.on_transition_complete(execute_transition(remote, *request), deadline));
        assert(!machine.privacy_enabled());
        assert(!machine.timeout_deadline());
        assert(!machine.on_timeout_check(deadline + std::chrono::hours(5)));
    }

    {
        // Timeout 0 never auto-disables.
        FakeRemote remote;
        StateStore store(dir.file("f_{camera}.json"));
        CameraStateMachine machine(camera("Kitchen", 0), off_state("Kitchen"), store);
        run(machine, remote, machine.on_press(t0), t0);
        assert(!machine.timeout_deadline());
        assert(!machine.on_timeout_check(t0 + std::chrono::hours(24 * 30)));
        assert(machine.privacy_enabled());
    }

    {
        // A failed timeout disable is retried only after the retry interval.
        FakeRemote remote;
        StateStore store(dir.file("g_{camera}.json"));
        CameraStateMachine machine(camera("Bedroom", 1), off_state("Bedroom"), store, 30);
        run(machine, remote, machine.on_press(t0), t0);

        const TimePoint deadline = t0 + std::chrono::minutes(1);
        remote.fail("privacy", "Bedroom", RemoteResult::TransientFailure);
        assert(!run(machine, remote, machine.on_timeout_check(deadline), deadline));
        assert(machine.privacy_enabled());
        assert(!machine.on_timeout_check(deadline + std::chrono::seconds(29)));

        remote.heal("privacy", "Bedroom");
        auto retry = machine.on_timeout_check(deadline + std::chrono::seconds(30));
        assert(retry);
        assert(machine.on_transition_complete(execute_transition(remote, *retry), deadline + std::chrono::seconds(30)));
        assert(!machine.privacy_enabled());
    }

    {
        // Restored state keeps its original start time for the timeout.
        FakeRemote remote;
        StateStore store(dir.file("h_{camera}.json"));
        PrivacyState restored;
        restored.camera_name = "Bedroom";
        restored.privacy_enabled = true;
        restored.enabled_at = t0 - std::chrono::minutes(59);
        CameraStateMachine machine(camera("Bedroom", 60), restored, store);
        assert(!machine.on_timeout_check(t0));
        assert(machine.on_timeout_check(t0 + std::chrono::minutes(1)));
    }

    return 0;
}
