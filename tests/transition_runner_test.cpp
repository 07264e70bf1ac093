#undef NDEBUG
#include "features/transition_runner.hpp"

#include "test_support.hpp"

#include <glibmm/init.h>
#include <glibmm/main.h>

#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace {
TransitionRequest enable(const std::string& camera) {
    TransitionRequest request;
    request.camera_name = camera;
    request.enable_privacy = true;
    request.requested_at = ManualClock().now();
    return request;
}

void iterate_until(const std::function<bool()>& done) {
    auto context = Glib::MainContext::get_default();
    while (!done()) {
        context->iteration(true);
    }
}
}

int main() {
    Glib::init();
    auto remote = std::make_shared<FakeRemote>();

    {
        InlineTransitionRunner runner(remote);
        bool called = false;
        runner.submit(enable("Bedroom"), [&called](const TransitionOutcome& outcome) {
            called = true;
            assert(outcome.confirmed());
            assert(outcome.led == RemoteResult::Ok);
        });
        assert(called);
        assert(runner.in_flight() == 0);
    }

    {
        // A hung camera does not hold up the others; completions arrive on this thread.
        ThreadedTransitionRunner runner(remote);
        const std::thread::id main_thread = std::this_thread::get_id();
        std::vector<TransitionOutcome> done;
        auto record = [&done, main_thread](const TransitionOutcome& outcome) {
            assert(std::this_thread::get_id() == main_thread);
            done.push_back(outcome);
        };

        remote->block("Bedroom");
        runner.submit(enable("Bedroom"), record);
        runner.submit(enable("Kitchen"), record);
        assert(runner.in_flight() == 2);

        iterate_until([&done]() { return done.size() == 1; });
        assert(done[0].request.camera_name == "Kitchen");
        assert(done[0].confirmed());
        assert(done[0].mic == RemoteResult::Ok);
        assert(runner.in_flight() == 1);

        remote->unblock("Bedroom");
        iterate_until([&done]() { return done.size() == 2; });
        assert(done[1].request.camera_name == "Bedroom");
        assert(runner.in_flight() == 0);
    }

    {
        // Failures come back as outcomes, not exceptions.
        remote->fail("privacy", "Kitchen", RemoteResult::CameraNotFound);
        ThreadedTransitionRunner runner(remote);
        std::optional<TransitionOutcome> result;
        runner.submit(enable("Kitchen"), [&result](const TransitionOutcome& outcome) { result = outcome; });
        iterate_until([&result]() { return result.has_value(); });
        assert(!result->confirmed());
        assert(result->privacy == RemoteResult::CameraNotFound);
        assert(!result->led && !result->ir && !result->mic);
        remote->heal("privacy", "Kitchen");
    }

    {
        // A runner destroyed with work outstanding abandons it without calling back.
        const std::size_t before = remote->count("privacy", "Bedroom");
        bool called = false;
        remote->block("Bedroom");
        {
            ThreadedTransitionRunner runner(remote);
            runner.submit(enable("Bedroom"), [&called](const TransitionOutcome&) { called = true; });
            remote->wait_for_privacy_calls("Bedroom", before + 1);
        }
        remote->unblock("Bedroom");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        while (Glib::MainContext::get_default()->iteration(false)) {
        }
        assert(!called);
    }

    return 0;
}
