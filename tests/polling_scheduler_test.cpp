#undef NDEBUG
#include "features/polling_scheduler.hpp"
#include "features/privacy_controller.hpp"

#include "test_support.hpp"

#include <glibmm/init.h>
#include <glibmm/main.h>

#include <cassert>
#include <csignal>
#include <memory>

namespace {
constexpr int kButton = 18;

DaemonConfig one_camera(double grace_seconds) {
    DaemonConfig config;
    CameraSpec camera;
    camera.name = "Bedroom";
    camera.input_pin = kButton;
    config.cameras = {camera};
    config.settings.debounce_seconds = 0.05;
    config.settings.polling_interval_seconds = 0.01;
    config.settings.startup_delay_seconds = 0;
    config.settings.shutdown_grace_seconds = grace_seconds;
    return config;
}

void after(unsigned int ms, const std::function<void()>& action) {
    Glib::signal_timeout().connect_once(action, ms);
}

struct Daemon {
    explicit Daemon(const std::string& state_template, double grace_seconds = 5.0)
        : config(one_camera(grace_seconds)),
          remote(std::make_shared<FakeRemote>()),
          runner(remote),
          store(state_template),
          controller(config, gpio, *remote, runner, store, clock),
          scheduler(controller, config.settings) {
        controller.start();
    }

    DaemonConfig config;
    SystemClock clock;
    FakeGpio gpio;
    std::shared_ptr<FakeRemote> remote;
    ThreadedTransitionRunner runner;
    StateStore store;
    PrivacyController controller;
    PollingScheduler scheduler;
};
}

int main() {
    Glib::init();
    TempDir dir;

    {
        // A held button is picked up by the tick loop and applied through the runner.
        Daemon daemon(dir.file("press_{camera}.json"));
        after(50, [&daemon]() { daemon.gpio.press(kButton); });
        after(300, [&daemon]() { daemon.gpio.release_button(kButton); });
        after(600, [&daemon]() { daemon.scheduler.request_stop(); });
        daemon.scheduler.run();

        assert(daemon.scheduler.stopping());
        assert(daemon.scheduler.ticks() > 10);
        assert(!daemon.controller.accepting_events());
        assert(daemon.controller.camera("Bedroom")->privacy_enabled());
        assert(daemon.remote->count("privacy", "Bedroom") == 1);
        assert(daemon.store.load({"Bedroom"}, daemon.clock.now()).at("Bedroom").privacy_enabled);
    }

    {
        // A stop waits for the in-flight transition and applies it.
        Daemon daemon(dir.file("drain_{camera}.json"));
        daemon.remote->block("Bedroom");
        after(20, [&daemon]() { daemon.gpio.press(kButton); });
        after(300, [&daemon]() {
            assert(daemon.controller.pending_transitions() == 1);
            daemon.scheduler.request_stop();
        });
        after(500, [&daemon]() { daemon.remote->unblock("Bedroom"); });
        daemon.scheduler.run();

        assert(daemon.controller.pending_transitions() == 0);
        assert(daemon.controller.camera("Bedroom")->privacy_enabled());
        daemon.controller.shutdown();
        assert(daemon.gpio.release_all_calls() == 1);
    }

    {
        // The grace period bounds the wait.
        Daemon daemon(dir.file("grace_{camera}.json"), 0.2);
        daemon.remote->block("Bedroom");
        after(20, [&daemon]() { daemon.gpio.press(kButton); });
        after(300, [&daemon]() { daemon.scheduler.request_stop(); });
        daemon.scheduler.run();

        assert(daemon.controller.pending_transitions() == 1);
        assert(!daemon.controller.camera("Bedroom")->privacy_enabled());

        daemon.remote->unblock("Bedroom");
        auto context = Glib::MainContext::get_default();
        while (daemon.controller.pending_transitions() > 0) {
            context->iteration(true);
        }
    }

    {
        // SIGTERM starts the same graceful stop.
        Daemon daemon(dir.file("signal_{camera}.json"));
        after(100, []() { raise(SIGTERM); });
        daemon.scheduler.run();
        assert(daemon.scheduler.stopping());
        assert(daemon.scheduler.ticks() > 0);
    }

    {
        // Nothing ticks during the startup delay.
        DaemonConfig config = one_camera(1.0);
        config.settings.startup_delay_seconds = 1;
        SystemClock clock;
        FakeGpio gpio;
        auto remote = std::make_shared<FakeRemote>();
        ThreadedTransitionRunner runner(remote);
        StateStore store(dir.file("delay_{camera}.json"));
        PrivacyController controller(config, gpio, *remote, runner, store, clock);
        controller.start();
        PollingScheduler scheduler(controller, config.settings);
        after(300, [&scheduler]() { scheduler.request_stop(); });
        scheduler.run();
        assert(scheduler.ticks() == 0);
        assert(gpio.reads() == 0);
    }

    return 0;
}
