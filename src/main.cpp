#include "config_io.hpp"
#include "core/clock.hpp"
#include "core/errors.hpp"
#include "core/state_store.hpp"
#include "features/gpio_probe.hpp"
#include "features/polling_scheduler.hpp"
#include "features/privacy_controller.hpp"
#include "features/transition_runner.hpp"
#include "platform/command_remote_control.hpp"
#include "platform/libgpiod_backend.hpp"

#include <glib.h>
#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>

#include <iostream>
#include <memory>
#include <string>

namespace {
const char* const kConsumer = "privacy-buttons";

struct Options {
    std::string config_path = "cameras_config.json";
    bool check_config = false;
    bool list_cameras = false;
    bool probe_gpio = false;
    bool verbose = false;
};

bool parse_options(int argc, char* argv[], Options& options) {
    Glib::OptionContext context("- camera privacy buttons");
    Glib::OptionGroup group("privacy", "Privacy button options", "Show privacy button options");

    Glib::OptionEntry config_entry;
    config_entry.set_long_name("config");
    config_entry.set_short_name('c');
    config_entry.set_arg_description("PATH");
    config_entry.set_description("Camera configuration file (default: cameras_config.json)");
    group.add_entry_filename(config_entry, options.config_path);

    Glib::OptionEntry check_entry;
    check_entry.set_long_name("check-config");
    check_entry.set_description("Validate the configuration and exit");
    group.add_entry(check_entry, options.check_config);

    Glib::OptionEntry list_entry;
    list_entry.set_long_name("list-cameras");
    list_entry.set_description("List the cameras known to the camera-control service and exit");
    group.add_entry(list_entry, options.list_cameras);

    Glib::OptionEntry probe_entry;
    probe_entry.set_long_name("probe-gpio");
    probe_entry.set_description("Blink the LEDs and report button presses, without the camera service");
    group.add_entry(probe_entry, options.probe_gpio);

    Glib::OptionEntry verbose_entry;
    verbose_entry.set_long_name("verbose");
    verbose_entry.set_short_name('v');
    verbose_entry.set_description("Log debug messages");
    group.add_entry(verbose_entry, options.verbose);

    context.set_main_group(group);

    try {
        return context.parse(argc, argv);
    } catch (const Glib::OptionError& e) {
        std::cerr << e.what() << '\n';
        return false;
    }
}

void print_summary(const DaemonConfig& config) {
    std::cout << "Configuration OK\n";
    for (const auto& camera : config.cameras) {
        std::cout << "  - " << camera.name << ": button GPIO " << camera.input_pin;
        if (camera.led_pin) {
            std::cout << ", LED GPIO " << *camera.led_pin;
        }
        std::cout << ", timeout " << camera.timeout_minutes << " min"
                  << (camera.enabled ? "" : " (disabled)") << '\n';
    }

    StateStore store(config.settings.state_file_template);
    std::cout << "  state: " << store.describe() << '\n';
}

int list_remote_cameras(RemoteControl& remote) {
    auto cameras = remote.list_cameras();
    if (!cameras) {
        std::cerr << "Failed to reach the camera-control service\n";
        return 1;
    }

    std::cout << "Found " << cameras->size() << " camera(s)\n";
    for (const auto& camera : *cameras) {
        std::cout << "  - " << camera.name << " (" << camera.id << ")\n";
    }
    return 0;
}

int run_daemon(const DaemonConfig& config, std::shared_ptr<RemoteControl> remote) {
    LibgpiodBackend gpio(config.settings.gpio_chip, kConsumer);
    SystemClock clock;
    StateStore store(config.settings.state_file_template);
    ThreadedTransitionRunner runner(remote);
    PrivacyController controller(config, gpio, *remote, runner, store, clock);

    try {
        gpio.open();
        controller.start();
    } catch (const RemoteUnavailableError& e) {
        std::cerr << "Camera service error: " << e.what() << '\n';
        return 1;
    } catch (const HardwareAcquisitionError& e) {
        std::cerr << "GPIO error: " << e.what() << '\n'
                  << "Check that the user is in the gpio group and the chip name is right\n";
        return 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return 1;
    }

    PollingScheduler scheduler(controller, config.settings);
    scheduler.run();
    controller.shutdown();
    g_message("Privacy button controller stopped");
    return 0;
}
}

int main(int argc, char* argv[]) {
    Glib::init();

    Options options;
    if (!parse_options(argc, argv, options)) {
        return 1;
    }
    if (options.verbose) {
        g_setenv("G_MESSAGES_DEBUG", "all", TRUE);
    }

    DaemonConfig config;
    try {
        config = ConfigIO::loadFile(options.config_path);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return 1;
    }

    if (options.check_config) {
        print_summary(config);
        return 0;
    }

    if (options.probe_gpio) {
        LibgpiodBackend gpio(config.settings.gpio_chip, kConsumer);
        try {
            gpio.open();
        } catch (const HardwareAcquisitionError& e) {
            std::cerr << "GPIO error: " << e.what() << '\n';
            return 1;
        }
        SystemClock clock;
        GpioProbe probe(config, gpio, clock);
        return probe.run();
    }

    if (config.settings.remote_command.empty()) {
        std::cerr << "Configuration error: global_settings.remote_command is required\n";
        return 1;
    }
    auto remote = std::make_shared<CommandRemoteControl>(config.settings.remote_command,
                                                         config.settings.remote_command_timeout_seconds);

    if (options.list_cameras) {
        return list_remote_cameras(*remote);
    }

    g_message("Starting privacy button controller with %zu enabled camera(s)", config.enabled_cameras().size());
    return run_daemon(config, remote);
}
