#ifndef FEATURES_POLLING_SCHEDULER_HPP
#define FEATURES_POLLING_SCHEDULER_HPP

#include "core/models.hpp"

#include <glib.h>
#include <glibmm/main.h>

#include <chrono>
#include <cstddef>

class PrivacyController;

// Fixed-tick cooperative loop on the default GLib main context. The wait between
// ticks is the only place the daemon blocks; adapter calls finish on worker threads
// and come back through the same context.
class PollingScheduler {
public:
    PollingScheduler(PrivacyController& controller, const GlobalSettings& settings);
    ~PollingScheduler();

    PollingScheduler(const PollingScheduler&) = delete;
    PollingScheduler& operator=(const PollingScheduler&) = delete;

    // Applies the startup delay, then ticks until a stop completes. SIGINT and
    // SIGTERM request a stop; a second signal stops without waiting.
    void run();

    // Stops ticking and waits, up to the grace period, for in-flight transitions.
    void request_stop();

    bool stopping() const { return m_stopping; }
    std::size_t ticks() const { return m_ticks; }

private:
    void start_ticking();
    bool on_tick();
    bool on_drain_check();
    void remove_signal_sources();
    static gboolean on_unix_signal(gpointer data);

    PrivacyController& m_controller;
    unsigned int m_interval_ms;
    unsigned int m_startup_delay_seconds;
    std::chrono::milliseconds m_grace;

    Glib::RefPtr<Glib::MainLoop> m_loop;
    sigc::connection m_start_connection;
    sigc::connection m_tick_connection;
    sigc::connection m_drain_connection;
    guint m_sigint_source = 0;
    guint m_sigterm_source = 0;
    bool m_stopping = false;
    std::chrono::steady_clock::time_point m_drain_deadline;
    std::size_t m_ticks = 0;
};

#endif
