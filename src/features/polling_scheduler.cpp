#include "features/polling_scheduler.hpp"

#include "features/privacy_controller.hpp"

#include <glib-unix.h>

#include <algorithm>
#include <cmath>
#include <csignal>

namespace {
constexpr unsigned int kDrainCheckMs = 50;
}

PollingScheduler::PollingScheduler(PrivacyController& controller, const GlobalSettings& settings)
    : m_controller(controller),
      m_interval_ms(static_cast<unsigned int>(std::max(1L, std::lround(settings.polling_interval_seconds * 1000.0)))),
      m_startup_delay_seconds(static_cast<unsigned int>(std::max(0, settings.startup_delay_seconds))),
      m_grace(std::lround(settings.shutdown_grace_seconds * 1000.0)) {}

PollingScheduler::~PollingScheduler() {
    m_start_connection.disconnect();
    m_tick_connection.disconnect();
    m_drain_connection.disconnect();
    remove_signal_sources();
}

void PollingScheduler::run() {
    m_loop = Glib::MainLoop::create();
    m_stopping = false;

    m_sigint_source = g_unix_signal_add(SIGINT, &PollingScheduler::on_unix_signal, this);
    m_sigterm_source = g_unix_signal_add(SIGTERM, &PollingScheduler::on_unix_signal, this);

    if (m_startup_delay_seconds > 0) {
        g_message("Waiting %us for system startup...", m_startup_delay_seconds);
        m_start_connection = Glib::signal_timeout().connect_seconds_once(
            sigc::mem_fun(*this, &PollingScheduler::start_ticking), m_startup_delay_seconds);
    } else {
        start_ticking();
    }

    m_loop->run();

    remove_signal_sources();
    m_drain_connection.disconnect();
    m_loop.reset();
}

void PollingScheduler::start_ticking() {
    if (m_stopping) {
        return;
    }

    g_message("Polling %zu camera(s) every %u ms", m_controller.active_cameras().size(), m_interval_ms);
    m_tick_connection = Glib::signal_timeout().connect(sigc::mem_fun(*this, &PollingScheduler::on_tick),
                                                       m_interval_ms);
}

bool PollingScheduler::on_tick() {
    ++m_ticks;
    m_controller.tick();
    return true;
}

void PollingScheduler::request_stop() {
    if (m_stopping) {
        return;
    }
    m_stopping = true;

    m_start_connection.disconnect();
    m_tick_connection.disconnect();
    m_controller.begin_shutdown();

    m_drain_deadline = std::chrono::steady_clock::now() + m_grace;
    m_drain_connection = Glib::signal_timeout().connect(sigc::mem_fun(*this, &PollingScheduler::on_drain_check),
                                                        kDrainCheckMs);
}

bool PollingScheduler::on_drain_check() {
    std::size_t pending = m_controller.pending_transitions();
    if (pending > 0 && std::chrono::steady_clock::now() < m_drain_deadline) {
        return true;
    }

    if (pending > 0) {
        g_warning("Shutdown grace period over with %zu transition(s) still in flight", pending);
    }
    if (m_loop) {
        m_loop->quit();
    }
    return false;
}

void PollingScheduler::remove_signal_sources() {
    if (m_sigint_source != 0) {
        g_source_remove(m_sigint_source);
        m_sigint_source = 0;
    }
    if (m_sigterm_source != 0) {
        g_source_remove(m_sigterm_source);
        m_sigterm_source = 0;
    }
}

gboolean PollingScheduler::on_unix_signal(gpointer data) {
    auto* self = static_cast<PollingScheduler*>(data);
    if (self->m_stopping) {
        g_message("Second stop signal, exiting without waiting");
        if (self->m_loop) {
            self->m_loop->quit();
        }
        return G_SOURCE_CONTINUE;
    }

    g_message("Received stop signal, shutting down...");
    self->request_stop();
    return G_SOURCE_CONTINUE;
}
