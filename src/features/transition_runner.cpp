#include "features/transition_runner.hpp"

#include <glib.h>

#include <utility>
#include <vector>

InlineTransitionRunner::InlineTransitionRunner(std::shared_ptr<RemoteControl> remote)
    : m_remote(std::move(remote)) {}

void InlineTransitionRunner::submit(const TransitionRequest& request, CompletionHandler on_complete) {
    TransitionOutcome outcome = execute_transition(*m_remote, request);
    if (on_complete) {
        on_complete(outcome);
    }
}

ThreadedTransitionRunner::ThreadedTransitionRunner(std::shared_ptr<RemoteControl> remote)
    : m_remote(std::move(remote)), m_mailbox(std::make_shared<Mailbox>()) {
    m_mailbox->dispatcher = &m_dispatcher;
    m_dispatcher.connect(sigc::mem_fun(*this, &ThreadedTransitionRunner::on_dispatch));
}

ThreadedTransitionRunner::~ThreadedTransitionRunner() {
    {
        std::lock_guard<std::mutex> lock(m_mailbox->mutex);
        m_mailbox->dispatcher = nullptr;
    }

    for (auto& entry : m_jobs) {
        if (entry.second.worker.joinable()) {
            g_warning("Abandoning unfinished transition for a camera; its result will not be saved");
            entry.second.worker.detach();
        }
    }
}

void ThreadedTransitionRunner::submit(const TransitionRequest& request, CompletionHandler on_complete) {
    const unsigned long id = m_next_id++;
    Job& job = m_jobs[id];
    job.on_complete = std::move(on_complete);

    std::shared_ptr<RemoteControl> remote = m_remote;
    std::shared_ptr<Mailbox> mailbox = m_mailbox;
    job.worker = std::thread([remote, mailbox, request, id]() {
        TransitionOutcome outcome = execute_transition(*remote, request);

        std::lock_guard<std::mutex> lock(mailbox->mutex);
        mailbox->finished.emplace_back(id, std::move(outcome));
        if (mailbox->dispatcher) {
            mailbox->dispatcher->emit();
        }
    });
}

std::size_t ThreadedTransitionRunner::in_flight() const {
    return m_jobs.size();
}

void ThreadedTransitionRunner::on_dispatch() {
    std::deque<std::pair<unsigned long, TransitionOutcome>> finished;
    {
        std::lock_guard<std::mutex> lock(m_mailbox->mutex);
        finished.swap(m_mailbox->finished);
    }

    for (auto& entry : finished) {
        auto it = m_jobs.find(entry.first);
        if (it == m_jobs.end()) {
            continue;
        }

        if (it->second.worker.joinable()) {
            it->second.worker.join();
        }
        CompletionHandler handler = std::move(it->second.on_complete);
        m_jobs.erase(it);

        if (handler) {
            handler(entry.second);
        }
    }
}
