#ifndef FEATURES_TRANSITION_RUNNER_HPP
#define FEATURES_TRANSITION_RUNNER_HPP

#include "core/privacy_state_machine.hpp"
#include "platform/remote_control.hpp"

#include <glibmm/dispatcher.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

// Executes the remote half of transitions. Completion handlers always run on the
// thread that owns the polling loop.
class TransitionRunner {
public:
    using CompletionHandler = std::function<void(const TransitionOutcome&)>;

    virtual ~TransitionRunner() = default;

    virtual void submit(const TransitionRequest& request, CompletionHandler on_complete) = 0;
    virtual std::size_t in_flight() const = 0;
};

// Runs each transition to completion inside submit().
class InlineTransitionRunner : public TransitionRunner {
public:
    explicit InlineTransitionRunner(std::shared_ptr<RemoteControl> remote);

    void submit(const TransitionRequest& request, CompletionHandler on_complete) override;
    std::size_t in_flight() const override { return 0; }

private:
    std::shared_ptr<RemoteControl> m_remote;
};

// One worker thread per transition. Outcomes are posted to a mailbox and handed back
// to the main loop through a Glib::Dispatcher, so a hung remote call never holds up
// the tick. Must be constructed on the main-loop thread.
class ThreadedTransitionRunner : public TransitionRunner {
public:
    explicit ThreadedTransitionRunner(std::shared_ptr<RemoteControl> remote);
    ~ThreadedTransitionRunner() override;

    ThreadedTransitionRunner(const ThreadedTransitionRunner&) = delete;
    ThreadedTransitionRunner& operator=(const ThreadedTransitionRunner&) = delete;

    void submit(const TransitionRequest& request, CompletionHandler on_complete) override;
    std::size_t in_flight() const override;

private:
    // Outlives the runner when a worker is abandoned at shutdown.
    struct Mailbox {
        std::mutex mutex;
        std::deque<std::pair<unsigned long, TransitionOutcome>> finished;
        Glib::Dispatcher* dispatcher = nullptr;
    };

    struct Job {
        std::thread worker;
        CompletionHandler on_complete;
    };

    void on_dispatch();

    std::shared_ptr<RemoteControl> m_remote;
    std::shared_ptr<Mailbox> m_mailbox;
    Glib::Dispatcher m_dispatcher;
    std::map<unsigned long, Job> m_jobs;
    unsigned long m_next_id = 1;
};

#endif
