#include "echo/dispatcher.hpp"

#include "echo/log.hpp"

#include <exception>

namespace echo {

std::string_view to_string(dispatch_mode mode) {
    switch (mode) {
    case dispatch_mode::single_threaded: return "single";
    case dispatch_mode::thread_per_connection: return "multi";
    }
    return "unknown";
}

void dispatcher::run_counted(const task& work) {
    ++active_;
    try {
        work();
    } catch (const std::exception& e) {
        log::error("Connection task error: ", e.what());
    }
    --active_;
}

void inline_dispatcher::dispatch(task work) {
    run_counted(work);
}

thread_dispatcher::~thread_dispatcher() {
    join_all();
}

void thread_dispatcher::dispatch(task work) {
    reap_finished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, done, work = std::move(work)]() {
        run_counted(work);
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(worker{std::move(thread), std::move(done)});
}

void thread_dispatcher::join_all() {
    std::list<worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }

    for (auto& w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

std::size_t thread_dispatcher::pending_threads() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

void thread_dispatcher::reap_finished() {
    std::list<worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }

    // Joining outside the lock; these threads are already past their work
    for (auto& w : finished) {
        w.thread.join();
    }
}

std::unique_ptr<dispatcher> make_dispatcher(dispatch_mode mode) {
    if (mode == dispatch_mode::single_threaded) {
        return std::make_unique<inline_dispatcher>();
    }
    return std::make_unique<thread_dispatcher>();
}

} // namespace echo
