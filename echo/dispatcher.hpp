/**
 * @file dispatcher.hpp
 * @brief Where connection work runs: inline on the accept thread, or on a
 *        thread of its own
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace echo {

enum class dispatch_mode { single_threaded, thread_per_connection };

std::string_view to_string(dispatch_mode mode);

/**
 * @class dispatcher
 * @brief Runs one unit of connection work per dispatch() call
 */
class dispatcher {
public:
    using task = std::function<void()>;

    virtual ~dispatcher() = default;

    virtual void dispatch(task work) = 0;

    /**
     * @brief Block until every dispatched task has finished
     */
    virtual void join_all() = 0;

    /**
     * @brief Number of tasks currently executing
     */
    std::size_t active() const { return active_.load(); }

protected:
    /// Runs work and keeps active() accurate even if it throws
    void run_counted(const task& work);

private:
    std::atomic<std::size_t> active_{0};
};

/**
 * @class inline_dispatcher
 * @brief Runs each task to completion on the calling thread
 */
class inline_dispatcher : public dispatcher {
public:
    void dispatch(task work) override;
    void join_all() override {}
};

/**
 * @class thread_dispatcher
 * @brief One std::thread per task
 *
 * Finished threads are joined on the next dispatch(); join_all() joins the
 * rest. The destructor joins as well, so no thread outlives the dispatcher.
 */
class thread_dispatcher : public dispatcher {
public:
    ~thread_dispatcher() override;

    void dispatch(task work) override;
    void join_all() override;

    /**
     * @brief Threads started but not yet joined
     */
    std::size_t pending_threads() const;

private:
    struct worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex workers_mutex_;
    std::list<worker> workers_;

    void reap_finished();
};

std::unique_ptr<dispatcher> make_dispatcher(dispatch_mode mode);

} // namespace echo
