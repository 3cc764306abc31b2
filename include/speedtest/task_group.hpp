#pragma once
#include <atomic>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

/**
* @file
* @brief A set of independently running handler threads with join-on-demand.
*
* The dispatcher starts one thread per accepted connection or request. Finished
* threads are joined lazily by @ref speedtest::TaskGroup::reap (called from the
* dispatch loop) and the remainder by @ref speedtest::TaskGroup::join_all at shutdown,
* so every handler runs to its own completion and none is detached.
*/

namespace speedtest {

/**
* @brief Starts a thread running the given function.
*
* May throw @c std::system_error when the system cannot create another thread;
* the function has not run in that case.
*/
using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

/// @brief Launcher backed by the @c std::thread constructor.
ThreadLauncher default_launcher();

class TaskGroup {
public:
    explicit TaskGroup(ThreadLauncher launch = nullptr);
    ~TaskGroup() { join_all(); }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /**
     * @brief Run @p fn on a new thread. Exceptions escaping @p fn are logged and dropped.
     * @return false if no thread could be started; @p fn is then discarded unrun.
     */
    bool spawn(std::function<void()> fn);

    /// @brief Join threads that have already finished. @return How many were joined.
    size_t reap();

    /// @brief Wait for every thread, finished or not.
    void join_all();

    /// @brief Threads spawned and not yet joined.
    size_t size() const;

private:
    struct Task {
        std::thread                        th;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ThreadLauncher     launch_;
    mutable std::mutex mu_;
    std::list<Task>    tasks_;
};

} // namespace speedtest
