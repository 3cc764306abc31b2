/**
* @file
* @brief TaskGroup: spawn, lazy reaping and final join of handler threads.
*/

#include "speedtest/task_group.hpp"
#include "speedtest/log.hpp"

#include <exception>
#include <system_error>

namespace speedtest {

ThreadLauncher default_launcher() {
    return [](std::function<void()> fn) { return std::thread(std::move(fn)); };
}

TaskGroup::TaskGroup(ThreadLauncher launch)
: launch_(launch ? std::move(launch) : default_launcher()) {}

bool TaskGroup::spawn(std::function<void()> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread th;
    try {
        th = launch_([fn = std::move(fn), done]() {
            try {
                fn();
            } catch (const std::exception& e) {
                // Handlers report their own failures; this only guards the thread boundary.
                log_error("task", std::string("handler terminated: ") + e.what());
            }
            done->store(true);
        });
    } catch (const std::system_error& e) {
        log_error("task", std::string("cannot start handler thread: ") + e.what());
        return false;
    }
    std::lock_guard<std::mutex> lg(mu_);
    tasks_.push_back(Task{std::move(th), std::move(done)});
    return true;
}

size_t TaskGroup::reap() {
    std::list<Task> finished;
    {
        std::lock_guard<std::mutex> lg(mu_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            auto next = std::next(it);
            if (it->done->load()) finished.splice(finished.end(), tasks_, it);
            it = next;
        }
    }
    for (auto& t : finished) t.th.join();
    return finished.size();
}

void TaskGroup::join_all() {
    std::list<Task> all;
    {
        std::lock_guard<std::mutex> lg(mu_);
        all.swap(tasks_);
    }
    for (auto& t : all)
        if (t.th.joinable()) t.th.join();
}

size_t TaskGroup::size() const {
    std::lock_guard<std::mutex> lg(mu_);
    return tasks_.size();
}

} // namespace speedtest
