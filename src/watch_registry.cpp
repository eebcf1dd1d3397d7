#include "cryguard/watch_registry.hpp"

#include <iostream>
#include <tuple>
#include <vector>

namespace cryguard {

WatchRegistry::WatchRegistry(Sink sink, Producer producer)
    : sink_(std::move(sink)), producer_(std::move(producer)) {}

WatchRegistry::~WatchRegistry() {
    cancel_all();
}

void WatchRegistry::start(const std::string& origin, std::chrono::milliseconds period) {
    cancel(origin);
    auto task = std::make_shared<Task>();
    {
        std::lock_guard<std::mutex> lock(mu_);
        tasks_[origin] = task;
    }
    task->worker = std::thread(&WatchRegistry::run, this, task, origin, period);
}

bool WatchRegistry::cancel(const std::string& origin) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = tasks_.find(origin);
        if (it == tasks_.end()) return false;
        task = it->second;
        tasks_.erase(it);
    }
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(task->mu);
        was_running = !task->finished;
    }
    stop_task(task);
    return was_running;
}

void WatchRegistry::cancel_all() {
    std::vector<std::shared_ptr<Task>> all;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto& kv : tasks_) all.push_back(kv.second);
        tasks_.clear();
    }
    for (auto& task : all) stop_task(task);
}

bool WatchRegistry::active(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tasks_.find(origin);
    if (it == tasks_.end()) return false;
    std::lock_guard<std::mutex> task_lock(it->second->mu);
    return !it->second->finished;
}

size_t WatchRegistry::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& kv : tasks_) {
        std::lock_guard<std::mutex> task_lock(kv.second->mu);
        if (!kv.second->finished) ++n;
    }
    return n;
}

void WatchRegistry::stop_task(const std::shared_ptr<Task>& task) {
    {
        std::lock_guard<std::mutex> lock(task->mu);
        task->cancelled = true;
    }
    task->cv.notify_all();
    if (task->worker.joinable() && task->worker.get_id() != std::this_thread::get_id()) {
        task->worker.join();
    } else if (task->worker.joinable()) {
        task->worker.detach();
    }
}

void WatchRegistry::run(std::shared_ptr<Task> task, std::string origin, std::chrono::milliseconds period) {
    std::unique_lock<std::mutex> lock(task->mu);
    while (!task->cancelled) {
        // Emission happens under the task lock so cancel() cannot slip in between.
        bool keep = false;
        std::string text;
        try {
            std::tie(keep, text) = producer_();
            sink_(origin, text);
        } catch (const std::exception& e) {
            std::cerr << "[WARN] Watch task for " << origin << " failed: " << e.what() << std::endl;
            keep = false;
        }
        if (!keep) break;
        task->cv.wait_for(lock, period, [&] { return task->cancelled; });
    }
    task->finished = true;
}

}  // namespace cryguard
