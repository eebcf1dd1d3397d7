#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace cryguard {

// Periodic status emitters, at most one per origin (operator/chat id).
class WatchRegistry {
public:
    using Sink = std::function<void(const std::string& origin, const std::string& text)>;
    // Returns {keep_watching, text}. The text is emitted either way.
    using Producer = std::function<std::pair<bool, std::string>()>;

    WatchRegistry(Sink sink, Producer producer);
    ~WatchRegistry();

    WatchRegistry(const WatchRegistry&) = delete;
    WatchRegistry& operator=(const WatchRegistry&) = delete;

    // Replaces any task already running for origin. Emits once immediately.
    // The sink runs on the task thread and must not call back into the registry.
    void start(const std::string& origin, std::chrono::milliseconds period);
    // Idempotent. Once this returns, the task emits nothing further.
    // Returns whether a running task existed.
    bool cancel(const std::string& origin);
    void cancel_all();

    bool active(const std::string& origin) const;
    size_t size() const;

private:
    struct Task {
        std::thread worker;
        std::mutex mu;
        std::condition_variable cv;
        bool cancelled{false};
        bool finished{false};
    };

    void run(std::shared_ptr<Task> task, std::string origin, std::chrono::milliseconds period);
    static void stop_task(const std::shared_ptr<Task>& task);

    Sink sink_;
    Producer producer_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<Task>> tasks_;
};

}  // namespace cryguard
