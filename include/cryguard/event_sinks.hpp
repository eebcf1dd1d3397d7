#pragma once

#include <mutex>
#include <string>

#include "cryguard/score_types.hpp"

namespace cryguard {

// Persistence collaborator: store(EventRecord).
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;
    virtual void store(const EventRecord& event) = 0;
};

// Messaging collaborator: notify(EventRecord) -> success/failure. The
// collaborator retries once itself; callers only log the outcome.
class AlertDispatcher {
public:
    virtual ~AlertDispatcher() = default;
    virtual bool notify(const EventRecord& event) = 0;
};

// Escapes text for use inside a JSON string literal.
std::string json_escape(const std::string& text);
std::string event_to_json(const EventRecord& event);

// Appends one JSON line per confirmed event.
class JsonlArtifactStore : public ArtifactStore {
public:
    explicit JsonlArtifactStore(const std::string& path);
    void store(const EventRecord& event) override;

private:
    std::string path_;
    std::mutex mu_;
};

// Used when no alert sink is configured.
class LogAlertDispatcher : public AlertDispatcher {
public:
    bool notify(const EventRecord& event) override;
};

}  // namespace cryguard
