#pragma once

#include <memory>
#include <string>

#include "cryguard/event_sinks.hpp"

namespace cryguard {

// AlertDispatcher backed by the AlertSink gRPC service.
class GrpcAlertDispatcher : public AlertDispatcher {
public:
    GrpcAlertDispatcher(const std::string& address, int timeout_ms);
    ~GrpcAlertDispatcher() override;

    bool notify(const EventRecord& event) override;
    // Operator-facing text (calibration watch output).
    bool send_text(const std::string& origin, const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> d_;
};

}  // namespace cryguard
