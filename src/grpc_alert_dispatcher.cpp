#include "cryguard/grpc_alert_dispatcher.hpp"

#include <chrono>
#include <iostream>

#include <grpcpp/grpcpp.h>

#include "alert_sink.grpc.pb.h"

namespace cryguard {

struct GrpcAlertDispatcher::Impl {
    std::string address;
    int timeout_ms;
    std::unique_ptr<AlertSink::Stub> stub;

    Impl(const std::string& addr, int timeout) : address(addr), timeout_ms(timeout) {
        auto chan = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
        stub = AlertSink::NewStub(chan);
    }

    void arm(grpc::ClientContext& ctx) const {
        ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms));
    }
};

GrpcAlertDispatcher::GrpcAlertDispatcher(const std::string& address, int timeout_ms)
    : d_(std::make_unique<Impl>(address, timeout_ms)) {}

GrpcAlertDispatcher::~GrpcAlertDispatcher() = default;

bool GrpcAlertDispatcher::notify(const EventRecord& event) {
    CryEvent ev;
    ev.set_event_id(event.event_id);
    ev.set_timestamp_iso(event.timestamp_iso);
    ev.set_clip_reference(event.clip_reference);
    Scores* s = ev.mutable_scores();
    s->set_primary_decision(event.scores.primary_decision);
    s->set_primary_score(event.scores.primary_score);
    s->set_baby_score(event.scores.baby_score.value_or(0.0));
    s->set_cat_score(event.scores.cat_score.value_or(0.0));
    s->set_other_suppress_score(event.scores.other_suppress_score);
    s->set_window_id(event.scores.window_id);
    s->set_timestamp(event.scores.timestamp_sec);

    grpc::ClientContext ctx;
    d_->arm(ctx);
    Ack ack;
    grpc::Status status = d_->stub->Notify(&ctx, ev, &ack);
    if (!status.ok()) {
        std::cerr << "[WARN] AlertSink " << d_->address << " Notify failed: " << status.error_message() << std::endl;
        return false;
    }
    if (!ack.ok()) {
        std::cerr << "[WARN] AlertSink rejected event " << event.event_id << ": " << ack.detail() << std::endl;
    }
    return ack.ok();
}

bool GrpcAlertDispatcher::send_text(const std::string& origin, const std::string& text) {
    OperatorText msg;
    msg.set_origin(origin);
    msg.set_text(text);

    grpc::ClientContext ctx;
    d_->arm(ctx);
    Ack ack;
    grpc::Status status = d_->stub->SendText(&ctx, msg, &ack);
    if (!status.ok()) {
        std::cerr << "[WARN] AlertSink " << d_->address << " SendText failed: " << status.error_message() << std::endl;
        return false;
    }
    return ack.ok();
}

}  // namespace cryguard
