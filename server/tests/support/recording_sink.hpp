#pragma once

#include <algorithm>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "relay/realtime.hpp"
#include "relay/signaling_router.hpp"

namespace relay::testing {

struct RecordedEvent {
  std::string event;
  nlohmann::json payload;
};

class RecordingSink : public EventSink {
 public:
  bool SendServerEvent(const std::string& event, const nlohmann::json& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    events_.push_back(RecordedEvent{event, payload});
    return true;
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }

  std::vector<RecordedEvent> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<RecordedEvent> EventsNamed(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecordedEvent> out;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(out),
                 [&name](const RecordedEvent& e) { return e.event == name; });
    return out;
  }

  std::size_t Count(const std::string& name) const { return EventsNamed(name).size(); }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<RecordedEvent> events_;
  bool closed_{false};
};

// 코디네이터에 가짜 연결을 붙여 라우터를 직접 구동하는 하네스
class RouterHarness {
 public:
  RouterHarness()
      : observability_(std::make_shared<Observability>(LogLevel::kError)),
        coordinator_(std::make_shared<RealtimeCoordinator>()),
        router_(std::make_shared<SignalingRouter>(coordinator_, observability_)) {
    coordinator_->SetObservability(observability_);
  }

  std::shared_ptr<RecordingSink> Connect(const ConnectionId& id) {
    auto sink = std::make_shared<RecordingSink>();
    sinks_[id] = sink;
    coordinator_->Register(id, sink);
    return sink;
  }

  void Disconnect(const ConnectionId& id) {
    auto it = sinks_.find(id);
    if (it != sinks_.end()) {
      coordinator_->Unregister(id, it->second.get());
    }
    router_->HandleDisconnect(id);
  }

  SignalingRouter& Router() { return *router_; }
  RoomRegistry& Registry() { return *router_->GetRegistry(); }
  NegotiationTracker& Tracker() { return *router_->GetTracker(); }
  RealtimeCoordinator& Coordinator() { return *coordinator_; }
  Observability& Obs() { return *observability_; }

 private:
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SignalingRouter> router_;
  std::unordered_map<ConnectionId, std::shared_ptr<RecordingSink>> sinks_;
};

}  // namespace relay::testing
