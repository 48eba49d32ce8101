#include "tradecall/network/message_thread.hpp"

#include <iostream>
#include <utility>

namespace tradecall {

MessageThread::MessageThread(const ITimeProvider& time_provider,
                             EventSink event_sink, std::string endpoint)
    : time_provider_(time_provider),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

MessageThread::~MessageThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void MessageThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ =
      std::make_unique<MessageGateway>(time_provider_, event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[MessageThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[MessageThread] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void MessageThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace tradecall
