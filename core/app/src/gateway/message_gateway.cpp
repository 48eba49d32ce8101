#include "tradecall/gateway/message_gateway.hpp"
#include "tradecall/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tradecall {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, all topics, receive timeout
// -----------------------------------------------------------------------------
MessageGateway::MessageGateway(const ITimeProvider& time_provider,
                               EventSink event_sink,
                               const std::string& endpoint)
    : time_provider_(time_provider), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// decode: JSON payload -> ChatMessageEvent
// -----------------------------------------------------------------------------
std::optional<ChatMessageEvent> MessageGateway::decode(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    ChatMessageEvent message;
    message.sender = json.at("sender").get<std::string>();
    message.channel = json.value("channel", std::string{});
    message.content = json.at("content").get<std::string>();

    std::int64_t timestamp_ms = time_provider_.now_ms();
    if (json.contains("timestamp_ms")) {
      timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    }
    message.timestamp = ms_to_timestamp(timestamp_ms);
    message.sequence_id = next_sequence_++;
    return message;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MessageGateway] JSON parse error: " << e.what()
              << ", payload: " << payload << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MessageGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[MessageGateway] recv failed: " << e.what() << "\n";
      break;
    }

    if (!result.has_value()) {
      continue;
    }

    if (auto message = decode(msg.to_string())) {
      event_sink_(std::move(*message));
    }
  }
}

// -----------------------------------------------------------------------------
// stop(): picked up on the next receive timeout
// -----------------------------------------------------------------------------
void MessageGateway::stop() { running_.store(false); }

}  // namespace tradecall
