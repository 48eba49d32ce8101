// =============================================================================
// ipc_telemetry_test.cpp
// =============================================================================
// Tests for tradecall::IpcServer.
//
// Validates:
//   - formatTelemetry produces one JSON object per event with a "type" tag
//   - Chat messages are not published as telemetry
//   - REQ/REP command round trip through a running server
//   - A throwing command handler is answered with an error reply
//   - Invalid UTF-8 text is replaced in telemetry
//
// The round-trip test binds loopback ports in the 257xx range.
// =============================================================================

#include "tradecall/network/ipc_server.hpp"
#include "tradecall/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <string>

using namespace tradecall;
using nlohmann::json;

namespace {

json format(const Event& event) {
  auto text = IpcServer::formatTelemetry(event);
  EXPECT_TRUE(text.has_value());
  return text ? json::parse(*text) : json{};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Signal telemetry carries the disposition and the parsed intent.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, SignalEventFormat) {
  SignalEvent e;
  e.sender = "alice";
  e.raw_text = "BUY BTC AT 50000";
  e.disposition = SignalEvent::Disposition::Pending;
  e.sequence_id = 7;
  domain::TradeIntent intent;
  intent.symbol = "BTC";
  intent.entries = {50000.0};
  intent.take_profits = {52000.0, 54000.0};
  intent.rule = domain::PatternRule::ActionAt;
  e.intent = intent;

  json j = format(e);

  EXPECT_EQ(j.at("type"), "signal");
  EXPECT_EQ(j.at("id"), 7);
  EXPECT_EQ(j.at("disposition"), "pending");
  EXPECT_EQ(j.at("intent").at("action"), "OPEN");
  EXPECT_EQ(j.at("intent").at("rule"), "action_at");
  EXPECT_TRUE(j.at("intent").at("stop_loss").is_null());
  EXPECT_EQ(j.at("intent").at("take_profits").size(), 2u);
}

// -----------------------------------------------------------------------------
// 2. Position updates embed the position snapshot and the close details.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, PositionUpdateFormat) {
  PositionUpdateEvent e;
  e.position.symbol = "BTC";
  e.position.initial_size = 0.04;
  e.position.current_size = 0.02;
  e.position.average_entry_price = 50000.0;
  e.position.stop_loss = 48000.0;
  e.position.take_profits = {domain::TakeProfitLevel{52000.0, 0.5, true}};
  e.change = PositionUpdateEvent::Change::Reduced;
  e.exit_price = 52100.0;
  e.closed_size = 0.02;
  e.pnl_pct = 0.084;
  e.reason = "take_profit_1";

  json j = format(e);

  EXPECT_EQ(j.at("type"), "position_update");
  EXPECT_EQ(j.at("change"), "reduced");
  EXPECT_EQ(j.at("symbol"), "BTC");
  EXPECT_DOUBLE_EQ(j.at("current_size").get<double>(), 0.02);
  EXPECT_DOUBLE_EQ(j.at("stop_loss").get<double>(), 48000.0);
  EXPECT_TRUE(j.at("take_profits")[0].at("filled").get<bool>());
  EXPECT_EQ(j.at("reason"), "take_profit_1");
}

// -----------------------------------------------------------------------------
// 3. Order, report, trigger, failure and heartbeat events are tagged.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, RemainingEventTypesAreTagged) {
  OrderEvent order;
  order.request.symbol = "ETH";
  order.request.side = domain::Side::Sell;
  order.request.reduce_only = true;
  json o = format(order);
  EXPECT_EQ(o.at("type"), "order");
  EXPECT_EQ(o.at("side"), "SELL");
  EXPECT_TRUE(o.at("reduce_only").get<bool>());

  ExecutionReportEvent report;
  report.status = ExecutionStatus::Rejected;
  report.reason = "simulated rejection";
  json r = format(report);
  EXPECT_EQ(r.at("type"), "execution_report");
  EXPECT_EQ(r.at("status"), "rejected");

  ExitTriggerEvent trigger;
  trigger.symbol = "BTC";
  trigger.trigger = ExitTriggerEvent::Trigger::StopLossPercent;
  json t = format(trigger);
  EXPECT_EQ(t.at("type"), "exit_trigger");
  EXPECT_EQ(t.at("trigger"), "stop_loss_pct");

  ExecutionFailureEvent failure;
  failure.kind = domain::FailureKind::StateViolation;
  failure.action = domain::IntentAction::Close;
  json f = format(failure);
  EXPECT_EQ(f.at("type"), "execution_failure");
  EXPECT_EQ(f.at("kind"), "state_violation");
  EXPECT_EQ(f.at("action"), "CLOSE");

  HeartbeatEvent beat{"position_monitor", "sweep=1", ms_to_timestamp(1234), 1};
  json h = format(beat);
  EXPECT_EQ(h.at("type"), "heartbeat");
  EXPECT_EQ(h.at("component"), "position_monitor");
  EXPECT_EQ(h.at("timestamp_ms"), 1234);
}

// -----------------------------------------------------------------------------
// 4. Raw chat traffic stays off the telemetry stream.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, ChatMessageIsNotPublished) {
  ChatMessageEvent e;
  e.content = "BUY BTC AT 50000";
  EXPECT_FALSE(IpcServer::formatTelemetry(e).has_value());
}

// -----------------------------------------------------------------------------
// 5. A REQ client gets the handler's reply.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, CommandRoundTrip) {
  IpcServer server(
      [](const std::string& cmd) { return std::string("echo:") + cmd; },
      "tcp://127.0.0.1:25756", "tcp://127.0.0.1:25757");
  server.start();

  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect("tcp://127.0.0.1:25756");

  req.send(zmq::buffer(std::string("PING")), zmq::send_flags::none);
  zmq::message_t reply;
  auto received = req.recv(reply, zmq::recv_flags::none);

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(reply.to_string(), "echo:PING");

  server.stop();
}

// -----------------------------------------------------------------------------
// 6. A handler that throws still produces a reply, and the REP socket keeps
//    serving afterwards.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, ThrowingHandlerStillReplies) {
  IpcServer server(
      [](const std::string& cmd) -> std::string {
        if (cmd.rfind("FOO", 0) == 0) {
          return json{{"response", cmd}}.dump();
        }
        return "ok:" + cmd;
      },
      "tcp://127.0.0.1:25758", "tcp://127.0.0.1:25759");
  server.start();

  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect("tcp://127.0.0.1:25758");

  req.send(zmq::buffer(std::string("FOO\xff")), zmq::send_flags::none);
  zmq::message_t first;
  ASSERT_TRUE(req.recv(first, zmq::recv_flags::none).has_value());
  json error = json::parse(first.to_string());
  EXPECT_EQ(error.at("status"), "error");

  req.send(zmq::buffer(std::string("PING")), zmq::send_flags::none);
  zmq::message_t second;
  ASSERT_TRUE(req.recv(second, zmq::recv_flags::none).has_value());
  EXPECT_EQ(second.to_string(), "ok:PING");

  server.stop();
}

// -----------------------------------------------------------------------------
// 7. Invalid UTF-8 in event text is replaced, not thrown on.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, InvalidUtf8TextIsReplaced) {
  SignalEvent e;
  e.raw_text = "BUY BTC \xff";
  e.disposition = SignalEvent::Disposition::Ignored;

  json j = format(e);
  EXPECT_EQ(j.at("text"), "BUY BTC \xEF\xBF\xBD");
}
