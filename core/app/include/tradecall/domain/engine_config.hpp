#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tradecall {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig - engine-wide trading parameters and endpoints
// -----------------------------------------------------------------------------
//
// @brief  Plain configuration record loaded once at startup (see
//         config/config_loader.hpp) and passed by const reference or by value
//         into components.
//
// @details
// Percentages are fractions: 0.05 means 5%.
//
// position_size_pct is a share of account equity, not of a fixed cap.
// ExecutionEngine clamps it to (0, 1]; a value <= 0 sizes every order to
// zero and the open fails with a sizing failure instead of throwing.
//
// stop_loss_pct / take_profit_pct are the fallback exit rules used by
// PositionMonitor when a position has no absolute stop-loss or no
// take-profit ladder respectively. Both are compared against leveraged P/L.
//
// tp_weights seeds FractionAllocator. Empty means equal split.
//
// Endpoints left empty disable the matching thread (tests rely on this).
//
// Thread model:
//   Value type, no synchronization. Runtime-mutable switches (auto-execute,
//   halt, TP weighting) live in their owning components, not here.
// -----------------------------------------------------------------------------
struct EngineConfig {
  // --- Sizing ---------------------------------------------------------------
  double default_leverage{2.0};       // Used when a call names no leverage
  double position_size_pct{0.10};     // Share of equity per position

  // --- Exit defaults --------------------------------------------------------
  double stop_loss_pct{0.05};         // Leveraged loss that forces a close
  double take_profit_pct{0.02};       // Leveraged gain for the legacy TP rule
  std::string tp_weights;             // e.g. "50,30,20"; empty = equal split

  // --- Timing ---------------------------------------------------------------
  std::int64_t poll_interval_ms{60000};  // Monitor sweep period; 0 = manual
  int venue_timeout_ms{5000};            // Per venue round-trip

  // --- Signal intake --------------------------------------------------------
  bool auto_execute{false};           // Execute parsed calls immediately
  std::string authorized_sender;      // Empty = accept any sender
  std::string authorized_channel;     // Empty = accept any channel
  std::size_t max_message_chars{4000};  // Longer messages are not parsed

  // --- Venue ----------------------------------------------------------------
  bool simulation{true};              // SimulatedVenueClient instead of ZMQ
  double simulated_balance{10000.0};  // Starting equity in simulation

  // --- Endpoints (empty = disabled) -----------------------------------------
  std::string message_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  std::string venue_endpoint{"tcp://127.0.0.1:5558"};
};

}  // namespace domain
}  // namespace tradecall
