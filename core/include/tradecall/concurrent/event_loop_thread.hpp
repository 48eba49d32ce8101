#pragma once

#include "tradecall/concurrent/thread_safe_queue.hpp"
#include "tradecall/eventbus/event_bus.hpp"
#include "tradecall/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace tradecall {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: One worker thread draining a ThreadSafeQueue<Event> and
// publishing each event on its own EventBus. Producers on any thread call
// push(); subscribers of eventBus() then run one event at a time on the loop
// thread.
//
// In this engine the signal loop is the only instance: chat messages are
// pushed by the ingress thread and SignalRouter handles them here, so calls
// are parsed and opened strictly in arrival order.
//
// Thread model: start(), stop() and push() are safe from any thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Stops and joins; the worker never outlives the queue and bus.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Spawns the worker. No-op while a worker exists.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Clears running_, wakes the worker and joins it. Events still queued
  // are discarded with the queue. No-op when not started. start() may be
  // called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueue for dispatch on the loop thread.
  void push(Event event) { queue_.push(std::move(event)); }

  // Bus the loop publishes to. subscribe() is safe from any thread.
  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

 private:
  // Worker body: try_pop and publish, or wait briefly on stop_cv_.
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace tradecall
