#pragma once

#include "shiptrack/concurrent/thread_safe_queue.hpp"
#include "shiptrack/events/domain_event.hpp"
#include "shiptrack/ports/i_event_transport.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace shiptrack {

// -----------------------------------------------------------------------------
// ZmqEventTransport — ZeroMQ PUB outbox for committed domain events
// -----------------------------------------------------------------------------
//
// @brief  Publishes every event as a three-frame message on a PUB socket:
//           frame 1  topic         e.g. "shipment.created"
//           frame 2  partition key the shipment id
//           frame 3  JSON body     EventCodec::toString(event)
//
// @details
// publish() serialises on the caller's thread and pushes onto a
// ThreadSafeQueue; the worker thread drains the queue and owns the socket.
// A single worker preserves enqueue order, so events of one shipment leave
// in the order they were committed.
//
// publish() refuses (accepted == false) while the transport is not running.
// Socket errors on the worker are logged and counted in sendFailures().
//
// Thread model:
//   start()/stop() from the owning thread (TrackingEngine).
//   publish() from any thread.
//
// Ownership:
//   Owned by TrackingEngine via std::unique_ptr. Owns the ZMQ context, the
//   PUB socket, the outbox queue and the worker thread.
// -----------------------------------------------------------------------------
class ZmqEventTransport final : public IEventTransport {
 public:
  explicit ZmqEventTransport(std::string pub_endpoint = "tcp://127.0.0.1:5560");

  // RAII: calls stop().
  ~ZmqEventTransport() override;

  ZmqEventTransport(const ZmqEventTransport&) = delete;
  ZmqEventTransport& operator=(const ZmqEventTransport&) = delete;
  ZmqEventTransport(ZmqEventTransport&&) = delete;
  ZmqEventTransport& operator=(ZmqEventTransport&&) = delete;

  // Binds the PUB socket and spawns the worker. Idempotent.
  void start();

  // Signals the worker, lets it drain the outbox, joins it and closes the
  // socket. Idempotent; safe if never started.
  void stop();

  bool running() const { return running_.load(); }

  DeliveryAck publish(const std::string& topic, const std::string& partition_key,
                      const events::DomainEvent& event) override;

  std::uint64_t sentCount() const { return sent_.load(); }
  std::uint64_t sendFailures() const { return send_failures_.load(); }

 private:
  static constexpr int kIdleSleepMs = 5;

  struct OutboundMessage {
    std::string topic;
    std::string partition_key;
    std::string body;
  };

  void run();
  void drain();
  void send(const OutboundMessage& message);

  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<OutboundMessage> outbox_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sent_{0};
  std::atomic<std::uint64_t> send_failures_{0};
};

}  // namespace shiptrack
