#include "shiptrack/transport/zmq_event_transport.hpp"

#include "shiptrack/serialization/event_codec.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace shiptrack {

ZmqEventTransport::ZmqEventTransport(std::string pub_endpoint)
    : pub_endpoint_(std::move(pub_endpoint)) {}

ZmqEventTransport::~ZmqEventTransport() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind and spawn worker
// -----------------------------------------------------------------------------
void ZmqEventTransport::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  pub_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  pub_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ZmqEventTransport] started. PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void ZmqEventTransport::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  pub_socket_.reset();
  context_.reset();

  std::cout << "[ZmqEventTransport] stopped. sent=" << sent_.load()
            << " failures=" << send_failures_.load() << "\n";
}

DeliveryAck ZmqEventTransport::publish(const std::string& topic,
                                       const std::string& partition_key,
                                       const events::DomainEvent& event) {
  if (!running_.load()) {
    return DeliveryAck{false, "transport not running"};
  }
  outbox_.push(OutboundMessage{topic, partition_key, EventCodec::toString(event)});
  return DeliveryAck{true, "queued"};
}

// -----------------------------------------------------------------------------
// run(): drain until stopped, then one final drain
// -----------------------------------------------------------------------------
void ZmqEventTransport::run() {
  while (running_.load()) {
    drain();
    std::this_thread::sleep_for(std::chrono::milliseconds(kIdleSleepMs));
  }
  drain();
}

void ZmqEventTransport::drain() {
  while (auto message = outbox_.try_pop()) {
    send(*message);
  }
}

void ZmqEventTransport::send(const OutboundMessage& message) {
  try {
    pub_socket_->send(zmq::buffer(message.topic), zmq::send_flags::sndmore);
    pub_socket_->send(zmq::buffer(message.partition_key), zmq::send_flags::sndmore);
    pub_socket_->send(zmq::buffer(message.body), zmq::send_flags::none);
    sent_.fetch_add(1);
  } catch (const zmq::error_t& e) {
    send_failures_.fetch_add(1);
    std::cerr << "[ZmqEventTransport] ERROR: send on " << message.topic
              << " failed: " << e.what() << "\n";
  }
}

}  // namespace shiptrack
