#include "shiptrack/collaborators/logging_collaborators.hpp"

#include <iostream>

namespace shiptrack {

void LoggingNotificationDispatcher::sendConfirmation(const std::string& shipment_id,
                                                     const std::string& shipment_number) {
  sent_.fetch_add(1);
  std::cout << "[Notification] confirmation for " << shipment_number << " ("
            << shipment_id << ")\n";
}

void LoggingNotificationDispatcher::sendArrivalAlert(const std::string& shipment_id,
                                                     int stop_sequence) {
  sent_.fetch_add(1);
  std::cout << "[Notification] " << shipment_id << " arrived at stop " << stop_sequence
            << "\n";
}

void LoggingNotificationDispatcher::sendCancellationNotice(const std::string& shipment_id,
                                                           const std::string& reason) {
  sent_.fetch_add(1);
  std::cout << "[Notification] " << shipment_id << " cancelled: " << reason << "\n";
}

void LoggingNotificationDispatcher::sendCancellationReversal(
    const std::string& shipment_id) {
  sent_.fetch_add(1);
  std::cout << "[Notification] cancellation of " << shipment_id << " withdrawn\n";
}

void LoggingRefundProcessor::processRefund(const std::string& shipment_id) {
  refunds_.fetch_add(1);
  std::cout << "[Refund] refund issued for " << shipment_id << "\n";
}

void LoggingRefundProcessor::reverseRefund(const std::string& shipment_id) {
  refunds_.fetch_sub(1);
  std::cout << "[Refund] refund reversed for " << shipment_id << "\n";
}

}  // namespace shiptrack
