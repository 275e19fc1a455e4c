#pragma once

namespace shiptrack {
namespace domain {

// -----------------------------------------------------------------------------
// ShipmentStatus — shipment lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a shipment can occupy from creation to a
//         terminal outcome.
//
// @details
// Legal transitions (enforced by ShipmentStateMachine::isValidTransition):
//
//   Created ────> Confirmed ────> Dispatched ────> InTransit ────> Delivered
//      │              │               │              │   ▲
//      │              │               │              ▼   │
//      │              │               │            Exception
//      │              │               │              │
//      ▼              ▼               ▼              ▼
//   Cancelled      Cancelled       Cancelled      Cancelled   (from any
//                                                              non-terminal)
//
// Cancelling is the intermediate status held while a cancellation saga runs.
// Every non-terminal status may move to Cancelling; Cancelling may only move
// to Cancelled. Reverting Cancelling to the prior status is a separate,
// saga-only operation (ShipmentStateMachine::revertCancellation) and is not
// part of the table.
//
// Terminal states: Delivered, Cancelled. No outgoing transitions; a shipment
// in a terminal state cannot be mutated at all.
//
// Every switch over ShipmentStatus in this codebase lists all enumerators
// without a default label so -Wswitch flags any site missed when a status is
// added.
// -----------------------------------------------------------------------------
enum class ShipmentStatus {
  Created,     // Booked, awaiting confirmation
  Confirmed,   // Accepted by the carrier, awaiting dispatch
  Dispatched,  // Picked up; actual pickup time recorded
  InTransit,   // Moving between stops
  Exception,   // Delayed or otherwise off-plan; may resume transit
  Cancelling,  // Cancellation saga in progress
  Delivered,   // Terminal
  Cancelled,   // Terminal
};

const char* shipmentStatusToString(ShipmentStatus status);

// Human-readable one-liner for read projections.
const char* describeShipmentStatus(ShipmentStatus status);

inline bool isTerminal(ShipmentStatus status) {
  return status == ShipmentStatus::Delivered ||
         status == ShipmentStatus::Cancelled;
}

}  // namespace domain
}  // namespace shiptrack
