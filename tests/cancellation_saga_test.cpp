// =============================================================================
// cancellation_saga_test.cpp
// =============================================================================
// Tests for shiptrack::SagaInterpreter and shiptrack::CancellationSaga.
//
// Validates:
//   - Happy path: every step runs in order, shipment ends Cancelled
//   - Refund failure: completed steps are compensated back to front, the
//     failing step is not, the shipment returns to its prior status
//   - A failing compensation is recorded and the fold continues
//   - Step timeout → StepTimeout; the slow step is waited for, and compensated
//     when it succeeded late (unless it is the irreversible final step)
//   - Terminal or already-cancelling shipments are refused up front
//   - Crash recovery compensates in-flight ledgers
// =============================================================================

#include "shiptrack/common/error.hpp"
#include "shiptrack/common/id_generator.hpp"
#include "shiptrack/domain/saga_record.hpp"
#include "shiptrack/saga/cancellation_saga.hpp"
#include "shiptrack/saga/saga_interpreter.hpp"
#include "shiptrack/shipment/shipment_service.hpp"
#include "shiptrack/shipment/shipment_state_machine.hpp"
#include "shiptrack/store/in_memory_saga_store.hpp"
#include "shiptrack/store/in_memory_shipment_repository.hpp"
#include "shiptrack/time/simulation_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using shiptrack::CancellationSaga;
using shiptrack::ErrorCode;
using shiptrack::SagaFailedError;
using shiptrack::TrackingError;
using shiptrack::domain::SagaOutcome;
using shiptrack::domain::SagaRecord;
using shiptrack::domain::ShipmentStatus;
using shiptrack::domain::StopType;
namespace support = shiptrack::testing_support;

using Steps = std::vector<std::string>;

// =============================================================================
// Test fixture: a real ShipmentService plus recording fakes for the other
// contexts, all writing to one CallLog.
// =============================================================================
class CancellationSagaTest : public ::testing::Test {
 protected:
  shiptrack::SimulationTimeProvider clock{1735718400000};
  shiptrack::IdGenerator event_ids{"evt"};
  shiptrack::IdGenerator shipment_ids{"shp"};
  shiptrack::IdGenerator saga_ids{"saga"};
  shiptrack::InMemoryShipmentRepository repository;
  shiptrack::InMemorySagaStore sagas;
  shiptrack::ShipmentStateMachine machine{clock, event_ids, shipment_ids};
  support::RecordingPublisher publisher;
  shiptrack::ShipmentService shipments{repository, machine, publisher};

  support::CallLog log;
  support::FakeTrackingSessions tracking{log};
  support::FakeNotifications notifications{log};
  support::FakeRefunds refunds{log};

  shiptrack::SagaInterpreter interpreter{sagas, clock, saga_ids, std::chrono::seconds(2)};
  CancellationSaga saga{interpreter, shipments, tracking, notifications};

  void SetUp() override { saga.attachRefundProcessor(&refunds); }

  std::string confirmedShipment(const std::string& number = "SHP-1") {
    shiptrack::ShipmentDraft d;
    d.shipment_number = number;
    d.customer_id = "cust-1";
    d.carrier_id = "carr-1";
    d.origin = support::address("Trenton", 40.22, -74.76);
    d.destination = support::address("Newark", 40.73, -74.17);
    d.planned_pickup = shiptrack::ms_to_timestamp(clock.now_ms()) + std::chrono::hours(1);
    d.planned_delivery = d.planned_pickup + std::chrono::hours(5);
    d.stops.push_back(support::stop(1, StopType::Delivery, d.destination));
    const auto created = shipments.createShipment(d);
    shipments.confirm(created.id, "ops");
    return created.id;
  }

  SagaRecord expectSagaFailure(const std::string& id, bool refund) {
    try {
      saga.cancel(id, "customer request", "support", refund);
    } catch (const SagaFailedError& e) {
      EXPECT_EQ(e.code(), ErrorCode::SagaFailed);
      return e.record();
    }
    ADD_FAILURE() << "expected SagaFailedError";
    return SagaRecord{};
  }
};

// -----------------------------------------------------------------------------
// 1. Happy path with refund.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, CancelsAcrossContexts) {
  const std::string id = confirmedShipment();

  const SagaRecord record = saga.cancel(id, "customer request", "support", true);

  EXPECT_EQ(record.outcome, SagaOutcome::Completed);
  EXPECT_EQ(record.completed_steps,
            (Steps{"UpdateStatusCancelling", "StopTracking", "NotifyStakeholders",
                   "ProcessRefund", "UpdateStatusCancelled"}));
  EXPECT_EQ(log.entries(), (Steps{"tracking.stop:" + id,
                                  "notify.cancellation:" + id + ":customer request",
                                  "refund.process:" + id}));
  EXPECT_EQ(shipments.get(id).status, ShipmentStatus::Cancelled);
  EXPECT_EQ(sagas.find(record.saga_id)->outcome, SagaOutcome::Completed);
  EXPECT_TRUE(sagas.findInFlight().empty());
}

// -----------------------------------------------------------------------------
// 2. Without refund_required the refund step is skipped entirely.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, RefundStepSkippedWhenNotRequired) {
  const std::string id = confirmedShipment();

  const SagaRecord record = saga.cancel(id, "duplicate", "ops", false);

  EXPECT_EQ(record.completed_steps.size(), 4u);
  EXPECT_FALSE(log.contains("refund.process:" + id));
  EXPECT_EQ(shipments.get(id).status, ShipmentStatus::Cancelled);
}

// -----------------------------------------------------------------------------
// 3. Refund fails: notification reversal, tracking resume, status revert,
//    in that order. The refund itself is never reversed.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, RefundFailureCompensatesInReverse) {
  const std::string id = confirmedShipment();
  refunds.failOn("processRefund");

  const SagaRecord record = expectSagaFailure(id, true);

  EXPECT_EQ(record.outcome, SagaOutcome::Failed);
  EXPECT_FALSE(record.failure_code.has_value());
  EXPECT_NE(record.failure_message.find("ProcessRefund"), std::string::npos);
  EXPECT_EQ(record.completed_steps,
            (Steps{"UpdateStatusCancelling", "StopTracking", "NotifyStakeholders"}));
  EXPECT_EQ(record.compensated_steps,
            (Steps{"NotifyStakeholders", "StopTracking", "UpdateStatusCancelling"}));
  EXPECT_TRUE(record.compensation_failures.empty());

  EXPECT_EQ(log.entries(), (Steps{"tracking.stop:" + id,
                                  "notify.cancellation:" + id + ":customer request",
                                  "refund.process:" + id, "notify.reversal:" + id,
                                  "tracking.resume:" + id}));
  EXPECT_FALSE(log.contains("refund.reverse:" + id));

  const auto shipment = shipments.get(id);
  EXPECT_EQ(shipment.status, ShipmentStatus::Confirmed);
  EXPECT_EQ(shipment.events.back().event_type, "CANCELLATION_REVERTED");
  EXPECT_EQ(sagas.find(record.saga_id)->outcome, SagaOutcome::Failed);
}

// -----------------------------------------------------------------------------
// 4. A TrackingError from a step is kept as the saga's cause.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, MissingRefundProcessorIsPreconditionFailed) {
  const std::string id = confirmedShipment();
  saga.attachRefundProcessor(nullptr);

  try {
    saga.cancel(id, "customer request", "support", true);
    FAIL() << "expected SagaFailedError";
  } catch (const SagaFailedError& e) {
    ASSERT_TRUE(e.cause().has_value());
    EXPECT_EQ(*e.cause(), ErrorCode::PreconditionFailed);
    // The refund compensation was never reached, so the missing processor is
    // not looked up a second time.
    EXPECT_TRUE(e.record().compensation_failures.empty());
  }
  EXPECT_EQ(shipments.get(id).status, ShipmentStatus::Confirmed);
}

// -----------------------------------------------------------------------------
// 5. A compensation that throws is listed; the others still run.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, FailingCompensationDoesNotStopTheFold) {
  const std::string id = confirmedShipment();
  refunds.failOn("processRefund");
  tracking.failOn("resumeTracking");

  const SagaRecord record = expectSagaFailure(id, true);

  EXPECT_EQ(record.compensation_failures, (Steps{"StopTracking"}));
  EXPECT_EQ(record.compensated_steps, (Steps{"NotifyStakeholders", "UpdateStatusCancelling"}));
  EXPECT_EQ(shipments.get(id).status, ShipmentStatus::Confirmed);
}

// -----------------------------------------------------------------------------
// 6. Refused before any step: terminal and already-cancelling shipments.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, RefusesTerminalAndCancellingShipments) {
  const std::string cancelled = confirmedShipment("SHP-1");
  shipments.cancel(cancelled, "duplicate", "ops");

  const std::string cancelling = confirmedShipment("SHP-2");
  shipments.beginCancellation(cancelling, "manual", "ops");

  for (const auto& id : {cancelled, cancelling}) {
    try {
      saga.cancel(id, "customer request", "support", false);
      FAIL() << "expected InvalidState for " << id;
    } catch (const SagaFailedError&) {
      FAIL() << "no saga should run for " << id;
    } catch (const TrackingError& e) {
      EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }
  }
  EXPECT_TRUE(log.entries().empty());
  EXPECT_THROW(saga.cancel("shp-404", "x", "y", false), TrackingError);
}

// -----------------------------------------------------------------------------
// 7. Step timeout. The slow step still runs to the end before compensation
//    starts; since it succeeded it is compensated too, before the step ahead
//    of it.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, StepTimeoutWaitsAndCompensatesLateSuccess) {
  shiptrack::SagaInterpreter fast{sagas, clock, saga_ids, std::chrono::milliseconds(50)};

  shiptrack::SagaDefinition def;
  def.workflow = "SlowWorkflow";
  def.steps.push_back(shiptrack::SagaStep{
      "Quick", {}, [this](const auto& t) { log.add("quick:" + t.shipment_id); },
      [this](const auto& t) { log.add("undo-quick:" + t.shipment_id); }});
  def.steps.push_back(shiptrack::SagaStep{
      "Slow",
      {},
      [this](const auto& t) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        log.add("slow:" + t.shipment_id);
      },
      [this](const auto& t) { log.add("undo-slow:" + t.shipment_id); }});

  shiptrack::domain::SagaTrigger trigger;
  trigger.shipment_id = "shp-9";
  const SagaRecord record = fast.run(def, trigger);

  EXPECT_EQ(record.outcome, SagaOutcome::Failed);
  ASSERT_TRUE(record.failure_code.has_value());
  EXPECT_EQ(*record.failure_code, ErrorCode::StepTimeout);
  EXPECT_EQ(record.completed_steps, (Steps{"Quick", "Slow"}));
  EXPECT_EQ(record.compensated_steps, (Steps{"Slow", "Quick"}));
  EXPECT_EQ(log.entries(),
            (Steps{"quick:shp-9", "slow:shp-9", "undo-slow:shp-9", "undo-quick:shp-9"}));
}

// -----------------------------------------------------------------------------
// 8. A slow step that ends up throwing is the failing step: not compensated,
//    the cause stays StepTimeout.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, StepTimeoutThenFailure) {
  shiptrack::SagaInterpreter fast{sagas, clock, saga_ids, std::chrono::milliseconds(50)};

  shiptrack::SagaDefinition def;
  def.workflow = "SlowWorkflow";
  def.steps.push_back(shiptrack::SagaStep{
      "Quick", {}, [this](const auto& t) { log.add("quick:" + t.shipment_id); },
      [this](const auto& t) { log.add("undo-quick:" + t.shipment_id); }});
  def.steps.push_back(shiptrack::SagaStep{
      "Slow",
      {},
      [](const auto&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        throw std::runtime_error("downstream gave up");
      },
      [this](const auto& t) { log.add("undo-slow:" + t.shipment_id); }});

  shiptrack::domain::SagaTrigger trigger;
  trigger.shipment_id = "shp-9";
  const SagaRecord record = fast.run(def, trigger);

  EXPECT_EQ(record.outcome, SagaOutcome::Failed);
  ASSERT_TRUE(record.failure_code.has_value());
  EXPECT_EQ(*record.failure_code, ErrorCode::StepTimeout);
  EXPECT_NE(record.failure_message.find("downstream gave up"), std::string::npos);
  EXPECT_EQ(record.completed_steps, (Steps{"Quick"}));
  EXPECT_EQ(record.compensated_steps, (Steps{"Quick"}));
  EXPECT_EQ(log.entries(), (Steps{"quick:shp-9", "undo-quick:shp-9"}));
}

// -----------------------------------------------------------------------------
// 9. A cancellation notice that overruns is still delivered before the
//    reversal, and the shipment goes back to Confirmed.
// Why: a notice arriving after the revert would leave the customer told the
//      shipment is cancelled with no reversal ever sent.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, SlowNoticeIsReversed) {
  shiptrack::SagaInterpreter fast{sagas, clock, saga_ids, std::chrono::milliseconds(50)};
  CancellationSaga slow_saga{fast, shipments, tracking, notifications};
  const std::string id = confirmedShipment();
  notifications.delayOn("sendCancellationNotice", std::chrono::milliseconds(300));

  try {
    slow_saga.cancel(id, "customer request", "support", false);
    FAIL() << "expected SagaFailedError";
  } catch (const SagaFailedError& e) {
    ASSERT_TRUE(e.cause().has_value());
    EXPECT_EQ(*e.cause(), ErrorCode::StepTimeout);
    EXPECT_EQ(e.record().compensated_steps,
              (Steps{"NotifyStakeholders", "StopTracking", "UpdateStatusCancelling"}));
  }

  EXPECT_EQ(log.entries(), (Steps{"tracking.stop:" + id,
                                  "notify.cancellation:" + id + ":customer request",
                                  "notify.reversal:" + id, "tracking.resume:" + id}));
  EXPECT_EQ(shipments.get(id).status, ShipmentStatus::Confirmed);
}

// -----------------------------------------------------------------------------
// 10. The final status write is irreversible: when it overruns but succeeds
//     the cancellation completes and nothing is compensated.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, SlowFinalStatusCompletes) {
  shiptrack::SagaInterpreter fast{sagas, clock, saga_ids, std::chrono::milliseconds(50)};
  CancellationSaga slow_saga{fast, shipments, tracking, notifications};
  const std::string id = confirmedShipment();
  publisher.delayOn("ShipmentCancelled", std::chrono::milliseconds(300));

  const SagaRecord record = slow_saga.cancel(id, "customer request", "support", false);

  EXPECT_EQ(record.outcome, SagaOutcome::Completed);
  EXPECT_FALSE(record.failure_code.has_value());
  EXPECT_EQ(record.completed_steps.back(), "UpdateStatusCancelled");
  EXPECT_TRUE(record.compensated_steps.empty());
  EXPECT_EQ(shipments.get(id).status, ShipmentStatus::Cancelled);
  EXPECT_FALSE(log.contains("notify.reversal:" + id));
  EXPECT_FALSE(log.contains("tracking.resume:" + id));
}

// -----------------------------------------------------------------------------
// 11. Non-positive step timeouts are rejected.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, InterpreterRejectsNonPositiveTimeout) {
  EXPECT_THROW(
      shiptrack::SagaInterpreter(sagas, clock, saga_ids, std::chrono::milliseconds(0)),
      TrackingError);
}

// -----------------------------------------------------------------------------
// 12. A ledger left Running by a crash is compensated on recovery.
// Why: the shipment would otherwise stay in Cancelling with tracking off.
// -----------------------------------------------------------------------------
TEST_F(CancellationSagaTest, RecoverIncompleteCompensatesInFlightLedger) {
  const std::string id = confirmedShipment();
  shipments.beginCancellation(id, "customer request", "support");

  SagaRecord orphan;
  orphan.saga_id = "saga-77";
  orphan.workflow = CancellationSaga::kWorkflow;
  orphan.trigger.shipment_id = id;
  orphan.trigger.actor = "support";
  orphan.trigger.prior_status = ShipmentStatus::Confirmed;
  orphan.completed_steps = {"UpdateStatusCancelling", "StopTracking"};
  orphan.current_step = "NotifyStakeholders";
  orphan.outcome = SagaOutcome::Running;
  sagas.save(orphan);

  SagaRecord other = orphan;
  other.saga_id = "saga-78";
  other.workflow = "SomethingElse";
  sagas.save(other);

  const auto recovered = saga.recoverIncomplete();

  ASSERT_EQ(recovered.size(), 1u);
  EXPECT_EQ(recovered[0].saga_id, "saga-77");
  EXPECT_EQ(recovered[0].outcome, SagaOutcome::Compensated);
  EXPECT_EQ(recovered[0].failure_message, "interrupted before completion");
  EXPECT_FALSE(recovered[0].current_step.has_value());
  EXPECT_EQ(log.entries(), (Steps{"tracking.resume:" + id}));
  EXPECT_EQ(shipments.get(id).status, ShipmentStatus::Confirmed);

  EXPECT_EQ(sagas.find("saga-77")->outcome, SagaOutcome::Compensated);
  EXPECT_EQ(sagas.find("saga-78")->outcome, SagaOutcome::Running);
  EXPECT_TRUE(saga.recoverIncomplete().empty());
}
