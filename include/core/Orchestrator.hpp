#pragma once

/** @file  Orchestrator.hpp
 *  @brief Public API for cloneflow::core::Orchestrator, the client-side clone workflow FSM.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

// cloneflow headers
#include "core/CommandGateway.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventBridge.hpp"
#include "core/EventLoop.hpp"
#include "core/Executor.hpp"
#include "core/HistoryLogger.hpp"
#include "core/NotificationHub.hpp"
#include "core/Settings.hpp"
#include "core/WizardContext.hpp"

namespace cloneflow {
  namespace core {

    /// Client-visible workflow states; a superset of the authoritative outcome tags.
    enum class State : std::uint8_t {
      Idle,
      DetectingDevice,
      CheckingFirmware,
      FirmwareOutdated,
      UpdatingFirmware,
      RedetectingDevice,
      DeviceConnected,
      ScanningCard,
      CredentialIdentified,
      HfProcessing,
      HfDumpReady,
      WaitingForBlank,
      BlankDetected,
      Writing,
      Verifying,
      VerificationComplete,
      Complete,
      Error
    };

    const char* toString(State s);

    /**
 * @class Orchestrator
 * @brief Owns the workflow state and WizardContext and keeps them in lockstep
 *        with the authoritative machine behind a CommandGateway.
 *
 *  * Intents may be called from any thread; they are posted to the loop and
 *    evaluated there one at a time. Intents that do not apply to the current
 *    state are no-ops.
 *  * Each asynchronous state issues exactly one gateway call on entry, on the
 *    Executor. A result is applied only if no transition happened since the
 *    call was issued.
 *  * Remote aborts (cancel_hf_operation, cancel_flash) go to `abortExecutor`
 *    so they reach the device while the call they abort is still blocking
 *    `executor`. Pass the same executor twice only if it runs tasks
 *    concurrently or is driven by hand.
 *  * `start()` mounts the EventBridge; `shutdown()` (or destruction) tears it
 *    down. Stop whatever thread drives `loop()` before destroying.
 */
    class Orchestrator {
    public:
      using TransitionListener = std::function<void(State from, State to)>;

      Orchestrator(std::shared_ptr<CommandGateway> gateway, Executor& executor,
                   Executor& abortExecutor, NotificationHub& hub, std::shared_ptr<ErrorMonitor> monitor,
                   std::shared_ptr<HistoryLogger> history = nullptr,
                   OrchestratorTimers timers = {},
                   EventLoop::NowFn now = &EventLoop::Clock::now);
      ~Orchestrator();

      void start();
      void shutdown();

      //---loop-thread accessors---------------------------------------------
      State state() const { return state_; }
      const WizardContext& context() const { return ctx_; }
      bool controlPending() const { return controlInFlight_; }
      EventLoop& loop() { return *loop_; }

      /// Called on the loop thread after every state change.
      void onTransition(TransitionListener listener);

      //---user intents------------------------------------------------------
      void detect();
      void scan();
      void skipToBlank(protocols::BlankType expected);
      void startHfProcess();
      void cancelHf();
      void write();
      void finish();
      void reset();
      void recover(); ///< follow the error's (recovery action, source) key

      void updateFirmware();
      void skipFirmware();
      void cancelFirmware();
      void selectVariant(std::string variant);

      void backToScan();
      void softReset();
      void disconnect();
      void reDetectBlank();
      void loadSavedCard(protocols::SavedCard card);

      Orchestrator(const Orchestrator&) = delete;
      Orchestrator& operator=(const Orchestrator&) = delete;

    private:
      void transitionTo(State next);
      void enterAction(State s);

      //---per-state entry operations-----------------------------------------
      void runDetect(State issuing);
      void runFirmwareCheck();
      void runFlash();
      void runScan();
      void runHfProcess();
      void runBlankDetect();
      void runWrite();
      void runVerify();

      //---intent handlers (loop thread)---------------------------------------
      void handleDetect();
      void handleScan();
      void handleSkipToBlank(protocols::BlankType expected);
      void handleStartHf();
      void handleCancelHf();
      void handleWrite();
      void handleFinish();
      void handleReset();
      void handleRecover();
      void handleUpdateFirmware();
      void handleSkipFirmware();
      void handleCancelFirmware();
      void handleSelectVariant(const std::string& variant);
      void handleBackToScan();
      void handleSoftReset();
      void handleDisconnect();
      void handleReDetectBlank();
      void handleLoadSavedCard(const protocols::SavedCard& card);

      void handleBridged(const BridgedEvent& ev);

      //---errors----------------------------------------------------------------
      void fail(ErrorSource source, const std::string& message, const std::string& userMessage,
                bool recoverable, std::optional<protocols::RecoveryAction> action);
      /// Domain Error outcomes are taken verbatim; any other tag is "unexpected".
      void rejectOutcome(ErrorSource source, const protocols::WizardState& outcome,
                         const std::string& unexpectedUserMessage,
                         protocols::RecoveryAction unexpectedAction);

      //---gateway plumbing--------------------------------------------------------
      template <class Call, class OnOk, class OnFail>
      void invoke(Call call, OnOk onOk, OnFail onFail);

      /// Must-succeed round trip; a rejection falls back to a full reset of both sides.
      void control(protocols::WizardAction action, std::function<void()> onAccepted);

      /// Fire-and-forget; failures go to the ErrorMonitor only.
      void bestEffort(std::string what, std::function<void(CommandGateway&)> call);
      /// bestEffort on the abort executor, never queued behind the operation it aborts.
      void abortRemote(std::string what, std::function<void(CommandGateway&)> call);

      void fullReset();
      void saveHistory();
      void armDeadline(std::chrono::seconds after, std::string message);

      bool hasDevice() const { return ctx_.device.has_value(); }
      std::string devicePort() const { return ctx_.device ? ctx_.device->port : std::string{}; }

      std::shared_ptr<CommandGateway> gateway_;
      Executor& executor_;
      Executor& abortExecutor_;
      NotificationHub& hub_;
      std::shared_ptr<ErrorMonitor> monitor_;
      std::shared_ptr<HistoryLogger> history_;
      OrchestratorTimers timers_;

      std::shared_ptr<EventLoop> loop_;
      std::optional<EventBridge> bridge_;

      State state_{ State::Idle };
      WizardContext ctx_;
      std::uint64_t generation_{ 0 };
      bool controlInFlight_{ false };
      std::optional<EventLoop::TimerId> deadline_;
      TransitionListener listener_;
    };

  } // namespace core
} // namespace cloneflow
