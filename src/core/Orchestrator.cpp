/* @file Orchestrator.cpp
 * @brief transition table, entry operations and recovery keying of the clone workflow
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <variant>

// cloneflow headers
#include "core/Orchestrator.hpp"
#include "core/Redact.hpp"

using namespace cloneflow::core;
using namespace cloneflow::protocols;

namespace {

  template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
  };

  std::string isoUtcNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << millis << 'Z';
    return os.str();
  }

  CardSummary summaryOf(CardType type, const std::string& uid) {
    return CardSummary{ toString(type), uid, displayName(type) };
  }

  CardSummary summaryOf(BlankType type, const std::string& uid) {
    return CardSummary{ toString(type), uid, displayName(type) };
  }

  bool isRetryToBlank(ErrorSource s) { return s == ErrorSource::Write || s == ErrorSource::Blank; }

  void submitBestEffort(Executor& lane, std::shared_ptr<CommandGateway> gateway,
                        std::shared_ptr<ErrorMonitor> monitor, std::string what,
                        std::function<void(CommandGateway&)> call) {
    lane.submit([gateway = std::move(gateway), monitor = std::move(monitor), what = std::move(what),
                 call = std::move(call)] {
      try {
        call(*gateway);
      } catch (const std::exception& e) {
        monitor->notifyFailure(what + " failed: " + redactPaths(e.what()));
      }
    });
  }

} // namespace

const char* cloneflow::core::toString(State s) {
  switch (s) {
  case State::Idle:
    return "idle";
  case State::DetectingDevice:
    return "detectingDevice";
  case State::CheckingFirmware:
    return "checkingFirmware";
  case State::FirmwareOutdated:
    return "firmwareOutdated";
  case State::UpdatingFirmware:
    return "updatingFirmware";
  case State::RedetectingDevice:
    return "redetectingDevice";
  case State::DeviceConnected:
    return "deviceConnected";
  case State::ScanningCard:
    return "scanningCard";
  case State::CredentialIdentified:
    return "credentialIdentified";
  case State::HfProcessing:
    return "hfProcessing";
  case State::HfDumpReady:
    return "hfDumpReady";
  case State::WaitingForBlank:
    return "waitingForBlank";
  case State::BlankDetected:
    return "blankDetected";
  case State::Writing:
    return "writing";
  case State::Verifying:
    return "verifying";
  case State::VerificationComplete:
    return "verificationComplete";
  case State::Complete:
    return "complete";
  case State::Error:
    return "error";
  }
  return "unknown";
}

Orchestrator::Orchestrator(std::shared_ptr<CommandGateway> gateway, Executor& executor,
                           Executor& abortExecutor, NotificationHub& hub,
                           std::shared_ptr<ErrorMonitor> monitor,
                           std::shared_ptr<HistoryLogger> history, OrchestratorTimers timers,
                           EventLoop::NowFn now)
    : gateway_(std::move(gateway)),
      executor_(executor),
      abortExecutor_(abortExecutor),
      hub_(hub),
      monitor_(std::move(monitor)),
      history_(std::move(history)),
      timers_(timers),
      loop_(std::make_shared<EventLoop>(std::move(now))) {
  assert(gateway_ && "Orchestrator needs a gateway");
  assert(monitor_ && "Orchestrator needs an ErrorMonitor");
}

Orchestrator::~Orchestrator() { shutdown(); }

void Orchestrator::start() {
  if (bridge_)
    return;
  std::weak_ptr<EventLoop> weakLoop = loop_;
  bridge_.emplace(hub_, [this, weakLoop](BridgedEvent ev) {
    if (auto loop = weakLoop.lock())
      loop->post([this, ev = std::move(ev)] { handleBridged(ev); });
  });
}

void Orchestrator::shutdown() { bridge_.reset(); }

void Orchestrator::onTransition(TransitionListener listener) { listener_ = std::move(listener); }

//---intents: post onto the loop------------------------------------------------

void Orchestrator::detect() { loop_->post([this] { handleDetect(); }); }
void Orchestrator::scan() { loop_->post([this] { handleScan(); }); }
void Orchestrator::skipToBlank(BlankType expected) {
  loop_->post([this, expected] { handleSkipToBlank(expected); });
}
void Orchestrator::startHfProcess() { loop_->post([this] { handleStartHf(); }); }
void Orchestrator::cancelHf() { loop_->post([this] { handleCancelHf(); }); }
void Orchestrator::write() { loop_->post([this] { handleWrite(); }); }
void Orchestrator::finish() { loop_->post([this] { handleFinish(); }); }
void Orchestrator::reset() { loop_->post([this] { handleReset(); }); }
void Orchestrator::recover() { loop_->post([this] { handleRecover(); }); }
void Orchestrator::updateFirmware() { loop_->post([this] { handleUpdateFirmware(); }); }
void Orchestrator::skipFirmware() { loop_->post([this] { handleSkipFirmware(); }); }
void Orchestrator::cancelFirmware() { loop_->post([this] { handleCancelFirmware(); }); }
void Orchestrator::selectVariant(std::string variant) {
  loop_->post([this, variant = std::move(variant)] { handleSelectVariant(variant); });
}
void Orchestrator::backToScan() { loop_->post([this] { handleBackToScan(); }); }
void Orchestrator::softReset() { loop_->post([this] { handleSoftReset(); }); }
void Orchestrator::disconnect() { loop_->post([this] { handleDisconnect(); }); }
void Orchestrator::reDetectBlank() { loop_->post([this] { handleReDetectBlank(); }); }
void Orchestrator::loadSavedCard(SavedCard card) {
  loop_->post([this, card = std::move(card)] { handleLoadSavedCard(card); });
}

//---transitions------------------------------------------------------------------

void Orchestrator::transitionTo(State next) {
  const State prev = state_;
  ++generation_; // results of the superseded invocation are dropped
  if (deadline_) {
    loop_->cancel(*deadline_);
    deadline_.reset();
  }
  if (prev == State::Error && next != State::Error)
    ctx_.error.reset();

  state_ = next;
  if (listener_)
    listener_(prev, next);
  enterAction(next);
}

void Orchestrator::enterAction(State s) {
  switch (s) {
  case State::DetectingDevice:
  case State::RedetectingDevice:
    runDetect(s);
    break;
  case State::CheckingFirmware:
    runFirmwareCheck();
    break;
  case State::UpdatingFirmware:
    runFlash();
    break;
  case State::ScanningCard:
    runScan();
    break;
  case State::HfProcessing:
    runHfProcess();
    break;
  case State::WaitingForBlank:
    runBlankDetect();
    break;
  case State::Writing:
    runWrite();
    break;
  case State::Verifying:
    runVerify();
    break;
  default:
    break; // resting state: waits for an intent
  }
}

//---gateway plumbing-----------------------------------------------------------

template <class Call, class OnOk, class OnFail>
void Orchestrator::invoke(Call call, OnOk onOk, OnFail onFail) {
  using Result = std::invoke_result_t<Call&, CommandGateway&>;
  using Value = std::conditional_t<std::is_void_v<Result>, std::monostate, Result>;

  const std::uint64_t issuedAt = generation_;
  std::weak_ptr<EventLoop> weakLoop = loop_;

  executor_.submit([this, issuedAt, weakLoop, gateway = gateway_, call = std::move(call),
                    onOk = std::move(onOk), onFail = std::move(onFail)]() mutable {
    std::optional<Value> result;
    std::string failure;
    try {
      if constexpr (std::is_void_v<Result>) {
        call(*gateway);
        result.emplace();
      } else {
        result.emplace(call(*gateway));
      }
    } catch (const std::exception& e) {
      failure = e.what();
    }

    auto loop = weakLoop.lock();
    if (!loop)
      return; // orchestrator is gone
    loop->post([this, issuedAt, result = std::move(result), failure = std::move(failure),
                onOk = std::move(onOk), onFail = std::move(onFail)]() mutable {
      if (issuedAt != generation_)
        return; // stale
      if (result)
        onOk(std::move(*result));
      else
        onFail(failure);
    });
  });
}

void Orchestrator::control(WizardAction action, std::function<void()> onAccepted) {
  ++generation_; // supersede whatever the current state still has in flight
  controlInFlight_ = true;
  const std::string name(actionName(action));

  auto rejected = [this, name](const std::string& why) {
    controlInFlight_ = false;
    monitor_->notifyFailure(name + " rejected by device (" + redactPaths(why) + "), resetting");
    fullReset();
  };

  invoke([action](CommandGateway& g) { return g.wizardAction(action); },
         [this, rejected, onAccepted = std::move(onAccepted)](WizardState outcome) {
           if (const auto* err = std::get_if<step::Error>(&outcome)) {
             rejected(err->message);
             return;
           }
           controlInFlight_ = false;
           onAccepted();
         },
         rejected);
}

void Orchestrator::bestEffort(std::string what, std::function<void(CommandGateway&)> call) {
  submitBestEffort(executor_, gateway_, monitor_, std::move(what), std::move(call));
}

void Orchestrator::abortRemote(std::string what, std::function<void(CommandGateway&)> call) {
  submitBestEffort(abortExecutor_, gateway_, monitor_, std::move(what), std::move(call));
}

void Orchestrator::armDeadline(std::chrono::seconds after, std::string message) {
  const State armedIn = state_;
  deadline_ = loop_->scheduleAfter(after, [this, armedIn, message = std::move(message)] {
    deadline_.reset();
    if (state_ != armedIn)
      return;
    fail(ErrorSource::Detect, message, "The device stopped responding. Reconnect it and try again.",
         true, RecoveryAction::Reconnect);
  });
}

//---errors---------------------------------------------------------------------

void Orchestrator::fail(ErrorSource source, const std::string& message,
                        const std::string& userMessage, bool recoverable,
                        std::optional<RecoveryAction> action) {
  ctx_.error = ErrorInfo{ redactPaths(message), redactPaths(userMessage), recoverable, action, source };
  std::cerr << "[Orchestrator] " << toString(source) << " failed in " << toString(state_) << ": "
            << ctx_.error->message << '\n';
  transitionTo(State::Error);
}

void Orchestrator::rejectOutcome(ErrorSource source, const WizardState& outcome,
                                 const std::string& unexpectedUserMessage,
                                 RecoveryAction unexpectedAction) {
  if (const auto* err = std::get_if<step::Error>(&outcome)) {
    fail(source, err->message, err->userMessage, err->recoverable, err->recoveryAction);
    return;
  }
  fail(source,
       "unexpected " + std::string(stepName(outcome)) + " outcome in " + toString(state_),
       unexpectedUserMessage, true, unexpectedAction);
}

//---entry operations-----------------------------------------------------------

void Orchestrator::runDetect(State issuing) {
  if (issuing == State::RedetectingDevice)
    armDeadline(timers_.redetectDeadline, "device did not re-enumerate after the firmware update");

  invoke([](CommandGateway& g) { return g.detectDevice(); },
         [this, issuing](WizardState outcome) {
           if (const auto* dev = std::get_if<step::DeviceConnected>(&outcome)) {
             ctx_.device = DeviceInfo{ dev->port, dev->model, dev->firmware };
             transitionTo(issuing == State::DetectingDevice ? State::CheckingFirmware
                                                            : State::DeviceConnected);
             return;
           }
           // unlike other states, an unexpected tag here maps to Reconnect, not Retry:
           // no device is known yet, so there is nothing to retry against
           rejectOutcome(ErrorSource::Detect, outcome,
                         "Could not detect a reader. Check the USB connection and try again.",
                         RecoveryAction::Reconnect);
         },
         [this](const std::string& why) {
           fail(ErrorSource::Detect, why,
                "Could not detect a reader. Check the USB connection and try again.", true,
                RecoveryAction::Reconnect);
         });
}

void Orchestrator::runFirmwareCheck() {
  const std::string port = devicePort();
  invoke([port](CommandGateway& g) { return g.checkFirmwareVersion(port); },
         [this](FirmwareCheck check) {
           auto& fw = ctx_.firmware;
           fw.clientVersion = check.clientVersion;
           fw.deviceVersion = check.deviceVersion;
           fw.hardwareVariant = check.hardwareVariant;
           fw.imageExists = check.imageExists;
           if (check.matched) {
             fw.status = FirmwareStatus::Matched;
             transitionTo(State::DeviceConnected);
           } else {
             fw.status = FirmwareStatus::Mismatched;
             transitionTo(State::FirmwareOutdated);
           }
         },
         [this](const std::string& why) {
           // a check that cannot run never blocks the workflow
           std::cerr << "[Orchestrator] firmware check skipped: " << redactPaths(why) << '\n';
           ctx_.firmware.status = FirmwareStatus::Unknown;
           transitionTo(State::DeviceConnected);
         });
}

void Orchestrator::runFlash() {
  auto& fw = ctx_.firmware;
  fw.status = FirmwareStatus::Updating;
  fw.flashPercent = 0;
  fw.flashMessage.clear();
  armDeadline(timers_.flashDeadline, "firmware update produced no completion event");

  const std::string port = devicePort();
  const std::string variant = fw.hardwareVariant;
  invoke([port, variant](CommandGateway& g) { g.flashFirmware(port, variant); },
         [](std::monostate) {}, // completion arrives on the notification stream
         [this](const std::string& why) {
           fail(ErrorSource::Detect, why,
                "Firmware update could not start. Reconnect the device and try again.", true,
                RecoveryAction::Reconnect);
         });
}

void Orchestrator::runScan() {
  invoke([](CommandGateway& g) { return g.scanCard(); },
         [this](WizardState outcome) {
           if (const auto* card = std::get_if<step::CardIdentified>(&outcome)) {
             ctx_.credential = Credential{ card->frequency, card->cardType, card->cardData,
                                           card->cloneable, card->recommendedBlank };
             transitionTo(State::CredentialIdentified);
             return;
           }
           rejectOutcome(ErrorSource::Scan, outcome,
                         "No card detected. Place a card on the reader and try again.",
                         RecoveryAction::Retry);
         },
         [this](const std::string& why) {
           fail(ErrorSource::Scan, why, "Card scan failed. Check device connection.", true,
                RecoveryAction::Retry);
         });
}

void Orchestrator::runHfProcess() {
  ctx_.hf = HfProgress{};
  const bool keyRecovery = needsKeyRecovery(ctx_.credential->cardType);

  invoke([keyRecovery](CommandGateway& g) { return keyRecovery ? g.hfAutopwn() : g.hfDump(); },
         [this](WizardState outcome) {
           if (const auto* ready = std::get_if<step::HfDumpReady>(&outcome)) {
             ctx_.hf.dumpInfo = ready->dumpInfo;
             transitionTo(State::HfDumpReady);
             return;
           }
           rejectOutcome(ErrorSource::Scan, outcome,
                         "Reading the card did not finish. Keep it on the reader and try again.",
                         RecoveryAction::Retry);
         },
         [this](const std::string& why) {
           fail(ErrorSource::Scan, why, "Key recovery failed. Check device connection.", true,
                RecoveryAction::Retry);
         });
}

void Orchestrator::runBlankDetect() {
  const std::string port = devicePort();
  invoke([port](CommandGateway& g) { return g.detectBlank(port); },
         [this](WizardState outcome) {
           if (const auto* blank = std::get_if<step::BlankDetected>(&outcome)) {
             ctx_.setBlankDetected(blank->blankType, blank->readyToWrite, blank->existingDataType);
             transitionTo(State::BlankDetected);
             return;
           }
           rejectOutcome(ErrorSource::Blank, outcome, "Place the correct blank card on the reader.",
                         RecoveryAction::Retry);
         },
         [this](const std::string& why) {
           fail(ErrorSource::Blank, why, "Failed to detect blank card.", true,
                RecoveryAction::Retry);
         });
}

void Orchestrator::runWrite() {
  ctx_.setWriteProgress(0, std::nullopt, std::nullopt);
  const Credential cred = *ctx_.credential;
  const std::optional<BlankType> blank = ctx_.blank.detected ? ctx_.blank.detected : ctx_.blank.expected;

  auto onOk = [this](WizardState outcome) {
    const bool written = std::holds_alternative<step::Verifying>(outcome) ||
                         std::holds_alternative<step::VerificationComplete>(outcome) ||
                         std::holds_alternative<step::Complete>(outcome);
    if (written) {
      ctx_.setWriteProgress(100, ctx_.write.currentBlock, ctx_.write.totalBlocks);
      transitionTo(State::Verifying);
      return;
    }
    rejectOutcome(ErrorSource::Write, outcome, "Write failed. Do not remove the card.",
                  RecoveryAction::Retry);
  };
  // the blank may hold half a payload; only the device may call that recoverable
  auto onFail = [this](const std::string& why) {
    fail(ErrorSource::Write, why, "Write operation failed. Do not remove the card.", false,
         RecoveryAction::Manual);
  };

  if (cred.frequency == Frequency::HF) {
    const HfCloneRequest req{ cred.data.uid, cred.cardType, blank.value_or(cred.recommendedBlank) };
    invoke([req](CommandGateway& g) { return g.hfWriteClone(req); }, onOk, onFail);
  } else {
    const WriteRequest req{ devicePort(), cred.cardType, cred.data.uid, cred.data.decoded, blank };
    invoke([req](CommandGateway& g) { return g.writeClone(req); }, onOk, onFail);
  }
}

void Orchestrator::runVerify() {
  const Credential cred = *ctx_.credential;
  const std::optional<BlankType> blank = ctx_.blank.detected ? ctx_.blank.detected : ctx_.blank.expected;

  auto onOk = [this](WizardState outcome) {
    if (auto* result = std::get_if<step::VerificationComplete>(&outcome)) {
      ctx_.setVerification(result->success, std::move(result->mismatchedBlocks));
      transitionTo(State::VerificationComplete);
      return;
    }
    rejectOutcome(ErrorSource::Verify, outcome, "Verification could not complete.",
                  RecoveryAction::Retry);
  };
  auto onFail = [this](const std::string& why) {
    fail(ErrorSource::Verify, why, "Verification failed.", true, RecoveryAction::Retry);
  };

  if (cred.frequency == Frequency::HF) {
    const HfCloneRequest req{ cred.data.uid, cred.cardType, blank.value_or(cred.recommendedBlank) };
    invoke([req](CommandGateway& g) { return g.hfVerifyClone(req); }, onOk, onFail);
  } else {
    const VerifyRequest req{ devicePort(), cred.data.uid, cred.cardType, cred.data.decoded, blank };
    invoke([req](CommandGateway& g) { return g.verifyClone(req); }, onOk, onFail);
  }
}

//---intent handlers------------------------------------------------------------

void Orchestrator::handleDetect() {
  if (controlInFlight_)
    return;
  if (state_ == State::Idle)
    transitionTo(State::DetectingDevice);
  else if (state_ == State::Error && ctx_.error &&
           ctx_.error->recoveryAction == RecoveryAction::Reconnect)
    handleRecover();
}

void Orchestrator::handleScan() {
  if (controlInFlight_)
    return;
  if (state_ == State::DeviceConnected)
    transitionTo(State::ScanningCard);
  else if (state_ == State::Error && ctx_.error &&
           ctx_.error->recoveryAction == RecoveryAction::Retry && !isRetryToBlank(ctx_.error->source))
    handleRecover();
}

void Orchestrator::handleWrite() {
  if (controlInFlight_)
    return;
  if (state_ == State::BlankDetected && ctx_.blank.readyToWrite)
    transitionTo(State::Writing);
  else if (state_ == State::Error && ctx_.error &&
           ctx_.error->recoveryAction == RecoveryAction::Retry && isRetryToBlank(ctx_.error->source))
    handleRecover();
}

void Orchestrator::handleSkipToBlank(BlankType expected) {
  if (controlInFlight_ || !ctx_.credential)
    return;
  const bool lfCredential = state_ == State::CredentialIdentified &&
                            ctx_.credential->frequency == Frequency::LF && ctx_.credential->cloneable;
  if (!lfCredential && state_ != State::HfDumpReady)
    return;

  control(action::ProceedToWrite{ expected }, [this, expected] {
    ctx_.blank = BlankTarget{};
    ctx_.blank.expected = expected;
    transitionTo(State::WaitingForBlank);
  });
}

void Orchestrator::handleStartHf() {
  if (controlInFlight_ || state_ != State::CredentialIdentified || !ctx_.credential)
    return;
  if (ctx_.credential->frequency == Frequency::HF && ctx_.credential->cloneable)
    transitionTo(State::HfProcessing);
}

void Orchestrator::handleCancelHf() {
  if (controlInFlight_ || state_ != State::HfProcessing)
    return;
  // both sides: ask the device to abort, but never wait on it. The wizard action
  // is ordered after the aborted call returns.
  abortRemote("cancel_hf_operation", [](CommandGateway& g) { g.cancelHfOperation(); });
  bestEffort("CancelHfProcess",
             [](CommandGateway& g) { static_cast<void>(g.wizardAction(action::CancelHfProcess{})); });
  ctx_.hf = HfProgress{};
  transitionTo(State::CredentialIdentified);
}

void Orchestrator::handleFinish() {
  if (controlInFlight_ || state_ != State::VerificationComplete)
    return;
  if (ctx_.verify.success != true || !ctx_.credential)
    return;

  const Credential& cred = *ctx_.credential;
  const BlankType target = ctx_.blank.detected.value_or(ctx_.blank.expected.value_or(cred.recommendedBlank));
  action::MarkComplete mark{ summaryOf(cred.cardType, cred.data.uid), summaryOf(target, cred.data.uid) };

  control(std::move(mark), [this] {
    ctx_.completedAt = isoUtcNow();
    transitionTo(State::Complete);
    saveHistory();
  });
}

void Orchestrator::handleReset() { fullReset(); }

void Orchestrator::handleRecover() {
  if (controlInFlight_ || state_ != State::Error || !ctx_.error || !ctx_.error->recoveryAction)
    return;
  const ErrorInfo err = *ctx_.error;

  switch (*err.recoveryAction) {
  case RecoveryAction::Reconnect:
    bestEffort("reset_wizard", [](CommandGateway& g) { static_cast<void>(g.resetWizard()); });
    transitionTo(State::DetectingDevice);
    return;

  case RecoveryAction::Retry:
    if (isRetryToBlank(err.source)) {
      if (!hasDevice() || !ctx_.credential || !ctx_.blank.expected)
        return;
      control(action::ReDetectBlank{}, [this] {
        const auto expected = ctx_.blank.expected;
        ctx_.blank = BlankTarget{};
        ctx_.blank.expected = expected;
        ctx_.write = WriteProgress{};
        ctx_.verify = Verification{};
        transitionTo(State::WaitingForBlank);
      });
    } else if (err.source == ErrorSource::Detect) {
      bestEffort("reset_wizard", [](CommandGateway& g) { static_cast<void>(g.resetWizard()); });
      transitionTo(State::DetectingDevice);
    } else {
      if (!hasDevice())
        return;
      control(action::BackToScan{}, [this] {
        ctx_.clearWorkflow();
        transitionTo(State::ScanningCard);
      });
    }
    return;

  case RecoveryAction::GoBack:
  case RecoveryAction::Manual:
    return; // explicit reset only
  }
}

void Orchestrator::handleUpdateFirmware() {
  if (controlInFlight_ || state_ != State::FirmwareOutdated || !hasDevice())
    return;
  if (!isKnownHardwareVariant(ctx_.firmware.hardwareVariant))
    return; // ask for selectVariant first
  transitionTo(State::UpdatingFirmware);
}

void Orchestrator::handleSkipFirmware() {
  if (controlInFlight_ || state_ != State::FirmwareOutdated)
    return;
  transitionTo(State::DeviceConnected);
}

void Orchestrator::handleCancelFirmware() {
  if (controlInFlight_ || state_ != State::UpdatingFirmware)
    return;
  abortRemote("cancel_flash", [](CommandGateway& g) { g.cancelFlash(); });
  ctx_.firmware.status = FirmwareStatus::Mismatched;
  ctx_.firmware.flashPercent = 0;
  ctx_.firmware.flashMessage.clear();
  transitionTo(State::FirmwareOutdated);
}

void Orchestrator::handleSelectVariant(const std::string& variant) {
  if (controlInFlight_ || state_ != State::FirmwareOutdated || !isKnownHardwareVariant(variant))
    return;
  ctx_.firmware.hardwareVariant = variant;
}

void Orchestrator::handleBackToScan() {
  if (controlInFlight_ || !hasDevice())
    return;
  switch (state_) {
  case State::CredentialIdentified:
  case State::WaitingForBlank:
  case State::BlankDetected:
  case State::HfDumpReady:
  case State::VerificationComplete:
  case State::Complete:
  case State::Error:
    break;
  default:
    return;
  }
  control(action::BackToScan{}, [this] {
    ctx_.clearWorkflow();
    transitionTo(State::DeviceConnected);
  });
}

void Orchestrator::handleSoftReset() {
  if (controlInFlight_ || (state_ != State::Complete && state_ != State::Error))
    return;
  control(action::SoftReset{}, [this] {
    ctx_.clearWorkflow();
    transitionTo(hasDevice() ? State::DeviceConnected : State::Idle);
  });
}

void Orchestrator::handleDisconnect() {
  if (controlInFlight_ || !hasDevice())
    return;
  switch (state_) {
  case State::DeviceConnected:
  case State::FirmwareOutdated:
  case State::CredentialIdentified:
  case State::HfDumpReady:
  case State::WaitingForBlank:
  case State::BlankDetected:
  case State::VerificationComplete:
  case State::Complete:
  case State::Error:
    break;
  default:
    return;
  }
  control(action::Disconnect{}, [this] {
    ctx_.reset();
    transitionTo(State::Idle);
  });
}

void Orchestrator::handleReDetectBlank() {
  if (controlInFlight_ || state_ != State::BlankDetected)
    return;
  control(action::ReDetectBlank{}, [this] {
    ctx_.blank.detected.reset();
    ctx_.blank.readyToWrite = false;
    ctx_.blank.existingData.reset();
    transitionTo(State::WaitingForBlank);
  });
}

void Orchestrator::handleLoadSavedCard(const SavedCard& card) {
  if (controlInFlight_ || state_ != State::DeviceConnected)
    return;
  control(action::LoadSavedCard{ card }, [this, card] {
    ctx_.credential =
        Credential{ card.frequency, card.cardType, card.data, card.cloneable, card.recommendedBlank };
    transitionTo(State::CredentialIdentified);
  });
}

//---bridged notifications------------------------------------------------------

void Orchestrator::handleBridged(const BridgedEvent& ev) {
  std::visit(overloaded{
                 [this](const bridged::WriteProgress& e) {
                   ctx_.setWriteProgress(e.percent, e.currentBlock, e.totalBlocks);
                 },
                 [this](const bridged::HfProgress& e) {
                   ctx_.setHfProgress(e.phase, e.keysFound, e.keysTotal, e.elapsedSecs);
                 },
                 [this](const bridged::FlashProgress& e) {
                   ctx_.firmware.flashPercent = e.percent;
                   ctx_.firmware.flashMessage = e.message;
                 },
                 [this](const bridged::FlashComplete&) {
                   if (state_ != State::UpdatingFirmware)
                     return;
                   ctx_.firmware.status = FirmwareStatus::Updated;
                   ctx_.firmware.flashPercent = 100;
                   transitionTo(State::RedetectingDevice);
                 },
                 [this](const bridged::FlashFailed& e) {
                   if (state_ != State::UpdatingFirmware)
                     return;
                   fail(ErrorSource::Detect, e.message,
                        "Firmware update failed. Reconnect the device and try again.", true,
                        RecoveryAction::Reconnect);
                 },
             },
             ev);
}

//---resets and history---------------------------------------------------------

void Orchestrator::fullReset() {
  if (state_ == State::UpdatingFirmware)
    abortRemote("cancel_flash", [](CommandGateway& g) { g.cancelFlash(); });
  else if (state_ == State::HfProcessing)
    abortRemote("cancel_hf_operation", [](CommandGateway& g) { g.cancelHfOperation(); });
  // local reset always succeeds; the remote one is best effort, queued after the aborted call
  bestEffort("reset_wizard", [](CommandGateway& g) { static_cast<void>(g.resetWizard()); });

  controlInFlight_ = false;
  ctx_.reset();
  transitionTo(State::Idle);
}

void Orchestrator::saveHistory() {
  if (!history_ || !ctx_.credential)
    return;
  const Credential& cred = *ctx_.credential;
  const BlankType target = ctx_.blank.detected.value_or(ctx_.blank.expected.value_or(cred.recommendedBlank));

  CloneRecord rec;
  rec.sourceType = toString(cred.cardType);
  rec.sourceUid = cred.data.uid;
  rec.targetType = toString(target);
  rec.targetUid = cred.data.uid;
  rec.port = devicePort();
  rec.success = true;
  rec.timestamp = ctx_.completedAt.value_or(isoUtcNow());

  try {
    history_->record(rec);
  } catch (const std::exception& e) {
    monitor_->notifyFailure(std::string("history save failed: ") + redactPaths(e.what()));
  }
}
