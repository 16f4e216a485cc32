#pragma once
/** @file  WizardContext.hpp
 *  @brief The mutable record the orchestrator accumulates and clears across transitions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// cloneflow headers
#include "protocols/CardTypes.hpp"

namespace cloneflow {
  namespace core {

    /// Which operation raised the error; keys recovery together with RecoveryAction.
    enum class ErrorSource : std::uint8_t { Detect, Scan, Blank, Write, Verify };

    enum class FirmwareStatus : std::uint8_t { Unknown, Matched, Mismatched, Updating, Updated };

    const char* toString(ErrorSource s);
    const char* toString(FirmwareStatus s);

    struct DeviceInfo {
      std::string port;
      std::string model;
      std::string firmware;

      bool operator==(const DeviceInfo&) const = default;
    };

    struct Credential {
      protocols::Frequency frequency{ protocols::Frequency::LF };
      protocols::CardType cardType{ protocols::CardType::EM4100 };
      protocols::CardData data;
      bool cloneable{ false };
      protocols::BlankType recommendedBlank{ protocols::BlankType::T5577 };

      bool operator==(const Credential&) const = default;
    };

    struct BlankTarget {
      std::optional<protocols::BlankType> expected;
      std::optional<protocols::BlankType> detected;
      bool readyToWrite{ false };
      std::optional<std::string> existingData;

      bool operator==(const BlankTarget&) const = default;
    };

    struct WriteProgress {
      int percent{ 0 };
      std::optional<std::uint16_t> currentBlock; ///< set together with totalBlocks
      std::optional<std::uint16_t> totalBlocks;

      bool operator==(const WriteProgress&) const = default;
    };

    struct Verification {
      std::optional<bool> success;
      std::vector<std::uint16_t> mismatchedBlocks; ///< non-empty only when success == false

      bool operator==(const Verification&) const = default;
    };

    struct ErrorInfo {
      std::string message;     ///< diagnostic, path-scrubbed
      std::string userMessage;
      bool recoverable{ false };
      std::optional<protocols::RecoveryAction> recoveryAction;
      ErrorSource source{ ErrorSource::Detect };

      bool operator==(const ErrorInfo&) const = default;
    };

    struct FirmwareInfo {
      std::optional<FirmwareStatus> status;
      std::string clientVersion;
      std::string deviceVersion;
      std::string hardwareVariant;
      bool imageExists{ false };
      int flashPercent{ 0 };
      std::string flashMessage;

      bool operator==(const FirmwareInfo&) const = default;
    };

    struct HfProgress {
      std::string phase;
      std::uint32_t keysFound{ 0 }; ///< never above keysTotal
      std::uint32_t keysTotal{ 0 };
      std::uint32_t elapsedSecs{ 0 };
      std::optional<std::string> dumpInfo;

      bool operator==(const HfProgress&) const = default;
    };

    /**
 * @struct WizardContext
 * @brief Grouped by concern; every group starts empty.
 *
 *  * `reset()`: terminal reset, everything back to empty.
 *  * `clearWorkflow()`: soft reset / back-to-scan: keeps device + firmware.
 *  * Mutated only on the orchestrator's loop thread.
 */
    struct WizardContext {
      std::optional<DeviceInfo> device;
      std::optional<Credential> credential;
      BlankTarget blank;
      WriteProgress write;
      Verification verify;
      std::optional<std::string> completedAt;
      std::optional<ErrorInfo> error;
      FirmwareInfo firmware;
      HfProgress hf;

      void reset();
      void clearWorkflow();

      //---guarded setters (keep the per-group invariants)------------------
      void setWriteProgress(int percent, std::optional<std::uint16_t> current,
                            std::optional<std::uint16_t> total);
      void setHfProgress(std::string phase, std::uint32_t found, std::uint32_t total,
                         std::uint32_t elapsed);
      void setVerification(bool success, std::vector<std::uint16_t> mismatched);
      void setBlankDetected(protocols::BlankType detected, bool deviceSaysReady,
                            std::optional<std::string> existingData);

      bool operator==(const WizardContext&) const = default;
    };

  } // namespace core
} // namespace cloneflow
