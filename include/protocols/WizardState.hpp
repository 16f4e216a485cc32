#pragma once
/** @file  WizardState.hpp
 *  @brief Authoritative outcome: the closed tagged union every gateway call returns.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// cloneflow headers
#include "protocols/CardTypes.hpp"

namespace cloneflow::protocols {

  /**
 * One struct per authoritative step. `kStep` is the wire tag; the codec walks
 * the variant alternatives with it, so adding a step here is enough to make it
 * decodable and every exhaustive `std::visit` over WizardState a compile error
 * until the new step is handled.
 */
  namespace step {

    struct Idle {
      static constexpr std::string_view kStep = "Idle";
    };

    struct DetectingDevice {
      static constexpr std::string_view kStep = "DetectingDevice";
    };

    struct DeviceConnected {
      static constexpr std::string_view kStep = "DeviceConnected";
      std::string port;
      std::string model;
      std::string firmware;
    };

    struct ScanningCard {
      static constexpr std::string_view kStep = "ScanningCard";
    };

    struct CardIdentified {
      static constexpr std::string_view kStep = "CardIdentified";
      Frequency frequency{ Frequency::LF };
      CardType cardType{ CardType::EM4100 };
      CardData cardData;
      bool cloneable{ false };
      BlankType recommendedBlank{ BlankType::T5577 };
    };

    struct WaitingForBlank {
      static constexpr std::string_view kStep = "WaitingForBlank";
      BlankType expectedBlank{ BlankType::T5577 };
    };

    struct BlankDetected {
      static constexpr std::string_view kStep = "BlankDetected";
      BlankType blankType{ BlankType::T5577 };
      bool readyToWrite{ false };
      std::optional<std::string> existingDataType;
    };

    struct Writing {
      static constexpr std::string_view kStep = "Writing";
      double progress{ 0.0 };
      std::optional<std::uint16_t> currentBlock;
      std::optional<std::uint16_t> totalBlocks;
    };

    struct HfProcessing {
      static constexpr std::string_view kStep = "HfProcessing";
      std::string phase;
      std::uint32_t keysFound{ 0 };
      std::uint32_t keysTotal{ 0 };
      std::uint32_t elapsedSecs{ 0 };
    };

    struct HfDumpReady {
      static constexpr std::string_view kStep = "HfDumpReady";
      std::string dumpInfo;
    };

    struct Verifying {
      static constexpr std::string_view kStep = "Verifying";
    };

    struct VerificationComplete {
      static constexpr std::string_view kStep = "VerificationComplete";
      bool success{ false };
      std::vector<std::uint16_t> mismatchedBlocks;
    };

    struct Complete {
      static constexpr std::string_view kStep = "Complete";
      CardSummary source;
      CardSummary target;
      std::string timestamp;
    };

    struct Error {
      static constexpr std::string_view kStep = "Error";
      std::string message;
      std::string userMessage;
      bool recoverable{ false };
      std::optional<RecoveryAction> recoveryAction;
    };

  } // namespace step

  using WizardState =
      std::variant<step::Idle, step::DetectingDevice, step::DeviceConnected, step::ScanningCard,
                   step::CardIdentified, step::WaitingForBlank, step::BlankDetected,
                   step::Writing, step::HfProcessing, step::HfDumpReady, step::Verifying,
                   step::VerificationComplete, step::Complete, step::Error>;

  /// Wire tag of the active alternative.
  std::string_view stepName(const WizardState& state);

} // namespace cloneflow::protocols
