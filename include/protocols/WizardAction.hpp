#pragma once
/** @file  WizardAction.hpp
 *  @brief Control actions that advance the authoritative machine in lockstep.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string_view>
#include <variant>

// cloneflow headers
#include "protocols/CardTypes.hpp"

namespace cloneflow::protocols {

  namespace action {

    struct ProceedToWrite {
      static constexpr std::string_view kName = "ProceedToWrite";
      BlankType blankType{ BlankType::T5577 };
    };

    struct MarkComplete {
      static constexpr std::string_view kName = "MarkComplete";
      CardSummary source;
      CardSummary target;
    };

    struct Reset {
      static constexpr std::string_view kName = "Reset";
    };

    struct BackToScan {
      static constexpr std::string_view kName = "BackToScan";
    };

    struct SoftReset {
      static constexpr std::string_view kName = "SoftReset";
    };

    struct Disconnect {
      static constexpr std::string_view kName = "Disconnect";
    };

    struct ReDetectBlank {
      static constexpr std::string_view kName = "ReDetectBlank";
    };

    struct LoadSavedCard {
      static constexpr std::string_view kName = "LoadSavedCard";
      SavedCard card;
    };

    struct CancelHfProcess {
      static constexpr std::string_view kName = "CancelHfProcess";
    };

  } // namespace action

  using WizardAction =
      std::variant<action::ProceedToWrite, action::MarkComplete, action::Reset,
                   action::BackToScan, action::SoftReset, action::Disconnect,
                   action::ReDetectBlank, action::LoadSavedCard, action::CancelHfProcess>;

  std::string_view actionName(const WizardAction& a);

} // namespace cloneflow::protocols
