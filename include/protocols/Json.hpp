#pragma once
/** @file  Json.hpp
 *  @brief nlohmann::json codec for outcomes, actions, notifications and records.
 *
 *  Decoders throw (nlohmann::json::exception or std::invalid_argument) on unknown
 *  tags, unknown enum names and missing required fields; callers decide whether
 *  that is a transport failure or a config error.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string_view>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cloneflow headers
#include "protocols/CardTypes.hpp"
#include "protocols/Notifications.hpp"
#include "protocols/WizardAction.hpp"
#include "protocols/WizardState.hpp"

namespace cloneflow::protocols {

  //---enums (ADL hooks)-------------------------------------------------------
  void to_json(nlohmann::json& j, Frequency f);
  void from_json(const nlohmann::json& j, Frequency& f);
  void to_json(nlohmann::json& j, CardType t);
  void from_json(const nlohmann::json& j, CardType& t);
  void to_json(nlohmann::json& j, BlankType b);
  void from_json(const nlohmann::json& j, BlankType& b);
  void to_json(nlohmann::json& j, RecoveryAction a);
  void from_json(const nlohmann::json& j, RecoveryAction& a);

  //---records-----------------------------------------------------------------
  void to_json(nlohmann::json& j, const CardData& d);
  void from_json(const nlohmann::json& j, CardData& d);
  void to_json(nlohmann::json& j, const CardSummary& s);
  void from_json(const nlohmann::json& j, CardSummary& s);
  void to_json(nlohmann::json& j, const SavedCard& c);
  void from_json(const nlohmann::json& j, FirmwareCheck& f);

  //---tagged unions -----------------------------------------------------------
  /** {"step": <tag>, "data": {...}}; "data" omitted for payload-less steps. */
  nlohmann::json encodeState(const WizardState& state);
  WizardState decodeState(const nlohmann::json& j);

  /** {"action": <name>, "payload": {...}}; mirrors the authoritative action enum. */
  nlohmann::json encodeAction(const WizardAction& a);

  /** Build a Notification from an event line's channel name and payload. */
  Notification decodeNotification(std::string_view channel, const nlohmann::json& payload);

} // namespace cloneflow::protocols
