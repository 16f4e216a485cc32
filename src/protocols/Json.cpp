/* @file Json.cpp
 * @brief nlohmann::json (de)serialisation matching the authoritative machine's tagging
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

// cloneflow headers
#include "protocols/Json.hpp"

using nlohmann::json;

namespace {

  template <typename T> std::optional<T> optionalField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return std::nullopt;
    return it->template get<T>();
  }

  template <typename T> void putOptional(json& j, const char* key, const std::optional<T>& v) {
    if (v)
      j[key] = *v;
    else
      j[key] = nullptr;
  }

  template <typename T> T decodeAlternative(const json& data) {
    if constexpr (std::is_empty_v<T>) {
      (void)data;
      return T{};
    } else {
      return data.get<T>();
    }
  }

  [[noreturn]] void unknownName(const char* what, const json& j) {
    throw std::invalid_argument(std::string("unknown ") + what + ": " + j.dump());
  }

} // namespace

namespace cloneflow::protocols {

  //---enums---------------------------------------------------------------------
  void to_json(json& j, Frequency f) { j = toString(f); }

  void from_json(const json& j, Frequency& f) {
    auto parsed = parseFrequency(j.get<std::string>());
    if (!parsed)
      unknownName("frequency", j);
    f = *parsed;
  }

  void to_json(json& j, CardType t) { j = toString(t); }

  void from_json(const json& j, CardType& t) {
    auto parsed = parseCardType(j.get<std::string>());
    if (!parsed)
      unknownName("card type", j);
    t = *parsed;
  }

  void to_json(json& j, BlankType b) { j = toString(b); }

  void from_json(const json& j, BlankType& b) {
    auto parsed = parseBlankType(j.get<std::string>());
    if (!parsed)
      unknownName("blank type", j);
    b = *parsed;
  }

  void to_json(json& j, RecoveryAction a) { j = toString(a); }

  void from_json(const json& j, RecoveryAction& a) {
    auto parsed = parseRecoveryAction(j.get<std::string>());
    if (!parsed)
      unknownName("recovery action", j);
    a = *parsed;
  }

  //---records-------------------------------------------------------------------
  void to_json(json& j, const CardData& d) {
    j = json{ { "uid", d.uid }, { "raw", d.raw }, { "decoded", d.decoded } };
  }

  void from_json(const json& j, CardData& d) {
    j.at("uid").get_to(d.uid);
    d.raw = j.value("raw", std::string{});
    d.decoded = j.value("decoded", std::map<std::string, std::string>{});
  }

  void to_json(json& j, const CardSummary& s) {
    j = json{ { "card_type", s.cardType }, { "uid", s.uid }, { "display_name", s.displayName } };
  }

  void from_json(const json& j, CardSummary& s) {
    j.at("card_type").get_to(s.cardType);
    j.at("uid").get_to(s.uid);
    s.displayName = j.value("display_name", s.cardType);
  }

  void to_json(json& j, const SavedCard& c) {
    j = json{ { "frequency", c.frequency },
              { "card_type", c.cardType },
              { "uid", c.data.uid },
              { "raw", c.data.raw },
              { "decoded", c.data.decoded },
              { "cloneable", c.cloneable },
              { "recommended_blank", c.recommendedBlank } };
  }

  void from_json(const json& j, FirmwareCheck& f) {
    j.at("matched").get_to(f.matched);
    f.clientVersion = j.value("clientVersion", std::string{});
    f.deviceVersion = j.value("deviceFirmwareVersion", std::string{});
    f.hardwareVariant = j.value("hardwareVariant", std::string{ "unknown" });
    f.imageExists = j.value("firmwarePathExists", false);
  }

  //---notification payloads -----------------------------------------------------
  void from_json(const json& j, WriteProgressEvent& e) {
    j.at("progress").get_to(e.progress);
    e.currentBlock = optionalField<std::uint16_t>(j, "current_block");
    e.totalBlocks = optionalField<std::uint16_t>(j, "total_blocks");
  }

  void from_json(const json& j, HfProgressEvent& e) {
    j.at("phase").get_to(e.phase);
    e.keysFound = j.value("keys_found", 0u);
    e.keysTotal = j.value("keys_total", 0u);
    e.elapsedSecs = j.value("elapsed_secs", 0u);
  }

  void from_json(const json& j, FirmwareProgressEvent& e) {
    e.phase = j.value("phase", std::string{});
    j.at("percent").get_to(e.percent);
    e.message = j.value("message", std::string{});
  }

  void from_json(const json& j, FirmwareFailedEvent& e) {
    e.message = j.value("message", std::string{ "Firmware flash failed" });
  }

  namespace step {

    void to_json(json& j, const DeviceConnected& s) {
      j = json{ { "port", s.port }, { "model", s.model }, { "firmware", s.firmware } };
    }

    void from_json(const json& j, DeviceConnected& s) {
      j.at("port").get_to(s.port);
      s.model = j.value("model", std::string{});
      s.firmware = j.value("firmware", std::string{});
    }

    void to_json(json& j, const CardIdentified& s) {
      j = json{ { "frequency", s.frequency },
                { "card_type", s.cardType },
                { "card_data", s.cardData },
                { "cloneable", s.cloneable },
                { "recommended_blank", s.recommendedBlank } };
    }

    void from_json(const json& j, CardIdentified& s) {
      j.at("card_type").get_to(s.cardType);
      // older device builds omit the derived fields
      s.frequency = j.contains("frequency") ? j.at("frequency").get<Frequency>()
                                            : frequencyOf(s.cardType);
      j.at("card_data").get_to(s.cardData);
      s.cloneable = j.value("cloneable", isCloneable(s.cardType));
      s.recommendedBlank = j.contains("recommended_blank")
                               ? j.at("recommended_blank").get<BlankType>()
                               : recommendedBlank(s.cardType);
    }

    void to_json(json& j, const WaitingForBlank& s) {
      j = json{ { "expected_blank", s.expectedBlank } };
    }

    void from_json(const json& j, WaitingForBlank& s) { j.at("expected_blank").get_to(s.expectedBlank); }

    void to_json(json& j, const BlankDetected& s) {
      j = json{ { "blank_type", s.blankType }, { "ready_to_write", s.readyToWrite } };
      putOptional(j, "existing_data_type", s.existingDataType);
    }

    void from_json(const json& j, BlankDetected& s) {
      j.at("blank_type").get_to(s.blankType);
      j.at("ready_to_write").get_to(s.readyToWrite);
      s.existingDataType = optionalField<std::string>(j, "existing_data_type");
    }

    void to_json(json& j, const Writing& s) {
      j = json{ { "progress", s.progress } };
      putOptional(j, "current_block", s.currentBlock);
      putOptional(j, "total_blocks", s.totalBlocks);
    }

    void from_json(const json& j, Writing& s) {
      s.progress = j.value("progress", 0.0);
      s.currentBlock = optionalField<std::uint16_t>(j, "current_block");
      s.totalBlocks = optionalField<std::uint16_t>(j, "total_blocks");
    }

    void to_json(json& j, const HfProcessing& s) {
      j = json{ { "phase", s.phase },
                { "keys_found", s.keysFound },
                { "keys_total", s.keysTotal },
                { "elapsed_secs", s.elapsedSecs } };
    }

    void from_json(const json& j, HfProcessing& s) {
      s.phase = j.value("phase", std::string{});
      s.keysFound = j.value("keys_found", 0u);
      s.keysTotal = j.value("keys_total", 0u);
      s.elapsedSecs = j.value("elapsed_secs", 0u);
    }

    void to_json(json& j, const HfDumpReady& s) { j = json{ { "dump_info", s.dumpInfo } }; }

    void from_json(const json& j, HfDumpReady& s) { j.at("dump_info").get_to(s.dumpInfo); }

    void to_json(json& j, const VerificationComplete& s) {
      j = json{ { "success", s.success }, { "mismatched_blocks", s.mismatchedBlocks } };
    }

    void from_json(const json& j, VerificationComplete& s) {
      j.at("success").get_to(s.success);
      s.mismatchedBlocks = j.value("mismatched_blocks", std::vector<std::uint16_t>{});
    }

    void to_json(json& j, const Complete& s) {
      j = json{ { "source", s.source }, { "target", s.target }, { "timestamp", s.timestamp } };
    }

    void from_json(const json& j, Complete& s) {
      j.at("source").get_to(s.source);
      j.at("target").get_to(s.target);
      s.timestamp = j.value("timestamp", std::string{});
    }

    void to_json(json& j, const Error& s) {
      j = json{ { "message", s.message },
                { "user_message", s.userMessage },
                { "recoverable", s.recoverable } };
      putOptional(j, "recovery_action", s.recoveryAction);
    }

    void from_json(const json& j, Error& s) {
      j.at("message").get_to(s.message);
      s.userMessage = j.value("user_message", s.message);
      s.recoverable = j.value("recoverable", false);
      s.recoveryAction = optionalField<RecoveryAction>(j, "recovery_action");
    }

  } // namespace step

  namespace action {

    void to_json(json& j, const ProceedToWrite& a) { j = json{ { "blank_type", a.blankType } }; }

    void to_json(json& j, const MarkComplete& a) {
      j = json{ { "source", a.source }, { "target", a.target } };
    }

    void to_json(json& j, const LoadSavedCard& a) { j = a.card; }

  } // namespace action

  //---tagged unions -------------------------------------------------------------
  namespace {

    template <std::size_t... I>
    WizardState decodeStateByTag(std::string_view tag, const json& data,
                                 std::index_sequence<I...>) {
      std::optional<WizardState> out;
      (void)((std::variant_alternative_t<I, WizardState>::kStep == tag
                  ? (out.emplace(std::in_place_index<I>,
                                 decodeAlternative<std::variant_alternative_t<I, WizardState>>(data)),
                     true)
                  : false) ||
             ...);
      if (!out)
        throw std::invalid_argument("unknown step tag: " + std::string(tag));
      return std::move(*out);
    }

    template <std::size_t... I>
    Notification decodeNotificationByChannel(std::string_view channel, const json& payload,
                                             std::index_sequence<I...>) {
      std::optional<Notification> out;
      (void)((std::variant_alternative_t<I, Notification>::kChannel == channel
                  ? (out.emplace(std::in_place_index<I>,
                                 decodeAlternative<std::variant_alternative_t<I, Notification>>(
                                     payload)),
                     true)
                  : false) ||
             ...);
      if (!out)
        throw std::invalid_argument("unknown notification channel: " + std::string(channel));
      return std::move(*out);
    }

  } // namespace

  json encodeState(const WizardState& state) {
    return std::visit(
        [](const auto& s) {
          using T = std::decay_t<decltype(s)>;
          json j{ { "step", std::string(T::kStep) } };
          if constexpr (!std::is_empty_v<T>)
            j["data"] = s;
          return j;
        },
        state);
  }

  WizardState decodeState(const json& j) {
    const auto tag = j.at("step").get<std::string>();
    const auto data = j.value("data", json::object());
    return decodeStateByTag(tag, data, std::make_index_sequence<std::variant_size_v<WizardState>>{});
  }

  json encodeAction(const WizardAction& a) {
    return std::visit(
        [](const auto& act) {
          using T = std::decay_t<decltype(act)>;
          json j{ { "action", std::string(T::kName) } };
          if constexpr (!std::is_empty_v<T>)
            j["payload"] = act;
          return j;
        },
        a);
  }

  Notification decodeNotification(std::string_view channel, const json& payload) {
    const json& body = payload.is_null() ? json::object() : payload;
    return decodeNotificationByChannel(
        channel, body, std::make_index_sequence<std::variant_size_v<Notification>>{});
  }

} // namespace cloneflow::protocols
