#pragma once
/** @file  CardTypes.hpp
 *  @brief Credential / blank catalogue shared by the wire codec and the orchestrator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cloneflow {
  namespace protocols {

    enum class Frequency : std::uint8_t { LF, HF };

    /**
 * @enum CardType
 * @brief Every source credential the authoritative machine can identify.
 *
 *  * Order matters: kCardTable in CardTypes.cpp is indexed by this enum.
 */
    enum class CardType : std::uint8_t {
      // LF cloneable
      EM4100,
      HIDProx,
      Indala,
      IOProx,
      AWID,
      FDX_B,
      Paradox,
      Viking,
      Pyramid,
      Keri,
      NexWatch,
      Presco,
      Nedap,
      GProxII,
      Gallagher,
      PAC,
      Noralsy,
      Jablotron,
      SecuraKey,
      Visa2000,
      Motorola,
      IDTECK,
      // LF display only
      COTAG,
      EM4x50,
      Hitag,
      // HF
      MifareClassic1K,
      MifareClassic4K,
      MifareUltralight,
      NTAG,
      DESFire,
      IClass,
      Count
    };

    enum class BlankType : std::uint8_t {
      T5577,
      EM4305,
      MagicMifareGen1a,
      MagicMifareGen2,
      MagicMifareGen3,
      MagicMifareGen4GTU,
      MagicMifareGen4GDM,
      MagicUltralight,
      IClassBlank,
      Count
    };

    /// Next user-facing operation recommended after an error.
    enum class RecoveryAction : std::uint8_t { Retry, GoBack, Reconnect, Manual };

    //---catalogue lookups-------------------------------------------------
    const char* toString(Frequency f);
    const char* toString(CardType t); ///< wire name, e.g. "FDX_B"
    const char* toString(BlankType b);
    const char* toString(RecoveryAction a);

    const char* displayName(CardType t); ///< e.g. "FDX-B"
    const char* displayName(BlankType b);

    Frequency frequencyOf(CardType t);
    bool isCloneable(CardType t);
    BlankType recommendedBlank(CardType t);

    /// MIFARE Classic recovers keys first; every other HF type is dumped directly.
    bool needsKeyRecovery(CardType t);

    /// True when a detected blank can take a write planned for \p expected.
    bool isBlankCompatible(BlankType expected, BlankType detected);

    /** Parse wire names; std::nullopt for anything not in the catalogue. */
    std::optional<Frequency> parseFrequency(std::string_view s);
    std::optional<CardType> parseCardType(std::string_view s);
    std::optional<BlankType> parseBlankType(std::string_view s);
    std::optional<RecoveryAction> parseRecoveryAction(std::string_view s);

    //---records-----------------------------------------------------------
    struct CardData {
      std::string uid;
      std::string raw;
      std::map<std::string, std::string> decoded;

      bool operator==(const CardData&) const = default;
    };

    struct CardSummary {
      std::string cardType;
      std::string uid;
      std::string displayName;

      bool operator==(const CardSummary&) const = default;
    };

    /// A credential stored locally that can be re-loaded without scanning.
    struct SavedCard {
      std::string name;
      Frequency frequency{ Frequency::LF };
      CardType cardType{ CardType::EM4100 };
      CardData data;
      bool cloneable{ true };
      BlankType recommendedBlank{ BlankType::T5577 };
    };

    /// One finished clone run, as appended to the history file.
    struct CloneRecord {
      std::string sourceType;
      std::string sourceUid;
      std::string targetType;
      std::string targetUid;
      std::string port;
      bool success{ false };
      std::string timestamp;
      std::optional<std::string> notes;
    };

    /// Result of `check_firmware_version`.
    struct FirmwareCheck {
      bool matched{ false };
      std::string clientVersion;
      std::string deviceVersion;
      std::string hardwareVariant; ///< "rdv4", "rdv4-bt", "generic", "generic-256" or "unknown"
      bool imageExists{ false };
    };

    bool isKnownHardwareVariant(std::string_view variant);

  } // namespace protocols
} // namespace cloneflow
