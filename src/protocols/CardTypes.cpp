/* @file CardTypes.cpp
 * @brief static credential catalogue and wire-name lookups
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>

// cloneflow headers
#include "protocols/CardTypes.hpp"

using namespace cloneflow::protocols;

namespace {

  struct CardInfo {
    CardType type;
    const char* wire;
    const char* display;
    Frequency frequency;
    bool cloneable;
    BlankType blank;
  };

  // Non-cloneable types still carry a blank so the record is total; it is never written.
  constexpr std::array<CardInfo, static_cast<std::size_t>(CardType::Count)> kCardTable{ {
      { CardType::EM4100, "EM4100", "EM4100", Frequency::LF, true, BlankType::T5577 },
      { CardType::HIDProx, "HIDProx", "HID Prox", Frequency::LF, true, BlankType::T5577 },
      { CardType::Indala, "Indala", "Indala", Frequency::LF, true, BlankType::T5577 },
      { CardType::IOProx, "IOProx", "IO Prox", Frequency::LF, true, BlankType::T5577 },
      { CardType::AWID, "AWID", "AWID", Frequency::LF, true, BlankType::T5577 },
      { CardType::FDX_B, "FDX_B", "FDX-B", Frequency::LF, true, BlankType::T5577 },
      { CardType::Paradox, "Paradox", "Paradox", Frequency::LF, true, BlankType::T5577 },
      { CardType::Viking, "Viking", "Viking", Frequency::LF, true, BlankType::T5577 },
      { CardType::Pyramid, "Pyramid", "Pyramid", Frequency::LF, true, BlankType::T5577 },
      { CardType::Keri, "Keri", "Keri", Frequency::LF, true, BlankType::T5577 },
      { CardType::NexWatch, "NexWatch", "NexWatch", Frequency::LF, true, BlankType::T5577 },
      { CardType::Presco, "Presco", "Presco", Frequency::LF, true, BlankType::T5577 },
      { CardType::Nedap, "Nedap", "Nedap", Frequency::LF, true, BlankType::T5577 },
      { CardType::GProxII, "GProxII", "GProx II", Frequency::LF, true, BlankType::T5577 },
      { CardType::Gallagher, "Gallagher", "Gallagher", Frequency::LF, true, BlankType::T5577 },
      { CardType::PAC, "PAC", "PAC/Stanley", Frequency::LF, true, BlankType::T5577 },
      { CardType::Noralsy, "Noralsy", "Noralsy", Frequency::LF, true, BlankType::T5577 },
      { CardType::Jablotron, "Jablotron", "Jablotron", Frequency::LF, true, BlankType::T5577 },
      { CardType::SecuraKey, "SecuraKey", "SecuraKey", Frequency::LF, true, BlankType::T5577 },
      { CardType::Visa2000, "Visa2000", "Visa2000", Frequency::LF, true, BlankType::T5577 },
      { CardType::Motorola, "Motorola", "Motorola", Frequency::LF, true, BlankType::T5577 },
      { CardType::IDTECK, "IDTECK", "IDTECK", Frequency::LF, true, BlankType::T5577 },
      { CardType::COTAG, "COTAG", "COTAG", Frequency::LF, false, BlankType::T5577 },
      { CardType::EM4x50, "EM4x50", "EM4x50", Frequency::LF, false, BlankType::T5577 },
      { CardType::Hitag, "Hitag", "Hitag", Frequency::LF, false, BlankType::T5577 },
      { CardType::MifareClassic1K, "MifareClassic1K", "MIFARE Classic 1K", Frequency::HF, true,
        BlankType::MagicMifareGen1a },
      { CardType::MifareClassic4K, "MifareClassic4K", "MIFARE Classic 4K", Frequency::HF, true,
        BlankType::MagicMifareGen1a },
      { CardType::MifareUltralight, "MifareUltralight", "MIFARE Ultralight", Frequency::HF, true,
        BlankType::MagicUltralight },
      { CardType::NTAG, "NTAG", "NTAG", Frequency::HF, true, BlankType::MagicUltralight },
      { CardType::DESFire, "DESFire", "DESFire", Frequency::HF, false,
        BlankType::MagicMifareGen4GTU },
      { CardType::IClass, "IClass", "iCLASS", Frequency::HF, true, BlankType::IClassBlank },
  } };

  struct BlankInfo {
    BlankType type;
    const char* wire;
    const char* display;
  };

  constexpr std::array<BlankInfo, static_cast<std::size_t>(BlankType::Count)> kBlankTable{ {
      { BlankType::T5577, "T5577", "T5577" },
      { BlankType::EM4305, "EM4305", "EM4305" },
      { BlankType::MagicMifareGen1a, "MagicMifareGen1a", "Magic MIFARE Gen1a" },
      { BlankType::MagicMifareGen2, "MagicMifareGen2", "Magic MIFARE Gen2 (CUID)" },
      { BlankType::MagicMifareGen3, "MagicMifareGen3", "Magic MIFARE Gen3 (UFUID)" },
      { BlankType::MagicMifareGen4GTU, "MagicMifareGen4GTU", "Magic MIFARE Gen4 GTU" },
      { BlankType::MagicMifareGen4GDM, "MagicMifareGen4GDM", "Magic MIFARE Gen4 GDM" },
      { BlankType::MagicUltralight, "MagicUltralight", "Magic Ultralight" },
      { BlankType::IClassBlank, "IClassBlank", "iCLASS Blank" },
  } };

  constexpr bool cardTableInOrder() {
    for (std::size_t i = 0; i < kCardTable.size(); ++i) {
      if (static_cast<std::size_t>(kCardTable[i].type) != i)
        return false;
    }
    return true;
  }
  static_assert(cardTableInOrder(), "kCardTable must follow CardType declaration order");

  constexpr bool blankTableInOrder() {
    for (std::size_t i = 0; i < kBlankTable.size(); ++i) {
      if (static_cast<std::size_t>(kBlankTable[i].type) != i)
        return false;
    }
    return true;
  }
  static_assert(blankTableInOrder(), "kBlankTable must follow BlankType declaration order");

  constexpr std::array<const char*, 4> kHardwareVariants{ "rdv4", "rdv4-bt", "generic",
                                                          "generic-256" };

  const CardInfo& info(CardType t) { return kCardTable.at(static_cast<std::size_t>(t)); }

  bool isMagicMifare(BlankType b) {
    switch (b) {
    case BlankType::MagicMifareGen1a:
    case BlankType::MagicMifareGen2:
    case BlankType::MagicMifareGen3:
    case BlankType::MagicMifareGen4GTU:
    case BlankType::MagicMifareGen4GDM:
      return true;
    default:
      return false;
    }
  }

} // namespace

namespace cloneflow::protocols {

  const char* toString(Frequency f) { return f == Frequency::HF ? "HF" : "LF"; }

  const char* toString(CardType t) { return info(t).wire; }

  const char* toString(BlankType b) { return kBlankTable.at(static_cast<std::size_t>(b)).wire; }

  const char* toString(RecoveryAction a) {
    switch (a) {
    case RecoveryAction::Retry:
      return "Retry";
    case RecoveryAction::GoBack:
      return "GoBack";
    case RecoveryAction::Reconnect:
      return "Reconnect";
    case RecoveryAction::Manual:
      return "Manual";
    }
    return "Unknown";
  }

  const char* displayName(CardType t) { return info(t).display; }

  const char* displayName(BlankType b) {
    return kBlankTable.at(static_cast<std::size_t>(b)).display;
  }

  Frequency frequencyOf(CardType t) { return info(t).frequency; }

  bool isCloneable(CardType t) { return info(t).cloneable; }

  BlankType recommendedBlank(CardType t) { return info(t).blank; }

  bool needsKeyRecovery(CardType t) {
    return t == CardType::MifareClassic1K || t == CardType::MifareClassic4K;
  }

  bool isBlankCompatible(BlankType expected, BlankType detected) {
    if (expected == detected)
      return true;
    // the write workflow is picked from the detected generation
    return isMagicMifare(expected) && isMagicMifare(detected);
  }

  std::optional<Frequency> parseFrequency(std::string_view s) {
    if (s == "LF")
      return Frequency::LF;
    if (s == "HF")
      return Frequency::HF;
    return std::nullopt;
  }

  std::optional<CardType> parseCardType(std::string_view s) {
    for (const auto& entry : kCardTable) {
      if (s == entry.wire)
        return entry.type;
    }
    return std::nullopt;
  }

  std::optional<BlankType> parseBlankType(std::string_view s) {
    for (const auto& entry : kBlankTable) {
      if (s == entry.wire)
        return entry.type;
    }
    return std::nullopt;
  }

  std::optional<RecoveryAction> parseRecoveryAction(std::string_view s) {
    for (auto a : { RecoveryAction::Retry, RecoveryAction::GoBack, RecoveryAction::Reconnect,
                    RecoveryAction::Manual }) {
      if (s == toString(a))
        return a;
    }
    return std::nullopt;
  }

  bool isKnownHardwareVariant(std::string_view variant) {
    for (const char* v : kHardwareVariants) {
      if (variant == v)
        return true;
    }
    return false;
  }

} // namespace cloneflow::protocols
