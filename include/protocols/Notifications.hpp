#pragma once
/** @file  Notifications.hpp
 *  @brief Out-of-band events streamed by the authoritative machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cloneflow {
  namespace protocols {

    /// `write-progress`: progress is a 0..1 fraction on the wire.
    struct WriteProgressEvent {
      static constexpr std::string_view kChannel = "write-progress";
      double progress{ 0.0 };
      std::optional<std::uint16_t> currentBlock;
      std::optional<std::uint16_t> totalBlocks;
    };

    /// `hf-progress`: key recovery / dump progress.
    struct HfProgressEvent {
      static constexpr std::string_view kChannel = "hf-progress";
      std::string phase;
      std::uint32_t keysFound{ 0 };
      std::uint32_t keysTotal{ 0 };
      std::uint32_t elapsedSecs{ 0 };
    };

    struct FirmwareProgressEvent {
      static constexpr std::string_view kChannel = "firmware-progress";
      std::string phase; ///< connecting | erasing | writing | done | error
      int percent{ 0 };
      std::string message;
    };

    struct FirmwareCompleteEvent {
      static constexpr std::string_view kChannel = "firmware-complete";
    };

    struct FirmwareFailedEvent {
      static constexpr std::string_view kChannel = "firmware-failed";
      std::string message;
    };

    using Notification = std::variant<WriteProgressEvent, HfProgressEvent, FirmwareProgressEvent,
                                      FirmwareCompleteEvent, FirmwareFailedEvent>;

    std::string_view channelName(const Notification& n);

  } // namespace protocols
} // namespace cloneflow
