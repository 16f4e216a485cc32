/* @file WizardContext.cpp
 * @brief clearing rules and invariant-preserving setters for the wizard context
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// cloneflow headers
#include "core/WizardContext.hpp"

namespace cloneflow {
  namespace core {

    const char* toString(ErrorSource s) {
      switch (s) {
      case ErrorSource::Detect:
        return "detect";
      case ErrorSource::Scan:
        return "scan";
      case ErrorSource::Blank:
        return "blank";
      case ErrorSource::Write:
        return "write";
      case ErrorSource::Verify:
        return "verify";
      }
      return "unknown";
    }

    const char* toString(FirmwareStatus s) {
      switch (s) {
      case FirmwareStatus::Unknown:
        return "unknown";
      case FirmwareStatus::Matched:
        return "matched";
      case FirmwareStatus::Mismatched:
        return "mismatched";
      case FirmwareStatus::Updating:
        return "updating";
      case FirmwareStatus::Updated:
        return "updated";
      }
      return "unknown";
    }

    void WizardContext::reset() { *this = WizardContext{}; }

    void WizardContext::clearWorkflow() {
      credential.reset();
      blank = BlankTarget{};
      write = WriteProgress{};
      verify = Verification{};
      completedAt.reset();
      error.reset();
      hf = HfProgress{};
    }

    void WizardContext::setWriteProgress(int percent, std::optional<std::uint16_t> current,
                                         std::optional<std::uint16_t> total) {
      write.percent = std::clamp(percent, 0, 100);
      if (current && total) {
        write.currentBlock = current;
        write.totalBlocks = total;
      } else {
        // half a block position is meaningless; drop both
        write.currentBlock.reset();
        write.totalBlocks.reset();
      }
    }

    void WizardContext::setHfProgress(std::string phase, std::uint32_t found, std::uint32_t total,
                                      std::uint32_t elapsed) {
      hf.phase = std::move(phase);
      hf.keysTotal = total;
      hf.keysFound = std::min(found, total);
      hf.elapsedSecs = elapsed;
    }

    void WizardContext::setVerification(bool success, std::vector<std::uint16_t> mismatched) {
      verify.success = success;
      if (success)
        verify.mismatchedBlocks.clear();
      else
        verify.mismatchedBlocks = std::move(mismatched);
    }

    void WizardContext::setBlankDetected(protocols::BlankType detected, bool deviceSaysReady,
                                         std::optional<std::string> existingData) {
      blank.detected = detected;
      blank.existingData = std::move(existingData);
      blank.readyToWrite =
          deviceSaysReady && blank.expected && protocols::isBlankCompatible(*blank.expected, detected);
    }

  } // namespace core
} // namespace cloneflow
