#pragma once
/** @file  Settings.hpp
 *  @brief Typed run-time settings with defaults, built from the config JSON.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace cloneflow::core {

  /// Round-trip deadlines per gateway call class.
  struct GatewayTimeouts {
    std::chrono::milliseconds standard{ 30'000 }; ///< detect, scan, blank, firmware check
    std::chrono::milliseconds write{ 120'000 };
    std::chrono::milliseconds verify{ 60'000 };
    std::chrono::milliseconds hfProcess{ 3'600'000 }; ///< hardnested can take an hour
    std::chrono::milliseconds control{ 5'000 };       ///< wizard_action, cancels, flash start
  };

  struct OrchestratorTimers {
    std::chrono::seconds flashDeadline{ 300 };
    std::chrono::seconds redetectDeadline{ 15 };
  };

  struct Settings {
    std::string linkDevice{ "/dev/ttyACM0" };
    int linkBaud{ 115200 };
    GatewayTimeouts timeouts;
    OrchestratorTimers timers;
    std::string historyPath{ "clone_history.csv" }; ///< empty disables history

    /** Missing keys keep their defaults. Throws std::invalid_argument on a bad
     *  value and nlohmann::json::exception on a wrongly typed one. */
    static Settings fromJson(const nlohmann::json& doc);
  };

} // namespace cloneflow::core
