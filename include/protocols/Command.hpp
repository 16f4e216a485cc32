#pragma once
/** @file  Command.hpp
 *  @brief One request to the authoritative machine, framed as a JSON line.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace cloneflow {
  namespace protocols {
    struct Command {
      std::uint64_t id{ 0 }; ///< correlates the reply; assigned by RPCManager
      std::string name;      ///< e.g. "detect_device", "wizard_action"
      nlohmann::json args = nlohmann::json::object();

      std::string toWire() const {
        return nlohmann::json{ { "id", id }, { "cmd", name }, { "args", args } }.dump() + "\r\n";
      }
    };

  } // namespace protocols
} // namespace cloneflow
