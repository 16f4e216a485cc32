#pragma once
/** @file  Response.hpp
 *  @brief Inbound line from the authoritative machine: a reply or an event.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cloneflow headers
#include "protocols/Notifications.hpp"

namespace cloneflow {
  namespace protocols {

    /// `{"id":N,"ok":...}` or `{"id":N,"err":"..."}`
    struct Reply {
      std::uint64_t id{ 0 };
      bool ok{ false };
      nlohmann::json value;  ///< valid when ok
      std::string error;     ///< valid when !ok
    };

    struct Response {
      std::variant<Reply, Notification> body;

      /** Parse one line (without CRLF). std::nullopt if it carries no valid id and
       *  is not an event on a known channel. An id with neither `ok` nor `err` is
       *  an error Reply ("malformed reply"). */
      static std::optional<Response> fromWire(const std::string& line);
    };

  } // namespace protocols
} // namespace cloneflow
