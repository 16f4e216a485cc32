/* @file Response.cpp
 * @brief classifies inbound JSON lines into replies and notifications
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// cloneflow headers
#include "protocols/Json.hpp"
#include "protocols/Response.hpp"

using namespace cloneflow::protocols;
using nlohmann::json;

std::optional<Response> Response::fromWire(const std::string& line) {
  const json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (!j.is_object())
    return std::nullopt;

  if (auto ev = j.find("event"); ev != j.end()) {
    if (!ev->is_string())
      return std::nullopt;
    try {
      return Response{ decodeNotification(ev->get<std::string>(), j.value("payload", json{})) };
    } catch (const std::exception&) {
      return std::nullopt; // malformed payload or unknown channel
    }
  }

  auto id = j.find("id");
  if (id == j.end() || !id->is_number_unsigned())
    return std::nullopt;

  Reply reply;
  reply.id = id->get<std::uint64_t>();
  if (auto ok = j.find("ok"); ok != j.end()) {
    reply.ok = true;
    reply.value = *ok;
  } else if (auto err = j.find("err"); err != j.end()) {
    reply.error = err->is_string() ? err->get<std::string>() : err->dump();
  } else {
    reply.error = "malformed reply"; // the id is known, so the matching call fails now
  }
  return Response{ std::move(reply) };
}
