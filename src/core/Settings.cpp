/* @file Settings.cpp
 * @brief config schema: defaults, overrides, validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cloneflow headers
#include "core/Settings.hpp"
#include "io/SerialChannel.hpp"

using namespace cloneflow::core;
using nlohmann::json;

namespace {

  template <typename Duration>
  void readDuration(const json& section, const char* key, Duration& out) {
    auto it = section.find(key);
    if (it == section.end())
      return;
    const auto count = it->get<long long>();
    if (count <= 0)
      throw std::invalid_argument(std::string("[Settings] ") + key + " must be positive");
    out = Duration{ count };
  }

  const json& section(const json& doc, const char* name) {
    static const json kEmpty = json::object();
    auto it = doc.find(name);
    return it != doc.end() && it->is_object() ? *it : kEmpty;
  }

} // namespace

Settings Settings::fromJson(const json& doc) {
  Settings s;

  const auto& link = section(doc, "link");
  s.linkDevice = link.value("device", s.linkDevice);
  s.linkBaud = link.value("baud", s.linkBaud);
  if (!io::baudFromInt(s.linkBaud))
    throw std::invalid_argument("[Settings] unsupported baud rate " + std::to_string(s.linkBaud));

  const auto& timeouts = section(doc, "timeouts_ms");
  readDuration(timeouts, "default", s.timeouts.standard);
  readDuration(timeouts, "write", s.timeouts.write);
  readDuration(timeouts, "verify", s.timeouts.verify);
  readDuration(timeouts, "hf_process", s.timeouts.hfProcess);
  readDuration(timeouts, "control", s.timeouts.control);

  const auto& firmware = section(doc, "firmware");
  readDuration(firmware, "flash_deadline_s", s.timers.flashDeadline);
  readDuration(firmware, "redetect_deadline_s", s.timers.redetectDeadline);

  s.historyPath = section(doc, "history").value("path", s.historyPath);
  return s;
}
