/* @file WizardState.cpp
 * @brief tag lookups for the outcome / action / notification unions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <type_traits>

// cloneflow headers
#include "protocols/Notifications.hpp"
#include "protocols/WizardAction.hpp"
#include "protocols/WizardState.hpp"

namespace cloneflow::protocols {

  std::string_view stepName(const WizardState& state) {
    return std::visit([](const auto& s) { return std::decay_t<decltype(s)>::kStep; }, state);
  }

  std::string_view actionName(const WizardAction& a) {
    return std::visit([](const auto& act) { return std::decay_t<decltype(act)>::kName; }, a);
  }

  std::string_view channelName(const Notification& n) {
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::kChannel; }, n);
  }

} // namespace cloneflow::protocols
