/* @file Redact.cpp
 * @brief path scrubbing for error messages
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <regex>

// cloneflow headers
#include "core/Redact.hpp"

namespace cloneflow::core {

  namespace {

    // drive path, or a slash-rooted path with at least two components
    const std::regex& pathPattern() {
      static const std::regex re(R"re(\b[A-Za-z]:[\\/][^\s'"`,;]*|(?:^|[\s'"`(=])(/[^\s'"`,;:/]+(?:/[^\s'"`,;:]*)+))re");
      return re;
    }

  } // namespace

  std::string redactPaths(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    auto cursor = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), pathPattern()), end; it != end; ++it) {
      const std::smatch& m = *it;
      // group 1 is the POSIX form; its match excludes the leading delimiter
      const bool posix = m[1].matched;
      const auto first = posix ? m[1].first : m[0].first;
      const auto last = posix ? m[1].second : m[0].second;

      out.append(cursor, first);
      if (posix && m.str(1).starts_with("/dev/"))
        out.append(first, last);
      else
        out += "<path>";
      cursor = last;
    }
    out.append(cursor, text.cend());
    return out;
  }

} // namespace cloneflow::core
