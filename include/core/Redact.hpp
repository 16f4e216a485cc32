#pragma once
/** @file  Redact.hpp
 *  @brief Scrubs local filesystem paths out of diagnostic text before display.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace cloneflow::core {

  /** Absolute POSIX paths (except device nodes under /dev/) and Windows drive
   *  paths are replaced by `<path>`; everything else is kept verbatim. */
  std::string redactPaths(const std::string& text);

} // namespace cloneflow::core
