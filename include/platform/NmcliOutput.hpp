#pragma once
/** @file  NmcliOutput.hpp
 *  @brief Parsing helpers for nmcli terse (-t) output.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>
#include <vector>

#include "platform/TetheringManager.hpp"

namespace hotspot::platform::nmcli {

  /// Split one terse line on ':' honouring the `\:` and `\\` escapes.
  std::vector<std::string> splitFields(const std::string& line);

  /// Non-empty lines, trailing '\r' stripped.
  std::vector<std::string> lines(const std::string& output);

  std::string trim(const std::string& s);

  /// Interface names go onto an argv, still reject anything odd.
  bool isValidInterfaceName(const std::string& name);

  /// nmcli exit status → TetheringOperationStatus (see nmcli(1) EXIT STATUS).
  TetheringOperationStatus statusFromExitCode(int exitCode);

} // namespace hotspot::platform::nmcli
