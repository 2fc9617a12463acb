/* @file NmcliOutput.cpp
 * @brief nmcli terse-mode field splitting and exit code mapping
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <cctype>
#include <sstream>

#include "platform/NmcliOutput.hpp"

namespace hotspot::platform::nmcli {

  std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (std::size_t i = 0; i < line.size(); ++i) {
      if (line[i] == '\\' && i + 1 < line.size() && (line[i + 1] == ':' || line[i + 1] == '\\')) {
        current += line[i + 1]; // escaped separator or backslash
        ++i;
      } else if (line[i] == ':') {
        fields.push_back(current);
        current.clear();
      } else {
        current += line[i];
      }
    }
    fields.push_back(current);
    return fields;
  }

  std::vector<std::string> lines(const std::string& output) {
    std::vector<std::string> out;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      if (!line.empty())
        out.push_back(line);
    }
    return out;
  }

  std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
      return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
  }

  bool isValidInterfaceName(const std::string& name) {
    if (name.empty() || name.size() > 15) // IFNAMSIZ - 1
      return false;
    for (char c : name) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.')
        return false;
    }
    return true;
  }

  TetheringOperationStatus statusFromExitCode(int exitCode) {
    switch (exitCode) {
    case 0:
      return TetheringOperationStatus::Success;
    case 3:
      return TetheringOperationStatus::Timeout;
    case 4:
      return TetheringOperationStatus::ActivationFailed;
    case 5:
      return TetheringOperationStatus::DeactivationFailed;
    case 8:
      return TetheringOperationStatus::ServiceUnavailable;
    case 10:
      return TetheringOperationStatus::NotFound;
    default:
      return TetheringOperationStatus::Unknown;
    }
  }

} // namespace hotspot::platform::nmcli
