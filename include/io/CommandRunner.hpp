#pragma once
/** @file  CommandRunner.hpp
 *  @brief Runs an external tool (nmcli, notify-send) and captures its output.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>
#include <vector>

namespace hotspot {
  namespace io {

    struct CommandResult {
      int exitCode{ -1 }; ///< -1: could not spawn / killed by signal
      std::string output; ///< stdout + stderr, as produced

      bool ok() const { return exitCode == 0; }
    };

    /**
 * @class CommandRunner
 * @brief fork/execvp wrapper, no shell involved (arguments are never re-parsed).
 *
 *  * Blocks until the child exits.
 *  * Virtual so backends can be tested against scripted output.
 */
    class CommandRunner {

    public:
      CommandRunner() = default;
      virtual ~CommandRunner() = default;

      //---public API-------------------------------------------
      virtual CommandResult run(const std::vector<std::string>& argv);

      /// "nmcli -t radio" style rendering for log lines.
      static std::string render(const std::vector<std::string>& argv);

      //---non-copyable-----------------------------------------
      CommandRunner(const CommandRunner&) = delete;
      CommandRunner& operator=(const CommandRunner&) = delete;
    };
  } // namespace io
} // namespace hotspot
