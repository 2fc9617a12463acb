#pragma once
/** @file  FakeCommandRunner.hpp
 *  @brief CommandRunner derivative with scripted output per command line.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "io/CommandRunner.hpp"

namespace hotspot {
  namespace test {

    /**
 * @class FakeCommandRunner
 * @brief Commands are matched on their rendered form ("nmcli radio wifi off").
 *
 *  * Several scripted results for one command are handed out in order, the
 *    last one repeats.
 *  * Unscripted commands exit 127.
 */
    class FakeCommandRunner : public hotspot::io::CommandRunner {
    public:
      void script(const std::string& command, int exitCode, const std::string& output = "") {
        std::lock_guard<std::mutex> lock(mtx_);
        responses_[command].push_back({ exitCode, output });
      }

      hotspot::io::CommandResult run(const std::vector<std::string>& argv) override {
        std::lock_guard<std::mutex> lock(mtx_);
        const std::string command = render(argv);
        calls_.push_back(command);

        auto it = responses_.find(command);
        if (it == responses_.end() || it->second.empty())
          return { 127, "unscripted: " + command };
        auto result = it->second.front();
        if (it->second.size() > 1)
          it->second.pop_front();
        return result;
      }

      std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_;
      }

    private:
      mutable std::mutex mtx_;
      std::map<std::string, std::deque<hotspot::io::CommandResult>> responses_;
      std::vector<std::string> calls_;
    };

  } // namespace test
} // namespace hotspot
