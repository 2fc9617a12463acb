#pragma once
/** @file  Logger.hpp
 *  @brief Severity-filtered line logger (stderr + optional log file).
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace hotspot {
  namespace io {
    class FileLogger; // forward decl to avoid heavy include
  } // namespace io

  namespace core {

    enum class Severity : std::uint8_t { Debug, Info, Warning, Error };

    inline const char* toString(Severity s) {
      switch (s) {
      case Severity::Debug:
        return "DEBUG";
      case Severity::Info:
        return "INFO";
      case Severity::Warning:
        return "WARN";
      case Severity::Error:
        return "ERROR";
      default:
        return "?";
      }
    }

    class Logger {

    public:
      Logger();
      virtual ~Logger();

      // --- public API ---
      virtual void log(Severity severity, const std::string& message); ///< never throws

      void debug(const std::string& msg) { log(Severity::Debug, msg); }
      void info(const std::string& msg) { log(Severity::Info, msg); }
      void warn(const std::string& msg) { log(Severity::Warning, msg); }
      void error(const std::string& msg) { log(Severity::Error, msg); }

      void setMinSeverity(Severity s);
      void setConsoleEnabled(bool enabled);

      /// Mirror every accepted line into @p file (ownership shared with caller).
      void attachFile(std::shared_ptr<io::FileLogger> file);

      /// `YYYY-MM-DD HH:MM:SS [LEVEL] message`
      static std::string formatLine(Severity severity, const std::string& message);

    private:
      mutable std::mutex mtx_;
      Severity minSeverity_{ Severity::Info };
      bool console_{ true };
      std::shared_ptr<io::FileLogger> file_;
    };

  } // namespace core
} // namespace hotspot
