#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/HotspotOrchestrator.hpp"
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <unistd.h>

using namespace hotspot::core;

TEST(error_monitor, escalates_each_unique_failure_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](ErrorKind, const std::string& msg) { escalated.push_back(msg); });

  monitor.notifyFailure(ErrorKind::RadioNotFound, "no radio");
  monitor.notifyFailure(ErrorKind::RadioNotFound, "no radio");
  monitor.notifyFailure(ErrorKind::NoProfileFound, "no profile");

  EXPECT_EQ(escalated, (std::vector<std::string>{ "no radio", "no profile" }));
  EXPECT_EQ(monitor.uniqueFailures(), 2u);
  EXPECT_EQ(monitor.lastFailure(), ErrorKind::NoProfileFound);
}

TEST(error_monitor, repeated_failure_still_updates_last_kind) {
  ErrorMonitor monitor;
  monitor.notifyFailure(ErrorKind::PlatformFailure, "boom");
  monitor.notifyFailure(ErrorKind::RadioNotFound, "x");
  monitor.notifyFailure(ErrorKind::PlatformFailure, "boom");

  EXPECT_EQ(monitor.lastFailure(), ErrorKind::PlatformFailure);

  monitor.reset();
  EXPECT_FALSE(monitor.lastFailure());
  EXPECT_EQ(monitor.uniqueFailures(), 0u);
}

TEST(errors, every_kind_has_a_name) {
  for (int k = 0; k < static_cast<int>(ErrorKind::Count); ++k)
    EXPECT_STRNE(toString(static_cast<ErrorKind>(k)), "Unknown");
  EXPECT_STREQ(toString(HotspotOrchestrator::State::CyclingRadio), "CyclingRadio");
}

TEST(errors, tethering_failure_carries_status) {
  TetheringOperationFailed err("start failed", hotspot::platform::TetheringOperationStatus::Timeout);
  EXPECT_EQ(err.kind(), ErrorKind::TetheringOperationFailed);
  EXPECT_EQ(err.status(), hotspot::platform::TetheringOperationStatus::Timeout);
}

TEST(logger, format_line_has_timestamp_and_level) {
  const auto line = Logger::formatLine(Severity::Warning, "radio refused");
  EXPECT_THAT(line, ::testing::MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2} \\[WARN\\] radio refused"));
}

TEST(logger, filters_by_severity_and_mirrors_to_file) {
  char path[] = "/tmp/hotspot-log-XXXXXX";
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  close(fd);

  {
    auto file = std::make_shared<hotspot::io::FileLogger>();
    ASSERT_TRUE(file->open(path));

    Logger log;
    log.setConsoleEnabled(false);
    log.setMinSeverity(Severity::Info);
    log.attachFile(file);

    log.debug("hidden");
    log.info("shown");
    log.error("also shown");
  } // FileLogger flushes on destruction

  std::ifstream in(path);
  std::stringstream contents;
  contents << in.rdbuf();
  std::remove(path);

  EXPECT_EQ(contents.str().find("hidden"), std::string::npos);
  EXPECT_NE(contents.str().find("[INFO] shown"), std::string::npos);
  EXPECT_NE(contents.str().find("[ERROR] also shown"), std::string::npos);
}

TEST(logger, broken_file_sink_never_throws) {
  auto file = std::make_shared<hotspot::io::FileLogger>(); // never opened
  Logger log;
  log.setConsoleEnabled(false);
  log.attachFile(file);

  EXPECT_NO_THROW(log.error("first"));
  EXPECT_NO_THROW(log.error("second"));
}
