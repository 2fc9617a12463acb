// Hotspot headers
#include "core/ConnectionProfileWaiter.hpp"
#include "core/Errors.hpp"

// Hotspot fakes
#include "FakeClock.hpp"
#include "FakePlatform.hpp"
#include "Mocks.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace hotspot::test {

  using namespace std::chrono_literals;
  using hotspot::core::ConnectionProfileWaiter;
  using hotspot::core::RetryBudget;
  using hotspot::core::Severity;
  using ::testing::_;
  using ::testing::HasSubstr;

  class ProfileWaiterTest : public ::testing::Test {
  protected:
    FakeWorld world;
    FakeNetworkInformation network{ world };
    FakeClock clock;
    testing::NiceMock<MockLogger> log;
    ConnectionProfileWaiter waiter{ network, clock, log };
  };

  TEST_F(ProfileWaiterTest, waitForInternetProfile_ImmediateProfileCostsOnePoll) {
    auto profile = waiter.waitForInternetProfile(RetryBudget{ 12, 5s });

    EXPECT_EQ(profile.name, "Wired connection 1");
    EXPECT_EQ(world.profilePolls, 1);
    EXPECT_TRUE(clock.sleeps.empty());
  }

  TEST_F(ProfileWaiterTest, waitForInternetProfile_LateProfileIsPickedUp) {
    world.profileAvailableAfterPolls = 4;

    auto profile = waiter.waitForInternetProfile(RetryBudget{ 12, 5s });

    EXPECT_EQ(profile.device, "eth0");
    EXPECT_EQ(world.profilePolls, 5);
    EXPECT_EQ(clock.elapsed(), 20s);
  }

  TEST_F(ProfileWaiterTest, waitForInternetProfile_NeverAvailableThrowsWithinBudget) {
    world.profileAvailableAfterPolls = -1;

    EXPECT_THROW(waiter.waitForInternetProfile(RetryBudget{ 12, 5s }), hotspot::core::NoProfileFound);
    EXPECT_EQ(world.profilePolls, 12);
    EXPECT_LE(clock.elapsed(), 60s);
  }

  TEST_F(ProfileWaiterTest, waitForInternetProfile_LogsEachAttemptNumber) {
    world.profileAvailableAfterPolls = 2;

    EXPECT_CALL(log, log(_, _)).Times(testing::AnyNumber());
    EXPECT_CALL(log, log(Severity::Info, HasSubstr("attempt 1/3")));
    EXPECT_CALL(log, log(Severity::Info, HasSubstr("attempt 2/3")));
    EXPECT_CALL(log, log(Severity::Info, HasSubstr("internet profile 'Wired connection 1'")));

    waiter.waitForInternetProfile(RetryBudget{ 3, 1s });
  }

} // namespace hotspot::test
