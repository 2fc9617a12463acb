// Hotspot headers
#include "core/Errors.hpp"
#include "core/TetheringController.hpp"

// Hotspot fakes
#include "FakePlatform.hpp"
#include "Mocks.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace hotspot::test {

  using hotspot::core::TetheringController;

  class TetheringControllerTest : public ::testing::Test {
  protected:
    FakeWorld world;
    FakeTetheringManagerFactory factory{ world };
    testing::NiceMock<MockLogger> log;
    TetheringController tethering{ factory, log };
  };

  TEST_F(TetheringControllerTest, fromProfile_BindsManagerToProfile) {
    auto handle = tethering.fromProfile(world.profile);

    ASSERT_TRUE(handle);
    EXPECT_EQ(world.boundProfile, "Wired connection 1");
    EXPECT_EQ(world.managersCreated, 1);
  }

  TEST_F(TetheringControllerTest, fromProfile_NoManagerIsPlatformFailure) {
    world.factoryReturnsNull = true;

    EXPECT_THROW(tethering.fromProfile(world.profile), hotspot::core::PlatformFailure);
  }

  TEST_F(TetheringControllerTest, startAndStop_DriveOperationalState) {
    auto handle = tethering.fromProfile(world.profile);
    EXPECT_EQ(tethering.operationalState(handle), TetheringState::Off);

    EXPECT_TRUE(tethering.start(handle).ok());
    EXPECT_EQ(tethering.operationalState(handle), TetheringState::On);

    EXPECT_TRUE(tethering.stop(handle).ok());
    EXPECT_EQ(tethering.operationalState(handle), TetheringState::Off);
  }

  TEST_F(TetheringControllerTest, operationalState_OnlyDefiniteOffIsOff) {
    auto handle = tethering.fromProfile(world.profile);

    world.tetheringState = TetheringState::Off;
    EXPECT_EQ(tethering.operationalState(handle), TetheringState::Off);
    world.tetheringState = TetheringState::On;
    EXPECT_EQ(tethering.operationalState(handle), TetheringState::On);
    world.tetheringState = TetheringState::InTransition;
    EXPECT_EQ(tethering.operationalState(handle), TetheringState::On);
    world.tetheringState = TetheringState::Unknown;
    EXPECT_EQ(tethering.operationalState(handle), TetheringState::On);
  }

  TEST_F(TetheringControllerTest, start_FailureStatusIsReturnedNotThrown) {
    world.startResult = { TetheringOperationStatus::ActivationFailed, 4, "no secrets" };
    auto handle = tethering.fromProfile(world.profile);

    auto result = tethering.start(handle);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status, TetheringOperationStatus::ActivationFailed);
    EXPECT_EQ(result.nativeCode, 4);
    EXPECT_EQ(result.message, "no secrets");
  }

} // namespace hotspot::test
