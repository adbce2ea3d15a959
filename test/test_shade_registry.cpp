#include <gtest/gtest.h>

#include <fake_publisher.h>
#include <shade_registry.h>

#include <memory>

using namespace SHADY;

namespace {
    class ShadeRegistryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            std::vector<ShadeEntry> entries = {
                {"kitchen", "relay_1", "relay_2"},
                {"bedroom", "relay_3", "relay_4"},
            };
            registry.reset(new ShadeRegistry(entries, testSettings(), publisher));
            publisher.setDelivery([this](const std::string &topic, const std::string &payload) {
                registry->dispatch(topic, payload);
            });
        }

        void TearDown() override {
            registry->shutdownAll();
            publisher.setDelivery(nullptr);
        }

        FakePublisher publisher;
        std::unique_ptr<ShadeRegistry> registry;
    };
}

TEST_F(ShadeRegistryTest, SubscribesToCoversAndRelayWildcard) {
    std::vector<std::string> expected = {
        "homeassistant/cover/kitchen/set",
        "homeassistant/cover/bedroom/set",
        "shady/relay/+/state",
    };
    EXPECT_EQ(expected, registry->subscriptions());
}

TEST_F(ShadeRegistryTest, FindsShadesByNameAndRelay) {
    ASSERT_NE(nullptr, registry->find("bedroom"));
    EXPECT_EQ("bedroom", registry->find("bedroom")->getName());
    EXPECT_EQ(nullptr, registry->find("garage"));

    EXPECT_EQ(registry->find("kitchen"), registry->findByRelay("relay_2"));
    EXPECT_EQ(registry->find("bedroom"), registry->findByRelay("relay_3"));
    EXPECT_EQ(nullptr, registry->findByRelay("relay_9"));
}

TEST_F(ShadeRegistryTest, RoutesCoverCommandsToTheirShade) {
    EXPECT_TRUE(registry->dispatch("homeassistant/cover/bedroom/set", "CLOSE"));
    EXPECT_EQ(1u, registry->find("bedroom")->status().pendingCommands);
    EXPECT_EQ(0u, registry->find("kitchen")->status().pendingCommands);
}

TEST_F(ShadeRegistryTest, RoutesRelayFeedbackToOwner) {
    EXPECT_TRUE(registry->dispatch("shady/relay/relay_4/state", "ON"));
    EXPECT_TRUE(registry->find("bedroom")->status().closeRelayOn);
    EXPECT_FALSE(registry->find("kitchen")->status().closeRelayOn);
}

TEST_F(ShadeRegistryTest, DropsForeignTraffic) {
    EXPECT_FALSE(registry->dispatch("shady/relay/relay_9/state", "ON"));
    EXPECT_FALSE(registry->dispatch("other/relay/relay_1/state", "ON"));
    EXPECT_FALSE(registry->dispatch("homeassistant/cover/garage/set", "OPEN"));
    EXPECT_FALSE(registry->dispatch("homeassistant/cover/kitchen/state", "OPEN"));
    EXPECT_FALSE(registry->dispatch("shady/relay/relay_1/set", "ON"));
    EXPECT_FALSE(registry->dispatch("not a topic", "ON"));
}

TEST_F(ShadeRegistryTest, ShadesAreIndependent) {
    ShadeController *kitchen = registry->find("kitchen");
    ShadeController *bedroom = registry->find("bedroom");
    ASSERT_EQ(CommandResult::Done, kitchen->execute(Command::Close));
    EXPECT_EQ(ShadeState::Closing, kitchen->getState());
    EXPECT_EQ(ShadeState::Stopped, bedroom->getState());
    EXPECT_EQ(0u, publisher.count("shady/relay/relay_3/set", "OFF"));
    EXPECT_EQ(0u, publisher.count("shady/relay/relay_4/set", "ON"));
}

TEST_F(ShadeRegistryTest, OneFailedShadeIsReported) {
    EXPECT_FALSE(registry->anyFailed());
    registry->find("kitchen")->fail("test");
    EXPECT_TRUE(registry->anyFailed());
    EXPECT_EQ(Phase::Running, registry->find("bedroom")->getPhase());

    registry->shutdownAll();
    EXPECT_EQ(Phase::Failed, registry->find("kitchen")->getPhase());
    EXPECT_EQ(Phase::Stopped, registry->find("bedroom")->getPhase());
}
