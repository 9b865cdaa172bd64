#include <gtest/gtest.h>
#include "settings/ServiceSettings.hpp"
#include <cstdlib>

using cookbook::settings::ServiceSettings;

class ServiceSettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        unsetenv("COOKBOOK_SERVICE_NAME");
        unsetenv("COOKBOOK_EVENTS_ENABLED");
        unsetenv("COOKBOOK_EVENT_ROUTING_KEY");
    }
};

TEST_F(ServiceSettingsTest, Defaults) {
    ServiceSettings settings;

    EXPECT_EQ(settings.getServiceName(), "cookbook-service");
    EXPECT_TRUE(settings.isEventsEnabled());
    EXPECT_EQ(settings.getEventRoutingKey(), "recipe.created");
}

TEST_F(ServiceSettingsTest, ReadsEnvironment) {
    setenv("COOKBOOK_SERVICE_NAME", "kitchen", 1);
    setenv("COOKBOOK_EVENTS_ENABLED", "0", 1);
    setenv("COOKBOOK_EVENT_ROUTING_KEY", "cookbook.recipe.created", 1);

    ServiceSettings settings;

    EXPECT_EQ(settings.getServiceName(), "kitchen");
    EXPECT_FALSE(settings.isEventsEnabled());
    EXPECT_EQ(settings.getEventRoutingKey(), "cookbook.recipe.created");
}

TEST_F(ServiceSettingsTest, EventsEnabledUnlessExplicitlyOff) {
    setenv("COOKBOOK_EVENTS_ENABLED", "yes", 1);
    EXPECT_TRUE(ServiceSettings().isEventsEnabled());

    setenv("COOKBOOK_EVENTS_ENABLED", "off", 1);
    EXPECT_FALSE(ServiceSettings().isEventsEnabled());
}

TEST_F(ServiceSettingsTest, OffValuesAreCaseInsensitive) {
    for (const char* off : {"false", "False", "FALSE", "off", "OFF", "Off", "no", "No", "NO", "0"}) {
        setenv("COOKBOOK_EVENTS_ENABLED", off, 1);
        EXPECT_FALSE(ServiceSettings().isEventsEnabled()) << "value=" << off;
    }

    for (const char* on : {"true", "TRUE", "1", "on"}) {
        setenv("COOKBOOK_EVENTS_ENABLED", on, 1);
        EXPECT_TRUE(ServiceSettings().isEventsEnabled()) << "value=" << on;
    }
}
