#include "config.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <map>
#include <string>

namespace
{

using testing::ElementsAre;
using testing::Eq;
using testing::Optional;

class TestConfig : public testing::Test
{
protected:
    collector_config load() const
    {
        return load_config([this](const char *name) -> const char * {
            auto it = environment_.find(name);
            return it == environment_.end() ? nullptr : it->second.c_str();
        });
    }

    std::map<std::string, std::string> environment_;
};

TEST_F(TestConfig, defaults_without_environment)
{
    auto config = load();
    EXPECT_EQ(config.mqtt_host, "localhost");
    EXPECT_EQ(config.mqtt_port, 1883);
    EXPECT_FALSE(config.debug);
    EXPECT_EQ(config.device_instance, 4194303U);
    EXPECT_THAT(config.cov_lifetime, Eq(std::nullopt));
    EXPECT_EQ(config.disposition.response, cov_disposition::action::acknowledge);
    EXPECT_EQ(config.refresh_seconds, 60U);
    EXPECT_EQ(config.who_is_seconds, 300U);
    EXPECT_EQ(config.max_objects_per_read, 16U);
    EXPECT_EQ(config.lists.once_object_properties, property_lists::defaults().once_object_properties);
}

TEST_F(TestConfig, reads_every_setting)
{
    environment_ = {
        {"MQTT_HOST", "broker.local"},
        {"MQTT_PORT", "8883"},
        {"BACNET_DEBUG", ""},
        {"BACNET_DEVICE_INSTANCE", "1234"},
        {"BACNET_COV_LIFETIME", "300"},
        {"BACNET_COV_DISPOSITION", "reject:9"},
        {"BACNET_REFRESH_SECONDS", "0"},
        {"BACNET_WHO_IS_SECONDS", "60"},
        {"BACNET_MAX_OBJECTS_PER_READ", "4"},
        {"BACNET_PERIODIC_PROPERTIES", "present-value,status-flags,1000"},
    };
    auto config = load();
    EXPECT_EQ(config.mqtt_host, "broker.local");
    EXPECT_EQ(config.mqtt_port, 8883);
    EXPECT_TRUE(config.debug);
    EXPECT_EQ(config.device_instance, 1234U);
    EXPECT_THAT(config.cov_lifetime, Optional(300U));
    EXPECT_EQ(config.disposition.response, cov_disposition::action::reject);
    EXPECT_EQ(config.disposition.reason, 9);
    EXPECT_EQ(config.refresh_seconds, 0U);
    EXPECT_EQ(config.who_is_seconds, 60U);
    EXPECT_EQ(config.max_objects_per_read, 4U);
    EXPECT_THAT(config.lists.periodic_object_properties,
                ElementsAre(property_id::present_value, property_id::status_flags, static_cast<property_id>(1000)));
}

TEST_F(TestConfig, zero_lifetime_means_indefinite)
{
    environment_ = {{"BACNET_COV_LIFETIME", "0"}};
    EXPECT_THAT(load().cov_lifetime, Eq(std::nullopt));
}

TEST_F(TestConfig, disposition_forms)
{
    environment_ = {{"BACNET_COV_DISPOSITION", "abort"}};
    auto config = load();
    EXPECT_EQ(config.disposition.response, cov_disposition::action::abort);
    EXPECT_EQ(config.disposition.reason, 0);

    environment_ = {{"BACNET_COV_DISPOSITION", "ack"}};
    EXPECT_EQ(load().disposition.response, cov_disposition::action::acknowledge);
}

TEST_F(TestConfig, invalid_values_keep_defaults)
{
    environment_ = {
        {"MQTT_PORT", "70000"},
        {"BACNET_DEVICE_INSTANCE", "abc"},
        {"BACNET_COV_DISPOSITION", "ignore"},
        {"BACNET_REFRESH_SECONDS", "-5"},
        {"BACNET_ONCE_PROPERTIES", "present-value,no-such-property"},
    };
    auto config = load();
    EXPECT_EQ(config.mqtt_port, 1883);
    EXPECT_EQ(config.device_instance, 4194303U);
    EXPECT_EQ(config.disposition.response, cov_disposition::action::acknowledge);
    EXPECT_EQ(config.refresh_seconds, 60U);
    EXPECT_EQ(config.lists.once_object_properties, property_lists::defaults().once_object_properties);

    environment_ = {{"BACNET_COV_DISPOSITION", "reject:300"}};
    EXPECT_EQ(load().disposition.response, cov_disposition::action::acknowledge);
}

}  // namespace
