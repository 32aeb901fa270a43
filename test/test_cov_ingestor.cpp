#include "cov_ingestor.hpp"
#include "protocol_stack_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{

using testing::_;
using testing::AllOf;
using testing::Eq;
using testing::Field;
using testing::Optional;
using testing::Return;
using testing::StrictMock;

const object_id Device = device_object(100);
const object_id Input1 = {.type = object_type::analog_input, .instance = 1};

class TestCovIngestor : public testing::Test
{
protected:
    void SetUp() override
    {
        EXPECT_CALL(stack_, datatype_of(object_type::analog_input, property_id::present_value))
            .WillRepeatedly(Return(datatype{.shape = value_shape::scalar, .element = app_tag::real}));
        EXPECT_CALL(stack_, datatype_of(object_type::analog_input, property_id::status_flags))
            .WillRepeatedly(Return(datatype{.shape = value_shape::scalar, .element = app_tag::bit_string}));
        registry_.upsert(Device, bip_address(10));
    }

    cov_notification notification(std::optional<confirmed_context> confirmed) const
    {
        return {
            .subscriber_process_id = 1,
            .initiating_device = Device,
            .monitored_object = Input1,
            .time_remaining = 240,
            .values = {
                {.property = property_id::present_value, .value = {app_value{22.5f}}},
                {.property = property_id::status_flags, .value = {app_value{bit_string{{false, false, false, false}}}}},
            },
            .confirmed = confirmed,
        };
    }

    StrictMock<protocol_stack_mock> stack_;
    device_registry registry_;
    id_allocator ids_;
    property_lists lists_ = property_lists::defaults();
    request_dispatcher dispatcher_{stack_, registry_, ids_, lists_};
    cov_ingestor ingestor_{stack_, registry_, dispatcher_};
};

TEST_F(TestCovIngestor, attach_registers_handler)
{
    protocol_stack::cov_handler handler;
    EXPECT_CALL(stack_, set_cov_handler(_)).WillOnce([&handler](protocol_stack::cov_handler h) { handler = std::move(h); });
    ingestor_.attach();

    handler(notification(std::nullopt));
    EXPECT_THAT(registry_.property(Device, Input1, property_id::present_value), Optional(Eq(property_value{app_value{22.5f}})));
}

TEST_F(TestCovIngestor, unconfirmed_notification_is_merged_without_answer)
{
    ingestor_.on_notification(notification(std::nullopt));

    EXPECT_THAT(registry_.property(Device, Input1, property_id::present_value), Optional(Eq(property_value{app_value{22.5f}})));
    EXPECT_THAT(registry_.property(Device, Input1, property_id::status_flags),
                Optional(Eq(property_value{app_value{bit_string{{false, false, false, false}}}})));
}

TEST_F(TestCovIngestor, confirmed_notification_is_acknowledged_by_default)
{
    confirmed_context context = {.invoke_id = 17, .source = bip_address(10)};
    EXPECT_CALL(stack_,
                respond_cov(AllOf(Field(&confirmed_context::invoke_id, 17), Field(&confirmed_context::source, bip_address(10))),
                            Field(&cov_disposition::response, cov_disposition::action::acknowledge)));
    ingestor_.on_notification(notification(context));
}

TEST_F(TestCovIngestor, configured_disposition_is_sent)
{
    ingestor_.set_disposition({.response = cov_disposition::action::reject, .reason = 9});
    EXPECT_CALL(stack_,
                respond_cov(Field(&confirmed_context::invoke_id, 3),
                            AllOf(Field(&cov_disposition::response, cov_disposition::action::reject),
                                  Field(&cov_disposition::reason, 9))));
    ingestor_.on_notification(notification(confirmed_context{.invoke_id = 3, .source = bip_address(10)}));
    // the values are kept whatever the answer
    EXPECT_TRUE(registry_.has_object(Device, Input1));

    ingestor_.set_disposition({.response = cov_disposition::action::abort, .reason = 4});
    EXPECT_CALL(stack_, respond_cov(_, Field(&cov_disposition::response, cov_disposition::action::abort)));
    ingestor_.on_notification(notification(confirmed_context{.invoke_id = 4, .source = bip_address(10)}));
}

TEST_F(TestCovIngestor, notification_from_unknown_device_is_still_answered)
{
    auto unknown = notification(confirmed_context{.invoke_id = 5, .source = bip_address(50)});
    unknown.initiating_device = device_object(999);
    EXPECT_CALL(stack_, respond_cov(Field(&confirmed_context::invoke_id, 5), _));
    ingestor_.on_notification(unknown);
    EXPECT_FALSE(registry_.has_device(device_object(999)));
}

TEST_F(TestCovIngestor, undecodable_value_is_skipped)
{
    auto mixed = notification(std::nullopt);
    mixed.values[0].value = {app_value{std::string("not a real")}};
    ingestor_.on_notification(mixed);

    EXPECT_THAT(registry_.property(Device, Input1, property_id::present_value), Eq(std::nullopt));
    EXPECT_TRUE(registry_.property(Device, Input1, property_id::status_flags).has_value());
}

TEST_F(TestCovIngestor, time_remaining_refreshes_subscription_expiry)
{
    EXPECT_CALL(stack_, subscribe_cov(_, _, _))
        .WillOnce([](const subscribe_cov_request&, const bacnet_address&, simple_ack_handler h) {
            h(simple_ack{.source = bip_address(10)});
            return submit_result::sent(1);
        });
    auto start = request_dispatcher::clock::now();
    dispatcher_.subscribe(Input1, true, bip_address(10), 3600U);
    EXPECT_TRUE(dispatcher_.subscriptions_due(start + std::chrono::seconds(120)).empty());

    auto short_remaining = notification(std::nullopt);
    short_remaining.time_remaining = 90;
    ingestor_.on_notification(short_remaining);
    EXPECT_THAT(dispatcher_.subscriptions_due(start + std::chrono::seconds(120)).size(), 1U);
}

}  // namespace
