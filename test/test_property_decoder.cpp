#include "property_decoder.hpp"
#include "protocol_stack_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{

using testing::Eq;
using testing::Optional;
using testing::Return;
using testing::StrictMock;

const object_id Input = {.type = object_type::analog_input, .instance = 3};
const object_id Device = device_object(100);

app_value object_value(object_type type, uint32_t instance)
{
    return app_value{object_id{.type = type, .instance = instance}};
}

TEST(TestPropertyDecoder, scalar_with_matching_tag)
{
    datatype type = {.shape = value_shape::scalar, .element = app_tag::real};
    EXPECT_THAT(decode_property(type, {app_value{21.5f}}, std::nullopt), Optional(Eq(property_value{app_value{21.5f}})));
}

TEST(TestPropertyDecoder, scalar_with_wrong_tag_fails)
{
    datatype type = {.shape = value_shape::scalar, .element = app_tag::real};
    EXPECT_THAT(decode_property(type, {app_value{uint64_t{21}}}, std::nullopt), Eq(std::nullopt));
    EXPECT_THAT(decode_property(type, {}, std::nullopt), Eq(std::nullopt));
}

TEST(TestPropertyDecoder, scalar_without_known_tag_accepts_anything)
{
    datatype type = {.shape = value_shape::scalar};
    EXPECT_THAT(decode_property(type, {app_value{uint64_t{7}}}, std::nullopt), Optional(Eq(property_value{app_value{uint64_t{7}}})));

    value_list constructed = {app_value{uint64_t{7}}, app_value{true}};
    EXPECT_THAT(decode_property(type, constructed, std::nullopt), Optional(Eq(property_value{constructed})));
}

TEST(TestPropertyDecoder, whole_array_decodes_all_elements)
{
    datatype type = {.shape = value_shape::array, .element = app_tag::object_id};
    value_list raw = {object_value(object_type::device, 100), object_value(object_type::analog_input, 1)};
    EXPECT_THAT(decode_property(type, raw, std::nullopt), Optional(Eq(property_value{raw})));

    raw.push_back(app_value{true});
    EXPECT_THAT(decode_property(type, raw, std::nullopt), Eq(std::nullopt));
}

TEST(TestPropertyDecoder, empty_list_is_empty_value_list)
{
    datatype type = {.shape = value_shape::list, .element = app_tag::object_id};
    EXPECT_THAT(decode_property(type, {}, std::nullopt), Optional(Eq(property_value{value_list{}})));
}

TEST(TestPropertyDecoder, array_index_zero_is_the_element_count)
{
    datatype type = {.shape = value_shape::array, .element = app_tag::object_id};
    EXPECT_THAT(decode_property(type, {app_value{uint64_t{12}}}, 0U), Optional(Eq(property_value{app_value{uint64_t{12}}})));
    EXPECT_THAT(decode_property(type, {object_value(object_type::device, 1)}, 0U), Eq(std::nullopt));
}

TEST(TestPropertyDecoder, array_index_selects_one_element)
{
    datatype type = {.shape = value_shape::array, .element = app_tag::character_string};
    value_list raw = {app_value{std::string("Off")}};
    EXPECT_THAT(decode_property(type, raw, 2U), Optional(Eq(property_value{raw.front()})));
}

TEST(TestPropertyDecoder, unknown_datatype_is_skipped)
{
    StrictMock<protocol_stack_mock> stack;
    EXPECT_CALL(stack, datatype_of(object_type::analog_input, static_cast<property_id>(5000))).WillOnce(Return(std::nullopt));

    EXPECT_THAT(decode_property(stack, Input, static_cast<property_id>(5000), {app_value{true}}, std::nullopt), Eq(std::nullopt));
}

TEST(TestPropertyDecoder, looks_up_datatype_through_the_stack)
{
    StrictMock<protocol_stack_mock> stack;
    EXPECT_CALL(stack, datatype_of(object_type::device, property_id::object_list))
        .WillOnce(Return(datatype{.shape = value_shape::array, .element = app_tag::object_id}));

    value_list raw = {object_value(object_type::device, 100)};
    EXPECT_THAT(decode_property(stack, Device, property_id::object_list, raw, std::nullopt), Optional(Eq(property_value{raw})));
}

}  // namespace
