#include "id_allocator.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <map>
#include <random>
#include <set>

namespace
{

using testing::Eq;
using testing::Optional;

class TestIdAllocator : public testing::Test
{
protected:
    static subscription_key key(uint32_t object_instance, uint32_t device_instance = 100)
    {
        return {.object = {.type = object_type::analog_input, .instance = object_instance},
                .device = device_object(device_instance)};
    }

    id_allocator ids_;
};

TEST_F(TestIdAllocator, assign_starts_at_one_and_counts_up)
{
    EXPECT_THAT(ids_.assign(key(1)), 1U);
    EXPECT_THAT(ids_.assign(key(2)), 2U);
    EXPECT_THAT(ids_.assign(key(3)), 3U);
    EXPECT_THAT(ids_.size(), 3U);
}

TEST_F(TestIdAllocator, assign_is_idempotent)
{
    EXPECT_THAT(ids_.assign(key(1)), 1U);
    EXPECT_THAT(ids_.assign(key(1)), 1U);
    EXPECT_THAT(ids_.assign(key(2)), 2U);
    EXPECT_THAT(ids_.size(), 2U);
}

TEST_F(TestIdAllocator, same_object_on_other_device_is_another_key)
{
    EXPECT_THAT(ids_.assign(key(1, 100)), 1U);
    EXPECT_THAT(ids_.assign(key(1, 200)), 2U);
}

TEST_F(TestIdAllocator, released_ids_are_reused_last_in_first_out)
{
    ids_.assign(key(1));
    ids_.assign(key(2));
    ids_.assign(key(3));

    ids_.unassign(key(1));
    ids_.unassign(key(3));

    EXPECT_THAT(ids_.assign(key(4)), 3U);
    EXPECT_THAT(ids_.assign(key(5)), 1U);
    EXPECT_THAT(ids_.assign(key(6)), 4U);
}

TEST_F(TestIdAllocator, unassign_unknown_key_does_nothing)
{
    ids_.assign(key(1));
    ids_.unassign(key(9));

    EXPECT_THAT(ids_.size(), 1U);
    EXPECT_THAT(ids_.assign(key(2)), 2U);
}

TEST_F(TestIdAllocator, lookup_both_ways)
{
    ids_.assign(key(7));

    EXPECT_THAT(ids_.lookup(key(7)), Optional(1U));
    EXPECT_THAT(ids_.key_of(1), Optional(Eq(key(7))));
    EXPECT_TRUE(ids_.contains(key(7)));

    ids_.unassign(key(7));
    EXPECT_THAT(ids_.lookup(key(7)), Eq(std::nullopt));
    EXPECT_THAT(ids_.key_of(1), Eq(std::nullopt));
    EXPECT_FALSE(ids_.contains(key(7)));
}

TEST_F(TestIdAllocator, live_ids_stay_unique_over_random_sequences)
{
    std::mt19937 random(20240611);
    std::uniform_int_distribution<uint32_t> instance(1, 40);
    std::bernoulli_distribution release(0.4);
    std::map<uint32_t, uint32_t> live;

    for (int step = 0; step < 5000; step++)
    {
        auto object = instance(random);
        if (release(random))
        {
            ids_.unassign(key(object));
            live.erase(object);
        }
        else
        {
            auto id = ids_.assign(key(object));
            auto it = live.emplace(object, id).first;
            EXPECT_THAT(it->second, id);
        }

        std::set<uint32_t> ids;
        for (const auto& [object_instance, id] : live)
        {
            EXPECT_GE(id, 1U);
            EXPECT_TRUE(ids.insert(id).second) << "id " << id << " held twice at step " << step;
            EXPECT_THAT(ids_.key_of(id), Optional(Eq(key(object_instance))));
        }
        ASSERT_THAT(ids_.size(), live.size());
    }
}

}  // namespace
