#pragma once

#include "bacnet_types.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

/* a COV subscription is keyed by the monitored object and the device holding it */
struct subscription_key {
    object_id object;
    object_id device;
};

inline bool operator==(const subscription_key& lhs, const subscription_key& rhs) {
    return lhs.object == rhs.object and lhs.device == rhs.device;
}

template <>
struct std::hash<subscription_key>
{
  std::size_t operator()(const subscription_key& k) const
  {
    return std::hash<object_id>()(k.object) ^ (std::hash<object_id>()(k.device) << 1);
  }
};

/**
 * Hands out subscriber process identifiers.
 *
 * Identifiers start at 1. Released identifiers are reused last-in first-out
 * before the counter advances. Owned by the main loop thread, no locking.
 */
class id_allocator {
public:
    uint32_t assign(const subscription_key& key);
    void unassign(const subscription_key& key);

    std::optional<uint32_t> lookup(const subscription_key& key) const;
    std::optional<subscription_key> key_of(uint32_t id) const;
    bool contains(const subscription_key& key) const { return _key_to_id.count(key) != 0; }
    std::size_t size() const { return _key_to_id.size(); }

private:
    std::unordered_map<subscription_key, uint32_t> _key_to_id;
    std::unordered_map<uint32_t, subscription_key> _id_to_key;
    std::vector<uint32_t> _released;
    uint32_t _next_id = 1;
};
