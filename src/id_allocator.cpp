#include "id_allocator.hpp"

uint32_t id_allocator::assign(const subscription_key& key) {
    auto it = _key_to_id.find(key);
    if (it != _key_to_id.end()) {
        return it->second;
    }
    uint32_t id;
    if (not _released.empty()) {
        id = _released.back();
        _released.pop_back();
    } else {
        id = _next_id++;
    }
    _key_to_id[key] = id;
    _id_to_key[id] = key;
    return id;
}

void id_allocator::unassign(const subscription_key& key) {
    auto it = _key_to_id.find(key);
    if (it == _key_to_id.end()) {
        return;
    }
    uint32_t id = it->second;
    _id_to_key.erase(id);
    _key_to_id.erase(it);
    _released.push_back(id);
}

std::optional<uint32_t> id_allocator::lookup(const subscription_key& key) const {
    auto it = _key_to_id.find(key);
    if (it == _key_to_id.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<subscription_key> id_allocator::key_of(uint32_t id) const {
    auto it = _id_to_key.find(id);
    if (it == _id_to_key.end()) {
        return std::nullopt;
    }
    return it->second;
}
