#include "binding_map.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <utility>

namespace svcloc::internal {

binding_map::shard& binding_map::shard_for(std::type_index contract) noexcept {
    return shards_[std::hash<std::type_index>{}(contract) % shard_count];
}

const binding_map::shard& binding_map::shard_for(std::type_index contract) const noexcept {
    return shards_[std::hash<std::type_index>{}(contract) % shard_count];
}

bool binding_map::try_emplace(std::type_index contract, std::shared_ptr<binding> b) {
    auto& s = shard_for(contract);
    std::unique_lock lock(s.mutex);
    return s.entries.try_emplace(contract, std::move(b)).second;
}

std::optional<std::type_index> binding_map::try_emplace_all(std::vector<entry> batch) {
    auto index_of = [](std::type_index contract) {
        return std::hash<std::type_index>{}(contract) % shard_count;
    };

    // Lock in ascending shard order so concurrent batches cannot deadlock.
    std::vector<std::size_t> indices;
    for (const auto& e : batch) indices.push_back(index_of(e.first));
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    std::vector<std::unique_lock<std::shared_mutex>> locks;
    locks.reserve(indices.size());
    for (auto i : indices) locks.emplace_back(shards_[i].mutex);

    for (const auto& e : batch) {
        if (shards_[index_of(e.first)].entries.contains(e.first)) return e.first;
    }
    for (auto& [contract, b] : batch) {
        shards_[index_of(contract)].entries.emplace(contract, std::move(b));
    }
    return std::nullopt;
}

std::shared_ptr<binding> binding_map::find(std::type_index contract) const {
    const auto& s = shard_for(contract);
    std::shared_lock lock(s.mutex);
    auto it = s.entries.find(contract);
    if (it == s.entries.end()) return nullptr;
    return it->second;
}

bool binding_map::contains(std::type_index contract) const {
    const auto& s = shard_for(contract);
    std::shared_lock lock(s.mutex);
    return s.entries.contains(contract);
}

std::size_t binding_map::size() const {
    std::size_t n = 0;
    for (const auto& s : shards_) {
        std::shared_lock lock(s.mutex);
        n += s.entries.size();
    }
    return n;
}

std::vector<std::type_index> binding_map::keys() const {
    std::vector<std::type_index> result;
    for (const auto& s : shards_) {
        std::shared_lock lock(s.mutex);
        for (const auto& [contract, b] : s.entries) {
            result.push_back(contract);
        }
    }
    return result;
}

} // namespace svcloc::internal
