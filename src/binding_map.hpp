#pragma once

// Internal: concurrent contract → binding table.  Not installed.

#include "binding.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace svcloc::internal {

/// Lock-striped map.  Each shard has its own shared_mutex, so a lookup only
/// contends with inserts that hash to the same shard.  Entries are never
/// erased or replaced.
class binding_map {
public:
    static constexpr std::size_t shard_count = 16;

    /// Insert `b` under `contract`.  Returns false, leaving the existing
    /// entry untouched, if the contract is already present.
    bool try_emplace(std::type_index contract, std::shared_ptr<binding> b);

    using entry = std::pair<std::type_index, std::shared_ptr<binding>>;

    /// Insert every entry or none.  All affected shards are locked together,
    /// so readers never observe part of the batch.  Returns the first
    /// contract found already present, in which case nothing was inserted.
    std::optional<std::type_index> try_emplace_all(std::vector<entry> batch);

    /// nullptr when absent.  The returned pointer stays valid after the
    /// shard lock is released.
    std::shared_ptr<binding> find(std::type_index contract) const;

    bool contains(std::type_index contract) const;

    std::size_t size() const;

    std::vector<std::type_index> keys() const;

private:
    struct shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::type_index, std::shared_ptr<binding>> entries;
    };

    shard& shard_for(std::type_index contract) noexcept;
    const shard& shard_for(std::type_index contract) const noexcept;

    std::array<shard, shard_count> shards_;
};

} // namespace svcloc::internal
