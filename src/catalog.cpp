#include "svcloc/catalog.hpp"

#include <mutex>
#include <utility>

namespace svcloc {

discovery_catalog& discovery_catalog::add_entry(discovery_entry entry) {
    std::lock_guard lock(mutex_);
    entries_.push_back(std::move(entry));
    return *this;
}

std::vector<discovery_entry> discovery_catalog::entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

std::size_t discovery_catalog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

discovery_catalog& discovery_catalog::global() {
    // Function-local static: safe to use from other translation units'
    // static initializers (SVCLOC_IMPLEMENTS).
    static discovery_catalog catalog;
    return catalog;
}

} // namespace svcloc
