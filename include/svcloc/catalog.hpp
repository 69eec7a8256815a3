#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "lifetime.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <mutex>
#include <source_location>
#include <typeindex>
#include <vector>

namespace svcloc {

// ---------------------------------------------------------------
// discovery_entry: one declarative "Impl implements Contract" marker
// ---------------------------------------------------------------

struct discovery_entry {
    std::type_index contract_type;
    std::type_index impl_type;
    bool construct_eagerly = true;
    bool single_instance   = true;

    /// False when the implementation does not derive from the contract.
    /// Such an entry has no factory; discovery rejects it with contract_mismatch.
    bool satisfies_contract = true;

    factory_fn factory;
    std::source_location location;

    lifetime_kind lifetime() const noexcept {
        return lifetime_from_flags(construct_eagerly, single_instance);
    }
};

// ---------------------------------------------------------------
// discovery_catalog
// ---------------------------------------------------------------

/// Explicit table of implementations that `registry::init()` registers
/// during auto-discovery.  Start-up code fills it with `implements<C, T>()`,
/// or translation units mark their implementations with SVCLOC_IMPLEMENTS,
/// which appends to `global()` during static initialization.
///
/// Appending and snapshotting are thread-safe.
class SVCLOC_EXPORT discovery_catalog {
public:
    discovery_catalog() = default;

    discovery_catalog(const discovery_catalog&) = delete;
    discovery_catalog& operator=(const discovery_catalog&) = delete;

    /// Mark `TImpl` as the implementation of `TContract`.
    ///   construct_eagerly: construct during discovery (singletons only)
    ///   single_instance: keep and reuse one instance; false = transient
    ///
    /// A `TImpl` that does not derive from `TContract` is accepted here and
    /// reported as contract_mismatch when the catalog is discovered.
    template <typename TContract, typename TImpl>
    discovery_catalog& implements(bool construct_eagerly = true,
                                  bool single_instance = true,
                                  std::source_location loc = std::source_location::current()) {
        static_assert(default_constructible<TImpl>,
            "implements<C,T>: T must be default constructible");
        discovery_entry entry{
            std::type_index(typeid(TContract)),
            std::type_index(typeid(TImpl)),
            construct_eagerly,
            single_instance,
            derived_from_base<TImpl, TContract>,
            {},
            loc
        };
        if constexpr (derived_from_base<TImpl, TContract>) {
            entry.factory = [] { return make_erased_as<TContract, TImpl>(); };
        }
        return add_entry(std::move(entry));
    }

    /// Copy of all entries in insertion order.
    std::vector<discovery_entry> entries() const;

    std::size_t size() const;

    /// Process-wide catalog used by `registry::init(true)`.
    static discovery_catalog& global();

private:
    discovery_catalog& add_entry(discovery_entry entry);

    mutable std::mutex mutex_;
    std::vector<discovery_entry> entries_;
};

} // namespace svcloc

#define SVCLOC_DETAIL_CONCAT_IMPL(a, b) a##b
#define SVCLOC_DETAIL_CONCAT(a, b) SVCLOC_DETAIL_CONCAT_IMPL(a, b)

/// Declarative marker: register `impl` for `contract` in the global catalog.
/// Optional trailing arguments are `construct_eagerly, single_instance`.
///
///   SVCLOC_IMPLEMENTS(IClock, SystemClock, false);   // lazy singleton
#define SVCLOC_IMPLEMENTS(contract, impl, ...)                                  \
    [[maybe_unused]] static const bool SVCLOC_DETAIL_CONCAT(                    \
        svcloc_implements_, __LINE__) =                                         \
        (::svcloc::discovery_catalog::global()                                  \
             .implements<contract, impl>(__VA_ARGS__),                          \
         true)
