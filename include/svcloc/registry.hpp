#pragma once

#include "export.hpp"
#include "catalog.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "lifetime.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <memory>
#include <source_location>
#include <string>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace svcloc {

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

/// Service locator keyed by contract type.
///
/// Lifecycle of a registry object:
///   1. `init()` creates the binding table exactly once (a second call throws
///      already_initialized) and optionally registers a discovery catalog.
///   2. `add_*()` binds one implementation per contract.  Calling any `add_*()`
///      on an uninitialized registry implicitly runs `init(false)` first; this
///      one-time side effect skips auto-discovery.
///   3. `resolve<C>()` materializes the binding according to its lifetime.
///
/// All member functions may be called concurrently.  Bindings are never
/// replaced or removed; a contract that is already bound is rejected with
/// duplicate_registration, including the losers of a registration race.
class SVCLOC_EXPORT registry {
public:
    registry();
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    /// The process-wide registry.  It is never destroyed before static
    /// destruction and follows the same init-once contract.
    static registry& instance();

    // ===============================================================
    // Initialization
    // ===============================================================

    /// Create the binding table.  With `auto_discover`, register every entry
    /// of `discovery_catalog::global()`.
    void init(bool auto_discover = true,
              std::source_location loc = std::source_location::current());

    /// Create the binding table and register every entry of `catalog`.
    void init(const discovery_catalog& catalog,
              std::source_location loc = std::source_location::current());

    void init(init_options options,
              std::source_location loc = std::source_location::current());

    bool is_initialized() const noexcept;

    // ===============================================================
    // Registration by type
    // ===============================================================

    /// Construct `TImpl` now and return that instance from every resolve.
    template <typename TContract, typename TImpl>
        requires derived_from_base<TImpl, TContract>
              && default_constructible<TImpl>
    bool add_eager(std::source_location loc = std::source_location::current()) {
        return add<TContract, TImpl>(lifetime_kind::eager_singleton, loc);
    }

    /// Construct `TImpl` on the first resolve, exactly once.
    template <typename TContract, typename TImpl>
        requires derived_from_base<TImpl, TContract>
              && default_constructible<TImpl>
    bool add_lazy(std::source_location loc = std::source_location::current()) {
        return add<TContract, TImpl>(lifetime_kind::lazy_singleton, loc);
    }

    /// Construct a new `TImpl` on every resolve.
    template <typename TContract, typename TImpl>
        requires derived_from_base<TImpl, TContract>
              && default_constructible<TImpl>
    bool add_transient(std::source_location loc = std::source_location::current()) {
        return add<TContract, TImpl>(lifetime_kind::transient, loc);
    }

    template <typename TContract, typename TImpl>
        requires derived_from_base<TImpl, TContract>
              && default_constructible<TImpl>
    bool add(lifetime_kind lifetime,
             std::source_location loc = std::source_location::current()) {
        descriptor desc;
        desc.contract_type = typeid(TContract);
        desc.lifetime = lifetime;
        desc.factory = [] { return make_erased_as<TContract, TImpl>(); };
        desc.impl_type = std::type_index(typeid(TImpl));
        desc.registration_location = loc;
        desc.api_name = api_name_for(lifetime);
        return register_binding(std::move(desc), nullptr);
    }

    // ===============================================================
    // Registration by instance (eager singleton)
    // ===============================================================

    /// `TImpl` is deduced: `reg.add_instance<ILogger>(std::make_shared<FileLogger>(path))`.
    template <typename TContract, typename TImpl>
        requires derived_from_base<TImpl, TContract>
    bool add_instance(std::shared_ptr<TImpl> instance,
                      std::source_location loc = std::source_location::current()) {
        if (!instance) {
            throw registry_error("add_instance: instance for "
                                 + internal::demangle(typeid(TContract))
                                 + " cannot be null", loc);
        }
        const TImpl& object = *instance;
        descriptor desc;
        desc.contract_type = typeid(TContract);
        desc.lifetime = lifetime_kind::eager_singleton;
        desc.impl_type = std::type_index(typeid(object));
        desc.registration_location = loc;
        desc.api_name = "add_instance";
        return register_binding(std::move(desc),
                                erase_as<TContract>(std::move(instance)));
    }

    // ===============================================================
    // Registration by factory
    // ===============================================================

    /// Bind `factory`, a zero-argument callable yielding something convertible
    /// to `std::shared_ptr<TContract>`.  Use this for implementations without
    /// a default constructor.
    template <typename TContract, typename F>
        requires contract_factory<F, TContract>
    bool add_factory(lifetime_kind lifetime, F&& factory,
                     std::source_location loc = std::source_location::current()) {
        descriptor desc;
        desc.contract_type = typeid(TContract);
        desc.lifetime = lifetime;
        desc.factory = [f = std::forward<F>(factory)]() mutable -> std::shared_ptr<void> {
            return erase_as<TContract>(std::shared_ptr<TContract>(f()));
        };
        desc.registration_location = loc;
        desc.api_name = "add_factory";
        return register_binding(std::move(desc), nullptr);
    }

    // ===============================================================
    // Queries
    // ===============================================================

    /// False (not an error) when the registry was never initialized.
    template <typename TContract>
    bool is_registered() const {
        return is_registered(typeid(TContract));
    }

    bool is_registered(std::type_index contract) const;

    /// True when a singleton instance for `TContract` exists.  Always false
    /// for transient and unbound contracts.
    template <typename TContract>
    bool is_constructed() const {
        return is_constructed(typeid(TContract));
    }

    bool is_constructed(std::type_index contract) const;

    std::size_t size() const;

    /// Bound contract types, in no particular order.
    std::vector<std::type_index> contracts() const;

    // ===============================================================
    // Resolution
    // ===============================================================

    /// Throws not_initialized, not_registered, or activation_error.
    template <typename TContract>
    std::shared_ptr<TContract> resolve(std::source_location loc = std::source_location::current()) {
        return std::static_pointer_cast<TContract>(
            resolve_impl(typeid(TContract), true, loc));
    }

    /// Like resolve(), but returns nullptr when the registry is uninitialized
    /// or the contract is unbound.  Activation failures still throw.
    template <typename TContract>
    std::shared_ptr<TContract> try_resolve(std::source_location loc = std::source_location::current()) {
        return std::static_pointer_cast<TContract>(
            resolve_impl(typeid(TContract), false, loc));
    }

private:
    static std::string api_name_for(lifetime_kind lifetime);

    bool register_binding(descriptor desc, std::shared_ptr<void> instance);

    std::shared_ptr<void> resolve_impl(std::type_index contract, bool required,
                                       std::source_location loc);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace svcloc
