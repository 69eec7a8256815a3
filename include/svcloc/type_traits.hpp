#pragma once

#include <concepts>
#include <memory>
#include <type_traits>

namespace svcloc {

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// T is default-constructible (for by-type registrations).
template <typename T>
concept default_constructible = std::is_default_constructible_v<T>;

/// A zero-argument callable whose result converts to `std::shared_ptr<TContract>`.
/// Covers lambdas returning `make_shared<Impl>()`, `make_unique<Impl>()` and
/// plain function pointers alike.
template <typename F, typename TContract>
concept contract_factory =
    std::invocable<F&>
    && std::is_convertible_v<std::invoke_result_t<F&>, std::shared_ptr<TContract>>;

// ---------------------------------------------------------------
// Type-erasure helpers
// ---------------------------------------------------------------

/// Erase a contract pointer.  The void pointer holds `TContract*`, so
/// `static_pointer_cast<TContract>` round-trips even under multiple or
/// virtual inheritance.
template <typename TContract>
std::shared_ptr<void> erase_as(std::shared_ptr<TContract> p) noexcept {
    return std::static_pointer_cast<void>(std::move(p));
}

/// Construct a `TImpl` and erase it as `TContract`.
template <typename TContract, typename TImpl>
    requires derived_from_base<TImpl, TContract> && default_constructible<TImpl>
std::shared_ptr<void> make_erased_as() {
    return erase_as<TContract>(std::make_shared<TImpl>());
}

} // namespace svcloc
