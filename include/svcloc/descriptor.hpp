#pragma once

#include "export.hpp"
#include "lifetime.hpp"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <typeindex>

namespace svcloc {

class discovery_catalog;

/// Produces a fresh instance, erased to `std::shared_ptr<void>` holding the
/// contract pointer.
using factory_fn = std::function<std::shared_ptr<void>()>;

// ---------------------------------------------------------------
// descriptor: one binding registration record
// ---------------------------------------------------------------

struct descriptor {
    std::type_index contract_type = std::type_index(typeid(void));
    lifetime_kind   lifetime      = lifetime_kind::eager_singleton;
    factory_fn      factory;          // empty for pre-built instances
    std::optional<std::type_index> impl_type;

    // Diagnostics
    std::source_location registration_location;
    std::string     api_name;         // e.g. "add_lazy"
    std::any        registration_stacktrace;
};

// ---------------------------------------------------------------
// init_options
// ---------------------------------------------------------------

struct init_options {
    /// Register the entries of `catalog` (or of the global catalog) during init.
    bool auto_discover = true;

    /// Catalog to discover from; nullptr selects `discovery_catalog::global()`.
    const discovery_catalog* catalog = nullptr;
};

} // namespace svcloc
