#pragma once

/// @file fwd.hpp
/// Forward declarations for all public svcloc symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace svcloc {

// lifetime.hpp
enum class lifetime_kind;

// descriptor.hpp
struct descriptor;
struct init_options;

// exceptions.hpp
class registry_error;
class already_initialized;
class not_initialized;
class duplicate_registration;
class not_registered;
class activation_error;
class contract_mismatch;

// catalog.hpp
struct discovery_entry;
class discovery_catalog;

// registry.hpp
class registry;

} // namespace svcloc
