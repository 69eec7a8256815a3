#pragma once

#include <string_view>

namespace svcloc {

enum class lifetime_kind {
    eager_singleton,
    lazy_singleton,
    transient
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    switch (lt) {
        case lifetime_kind::eager_singleton: return "eager singleton";
        case lifetime_kind::lazy_singleton:  return "lazy singleton";
        case lifetime_kind::transient:       return "transient";
    }
    return "unknown lifetime";
}

/// Map declarative marker flags onto a lifetime.  A non-shared instance is
/// always transient; `construct_eagerly` only matters for singletons.
constexpr lifetime_kind lifetime_from_flags(bool construct_eagerly,
                                            bool single_instance) noexcept {
    if (!single_instance) return lifetime_kind::transient;
    return construct_eagerly ? lifetime_kind::eager_singleton
                             : lifetime_kind::lazy_singleton;
}

constexpr bool is_singleton(lifetime_kind lt) noexcept {
    return lt != lifetime_kind::transient;
}

} // namespace svcloc
