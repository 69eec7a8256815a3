#pragma once

// Internal: where a binding was registered, for diagnostics.  Not installed.

#include "svcloc/descriptor.hpp"

#include <any>
#include <string>

namespace svcloc::internal {

/// Snapshot of the registering call stack, stored in
/// descriptor::registration_stacktrace.  Empty without SVCLOC_HAS_STACKTRACE.
std::any capture_registration_trace();

/// Diagnostic block for a binding, e.g.
///   "IClock [impl: SystemClock] registered as lazy singleton via add_lazy:\n  #0 ..."
/// Empty when no stacktrace was captured.
std::string describe_registration(const descriptor& desc);

} // namespace svcloc::internal
