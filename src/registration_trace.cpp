#include "registration_trace.hpp"
#include "svcloc/exceptions.hpp"

#include <cstddef>
#include <sstream>

#ifdef SVCLOC_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace svcloc::internal {

namespace {

std::string render(const std::any& snapshot) {
#ifdef SVCLOC_HAS_STACKTRACE
    const auto* frames = std::any_cast<boost::stacktrace::stacktrace>(&snapshot);
    if (frames == nullptr || frames->empty()) return {};
    std::ostringstream out;
    out << *frames;
    return out.str();
#else
    (void)snapshot;
    return {};
#endif
}

} // namespace

std::any capture_registration_trace() {
#ifdef SVCLOC_HAS_STACKTRACE
    // Skip this frame; the registering API is the first one reported.
    return boost::stacktrace::stacktrace(1, static_cast<std::size_t>(-1));
#else
    return {};
#endif
}

std::string describe_registration(const descriptor& desc) {
    auto frames = render(desc.registration_stacktrace);
    if (frames.empty()) return {};

    std::ostringstream out;
    out << demangle(desc.contract_type);
    if (desc.impl_type && *desc.impl_type != desc.contract_type) {
        out << " [impl: " << demangle(*desc.impl_type) << ']';
    }
    out << " registered as " << to_string(desc.lifetime);
    if (!desc.api_name.empty()) out << " via " << desc.api_name;
    out << ":\n" << frames;
    return out.str();
}

} // namespace svcloc::internal
