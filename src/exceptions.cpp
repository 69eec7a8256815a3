#include "svcloc/exceptions.hpp"

#include <cstdlib>
#include <optional>
#include <typeindex>
#include <string>
#include <memory>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace svcloc {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

} // namespace internal

namespace {

std::string describe(std::type_index contract, std::optional<std::type_index> impl) {
    std::string s = internal::demangle(contract);
    if (impl.has_value() && impl.value() != contract) {
        s += " [impl: " + internal::demangle(impl.value()) + "]";
    }
    return s;
}

} // namespace

std::string registry_error::format_message(const std::string& msg,
                                           const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

registry_error::registry_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void registry_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void registry_error::append_resolution_context(const std::string& component_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_info;
    cached_what_.clear();
}

const char* registry_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string registry_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

already_initialized::already_initialized(std::source_location loc)
    : registry_error("Registry is already initialized; init() may only be called once", loc)
{}

not_initialized::not_initialized(std::source_location loc)
    : registry_error("Registry is not initialized; call init() or register a binding first", loc)
{}

duplicate_registration::duplicate_registration(std::type_index contract,
                                               std::source_location loc)
    : registry_error("Contract already registered: " + internal::demangle(contract), loc)
    , contract_type_(contract)
{}

not_registered::not_registered(std::type_index contract, std::source_location loc)
    : registry_error("Contract not registered: " + internal::demangle(contract), loc)
    , contract_type_(contract)
{}

activation_error::activation_error(std::type_index contract,
                                   std::optional<std::type_index> impl,
                                   const std::exception& inner,
                                   std::source_location registration_loc)
    : registry_error("Failed to activate " + describe(contract, impl) + ": " + inner.what(),
                     registration_loc)
    , contract_type_(contract)
    , impl_type_(impl)
    , inner_message_(inner.what())
{}

contract_mismatch::contract_mismatch(std::type_index contract, std::type_index impl,
                                     std::source_location loc)
    : registry_error(internal::demangle(impl) + " does not implement "
                     + internal::demangle(contract), loc)
    , contract_type_(contract)
    , impl_type_(impl)
{}

} // namespace svcloc
