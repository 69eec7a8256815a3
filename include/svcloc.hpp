#pragma once

#include "svcloc/export.hpp"
#include "svcloc/fwd.hpp"
#include "svcloc/lifetime.hpp"
#include "svcloc/descriptor.hpp"
#include "svcloc/exceptions.hpp"
#include "svcloc/type_traits.hpp"
#include "svcloc/catalog.hpp"
#include "svcloc/log.hpp"
#include "svcloc/registry.hpp"
