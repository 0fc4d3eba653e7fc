#pragma once

#include <tl/expected.hpp>

#include "dtx/core/error.hpp"

namespace dtx {

template <class T>
using Expected = tl::expected<T, Error>;

template <class E>
using unexpected = tl::unexpected<E>;

using tl::make_unexpected;

}  // namespace dtx
