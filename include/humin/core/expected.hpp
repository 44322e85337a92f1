#pragma once

#include <string>
#include <utility>

#include "humin/core/error.hpp"

#if HUMIN_HAVE_STD_EXPECTED
#include <expected>
#else
#include <tl/expected.hpp>
#endif

namespace humin {

#if HUMIN_HAVE_STD_EXPECTED

template <class T>
using Expected = std::expected<T, Error>;

template <class E>
using unexpected = std::unexpected<E>;

#else

template <class T>
using Expected = tl::expected<T, Error>;

template <class E>
using unexpected = tl::unexpected<E>;

#endif

inline unexpected<Error> fail(ErrorCode code, std::string message) {
  return unexpected<Error>(Error{code, std::move(message)});
}

}  // namespace humin
