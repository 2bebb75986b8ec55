// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// names the success/error pair consistently. The default error type is the
// classified core::Error; socket and wire helpers use std::error_code and are
// mapped at the transport boundary.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "tvdeck/core/Error.hpp"

namespace tvdeck {

template <typename T, typename E = core::Error>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

/// Shorthand for building a classified failure.
[[nodiscard]] inline unexpected_t<core::Error>
fail(core::ErrorKind kind, std::string message, std::error_code cause = {}) {
    return unexpected_t<core::Error>(core::Error(kind, std::move(message), cause));
}

} // namespace tvdeck
