/**
 * @file expected.hpp
 * @brief Result type used by every fallible sluice operation.
 *
 * Registry updates, config loading, scheduler polls and routing replies return
 * sluice_detail::expected<T, E>; failures are built with sluice_detail::unexpected.
 * Resolves to std::expected where the standard library provides it and to
 * tl::expected (TartanLlama, header-only) on older libraries.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
namespace sluice_detail {
template <class T, class E> using expected = std::expected<T, E>;
template <class E> using unexpected        = std::unexpected<E>;
} // namespace sluice_detail
#else
#include <tl/expected.hpp>
namespace sluice_detail {
template <class T, class E> using expected = tl::expected<T, E>;
template <class E> using unexpected        = tl::unexpected<E>;
} // namespace sluice_detail
#endif
