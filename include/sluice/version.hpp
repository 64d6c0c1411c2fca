#pragma once
/**
 * @file version.hpp
 * @brief Release of the sluice library, logged at startup and reported in router state.
 */

namespace sluice {

inline constexpr int version_major = 0;
inline constexpr int version_minor = 3;
inline constexpr int version_patch = 0;

inline constexpr const char* version_string = "0.3.0";

} // namespace sluice
