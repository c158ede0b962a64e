/**
 * @file config.hpp
 * @brief epibits compile-time configuration.
 *
 * Episode bitwise encoding: temporal intervals encoded as fixed-width
 * bitmasks, one bit per discretized time unit.
 */

#ifndef EPIBITS_CONFIG_HPP
#define EPIBITS_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace epibits {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Maximum encoding width in bits
#ifndef EPIBITS_MAX_WIDTH
#define EPIBITS_MAX_WIDTH 65535U
#endif

/// Number of bits derived from a time window when none is given
#ifndef EPIBITS_DEFAULT_BIT_COUNT
#define EPIBITS_DEFAULT_BIT_COUNT 32U
#endif

inline constexpr std::size_t MAX_WIDTH = EPIBITS_MAX_WIDTH;
inline constexpr std::size_t DEFAULT_BIT_COUNT = EPIBITS_DEFAULT_BIT_COUNT;

/// 32-bit word type for bit vector storage
using word_t = std::uint32_t;
inline constexpr std::size_t BITS_PER_WORD = 32U;

/** @} */

} // namespace epibits

#endif // EPIBITS_CONFIG_HPP
