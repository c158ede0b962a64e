/**
 * @file epibits.hpp
 * @brief Episode bitwise encoding library.
 *
 * Encodes episodes (e.g. a medication's active period) as fixed-width
 * bitmasks and detects co-occurrence and lingering effect windows between
 * them with bitwise operations.
 *
 * @code
 * using namespace std::chrono;
 * auto ref = sys_days{year{2016} / May / 31};
 * auto drug_a = epibits::Encoding::from_time_window(ref - days{20}, ref - days{10}, ref);
 * auto drug_b = epibits::Encoding::from_time_window(ref - days{8}, ref - days{2}, ref);
 * auto overlap = epibits::Encoding::interaction(drug_a, drug_b, 3);
 * @endcode
 */

#ifndef EPIBITS_HPP
#define EPIBITS_HPP

#include "bitvector.hpp"
#include "collection.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "store.hpp"

namespace epibits {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace epibits

#endif // EPIBITS_HPP
