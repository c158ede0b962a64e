/**
 * @file encoding.hpp
 * @brief Episode bitwise encoding and its algebra.
 *
 * An Encoding is a fixed-width bitmask with one bit per discretized time
 * unit. Bit 0 is the most distant sample, bit width-1 the sample nearest
 * the reference time.
 *
 * Operations:
 * - Construction from a value, a bit sequence or a time window
 * - Resolution change (scale_down)
 * - Lingering effect modelling (post_expand)
 * - AND / OR combinators and the pairwise interaction
 */

#ifndef EPIBITS_ENCODING_HPP
#define EPIBITS_ENCODING_HPP

#include <chrono>
#include <string>
#include <string_view>

#include "bitvector.hpp"
#include "config.hpp"
#include "error.hpp"

namespace epibits {

/**
 * @brief Fixed-width episode bitmask.
 *
 * Constructors and the AND / OR combinators enforce value < 2^width - 1.
 * The in-place mutators scale_down() and post_expand() do not re-check.
 */
class Encoding {
public:
    /**
     * @brief Construct from a native integer.
     *
     * @param value Code value
     * @param width Number of bit positions (1..MAX_WIDTH)
     * @throws InvalidWidthException if value >= 2^width - 1 or the width is
     *         out of range
     */
    Encoding(std::uint64_t value, std::size_t width);

    /**
     * @brief Construct from a bit vector holding the value.
     *
     * The vector length does not need to match @p width; only its integer
     * value is used.
     *
     * @param value Code value
     * @param width Number of bit positions (1..MAX_WIDTH)
     * @throws InvalidWidthException if value >= 2^width - 1 or the width is
     *         out of range
     */
    Encoding(const BitVector& value, std::size_t width);

    /**
     * @brief Construct from the canonical text form.
     *
     * @param bits '0'/'1' characters, MSB first; width is bits.size()
     * @throws InvalidArgumentException on other characters
     * @throws InvalidWidthException as for the value constructors
     */
    static Encoding from_bit_sequence(std::string_view bits);

    /**
     * @brief Derive an encoding from a time window.
     *
     * Walks @p bit_count steps of @p step from @p reference. Bit
     * bit_count-1-i is set when the instant reached at step i lies within
     * [start, end]. A window with start > end yields an all-zero code.
     *
     * @param start Window start (inclusive)
     * @param end Window end (inclusive)
     * @param reference Instant of step 0
     * @param step Signed step, negative to walk backward in time
     * @param bit_count Width of the result
     * @throws InvalidWidthException if every sample falls in the window
     */
    template <typename Clock, typename Duration>
    static Encoding from_time_window(const std::chrono::time_point<Clock, Duration>& start,
                                     const std::chrono::time_point<Clock, Duration>& end,
                                     const std::chrono::time_point<Clock, Duration>& reference,
                                     typename Clock::duration step = std::chrono::days{-1},
                                     std::size_t bit_count = DEFAULT_BIT_COUNT) {
        BitVector code(bit_count);
        auto cur = reference + Clock::duration::zero();
        for (std::size_t i = 0; i < bit_count; ++i) {
            if (start <= cur && cur <= end) {
                code.set_bit(bit_count - 1U - i, 1);
            }
            cur += step;
        }
        return Encoding(code, bit_count);
    }

    /**
     * @brief Get the number of bit positions.
     */
    [[nodiscard]] std::size_t width() const noexcept {
        return width_;
    }

    /**
     * @brief Get the value as a bit vector of exactly width() bits.
     */
    [[nodiscard]] const BitVector& value() const noexcept {
        return value_;
    }

    /**
     * @brief Get the value as a native integer.
     * @throws OverflowException if it needs more than 64 bits
     */
    [[nodiscard]] std::uint64_t coding_value() const {
        return value_.to_uint64();
    }

    /**
     * @brief Check whether no bit is set.
     */
    [[nodiscard]] bool is_zero() const noexcept {
        return value_.is_zero();
    }

    /**
     * @brief Population count of the value.
     */
    [[nodiscard]] std::size_t magnitude() const noexcept {
        return value_.hamming_weight();
    }

    /**
     * @brief Raw value shifted left by n.
     *
     * Not masked to width(); the result has width() + n bits.
     */
    [[nodiscard]] BitVector lshift(std::size_t n) const;

    /**
     * @brief Raw value shifted right by n.
     */
    [[nodiscard]] BitVector rshift(std::size_t n) const;

    /**
     * @brief Raw value multiplied by factor, not masked to width().
     */
    [[nodiscard]] BitVector multiply(word_t factor) const;

    /**
     * @brief Canonical text form: width() characters of '0'/'1', MSB first.
     */
    [[nodiscard]] std::string bit_sequence() const {
        return value_.to_string();
    }

    /**
     * @brief Reduce resolution by OR-merging groups of bits.
     *
     * Group k of the result covers source bits [k*group_size,
     * (k+1)*group_size) counted from the MSB; the last group may be
     * shorter. The new width is ceil(width / group_size).
     *
     * @param group_size Number of bits merged into one
     * @throws InvalidArgumentException if group_size is 0
     */
    void scale_down(std::size_t group_size);

    /**
     * @brief Extend every set bit toward the LSB by extra_bits positions.
     *
     * Models an effect lasting after the event itself. Bits that would
     * move past the LSB are discarded; the width does not change.
     *
     * @param extra_bits Number of additional positions
     */
    void post_expand(std::size_t extra_bits);

    /**
     * @brief Independent copy.
     */
    [[nodiscard]] Encoding clone() const {
        return *this;
    }

    /**
     * @brief Sum of (width - position) over all set positions.
     *
     * Earlier (more significant) bits weigh more.
     */
    [[nodiscard]] std::uint64_t score_bitorder() const noexcept;

    /**
     * @brief Bitwise AND of two encodings of equal width.
     * @throws IncompatibleOperandsException if the widths differ
     * @throws InvalidWidthException if the result has every bit set
     */
    static Encoding eb_and(const Encoding& a, const Encoding& b);

    /**
     * @brief Bitwise OR of two encodings of equal width.
     * @throws IncompatibleOperandsException if the widths differ
     * @throws InvalidWidthException if the result has every bit set
     */
    static Encoding eb_or(const Encoding& a, const Encoding& b);

    /**
     * @brief Require two operands of equal width.
     * @throws IncompatibleOperandsException if the widths differ
     */
    static void check_compatible(const Encoding& a, const Encoding& b);

    /**
     * @brief Co-occurrence of two post-expanded encodings.
     *
     * If either operand is zero the result is a zero encoding of a's width
     * and widths are not compared. Otherwise both operands are cloned,
     * post-expanded by extra_bits and ANDed.
     *
     * @throws IncompatibleOperandsException if both are non-zero and the
     *         widths differ
     * @throws InvalidWidthException if the expanded operands overlap on
     *         every bit
     */
    static Encoding interaction(const Encoding& a, const Encoding& b, std::size_t extra_bits);

    [[nodiscard]] bool operator==(const Encoding& other) const noexcept {
        return width_ == other.width_ && value_ == other.value_;
    }

    [[nodiscard]] bool operator!=(const Encoding& other) const noexcept {
        return !(*this == other);
    }

private:
    BitVector value_;
    std::size_t width_;

    struct Unchecked {};

    /**
     * @brief Wrap a value already known to fit; value.length() == width.
     */
    Encoding(BitVector value, std::size_t width, Unchecked) noexcept;
};

} // namespace epibits

#endif // EPIBITS_ENCODING_HPP
