/**
 * @file bitvector.hpp
 * @brief Runtime-length bit vector used as encoding storage.
 *
 * Holds an unsigned integer of a given bit length. The value is kept in
 * 32-bit words, least significant word first, so that integer shifts and
 * products stay simple word loops. The public bit numbering is the one used
 * throughout epibits.
 *
 * @par Bit Numbering Convention
 * - Bit 0 = MSB (temporally earliest)
 * - Bit N-1 = LSB (nearest the reference time)
 *
 * @par Word Packing
 * - Integer bit k lives at bit (k % 32) of word (k / 32)
 * - Bit position p maps to integer bit (N - 1 - p)
 */

#ifndef EPIBITS_BITVECTOR_HPP
#define EPIBITS_BITVECTOR_HPP

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace epibits {

namespace detail {

/**
 * @brief Extract and clear the most significant set bit from a word.
 *
 * The loop termination of callers is bounded by popcount (number of set
 * bits).
 *
 * @param word Reference to the word (will be modified to clear the MSB)
 * @return Position of the MSB counted from the top of the word (0-31), or
 *         -1 if word was zero
 */
inline int extract_msb(std::uint32_t& word) noexcept {
    if (word == 0) {
        return -1;
    }
    int clz = __builtin_clz(word);
    word &= ~(1U << (31U - static_cast<std::uint32_t>(clz)));
    return clz;
}

} // namespace detail

/**
 * @brief Bit vector whose length is chosen at run time.
 *
 * Unused bits above the length in the top word are always kept zero.
 */
class BitVector {
public:
    /**
     * @brief Default constructor - empty vector of length 0.
     */
    BitVector() noexcept = default;

    /**
     * @brief Construct an all-zero vector.
     * @param length Number of bits
     */
    explicit BitVector(std::size_t length);

    /**
     * @brief Build a vector from a native integer.
     *
     * Bits of @p value above @p length are dropped.
     *
     * @param value Integer value
     * @param length Number of bits
     */
    static BitVector from_uint64(std::uint64_t value, std::size_t length);

    /**
     * @brief Build a vector from a '0'/'1' string, MSB first.
     *
     * @param bits Bit characters; the length of the vector is bits.size()
     * @throws InvalidArgumentException on any other character
     */
    static BitVector from_string(std::string_view bits);

    /**
     * @brief Get the number of bits.
     * @return Number of bits in the vector
     */
    [[nodiscard]] std::size_t length() const noexcept {
        return length_;
    }

    /**
     * @brief Get the number of 32-bit words.
     * @return Number of words used for storage
     */
    [[nodiscard]] std::size_t num_words() const noexcept {
        return words_.size();
    }

    /**
     * @brief Set all bits to zero.
     */
    void zero() noexcept;

    /**
     * @brief Check whether no bit is set.
     */
    [[nodiscard]] bool is_zero() const noexcept;

    /**
     * @brief Get bit value at position.
     *
     * @param pos Bit position (0 = MSB, N-1 = LSB)
     * @return Bit value (0 or 1), 0 when pos is out of range
     */
    [[nodiscard]] int get_bit(std::size_t pos) const noexcept {
        if (pos >= length_) [[unlikely]]
            return 0;
        std::size_t k = length_ - 1U - pos;
        return static_cast<int>((words_[k >> 5] >> (k & 31U)) & 1U);
    }

    /**
     * @brief Set bit value at position.
     *
     * Writes outside the vector are ignored.
     *
     * @param pos Bit position (0 = MSB, N-1 = LSB)
     * @param value Bit value (0 or 1)
     */
    void set_bit(std::size_t pos, int value) noexcept {
        if (pos >= length_) [[unlikely]]
            return;
        std::size_t k = length_ - 1U - pos;
        word_t bit = 1U << (k & 31U);
        if (value) {
            words_[k >> 5] |= bit;
        } else {
            words_[k >> 5] &= ~bit;
        }
    }

    /**
     * @brief Count number of set bits (Hamming weight).
     * @return Number of bits set to 1
     */
    [[nodiscard]] std::size_t hamming_weight() const noexcept;

    /**
     * @brief Minimal binary length of the integer value (0 for zero).
     */
    [[nodiscard]] std::size_t bit_length() const noexcept;

    /**
     * @brief Change the length, keeping the integer value.
     *
     * Growing pads with zeros above the current MSB. Shrinking drops the
     * bits above the new length.
     *
     * @param length New number of bits
     */
    void resize(std::size_t length);

    /**
     * @brief OR in-place with another vector.
     *
     * The vector grows to the longer of both lengths; the shorter operand
     * is zero extended.
     *
     * @param other Operand
     */
    void or_with(const BitVector& other);

    /**
     * @brief AND in-place with another vector.
     * @param other Operand (zero extended when shorter)
     */
    void and_with(const BitVector& other);

    /**
     * @brief Shift toward the MSB by n positions in-place.
     *
     * Equivalent to an integer left shift truncated to length().
     *
     * @param n Shift amount
     */
    void left_shift(std::size_t n) noexcept;

    /**
     * @brief Shift toward the LSB by n positions in-place.
     *
     * Equivalent to an integer right shift; bits moved past the LSB are
     * discarded.
     *
     * @param n Shift amount
     */
    void right_shift(std::size_t n) noexcept;

    /**
     * @brief Multiply the integer value by a factor in-place.
     *
     * The length grows by one word so the product is exact.
     *
     * @param factor Multiplier
     */
    void multiply(word_t factor);

    /**
     * @brief Convert to a native integer.
     * @throws OverflowException if the value needs more than 64 bits
     */
    [[nodiscard]] std::uint64_t to_uint64() const;

    /**
     * @brief Render as length() characters of '0'/'1', MSB first.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Visit the position of every set bit, MSB first.
     *
     * @tparam F Callable taking a std::size_t position
     * @param f Visitor
     */
    template <typename F> void for_each_set_bit(F&& f) const {
        for (std::size_t i = words_.size(); i-- > 0;) {
            std::uint32_t word = words_[i];
            int clz;
            while ((clz = detail::extract_msb(word)) >= 0) {
                std::size_t k = i * BITS_PER_WORD + (31U - static_cast<std::size_t>(clz));
                f(length_ - 1U - k);
            }
        }
    }

    /**
     * @brief Compare for equality (same length and same bits).
     * @param other Other vector
     * @return true if equal
     */
    [[nodiscard]] bool operator==(const BitVector& other) const noexcept {
        return length_ == other.length_ && words_ == other.words_;
    }

    /**
     * @brief Compare for inequality.
     * @param other Other vector
     * @return true if not equal
     */
    [[nodiscard]] bool operator!=(const BitVector& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Get raw word storage, least significant word first.
     */
    [[nodiscard]] const std::vector<word_t>& data() const noexcept {
        return words_;
    }

private:
    std::size_t length_ = 0;
    std::vector<word_t> words_;

    /**
     * @brief Mask off unused bits in the top word.
     */
    void mask_unused_bits() noexcept;
};

} // namespace epibits

#endif // EPIBITS_BITVECTOR_HPP
