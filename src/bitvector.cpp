/**
 * @file bitvector.cpp
 * @brief Runtime-length bit vector implementation.
 */

#include <epibits/bitvector.hpp>
#include <epibits/error.hpp>

#include <algorithm>

namespace epibits {

namespace {

std::size_t words_for(std::size_t length) noexcept {
    return (length + BITS_PER_WORD - 1U) / BITS_PER_WORD;
}

} // namespace

BitVector::BitVector(std::size_t length) : length_(length), words_(words_for(length), 0U) {}

BitVector BitVector::from_uint64(std::uint64_t value, std::size_t length) {
    BitVector bv(length);
    if (bv.words_.size() > 0) {
        bv.words_[0] = static_cast<word_t>(value & 0xFFFFFFFFU);
    }
    if (bv.words_.size() > 1) {
        bv.words_[1] = static_cast<word_t>(value >> 32);
    }
    bv.mask_unused_bits();
    return bv;
}

BitVector BitVector::from_string(std::string_view bits) {
    BitVector bv(bits.size());
    for (std::size_t pos = 0; pos < bits.size(); ++pos) {
        if (bits[pos] == '1') {
            bv.set_bit(pos, 1);
        } else if (bits[pos] != '0') {
            throw InvalidArgumentException("bit sequence may only contain '0' and '1', found '" +
                                           std::string(1, bits[pos]) + "'");
        }
    }
    return bv;
}

void BitVector::zero() noexcept {
    std::fill(words_.begin(), words_.end(), 0U);
}

bool BitVector::is_zero() const noexcept {
    return std::all_of(words_.begin(), words_.end(), [](word_t w) { return w == 0U; });
}

std::size_t BitVector::hamming_weight() const noexcept {
    std::size_t count = 0;
    for (word_t w : words_) {
        count += static_cast<std::size_t>(__builtin_popcount(w));
    }
    return count;
}

std::size_t BitVector::bit_length() const noexcept {
    for (std::size_t i = words_.size(); i-- > 0;) {
        if (words_[i] != 0U) {
            return i * BITS_PER_WORD + (32U - static_cast<std::size_t>(__builtin_clz(words_[i])));
        }
    }
    return 0;
}

void BitVector::resize(std::size_t length) {
    words_.resize(words_for(length), 0U);
    length_ = length;
    mask_unused_bits();
}

void BitVector::or_with(const BitVector& other) {
    if (other.length_ > length_) {
        resize(other.length_);
    }
    for (std::size_t i = 0; i < other.words_.size(); ++i) {
        words_[i] |= other.words_[i];
    }
}

void BitVector::and_with(const BitVector& other) {
    if (other.length_ > length_) {
        resize(other.length_);
    }
    for (std::size_t i = 0; i < words_.size(); ++i) {
        words_[i] &= (i < other.words_.size()) ? other.words_[i] : 0U;
    }
}

void BitVector::left_shift(std::size_t n) noexcept {
    if (n == 0) {
        return;
    }
    if (n >= length_) {
        zero();
        return;
    }

    std::size_t word_shift = n / BITS_PER_WORD;
    std::size_t bit_shift = n % BITS_PER_WORD;

    for (std::size_t i = words_.size(); i-- > 0;) {
        word_t w = 0;
        if (i >= word_shift) {
            std::size_t src = i - word_shift;
            w = words_[src] << bit_shift;
            if (bit_shift != 0 && src > 0) {
                w |= words_[src - 1] >> (BITS_PER_WORD - bit_shift);
            }
        }
        words_[i] = w;
    }
    mask_unused_bits();
}

void BitVector::right_shift(std::size_t n) noexcept {
    if (n == 0) {
        return;
    }
    if (n >= length_) {
        zero();
        return;
    }

    std::size_t word_shift = n / BITS_PER_WORD;
    std::size_t bit_shift = n % BITS_PER_WORD;
    std::size_t nw = words_.size();

    for (std::size_t i = 0; i < nw; ++i) {
        word_t w = 0;
        std::size_t src = i + word_shift;
        if (src < nw) {
            w = words_[src] >> bit_shift;
            if (bit_shift != 0 && src + 1 < nw) {
                w |= words_[src + 1] << (BITS_PER_WORD - bit_shift);
            }
        }
        words_[i] = w;
    }
}

void BitVector::multiply(word_t factor) {
    resize(length_ + BITS_PER_WORD);

    std::uint64_t carry = 0;
    for (word_t& w : words_) {
        std::uint64_t product = static_cast<std::uint64_t>(w) * factor + carry;
        w = static_cast<word_t>(product & 0xFFFFFFFFU);
        carry = product >> 32;
    }
    mask_unused_bits();
}

std::uint64_t BitVector::to_uint64() const {
    if (bit_length() > 64) {
        throw OverflowException("value of " + std::to_string(bit_length()) +
                                " bits does not fit a 64-bit integer");
    }
    std::uint64_t value = 0;
    if (words_.size() > 0) {
        value = words_[0];
    }
    if (words_.size() > 1) {
        value |= static_cast<std::uint64_t>(words_[1]) << 32;
    }
    return value;
}

std::string BitVector::to_string() const {
    std::string bits(length_, '0');
    for_each_set_bit([&bits](std::size_t pos) { bits[pos] = '1'; });
    return bits;
}

void BitVector::mask_unused_bits() noexcept {
    std::size_t extra_bits = words_.size() * BITS_PER_WORD - length_;
    if (extra_bits > 0 && !words_.empty()) {
        word_t mask = (1U << (BITS_PER_WORD - extra_bits)) - 1U;
        words_.back() &= mask;
    }
}

} // namespace epibits
