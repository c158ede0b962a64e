/**
 * @file encoding.cpp
 * @brief Episode bitwise encoding implementation.
 */

#include <epibits/encoding.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace epibits {

namespace {

/**
 * @brief Enforce value < 2^width - 1 and 0 < width <= MAX_WIDTH.
 */
void check_fits(const BitVector& value, std::size_t width) {
    if (width == 0 || width > MAX_WIDTH) {
        throw InvalidWidthException("width " + std::to_string(width) + " outside 1.." +
                                    std::to_string(MAX_WIDTH));
    }

    std::size_t bits = value.bit_length();
    bool all_ones = (bits == width) && (value.hamming_weight() == width);
    if (bits > width || all_ones) {
        throw InvalidWidthException("value of " + std::to_string(bits) +
                                    " bits is too large to fit the width " +
                                    std::to_string(width));
    }
}

} // namespace

Encoding::Encoding(std::uint64_t value, std::size_t width)
    : Encoding(BitVector::from_uint64(value, 64), width) {}

Encoding::Encoding(const BitVector& value, std::size_t width) : value_(value), width_(width) {
    check_fits(value_, width_);
    value_.resize(width_);
}

Encoding::Encoding(BitVector value, std::size_t width, Unchecked) noexcept
    : value_(std::move(value)), width_(width) {}

Encoding Encoding::from_bit_sequence(std::string_view bits) {
    return Encoding(BitVector::from_string(bits), bits.size());
}

BitVector Encoding::lshift(std::size_t n) const {
    BitVector shifted = value_;
    shifted.resize(width_ + n);
    shifted.left_shift(n);
    return shifted;
}

BitVector Encoding::rshift(std::size_t n) const {
    BitVector shifted = value_;
    shifted.right_shift(n);
    return shifted;
}

BitVector Encoding::multiply(word_t factor) const {
    BitVector product = value_;
    product.multiply(factor);
    return product;
}

void Encoding::scale_down(std::size_t group_size) {
    if (group_size == 0) {
        throw InvalidArgumentException("scale_down group size must be positive");
    }

    std::size_t final_width = (width_ + group_size - 1U) / group_size;
    BitVector scaled(final_width);

    value_.for_each_set_bit(
        [&scaled, group_size](std::size_t pos) { scaled.set_bit(pos / group_size, 1); });

    value_ = std::move(scaled);
    width_ = final_width;
}

void Encoding::post_expand(std::size_t extra_bits) {
    // OR of the value shifted by 0..n; shift amounts double each pass
    std::size_t n = std::min(extra_bits, width_);
    std::size_t span = 1;
    while (span <= n) {
        std::size_t shift = std::min(span, n + 1U - span);
        BitVector shifted = value_;
        shifted.right_shift(shift);
        value_.or_with(shifted);
        span += shift;
    }
}

std::uint64_t Encoding::score_bitorder() const noexcept {
    std::uint64_t score = 0;
    value_.for_each_set_bit([&score, this](std::size_t pos) { score += width_ - pos; });
    return score;
}

void Encoding::check_compatible(const Encoding& a, const Encoding& b) {
    if (a.width_ != b.width_) {
        throw IncompatibleOperandsException("operands are not equally sized (" +
                                            std::to_string(a.width_) + " vs " +
                                            std::to_string(b.width_) + " bits)");
    }
}

Encoding Encoding::eb_and(const Encoding& a, const Encoding& b) {
    check_compatible(a, b);
    BitVector v = a.value_;
    v.and_with(b.value_);
    return Encoding(v, a.width_);
}

Encoding Encoding::eb_or(const Encoding& a, const Encoding& b) {
    check_compatible(a, b);
    BitVector v = a.value_;
    v.or_with(b.value_);
    return Encoding(v, a.width_);
}

Encoding Encoding::interaction(const Encoding& a, const Encoding& b, std::size_t extra_bits) {
    if (a.is_zero() || b.is_zero()) {
        return Encoding(BitVector(a.width_), a.width_, Unchecked{});
    }
    check_compatible(a, b);

    Encoding pe_a = a.clone();
    pe_a.post_expand(extra_bits);
    Encoding pe_b = b.clone();
    pe_b.post_expand(extra_bits);
    return eb_and(pe_a, pe_b);
}

} // namespace epibits
