/**
 * @file collection.hpp
 * @brief Collections of episode encodings of uniform width.
 *
 * Implements the cross-encoding operations:
 * - transform: union of source encodings selected by a dimension mapping
 * - intersection: pairwise interaction search between two collections
 *
 * Both are built from Encoding primitives only.
 */

#ifndef EPIBITS_COLLECTION_HPP
#define EPIBITS_COLLECTION_HPP

#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

#include <Eigen/Core>

#include "config.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "store.hpp"

namespace epibits {

namespace detail {

/**
 * @brief Convert a dimension mapping coefficient to an integer weight.
 *
 * @throws InvalidArgumentException unless the coefficient is a
 *         non-negative integral value that fits a word
 */
template <typename Scalar> word_t to_weight(const Scalar& coeff) {
    constexpr auto max_weight = std::numeric_limits<word_t>::max();
    if constexpr (std::is_floating_point_v<Scalar>) {
        if (!(coeff >= Scalar(0) && coeff <= static_cast<Scalar>(max_weight) &&
              std::floor(coeff) == coeff)) {
            throw InvalidArgumentException("weight " + std::to_string(coeff) +
                                           " is not a non-negative integer");
        }
    } else {
        if constexpr (std::is_signed_v<Scalar>) {
            if (coeff < Scalar(0)) {
                throw InvalidArgumentException("weight " + std::to_string(coeff) +
                                               " is negative");
            }
        }
        if (static_cast<std::uint64_t>(coeff) > max_weight) {
            throw InvalidArgumentException("weight " + std::to_string(coeff) +
                                           " does not fit a storage word");
        }
    }
    return static_cast<word_t>(coeff);
}

} // namespace detail

/**
 * @brief Result of a pairwise intersection.
 *
 * Values are kept as bit vectors of the collection width so that wide
 * collections are represented exactly; coding_value() gives the integer
 * form for widths up to 64.
 */
struct IntersectionResult {
    std::map<std::string, BitVector> codes; ///< Key -> non-zero interaction value
    std::set<std::string> keys;             ///< Keys of the non-zero interactions

    /**
     * @brief Integer coding value of the interaction under key.
     *
     * @throws InvalidArgumentException if key is not in the result
     * @throws OverflowException if the value needs more than 64 bits
     */
    [[nodiscard]] std::uint64_t coding_value(const std::string& key) const;
};

/**
 * @brief Ordered collection of encodings sharing one width.
 *
 * Owns its code store; every encoding_at() call materializes a fresh
 * Encoding.
 */
class EncodingCollection {
public:
    /**
     * @param store Code storage backend
     * @param width Width of every encoding
     * @throws InvalidArgumentException if store is null
     * @throws InvalidWidthException if width is 0 or above MAX_WIDTH
     */
    explicit EncodingCollection(std::unique_ptr<CodeStore> store,
                                std::size_t width = DEFAULT_BIT_COUNT);

    /**
     * @brief Collection over a dense list of native codes.
     */
    static EncodingCollection dense(const std::vector<std::uint64_t>& codes,
                                    std::size_t width = DEFAULT_BIT_COUNT);

    /**
     * @brief Collection over a dense list of wide codes.
     */
    static EncodingCollection dense_wide(std::vector<BitVector> codes,
                                         std::size_t width = DEFAULT_BIT_COUNT);

    /**
     * @brief Collection over a single-column sparse matrix.
     */
    static EncodingCollection sparse(SparseStore::Matrix codes,
                                     std::size_t width = DEFAULT_BIT_COUNT);

    [[nodiscard]] std::size_t element_count() const noexcept {
        return store_->element_count();
    }

    [[nodiscard]] std::size_t width() const noexcept {
        return width_;
    }

    /**
     * @brief The underlying storage backend.
     */
    [[nodiscard]] const CodeStore& store() const noexcept {
        return *store_;
    }

    /**
     * @brief Materialize the encoding at index.
     *
     * @throws IndexOutOfRangeException if index >= element_count()
     * @throws InvalidWidthException if the stored code does not fit width()
     */
    [[nodiscard]] Encoding encoding_at(std::size_t index) const;

    /**
     * @brief Map the collection through a dimension mapping matrix.
     *
     * @p dm has one row per source encoding and one column per target.
     * Target i is the OR over sources j of value_j * dm(j, i). Weights are
     * meant as a {0, 1} selection; larger integers multiply the raw value
     * before the union.
     *
     * @param dm Dimension mapping (source_dim x target_dim)
     * @return target_dim encodings of width()
     * @throws IncompatibleSizeException if dm.rows() != element_count()
     * @throws InvalidArgumentException on a negative or fractional weight
     * @throws InvalidWidthException if a union does not fit width()
     */
    template <typename Derived>
    [[nodiscard]] std::vector<Encoding> transform(const Eigen::MatrixBase<Derived>& dm) const {
        std::size_t source_dim = element_count();
        if (static_cast<std::size_t>(dm.rows()) != source_dim) {
            throw IncompatibleSizeException(
                "dimension mapping has " + std::to_string(dm.rows()) + " rows for " +
                std::to_string(source_dim) + " encodings");
        }

        // Transposed: one row of source weights per target
        std::size_t target_dim = static_cast<std::size_t>(dm.cols());
        std::vector<word_t> weights(target_dim * source_dim);
        for (std::size_t i = 0; i < target_dim; ++i) {
            for (std::size_t j = 0; j < source_dim; ++j) {
                weights[i * source_dim + j] = detail::to_weight(
                    dm(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i)));
            }
        }
        return transform_weights(weights, target_dim);
    }

    /**
     * @brief Pairwise interaction of element i of this collection with
     *        element j > i of @p other.
     *
     * Keys are "labels_self[i] - labels_other[j]" when both label lists
     * are given, else "i j". Only non-zero interactions are reported.
     *
     * @param other Collection with the same element count
     * @param extra_bits Post-expansion applied to both operands
     * @param labels_self Labels of this collection (optional)
     * @param labels_other Labels of other (optional)
     * @throws IncompatibleSizeException if the element counts differ
     * @throws InvalidArgumentException if a label list is too short
     * @throws InvalidWidthException if an interaction sets every bit
     */
    [[nodiscard]] IntersectionResult intersection(
        const EncodingCollection& other, std::size_t extra_bits,
        const std::vector<std::string>& labels_self = {},
        const std::vector<std::string>& labels_other = {}) const;

private:
    std::unique_ptr<CodeStore> store_;
    std::size_t width_;

    std::vector<Encoding> transform_weights(const std::vector<word_t>& weights,
                                            std::size_t target_dim) const;
};

} // namespace epibits

#endif // EPIBITS_COLLECTION_HPP
