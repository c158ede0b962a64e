/**
 * @file store.hpp
 * @brief Storage backends for collections of episode codes.
 *
 * A collection reads its codes through the CodeStore interface. Two
 * backends exist:
 * - DenseStore: ordered list of codes
 * - SparseStore: single-column Eigen sparse matrix (absent entries are 0)
 */

#ifndef EPIBITS_STORE_HPP
#define EPIBITS_STORE_HPP

#include <utility>
#include <vector>

#include <Eigen/Sparse>

#include "bitvector.hpp"
#include "config.hpp"
#include "error.hpp"

namespace epibits {

/**
 * @brief Read access to an ordered sequence of integer codes.
 */
class CodeStore {
public:
    virtual ~CodeStore() = default;

    /**
     * @brief Number of codes held.
     */
    [[nodiscard]] virtual std::size_t element_count() const noexcept = 0;

    /**
     * @brief Read the code at index.
     * @throws IndexOutOfRangeException if index >= element_count()
     */
    [[nodiscard]] virtual BitVector value_at(std::size_t index) const = 0;

protected:
    void check_index(std::size_t index) const;
};

/**
 * @brief Array-backed code store.
 */
class DenseStore : public CodeStore {
public:
    explicit DenseStore(std::vector<BitVector> codes) noexcept : codes_(std::move(codes)) {}

    /**
     * @brief Build from native integer codes (64 bits each).
     */
    explicit DenseStore(const std::vector<std::uint64_t>& codes);

    [[nodiscard]] std::size_t element_count() const noexcept override {
        return codes_.size();
    }

    [[nodiscard]] BitVector value_at(std::size_t index) const override;

    [[nodiscard]] const std::vector<BitVector>& codes() const noexcept {
        return codes_;
    }

private:
    std::vector<BitVector> codes_;
};

/**
 * @brief Sparse-matrix-backed code store.
 *
 * Codes are the rows of a single column; rows without an entry hold 0.
 */
class SparseStore : public CodeStore {
public:
    using Matrix = Eigen::SparseMatrix<std::uint64_t>;

    /**
     * @param codes Column of codes
     * @throws InvalidArgumentException if the matrix has more than one
     *         column
     */
    explicit SparseStore(Matrix codes);

    [[nodiscard]] std::size_t element_count() const noexcept override {
        return static_cast<std::size_t>(codes_.rows());
    }

    [[nodiscard]] BitVector value_at(std::size_t index) const override;

    [[nodiscard]] const Matrix& matrix() const noexcept {
        return codes_;
    }

private:
    Matrix codes_;
};

} // namespace epibits

#endif // EPIBITS_STORE_HPP
