/**
 * @file store.cpp
 * @brief Dense and sparse code store implementations.
 */

#include <epibits/store.hpp>

#include <string>
#include <utility>

namespace epibits {

void CodeStore::check_index(std::size_t index) const {
    if (index >= element_count()) {
        throw IndexOutOfRangeException("index " + std::to_string(index) +
                                       " outside a store of " +
                                       std::to_string(element_count()) + " codes");
    }
}

DenseStore::DenseStore(const std::vector<std::uint64_t>& codes) {
    codes_.reserve(codes.size());
    for (std::uint64_t code : codes) {
        codes_.push_back(BitVector::from_uint64(code, 64));
    }
}

BitVector DenseStore::value_at(std::size_t index) const {
    check_index(index);
    return codes_[index];
}

SparseStore::SparseStore(Matrix codes) : codes_(std::move(codes)) {
    if (codes_.cols() > 1) {
        throw InvalidArgumentException("sparse code store must have a single column, got " +
                                       std::to_string(codes_.cols()));
    }
    codes_.makeCompressed();
}

BitVector SparseStore::value_at(std::size_t index) const {
    check_index(index);
    if (codes_.cols() == 0) {
        return BitVector::from_uint64(0, 64);
    }
    return BitVector::from_uint64(codes_.coeff(static_cast<Eigen::Index>(index), 0), 64);
}

} // namespace epibits
