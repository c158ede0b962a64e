/**
 * @file collection.cpp
 * @brief Encoding collection implementation.
 */

#include <epibits/collection.hpp>

#include <utility>

namespace epibits {

std::uint64_t IntersectionResult::coding_value(const std::string& key) const {
    auto it = codes.find(key);
    if (it == codes.end()) {
        throw InvalidArgumentException("no interaction under key '" + key + "'");
    }
    return it->second.to_uint64();
}

EncodingCollection::EncodingCollection(std::unique_ptr<CodeStore> store, std::size_t width)
    : store_(std::move(store)), width_(width) {
    if (!store_) {
        throw InvalidArgumentException("encoding collection requires a code store");
    }
    if (width_ == 0 || width_ > MAX_WIDTH) {
        throw InvalidWidthException("collection width " + std::to_string(width_) +
                                    " outside 1.." + std::to_string(MAX_WIDTH));
    }
}

EncodingCollection EncodingCollection::dense(const std::vector<std::uint64_t>& codes,
                                             std::size_t width) {
    return EncodingCollection(std::make_unique<DenseStore>(codes), width);
}

EncodingCollection EncodingCollection::dense_wide(std::vector<BitVector> codes,
                                                  std::size_t width) {
    return EncodingCollection(std::make_unique<DenseStore>(std::move(codes)), width);
}

EncodingCollection EncodingCollection::sparse(SparseStore::Matrix codes, std::size_t width) {
    return EncodingCollection(std::make_unique<SparseStore>(std::move(codes)), width);
}

Encoding EncodingCollection::encoding_at(std::size_t index) const {
    if (index >= element_count()) {
        throw IndexOutOfRangeException("index " + std::to_string(index) +
                                       " outside a collection of " +
                                       std::to_string(element_count()) + " encodings");
    }
    return Encoding(store_->value_at(index), width_);
}

std::vector<Encoding> EncodingCollection::transform_weights(const std::vector<word_t>& weights,
                                                            std::size_t target_dim) const {
    std::size_t source_dim = element_count();

    std::vector<Encoding> sources;
    sources.reserve(source_dim);
    for (std::size_t j = 0; j < source_dim; ++j) {
        sources.push_back(encoding_at(j));
    }

    std::vector<Encoding> result;
    result.reserve(target_dim);
    for (std::size_t i = 0; i < target_dim; ++i) {
        BitVector merged(width_);
        for (std::size_t j = 0; j < source_dim; ++j) {
            word_t weight = weights[i * source_dim + j];
            if (weight == 0) {
                continue;
            }
            if (weight == 1) {
                merged.or_with(sources[j].value());
            } else {
                merged.or_with(sources[j].multiply(weight));
            }
        }
        result.emplace_back(merged, width_);
    }
    return result;
}

IntersectionResult EncodingCollection::intersection(const EncodingCollection& other,
                                                    std::size_t extra_bits,
                                                    const std::vector<std::string>& labels_self,
                                                    const std::vector<std::string>& labels_other) const {
    std::size_t n = element_count();
    if (other.element_count() != n) {
        throw IncompatibleSizeException("intersecting a collection of " + std::to_string(n) +
                                        " encodings with one of " +
                                        std::to_string(other.element_count()));
    }

    bool labelled = !labels_self.empty() && !labels_other.empty();
    if (labelled && (labels_self.size() < n || labels_other.size() < n)) {
        throw InvalidArgumentException("label lists must cover all " + std::to_string(n) +
                                       " encodings");
    }

    // other[j] for j >= 1; other[0] never takes part in a pair
    std::vector<Encoding> rhs;
    if (n > 1) {
        rhs.reserve(n - 1);
        for (std::size_t j = 1; j < n; ++j) {
            rhs.push_back(other.encoding_at(j));
        }
    }

    IntersectionResult result;
    for (std::size_t i = 0; i + 1 < n; ++i) {
        Encoding lhs = encoding_at(i);
        for (std::size_t j = i + 1; j < n; ++j) {
            Encoding inter = Encoding::interaction(lhs, rhs[j - 1], extra_bits);
            if (inter.is_zero()) {
                continue;
            }
            std::string key = labelled ? labels_self[i] + " - " + labels_other[j]
                                       : std::to_string(i) + " " + std::to_string(j);
            result.keys.insert(key);
            result.codes.insert_or_assign(std::move(key), inter.value());
        }
    }
    return result;
}

} // namespace epibits
