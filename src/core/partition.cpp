#include "lr_puzzle/partition.hpp"
#include "lr_puzzle/errors.hpp"
#include <numeric>
#include <sstream>

namespace lr_puzzle {

Partition::Partition(std::vector<value_type> parts) : parts_(std::move(parts)) {
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (parts_[i] < 0) {
            throw FormatError("partition has a negative part: " + std::to_string(parts_[i]));
        }
        if (i > 0 && parts_[i] > parts_[i - 1]) {
            throw FormatError("partition is not weakly decreasing at index " + std::to_string(i));
        }
    }
    while (!parts_.empty() && parts_.back() == 0) {
        parts_.pop_back();
    }
}

Partition::value_type Partition::size() const {
    return std::accumulate(parts_.begin(), parts_.end(), value_type{0});
}

std::vector<Partition::value_type> Partition::padded(size_t length) const {
    std::vector<value_type> result = parts_;
    if (result.size() < length) {
        result.resize(length, 0);
    }
    return result;
}

std::string Partition::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << parts_[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace lr_puzzle
