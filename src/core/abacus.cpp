#include "lr_puzzle/abacus.hpp"
#include "lr_puzzle/errors.hpp"

namespace lr_puzzle {

namespace {

// bits は検証済みの 0/1 列
Partition partition_from_bits(const std::vector<int>& bits) {
    std::vector<int> parts;
    int ones = 0;
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] == 1) {
            // i 番目より左の '0' の個数
            parts.insert(parts.begin(), static_cast<int>(i) - ones);
            ++ones;
        }
    }
    return Partition(std::move(parts));
}

} // namespace

Partition abacus_to_partition(const std::string& abacus) {
    std::vector<int> bits;
    bits.reserve(abacus.size());
    for (size_t i = 0; i < abacus.size(); ++i) {
        char c = abacus[i];
        if (c != '0' && c != '1') {
            throw FormatError("abacus must consist of '0' and '1', got '" +
                              std::string(1, c) + "' at index " + std::to_string(i));
        }
        bits.push_back(c - '0');
    }
    return partition_from_bits(bits);
}

Partition abacus_to_partition(const std::vector<int>& abacus) {
    for (size_t i = 0; i < abacus.size(); ++i) {
        if (abacus[i] != 0 && abacus[i] != 1) {
            throw FormatError("abacus must consist of 0 and 1, got " +
                              std::to_string(abacus[i]) + " at index " + std::to_string(i));
        }
    }
    return partition_from_bits(abacus);
}

std::string partition_to_abacus(const std::vector<int>& parts, size_t min_size) {
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i] < 0 || (i > 0 && parts[i] > parts[i - 1])) {
            throw FormatError("not a partition at index " + std::to_string(i));
        }
    }

    // 小さい部分から順に、差分の '0' と '1' を並べる
    std::string abacus;
    int previous = 0;
    for (size_t k = parts.size(); k-- > 0;) {
        abacus.append(static_cast<size_t>(parts[k] - previous), '0');
        abacus.push_back('1');
        previous = parts[k];
    }
    if (abacus.size() < min_size) {
        abacus.append(min_size - abacus.size(), '0');
    }
    return abacus;
}

std::string partition_to_abacus(const Partition& partition, size_t min_size) {
    return partition_to_abacus(partition.parts(), min_size);
}

} // namespace lr_puzzle
