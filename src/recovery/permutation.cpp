// SEEDORDER - Permutation Enumeration Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/recovery/permutation.h"

#include <algorithm>
#include <numeric>

namespace seedorder {
namespace recovery {

uint64_t Factorial(size_t n) {
    if (n > MAX_EXACT_FACTORIAL) {
        return std::numeric_limits<uint64_t>::max();
    }
    uint64_t result = 1;
    for (size_t i = 2; i <= n; ++i) {
        result *= i;
    }
    return result;
}

std::optional<std::vector<size_t>> Unrank(size_t n, uint64_t rank) {
    if (n <= MAX_EXACT_FACTORIAL && rank >= Factorial(n)) {
        return std::nullopt;
    }

    std::vector<size_t> pool(n);
    std::iota(pool.begin(), pool.end(), 0);

    // Factorial number system: digit i selects among the n - i remaining
    std::vector<size_t> order;
    order.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        size_t remaining = n - 1 - i;
        size_t digit = 0;
        if (remaining <= MAX_EXACT_FACTORIAL) {
            uint64_t f = Factorial(remaining);
            digit = static_cast<size_t>(rank / f);
            rank %= f;
        }
        // (remaining)! > 2^64 > rank otherwise, so the digit is zero
        order.push_back(pool[digit]);
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(digit));
    }
    return order;
}

PermutationCursor::PermutationCursor(size_t n) : order_(n), rank_(0) {
    std::iota(order_.begin(), order_.end(), 0);
}

std::optional<PermutationCursor> PermutationCursor::AtRank(size_t n, uint64_t rank) {
    auto order = Unrank(n, rank);
    if (!order) {
        return std::nullopt;
    }
    return PermutationCursor(std::move(*order), rank);
}

bool PermutationCursor::Advance() {
    if (!std::next_permutation(order_.begin(), order_.end())) {
        // next_permutation wrapped around to the identity; undo that
        std::reverse(order_.begin(), order_.end());
        return false;
    }
    ++rank_;
    return true;
}

} // namespace recovery
} // namespace seedorder
