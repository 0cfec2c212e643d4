// SEEDORDER - Permutation Enumeration
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Lexicographic enumeration of orderings of n positions. The identity
// ordering has rank 0 and each step moves to the lexicographic successor
// of the position vector, so the rank of an ordering is stable across
// runs and machines and can be mapped back to an ordering directly.

#ifndef SEEDORDER_RECOVERY_PERMUTATION_H
#define SEEDORDER_RECOVERY_PERMUTATION_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace seedorder {
namespace recovery {

/// Largest n whose factorial fits in 64 bits
constexpr size_t MAX_EXACT_FACTORIAL = 20;

/// n!, saturating at UINT64_MAX for n > 20
uint64_t Factorial(size_t n);

/// a + b, saturating at UINT64_MAX
inline uint64_t SaturatingAdd(uint64_t a, uint64_t b) {
    return b > std::numeric_limits<uint64_t>::max() - a
               ? std::numeric_limits<uint64_t>::max()
               : a + b;
}

/**
 * Ordering of rank `rank` among the n! orderings of {0..n-1}.
 *
 * @return nullopt if rank >= n!
 */
std::optional<std::vector<size_t>> Unrank(size_t n, uint64_t rank);

/**
 * Walks orderings in rank order.
 *
 * Only the current ordering and its rank are held, so a cursor over 24
 * positions costs the same as one over 3.
 */
class PermutationCursor {
public:
    /// Start at the identity ordering (rank 0)
    explicit PermutationCursor(size_t n);

    /// Start at a given rank; nullopt if rank >= n!
    static std::optional<PermutationCursor> AtRank(size_t n, uint64_t rank);

    const std::vector<size_t>& Current() const { return order_; }

    uint64_t Rank() const { return rank_; }

    size_t Size() const { return order_.size(); }

    /// Step to the next ordering
    /// @return false (and leave the cursor unchanged) after the last one
    bool Advance();

private:
    PermutationCursor(std::vector<size_t> order, uint64_t rank)
        : order_(std::move(order)), rank_(rank) {}

    std::vector<size_t> order_;
    uint64_t rank_{0};
};

} // namespace recovery
} // namespace seedorder

#endif // SEEDORDER_RECOVERY_PERMUTATION_H
