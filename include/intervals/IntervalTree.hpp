#pragma once

// Standard
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <execution>
#include <string>
#include <utility>
#include <vector>

// Boost
#include <boost/serialization/access.hpp>
#include <boost/serialization/vector.hpp>

// Internal
#include "Errors.hpp"

namespace intervals {

using Position = int32_t;

/*
 * Intervals are kept in one array sorted by start position. The array is read as an implicit
 * balanced binary search tree: the root of the range [lo, hi) is its midpoint, the left
 * subtree is [lo, mid) and the right subtree is [mid + 1, hi). Each node stores the largest
 * end position found in its subtree, which lets a search skip every subtree that ends before
 * the query starts. Coordinates are closed on both ends.
 */
template <typename T>
class IntervalTree {
   public:
    struct Entry {
        Position start{};
        Position end{};
        Position maxEnd{};
        T data;

        template <class Archive>
        void serialize(Archive &archive, const unsigned int /*version*/) {
            archive & start & end & maxEnd & data;
        }
    };

    IntervalTree() = default;

    explicit IntervalTree(std::vector<Entry> entries) : entries(std::move(entries)) {
        for (const Entry &entry : this->entries) {
            checkBounds(entry.start, entry.end);
        }
        std::stable_sort(std::execution::par, this->entries.begin(), this->entries.end(),
                         [](const Entry &lhs, const Entry &rhs) { return lhs.start < rhs.start; });
        updateMaxEnd();
    }

    // Lands after every stored interval with the same start, so the tree matches bulk
    // construction from the same records in insertion order.
    void insert(Position start, Position end, T data) {
        checkBounds(start, end);
        const auto position =
            std::upper_bound(entries.begin(), entries.end(), start,
                             [](Position value, const Entry &entry) { return value < entry.start; });
        entries.insert(position,
                       Entry{.start = start, .end = end, .maxEnd = end, .data = std::move(data)});
        updateMaxEnd();
    }

    /**
     * @brief Collects the positions of all intervals intersecting [start, end].
     * @return true if at least one interval overlaps.
     */
    auto overlap(Position start, Position end, std::vector<size_t> &out) const -> bool {
        out.clear();

        std::vector<std::pair<size_t, size_t>> stack;
        stack.emplace_back(0, entries.size());

        while (!stack.empty()) {
            const auto [lo, hi] = stack.back();
            stack.pop_back();

            if (lo >= hi) {
                continue;
            }

            const size_t mid = lo + (hi - lo) / 2;
            const Entry &node = entries[mid];

            // Nothing below this node reaches the query
            if (node.maxEnd < start) {
                continue;
            }

            stack.emplace_back(lo, mid);

            if (node.start <= end) {
                if (start <= node.end) {
                    out.push_back(mid);
                }
                stack.emplace_back(mid + 1, hi);
            }
        }

        return !out.empty();
    }

    [[nodiscard]] auto search(Position start, Position end) const -> std::vector<const Entry *> {
        std::vector<size_t> indices;
        overlap(start, end, indices);

        std::vector<const Entry *> results;
        results.reserve(indices.size());
        for (const size_t index : indices) {
            results.push_back(&entries[index]);
        }
        return results;
    }

    [[nodiscard]] auto size() const -> size_t { return entries.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries.empty(); }

    [[nodiscard]] auto data(size_t i) const -> const T & { return entries[i].data; }

    [[nodiscard]] auto intervals() const -> const std::vector<Entry> & { return entries; }

   private:
    friend class boost::serialization::access;

    std::vector<Entry> entries;

    static void checkBounds(Position start, Position end) {
        if (start > end) {
            throw errors::MalformedRecordError("Interval start " + std::to_string(start) +
                                               " is past its end " + std::to_string(end));
        }
    }

    void updateMaxEnd() {
        if (!entries.empty()) {
            computeMaxEnd(0, entries.size());
        }
    }

    auto computeMaxEnd(size_t lo, size_t hi) -> Position {
        const size_t mid = lo + (hi - lo) / 2;
        Position maxEnd = entries[mid].end;
        if (lo < mid) {
            maxEnd = std::max(maxEnd, computeMaxEnd(lo, mid));
        }
        if (mid + 1 < hi) {
            maxEnd = std::max(maxEnd, computeMaxEnd(mid + 1, hi));
        }
        entries[mid].maxEnd = maxEnd;
        return maxEnd;
    }

    template <class Archive>
    void serialize(Archive &archive, const unsigned int /*version*/) {
        archive & entries;
    }
};

}  // namespace intervals
