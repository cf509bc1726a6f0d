#pragma once

// Standard
#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Internal
#include "ChromosomeIndex.hpp"

namespace intervals {

/**
 * @brief An interval of the query index with every overlapping interval of the target index.
 *
 * Both sides point into the indices passed to intersect and stay valid as long as they do.
 */
template <typename A, typename B>
struct Overlap {
    std::string referenceID;
    const A *query;
    std::vector<const B *> matches;
};

class IntersectionEngine {
   public:
    IntersectionEngine() = delete;

    [[nodiscard]] static auto commonChromosomes(const std::set<std::string> &lhs,
                                                const std::set<std::string> &rhs)
        -> std::vector<std::string> {
        std::vector<std::string> common;
        std::set_intersection(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                              std::back_inserter(common));
        return common;
    }

    /**
     * @brief Looks up every interval of A in B, chromosome by chromosome.
     *
     * Only chromosomes present in both indices are visited. Intervals of A without any match
     * produce no record. The result follows chromosome name order and, within a chromosome,
     * the start order of A.
     */
    template <IntervalRecord A, IntervalRecord B>
    [[nodiscard]] static auto intersect(const ChromosomeIndex<A> &queryIndex,
                                        const ChromosomeIndex<B> &targetIndex)
        -> std::vector<Overlap<A, B>> {
        std::vector<Overlap<A, B>> overlaps;
        std::vector<size_t> indices;

        for (const auto &referenceID :
             commonChromosomes(queryIndex.chromosomes(), targetIndex.chromosomes())) {
            const auto &queryTree = queryIndex.treeFor(referenceID);
            const auto &targetTree = targetIndex.treeFor(referenceID);

            for (const auto &entry : queryTree.intervals()) {
                if (!targetTree.overlap(entry.start, entry.end, indices)) {
                    continue;
                }

                Overlap<A, B> overlap{.referenceID = referenceID, .query = &entry.data, .matches = {}};
                overlap.matches.reserve(indices.size());
                for (const size_t index : indices) {
                    overlap.matches.push_back(&targetTree.data(index));
                }
                overlaps.push_back(std::move(overlap));
            }
        }

        return overlaps;
    }

    // Same join as intersect, flattened to one pair per overlapping (a, b).
    template <IntervalRecord A, IntervalRecord B>
    [[nodiscard]] static auto intersectPairs(const ChromosomeIndex<A> &queryIndex,
                                             const ChromosomeIndex<B> &targetIndex)
        -> std::vector<std::pair<const A *, const B *>> {
        std::vector<std::pair<const A *, const B *>> pairs;
        for (const auto &overlap : intersect(queryIndex, targetIndex)) {
            for (const B *match : overlap.matches) {
                pairs.emplace_back(overlap.query, match);
            }
        }
        return pairs;
    }
};

}  // namespace intervals
