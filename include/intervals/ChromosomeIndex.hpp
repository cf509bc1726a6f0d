#pragma once

// Standard
#include <concepts>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Boost
#include <boost/serialization/access.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/string.hpp>

// Internal
#include "Errors.hpp"
#include "IntervalTree.hpp"

namespace intervals {

template <typename T>
concept IntervalRecord = requires(const T &record) {
    { record.referenceID } -> std::convertible_to<std::string>;
    { record.startPosition } -> std::convertible_to<Position>;
    { record.endPosition } -> std::convertible_to<Position>;
};

/**
 * @brief Interval trees of one record type, partitioned by chromosome.
 *
 * Records are routed by their referenceID. The index is immutable once built.
 */
template <IntervalRecord T>
class ChromosomeIndex {
   public:
    using Tree = IntervalTree<T>;
    using TreeMap = std::map<std::string, Tree>;

    ChromosomeIndex() = default;

    /**
     * @brief Builds one tree per chromosome from a batch of records.
     *
     * The whole batch is validated first. A record without a chromosome name or with its start
     * past its end rejects the batch with a MalformedRecordError.
     */
    static auto build(const std::vector<T> &records) -> ChromosomeIndex {
        for (size_t i = 0; i < records.size(); ++i) {
            validate(records[i], i);
        }

        std::unordered_map<std::string, std::vector<typename Tree::Entry>> grouped;
        for (const auto &record : records) {
            grouped[record.referenceID].push_back(
                typename Tree::Entry{.start = record.startPosition,
                                     .end = record.endPosition,
                                     .maxEnd = record.endPosition,
                                     .data = record});
        }

        ChromosomeIndex index;
        for (auto &[referenceID, entries] : grouped) {
            index.treeMap.emplace(referenceID, Tree(std::move(entries)));
        }
        return index;
    }

    [[nodiscard]] auto chromosomes() const -> std::set<std::string> {
        std::set<std::string> names;
        for (const auto &[referenceID, _] : treeMap) {
            names.insert(referenceID);
        }
        return names;
    }

    [[nodiscard]] auto contains(const std::string &referenceID) const -> bool {
        return treeMap.contains(referenceID);
    }

    // Chromosomes without records yield a shared empty tree.
    [[nodiscard]] auto treeFor(const std::string &referenceID) const -> const Tree & {
        static const Tree emptyTree;
        const auto iterator = treeMap.find(referenceID);
        return iterator != treeMap.end() ? iterator->second : emptyTree;
    }

    [[nodiscard]] auto recordCount() const -> size_t {
        size_t count = 0;
        for (const auto &[_, tree] : treeMap) {
            count += tree.size();
        }
        return count;
    }

    [[nodiscard]] auto empty() const -> bool { return treeMap.empty(); }

   private:
    friend class boost::serialization::access;

    TreeMap treeMap;

    static void validate(const T &record, size_t position) {
        if (std::string(record.referenceID).empty()) {
            throw errors::MalformedRecordError("Record " + std::to_string(position + 1) +
                                               " has no chromosome name");
        }
        if (record.startPosition > record.endPosition) {
            throw errors::MalformedRecordError(
                "Record " + std::to_string(position + 1) + " on " + record.referenceID +
                " starts at " + std::to_string(record.startPosition) + " after its end " +
                std::to_string(record.endPosition));
        }
    }

    template <class Archive>
    void serialize(Archive &archive, const unsigned int /*version*/) {
        archive & treeMap;
    }
};

}  // namespace intervals
