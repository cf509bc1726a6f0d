#pragma once

// Standard
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Internal
#include "Logger.hpp"

namespace helper {

namespace fs = std::filesystem;

void crashHandler(int sig);

inline auto hasSuffix(const std::string &fullString, const std::string &ending) -> bool {
    if (fullString.length() >= ending.length()) {
        return (0 ==
                fullString.compare(fullString.length() - ending.length(), ending.length(), ending));
    }
    return false;
};

inline auto hasPrefix(const std::string &fullString, const std::string &prefix) -> bool {
    if (fullString.length() >= prefix.length()) {
        return (0 == fullString.compare(0, prefix.length(), prefix));
    }
    return false;
};

/** Splits a line of a tab-delimited file into its fields.
 *
 * A trailing carriage return is dropped. Empty fields are kept.
 **/
auto splitTabs(const std::string &line) -> std::vector<std::string>;

// Numeric field conversions. The whole token must be consumed, otherwise std::nullopt.
auto toPosition(const std::string &token) -> std::optional<int32_t>;
auto toDouble(const std::string &token) -> std::optional<double>;

// Shortest text that reads back to the same double.
auto formatDouble(double value) -> std::string;

class Timer {
   public:
    explicit Timer(std::string label)
        : label(std::move(label)), start(std::chrono::high_resolution_clock::now()) {}
    Timer(const Timer &) = default;
    Timer(Timer &&) = delete;
    auto operator=(const Timer &) -> Timer & = default;
    auto operator=(Timer &&) -> Timer & = delete;
    ~Timer() { stop(); }

    void stop() const;

   private:
    std::string label;
    std::chrono::time_point<std::chrono::high_resolution_clock> start;
};
}  // namespace helper
