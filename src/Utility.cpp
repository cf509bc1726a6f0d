#include "Utility.hpp"

// Standard
#include <execinfo.h>
#include <unistd.h>

#include <array>
#include <cstdlib>
#include <charconv>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace helper {

void crashHandler(int sig) {
    constexpr size_t MAX_FRAMES = 10;
    std::array<void *, MAX_FRAMES> array{};
    int size = backtrace(array.data(), MAX_FRAMES);

    // print out all the frames to stderr
    std::cerr << "Error: signal " << sig << ":" << '\n';
    backtrace_symbols_fd(array.data(), size, STDERR_FILENO);
    exit(1);
}

auto splitTabs(const std::string &line) -> std::vector<std::string> {
    std::string_view view{line};
    if (!view.empty() && view.back() == '\r') {
        view.remove_suffix(1);
    }

    std::vector<std::string> tokens;
    size_t begin = 0;
    while (true) {
        const size_t tab = view.find('\t', begin);
        if (tab == std::string_view::npos) {
            tokens.emplace_back(view.substr(begin));
            break;
        }
        tokens.emplace_back(view.substr(begin, tab - begin));
        begin = tab + 1;
    }
    return tokens;
}

auto toPosition(const std::string &token) -> std::optional<int32_t> {
    int32_t value{};
    const char *last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), last, value);
    if (ec != std::errc() || ptr != last || token.empty()) {
        return std::nullopt;
    }
    return value;
}

auto toDouble(const std::string &token) -> std::optional<double> {
    if (token.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        const double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument &) {
        return std::nullopt;
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

auto formatDouble(double value) -> std::string {
    constexpr size_t BUFFER_SIZE = 32;
    std::array<char, BUFFER_SIZE> buffer{};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        std::ostringstream stream;
        stream << value;
        return stream.str();
    }
    return std::string(buffer.data(), ptr);
}

void Timer::stop() const {
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    Logger::log(LogLevel::DEBUG, label, " took ", elapsed.count(), " s");
}

}  // namespace helper
