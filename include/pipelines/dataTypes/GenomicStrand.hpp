#pragma once

// Standard
#include <string>

// Internal
#include "Errors.hpp"

namespace dataTypes {
enum Strand : char { FORWARD = '+', REVERSE = '-' };

inline auto strandFromString(const std::string &token) -> Strand {
    if (token == "+") {
        return Strand::FORWARD;
    }
    if (token == "-") {
        return Strand::REVERSE;
    }
    throw errors::InvalidStrandError("Invalid strand '" + token + "', expected '+' or '-'");
}

}  // namespace dataTypes
