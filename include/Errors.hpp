#pragma once

// Standard
#include <stdexcept>
#include <string>

namespace errors {

// Genome index file is missing, unreadable or not a GarNet index.
class LoadError : public std::runtime_error {
   public:
    explicit LoadError(const std::string &message) : std::runtime_error(message) {}
};

class MalformedRecordError : public std::runtime_error {
   public:
    explicit MalformedRecordError(const std::string &message) : std::runtime_error(message) {}
};

class InvalidStrandError : public std::runtime_error {
   public:
    explicit InvalidStrandError(const std::string &message) : std::runtime_error(message) {}
};

// Numeric failure of a single fit. The regression driver recovers from it.
class RegressionFailure : public std::runtime_error {
   public:
    explicit RegressionFailure(const std::string &message) : std::runtime_error(message) {}
};

}  // namespace errors
