#pragma once

// Standard
#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

// Boost
#include <boost/any.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Logger.hpp"

namespace po = boost::program_options;

template <typename T>
concept arithmetic = std::integral<T> or std::floating_point<T>;

struct ParameterValidator {
    template <typename T>
        requires arithmetic<T>
    static auto validateArithmetic(const po::variables_map& params, const std::string& paramName,
                                   const T lowerLimit, const T upperLimit) -> T {
        Logger::log(LogLevel::DEBUG, "Validating ", paramName,
                    " parameter. Type: ", typeid(T).name(), ". Lower limit: ", lowerLimit,
                    ". Upper limit: ", upperLimit, ".");

        T value;

        try {
            value = params[paramName].as<T>();
        } catch (const boost::bad_any_cast& e) {
            Logger::log(LogLevel::ERROR, paramName, " is a required parameter.");
            exit(EXIT_FAILURE);
        } catch (const po::error& e) {
            Logger::log(LogLevel::ERROR, "Unknown error occurred while parsing ", paramName, ". ",
                        std::string(e.what()));
            exit(EXIT_FAILURE);
        }

        if (value < lowerLimit || value > upperLimit) {
            Logger::log(LogLevel::ERROR, paramName, " must be between ", lowerLimit, " and ",
                        upperLimit);
        }

        return value;
    }

    static auto validateRequired(const po::variables_map& params, const std::string& paramName)
        -> std::string {
        if (params.count(paramName) == 0U) {
            Logger::log(LogLevel::ERROR, "Missing required parameter '", paramName, "'.");
        }
        return params[paramName].as<std::string>();
    }

    static auto validateFilePath(const po::variables_map& params,
                                 const std::string& paramName) -> std::filesystem::path {
        const std::filesystem::path filePath{validateRequired(params, paramName)};
        checkFilePath(filePath, paramName);
        return filePath;
    }

    // Options that may be given several times, e.g. --peaks a.bed --peaks b.bed
    static auto validateFilePaths(const po::variables_map& params, const std::string& paramName)
        -> std::vector<std::filesystem::path> {
        if (params.count(paramName) == 0U) {
            Logger::log(LogLevel::ERROR, "Missing required parameter '", paramName, "'.");
        }

        std::vector<std::filesystem::path> filePaths;
        for (const auto& filePathStr : params[paramName].as<std::vector<std::string>>()) {
            std::filesystem::path filePath{filePathStr};
            checkFilePath(filePath, paramName);
            filePaths.push_back(std::move(filePath));
        }
        return filePaths;
    }

    static auto validateOutputDirectory(const po::variables_map& params,
                                        const std::string& paramName) -> std::filesystem::path {
        const std::filesystem::path dirPath{validateRequired(params, paramName)};

        if (std::filesystem::exists(dirPath) && !std::filesystem::is_directory(dirPath)) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", dirPath.string(),
                        " exists and is not a directory.");
        }

        return dirPath;
    }

   private:
    static void checkFilePath(const std::filesystem::path& filePath,
                              const std::string& paramName) {
        if (!std::filesystem::exists(filePath) || std::filesystem::is_directory(filePath)) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", filePath.string(),
                        " is not a valid file path.");
        }
    }
};
