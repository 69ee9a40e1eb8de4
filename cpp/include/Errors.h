#pragma once
/**
 * @file Errors.h
 * @brief Exceptions raised by model construction and forest generation.
 */
#include <stdexcept>
#include <string>

namespace treesim {
    /** @brief A rate, probability or bound outside its domain. */
    class InvalidParameter : public std::invalid_argument {
    public:
        explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
    };

    /** @brief Skyline models and switch times that do not line up. */
    class ConfigurationMismatch : public std::invalid_argument {
    public:
        explicit ConfigurationMismatch(const std::string& what) : std::invalid_argument(what) {}
    };

    /** @brief A process that can never reach the requested number of sampled tips. */
    class DegenerateProcess : public std::runtime_error {
    public:
        explicit DegenerateProcess(const std::string& what) : std::runtime_error(what) {}
    };

    /** @brief Raised when an explicit attempt cap is exhausted without an accepted forest. */
    class SimulationExhausted : public std::runtime_error {
    public:
        explicit SimulationExhausted(const std::string& what) : std::runtime_error(what) {}
    };
}
