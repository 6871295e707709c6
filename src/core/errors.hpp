/**
 * @file errors.hpp
 * @brief Exception hierarchy for Tidemark
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * Structural problems (bad input, wrong pipeline order, missing CRS) are
 * raised as exceptions. Data quality problems are never raised; they are
 * logged with counts and sample ids and processing continues.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tidemark {

/**
 * @brief Base class of every error raised by Tidemark
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// ============================================================================
// User input errors (non-recoverable at the engine layer)
// ============================================================================

/**
 * @brief Invalid caller input: unsupported option, malformed table, etc.
 */
class UserInputError : public Error {
public:
    explicit UserInputError(const std::string& message) : Error(message) {}
};

/**
 * @brief A required column is absent from a table
 */
class MissingColumnError : public UserInputError {
public:
    MissingColumnError(const std::string& column, const std::string& context)
        : UserInputError("Missing column '" + column + "'" +
                         (context.empty() ? std::string() : " required by " + context)),
          m_column(column) {}

    [[nodiscard]] const std::string& column() const { return m_column; }

private:
    std::string m_column;
};

/**
 * @brief A pipeline step was called before the step producing its inputs
 */
class PipelineOrderError : public UserInputError {
public:
    PipelineOrderError(const std::string& step, const std::string& dependency)
        : UserInputError("Cannot run '" + step + "': requires '" + dependency +
                         "' to be set up first") {}
};

/**
 * @brief One side of a geometry combination has no coordinate system
 */
class CrsMissingError : public UserInputError {
public:
    explicit CrsMissingError(const std::string& layer)
        : UserInputError("Layer '" + layer + "' has no coordinate reference system") {}
};

/**
 * @brief The join method does not support the given geometry combination
 */
class JoinMethodUnsupportedError : public UserInputError {
public:
    explicit JoinMethodUnsupportedError(const std::string& message)
        : UserInputError(message) {}
};

/**
 * @brief A damage source needs a cost table but none was provided
 */
class DamageTableRequiredError : public UserInputError {
public:
    explicit DamageTableRequiredError(const std::string& source)
        : UserInputError("Damage source '" + source + "' requires a cost table") {}
};

// ============================================================================
// Provider and configuration errors
// ============================================================================

/**
 * @brief A file could not be opened, read or written
 */
class ProviderError : public Error {
public:
    explicit ProviderError(const std::string& message) : Error(message) {}
};

/**
 * @brief The YAML configuration is malformed or incomplete
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

} // namespace tidemark
