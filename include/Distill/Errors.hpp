// =================================================================
// include/Distill/Errors.hpp
// =================================================================
// Exceptions for conditions that abort a run before any file is processed.
// Per-file problems never throw across the pipeline; they become
// FailureRecords.

#pragma once

#include <stdexcept>
#include <string>

namespace Distill {

class DistillError : public std::runtime_error {
public:
    explicit DistillError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Bad root directory, unwritable output path and similar
 */
class SetupError : public DistillError {
public:
    explicit SetupError(const std::string& message) : DistillError(message) {}
};

/**
 * @brief Invalid configuration value
 */
class ConfigError : public DistillError {
public:
    explicit ConfigError(const std::string& message) : DistillError(message) {}
};

} // namespace Distill
