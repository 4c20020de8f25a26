// =================================================================
// include/Distill/IngestConfig.hpp
// =================================================================
// Configuration structure for an ingestion run.

#pragma once

#include "Distill/Types.hpp"
#include <string>
#include <vector>

namespace Distill {

class ConfigParser;
struct Commands;

/**
 * @brief Settings for one ingestion run
 *
 * Values come from built-in defaults, then the configuration file, then
 * command-line options, in that order of precedence.
 */
struct IngestConfig {
    // Input
    std::string root_path = ".";
    std::string output_path;
    std::string ignore_file;            ///< Empty means <root>/.gitignore
    bool bypass_ignore = false;

    // Token accounting
    std::string model = "gpt-4o";
    size_t max_tokens_per_file = 0;     ///< 0 means unlimited
    size_t context_ceiling = 0;         ///< 0 means the model's context window
    OverflowPolicy overflow_policy = OverflowPolicy::Keep;

    // Output
    OutputFormat output_format = OutputFormat::Markdown;
    bool include_metadata = true;
    bool include_timestamp = false;
    bool show_progress = true;

    // Processing
    size_t workers = 0;                 ///< 0 means hardware concurrency
    size_t queue_capacity = 0;          ///< 0 means 4 x workers
    size_t max_file_size_bytes = 1024 * 1024;
    bool strip_comments = false;
    size_t max_consecutive_blank_lines = 1;
    std::vector<std::string> fallback_encodings = getDefaultFallbackEncodings();

    // Discovery
    std::vector<std::string> ignore_patterns;     ///< Appended to the default patterns
    std::vector<std::string> include_extensions;  ///< Empty means every extension
    std::vector<std::string> exclude_extensions;  ///< Wins over include_extensions
    bool follow_symlinks = false;

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     * @throws ConfigError for values of the wrong type or out of range
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings, logging every problem found
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Default patterns followed by the configured ones
     */
    std::vector<std::string> getMergedIgnorePatterns() const;

    size_t getEffectiveWorkers() const;
    size_t getEffectiveQueueCapacity() const;

    static std::vector<std::string> getDefaultIgnorePatterns();
    static std::vector<std::string> getDefaultFallbackEncodings();

    /**
     * @brief Commented YAML written by `distill init`
     */
    static std::string getDefaultConfigText();
};

} // namespace Distill
