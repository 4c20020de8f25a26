// =================================================================
// src/Distill/IngestConfig.cpp
// =================================================================
// Implementation for ingestion configuration management.

#include "Distill/IngestConfig.hpp"
#include "Distill/CliParser.hpp"
#include "Distill/ConfigParser.hpp"
#include "Distill/Errors.hpp"
#include "Distill/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <thread>

namespace Distill {

static size_t parseSize(const ConfigParser& config, const std::string& key, size_t current) {
    std::string value = config.getStringValue(key);
    if (value.empty()) {
        return current;
    }

    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError("Invalid " + key + " value '" + value + "': expected a non-negative integer");
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw ConfigError("Invalid " + key + " value '" + value + "': out of range");
    }
}

static bool parseBool(const ConfigParser& config, const std::string& key, bool current) {
    std::string value = config.getStringValue(key);
    if (value.empty()) {
        return current;
    }

    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    throw ConfigError("Invalid " + key + " value '" + value + "': expected true or false");
}

void IngestConfig::loadFromConfig(const ConfigParser& config) {
    if (!config.isLoaded()) {
        return;
    }

    std::string model_value = config.getStringValue("model");
    if (!model_value.empty()) {
        model = model_value;
    }

    max_tokens_per_file = parseSize(config, "budget.max_tokens_per_file", max_tokens_per_file);
    context_ceiling = parseSize(config, "budget.context_ceiling", context_ceiling);
    std::string overflow_value = config.getStringValue("budget.overflow_policy");
    if (!overflow_value.empty()) {
        overflow_policy = stringToOverflowPolicy(overflow_value);
    }

    std::string format_value = config.getStringValue("output.format");
    if (!format_value.empty()) {
        output_format = stringToOutputFormat(format_value);
    }
    include_metadata = parseBool(config, "output.include_metadata", include_metadata);
    include_timestamp = parseBool(config, "output.timestamp", include_timestamp);
    show_progress = parseBool(config, "output.progress", show_progress);

    workers = parseSize(config, "processing.workers", workers);
    queue_capacity = parseSize(config, "processing.queue_capacity", queue_capacity);
    max_file_size_bytes = parseSize(config, "processing.max_file_size_bytes", max_file_size_bytes);
    strip_comments = parseBool(config, "processing.strip_comments", strip_comments);
    max_consecutive_blank_lines = parseSize(config, "processing.max_consecutive_blank_lines",
                                            max_consecutive_blank_lines);
    if (config.hasKey("processing.fallback_encodings")) {
        fallback_encodings = config.getSequenceValue("processing.fallback_encodings");
    }

    std::vector<std::string> patterns = config.getSequenceValue("discovery.ignore_patterns");
    ignore_patterns.insert(ignore_patterns.end(), patterns.begin(), patterns.end());
    if (config.hasKey("discovery.include_extensions")) {
        include_extensions = config.getSequenceValue("discovery.include_extensions");
    }
    if (config.hasKey("discovery.exclude_extensions")) {
        exclude_extensions = config.getSequenceValue("discovery.exclude_extensions");
    }
    follow_symlinks = parseBool(config, "discovery.follow_symlinks", follow_symlinks);
    std::string ignore_file_value = config.getStringValue("discovery.ignore_file");
    if (!ignore_file_value.empty()) {
        ignore_file = ignore_file_value;
    }
}

void IngestConfig::applyCommandOverrides(const Commands& commands) {
    // Override with command-line options only when they were given
    root_path = commands.root_path;

    if (commands.isProvided("output")) {
        output_path = commands.output_path;
    }
    if (commands.isProvided("ignore_file")) {
        ignore_file = commands.ignore_file;
    }
    if (commands.isProvided("bypass_ignore")) {
        bypass_ignore = commands.bypass_ignore;
    }
    if (commands.isProvided("model")) {
        model = commands.model;
    }
    if (commands.isProvided("max_tokens")) {
        max_tokens_per_file = commands.max_tokens;
    }
    if (commands.isProvided("context_ceiling")) {
        context_ceiling = commands.context_ceiling;
    }
    if (commands.isProvided("format")) {
        output_format = stringToOutputFormat(commands.format);
    }
    if (commands.isProvided("no_metadata")) {
        include_metadata = !commands.no_metadata;
    }
    if (commands.isProvided("timestamp")) {
        include_timestamp = commands.timestamp;
    }
    if (commands.isProvided("workers")) {
        workers = commands.workers;
    }
    if (commands.isProvided("max_file_size")) {
        max_file_size_bytes = commands.max_file_size;
    }
    if (commands.isProvided("strip_comments")) {
        strip_comments = commands.strip_comments;
    }
    if (commands.isProvided("overflow")) {
        overflow_policy = stringToOverflowPolicy(commands.overflow);
    }
    if (commands.isProvided("no_progress")) {
        show_progress = !commands.no_progress;
    }
    if (commands.isProvided("include_extensions")) {
        include_extensions = commands.include_extensions;
    }
    if (commands.isProvided("exclude_extensions")) {
        exclude_extensions = commands.exclude_extensions;
    }
    if (commands.isProvided("follow_symlinks")) {
        follow_symlinks = commands.follow_symlinks;
    }
}

bool IngestConfig::validate() const {
    bool valid = true;

    if (root_path.empty()) {
        LOG_ERROR("IngestConfig", "root path cannot be empty");
        valid = false;
    }

    if (model.empty()) {
        LOG_ERROR("IngestConfig", "model cannot be empty");
        valid = false;
    }

    if (max_file_size_bytes == 0) {
        LOG_ERROR("IngestConfig", "max_file_size_bytes must be greater than 0");
        valid = false;
    }

    if (fallback_encodings.empty()) {
        LOG_WARNING("IngestConfig", "No fallback encodings configured, non-UTF-8 files will fail to decode");
    }

    for (const auto& extension : include_extensions) {
        if (extension.empty() || extension == ".") {
            LOG_ERROR("IngestConfig", "include_extensions contains an empty entry");
            valid = false;
            break;
        }
    }
    for (const auto& extension : exclude_extensions) {
        if (extension.empty() || extension == ".") {
            LOG_ERROR("IngestConfig", "exclude_extensions contains an empty entry");
            valid = false;
            break;
        }
    }

    if (workers > 1024) {
        LOG_ERROR("IngestConfig", "workers must not exceed 1024");
        valid = false;
    }

    return valid;
}

std::vector<std::string> IngestConfig::getMergedIgnorePatterns() const {
    std::vector<std::string> patterns = getDefaultIgnorePatterns();
    patterns.insert(patterns.end(), ignore_patterns.begin(), ignore_patterns.end());
    return patterns;
}

size_t IngestConfig::getEffectiveWorkers() const {
    if (workers > 0) {
        return workers;
    }
    unsigned int hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 4;
}

size_t IngestConfig::getEffectiveQueueCapacity() const {
    return queue_capacity > 0 ? queue_capacity : 4 * getEffectiveWorkers();
}

std::vector<std::string> IngestConfig::getDefaultIgnorePatterns() {
    return {
        // Version control
        ".git/",
        ".svn/",
        ".hg/",

        // Build output
        "build/",
        "cmake-build-*/",
        "dist/",
        "out/",
        "target/",
        "*.o",
        "*.obj",
        "*.a",
        "*.lib",
        "*.so",
        "*.dll",
        "*.dylib",
        "*.exe",
        "*.class",
        "*.jar",

        // Dependencies
        "node_modules/",
        "bower_components/",
        "jspm_packages/",

        // Python
        "__pycache__/",
        "*.py[cod]",
        "*.egg-info/",
        ".eggs/",
        ".tox/",
        ".pytest_cache/",
        ".mypy_cache/",
        ".ruff_cache/",

        // Virtual environments
        "venv/",
        ".venv/",
        "env/",
        ".env/",

        // IDE and editor
        ".vscode/",
        ".idea/",
        ".vs/",
        "*.swp",
        "*.swo",
        "*~",

        // Logs, caches and OS files
        "*.log",
        "*.tmp",
        "*.temp",
        ".cache/",
        ".DS_Store",
        "Thumbs.db",

        // Lock files carry no information for a reader
        "package-lock.json",
        "yarn.lock",
        "poetry.lock",
    };
}

std::vector<std::string> IngestConfig::getDefaultFallbackEncodings() {
    return {"windows-1252", "iso-8859-1"};
}

std::string IngestConfig::getDefaultConfigText() {
    return R"(# Distill Configuration v1.0
# Model used for token counting; unknown names fall back to cl100k_base
model: gpt-4o

budget:
  max_tokens_per_file: 0        # 0 means unlimited
  context_ceiling: 0            # 0 means the model's context window
  overflow_policy: keep         # keep, drop or abort

output:
  format: markdown              # markdown, json or yaml
  include_metadata: true
  timestamp: false
  progress: true                # report progress on stderr during ingest

processing:
  workers: 0                    # 0 means one per hardware thread
  queue_capacity: 0             # 0 means 4 x workers
  max_file_size_bytes: 1048576
  strip_comments: false
  max_consecutive_blank_lines: 1
  fallback_encodings:
    - windows-1252
    - iso-8859-1

discovery:
  # Added after the built-in patterns; the project's .gitignore is applied last
  ignore_patterns: []
  include_extensions: []        # empty means every extension
  exclude_extensions: []        # never read these, e.g. [lock, map]
  follow_symlinks: false
)";
}

} // namespace Distill
