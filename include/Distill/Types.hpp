// =================================================================
// include/Distill/Types.hpp
// =================================================================
// Shared value types flowing through the ingestion pipeline.

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace Distill {

/**
 * @brief Stages of the per-file pipeline
 *
 * A file moves Discovered -> Read -> Decoded -> Sanitized -> Counted -> Done.
 * Failure records carry the stage that could not be completed.
 */
enum class PipelineStage {
    Discovered,
    Read,
    Decoded,
    Sanitized,
    Counted,
    Done
};

std::string pipelineStageToString(PipelineStage stage);

/**
 * @brief A file found by the directory walker, not yet read
 */
struct CandidatePath {
    std::string absolute_path;
    std::string relative_path;  ///< Forward-slash separated, relative to the root
    size_t size_bytes = 0;
};

/**
 * @brief Result of reading and decoding a candidate
 */
struct DecodedFile {
    CandidatePath candidate;
    std::string encoding;
    std::string text;           ///< UTF-8, empty when binary
    bool binary = false;
};

/**
 * @brief Terminal successful outcome for one file
 */
struct FileRecord {
    std::string name;
    std::string absolute_path;
    std::string relative_path;
    std::string language;
    std::string encoding;
    size_t original_size = 0;
    size_t token_count = 0;
    std::string content;
    bool truncated = false;
    bool overflow = false;      ///< Set when the run total passed the context ceiling
};

/**
 * @brief Terminal unsuccessful outcome for one file (or one directory entry)
 */
struct FailureRecord {
    std::string relative_path;
    PipelineStage stage = PipelineStage::Discovered;
    std::string reason;
};

/**
 * @brief What to do with records that push the run total past the ceiling
 */
enum class OverflowPolicy {
    Keep,   ///< Keep them, flagged as overflow
    Drop,   ///< Flag them and leave them out of the document
    Abort   ///< Stop dispatching new files once the ceiling is crossed
};

std::string overflowPolicyToString(OverflowPolicy policy);
OverflowPolicy stringToOverflowPolicy(const std::string& value);

enum class OutputFormat {
    Markdown,
    Json,
    Yaml
};

std::string outputFormatToString(OutputFormat format);
OutputFormat stringToOutputFormat(const std::string& value);

/**
 * @brief Token limits for one run
 */
struct TokenBudget {
    size_t max_tokens_per_file = 0;  ///< 0 means unlimited
    size_t context_ceiling = 0;      ///< Whole-document ceiling
    size_t running_total = 0;

    bool wouldOverflow(size_t tokens) const {
        return running_total + tokens > context_ceiling;
    }
};

/**
 * @brief Aggregate statistics for a run, finalized after all workers join
 */
struct RunSummary {
    size_t discovered = 0;
    size_t processed = 0;
    size_t skipped_binary = 0;
    size_t failed = 0;
    size_t truncated = 0;
    size_t overflowed = 0;
    size_t omitted = 0;
    size_t total_tokens = 0;
    size_t total_bytes = 0;
    std::map<std::string, size_t> languages;
    std::map<std::string, size_t> encodings;
    long duration_ms = 0;
    size_t peak_memory_kb = 0;
    bool cancelled = false;
    std::string model;
    size_t context_ceiling = 0;
    std::string root;
};

/**
 * @brief Snapshot of a run in flight, handed to progress observers
 */
struct RunProgress {
    size_t completed = 0;        ///< Files whose outcome is known
    size_t dispatched = 0;       ///< Files handed to the workers so far
    size_t tokens = 0;           ///< Running token total of processed files
    bool discovery_done = false; ///< dispatched is final once the walk has ended
};

/**
 * @brief Everything a run produces
 */
struct RunResult {
    RunSummary summary;
    std::vector<FileRecord> records;       ///< Admitted to the document, sorted by path
    std::vector<FailureRecord> skipped;    ///< Binary skips
    std::vector<FailureRecord> failures;   ///< Discovery, read, decode, sanitize and count failures
    std::vector<FailureRecord> omitted;    ///< Dropped by the overflow policy
};

} // namespace Distill
