// =================================================================
// include/Distill/FileProcessor.hpp
// =================================================================
// Header for the per-file read, decode, sanitize and count pipeline.

#pragma once

#include "Distill/Types.hpp"
#include <string>

namespace Distill {

class EncodingDetector;
class LanguageClassifier;
class ContentSanitizer;
class TokenAccountant;

enum class ProcessStatus {
    Processed,
    SkippedBinary,
    Failed
};

/**
 * @brief Terminal outcome of processing one candidate
 *
 * record is meaningful for Processed, failure for the other two states.
 */
struct FileProcessResult {
    ProcessStatus status = ProcessStatus::Failed;
    FileRecord record;
    FailureRecord failure;
};

/**
 * @brief Runs one file through Read -> Decoded -> Sanitized -> Counted
 *
 * Every stage converts its errors into a FailureRecord naming the stage,
 * so process() never throws. The collaborators are shared read-only
 * between worker threads.
 */
class FileProcessor {
public:
    FileProcessor(const EncodingDetector& detector,
                  const LanguageClassifier& classifier,
                  const ContentSanitizer& sanitizer,
                  const TokenAccountant& accountant,
                  const std::string& model,
                  size_t max_tokens_per_file);

    /**
     * @brief Process one candidate file
     * @param candidate File found by the walker
     * @return Processed record, binary skip or failure
     */
    FileProcessResult process(const CandidatePath& candidate) const;

    /**
     * @brief Read a whole file into memory
     * @param path File to read
     * @param bytes Receives the content
     * @param error Receives a reason on failure
     * @return true on success
     */
    static bool readFile(const std::string& path, std::string& bytes, std::string& error);

private:
    const EncodingDetector& m_detector;
    const LanguageClassifier& m_classifier;
    const ContentSanitizer& m_sanitizer;
    const TokenAccountant& m_accountant;
    std::string m_model;
    size_t m_max_tokens_per_file;

    FileProcessResult fail(const CandidatePath& candidate, PipelineStage stage, const std::string& reason) const;
};

} // namespace Distill
