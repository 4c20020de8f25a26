// =================================================================
// src/Distill/FileProcessor.cpp
// =================================================================
// Implementation for the per-file read, decode, sanitize and count pipeline.

#include "Distill/FileProcessor.hpp"
#include "Distill/ContentSanitizer.hpp"
#include "Distill/EncodingDetector.hpp"
#include "Distill/LanguageClassifier.hpp"
#include "Distill/Logger.hpp"
#include "Distill/TokenAccountant.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace Distill {

FileProcessor::FileProcessor(const EncodingDetector& detector,
                             const LanguageClassifier& classifier,
                             const ContentSanitizer& sanitizer,
                             const TokenAccountant& accountant,
                             const std::string& model,
                             size_t max_tokens_per_file)
    : m_detector(detector),
      m_classifier(classifier),
      m_sanitizer(sanitizer),
      m_accountant(accountant),
      m_model(model),
      m_max_tokens_per_file(max_tokens_per_file) {
}

FileProcessResult FileProcessor::process(const CandidatePath& candidate) const {
    const size_t size_limit = m_detector.getOptions().max_file_size_bytes;

    // Oversized files are skipped without reading them
    if (size_limit > 0 && candidate.size_bytes > size_limit) {
        FileProcessResult result;
        result.status = ProcessStatus::SkippedBinary;
        result.failure = {candidate.relative_path, PipelineStage::Decoded,
                          "size " + std::to_string(candidate.size_bytes) + " bytes exceeds limit of " +
                          std::to_string(size_limit) + " bytes"};
        LOG_DEBUG("FileProcessor", "Skipping oversized file: " + candidate.relative_path);
        return result;
    }

    std::string bytes;
    std::string read_error;
    if (!readFile(candidate.absolute_path, bytes, read_error)) {
        return fail(candidate, PipelineStage::Read, read_error);
    }

    EncodingResult decoded;
    try {
        decoded = m_detector.detect(bytes);
    } catch (const std::exception& e) {
        return fail(candidate, PipelineStage::Decoded, e.what());
    }

    if (decoded.is_binary) {
        FileProcessResult result;
        result.status = ProcessStatus::SkippedBinary;
        result.failure = {candidate.relative_path, PipelineStage::Decoded, "binary: " + decoded.reason};
        LOG_DEBUG("FileProcessor", "Skipping binary file: " + candidate.relative_path);
        return result;
    }
    if (!decoded.decoded()) {
        return fail(candidate, PipelineStage::Decoded, decoded.reason);
    }

    FileRecord record;
    record.absolute_path = candidate.absolute_path;
    record.relative_path = candidate.relative_path;
    size_t slash = candidate.relative_path.find_last_of('/');
    record.name = slash == std::string::npos ? candidate.relative_path : candidate.relative_path.substr(slash + 1);
    record.encoding = decoded.encoding;
    record.original_size = bytes.size();

    std::string sanitized;
    try {
        record.language = m_classifier.classify(candidate.relative_path, decoded.text.substr(0, LanguageClassifier::kSniffLimit));
        sanitized = m_sanitizer.sanitize(record.language, decoded.text);
    } catch (const std::exception& e) {
        return fail(candidate, PipelineStage::Sanitized, e.what());
    }

    try {
        BudgetFit fit = m_accountant.fitToBudget(m_model, sanitized, m_max_tokens_per_file);
        record.content = std::move(fit.text);
        record.token_count = fit.token_count;
        record.truncated = fit.truncated;
    } catch (const std::exception& e) {
        return fail(candidate, PipelineStage::Counted, e.what());
    }

    if (record.truncated) {
        LOG_DEBUG("FileProcessor", "Truncated to token budget: " + candidate.relative_path);
    }

    FileProcessResult result;
    result.status = ProcessStatus::Processed;
    result.record = std::move(record);
    return result;
}

bool FileProcessor::readFile(const std::string& path, std::string& bytes, std::string& error) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = std::string("cannot open file: ") + (errno != 0 ? std::strerror(errno) : "unknown error");
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        error = std::string("read failed: ") + (errno != 0 ? std::strerror(errno) : "I/O error");
        return false;
    }

    bytes = content.str();
    return true;
}

FileProcessResult FileProcessor::fail(const CandidatePath& candidate, PipelineStage stage, const std::string& reason) const {
    Logger::getInstance().warning("FileProcessor",
        "Failed at stage " + pipelineStageToString(stage) + ": " + candidate.relative_path, reason);

    FileProcessResult result;
    result.status = ProcessStatus::Failed;
    result.failure = {candidate.relative_path, stage, reason};
    return result;
}

} // namespace Distill
