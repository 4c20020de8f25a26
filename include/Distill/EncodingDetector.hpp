// =================================================================
// include/Distill/EncodingDetector.hpp
// =================================================================
// Header for text encoding detection and conversion to UTF-8.

#pragma once

#include <string>
#include <vector>

namespace Distill {

/**
 * @brief Outcome of encoding detection for one byte buffer
 *
 * Three shapes are possible: decoded text (encoding set), binary
 * (is_binary set, reason names the heuristic) and undecodable (neither
 * set, reason explains why).
 */
struct EncodingResult {
    std::string encoding;
    bool is_binary = false;
    std::string text;
    std::string reason;

    bool decoded() const { return !is_binary && !encoding.empty(); }
};

struct EncodingOptions {
    size_t max_file_size_bytes = 1024 * 1024;
    std::vector<std::string> fallback_encodings = {"windows-1252", "iso-8859-1"};
    size_t sample_size = 8192;
    double control_ratio_threshold = 0.10;
};

/**
 * @brief Decides whether bytes are text and decodes them to UTF-8
 *
 * Detection order: size ceiling, byte order mark, binary heuristic on a
 * bounded sample, strict UTF-8, then each fallback encoding in turn.
 * Conversions go through iconv. Instances are immutable and can be
 * shared between worker threads.
 */
class EncodingDetector {
public:
    explicit EncodingDetector(EncodingOptions options = EncodingOptions());

    /**
     * @brief Detect the encoding of a buffer and decode it
     * @param bytes Raw file content
     * @return Detection result
     */
    EncodingResult detect(const std::string& bytes) const;

    /**
     * @brief Check that bytes are well-formed UTF-8
     *
     * Rejects overlong forms, surrogate code points and values above U+10FFFF.
     */
    static bool isValidUtf8(const std::string& bytes);

    /**
     * @brief Binary heuristic over the first sample_size bytes
     * @param reason Set to a short explanation when the result is true
     * @return true if the sample looks binary
     */
    bool looksBinary(const std::string& bytes, std::string& reason) const;

    /**
     * @brief Convert bytes from a named encoding to UTF-8
     * @param bytes Input bytes
     * @param from_encoding iconv encoding name
     * @param output Receives UTF-8 text on success
     * @return false if the encoding is unknown or the input is invalid for it
     */
    static bool convertToUtf8(const std::string& bytes, const std::string& from_encoding, std::string& output);

    const EncodingOptions& getOptions() const { return m_options; }

private:
    EncodingOptions m_options;

    bool decodeWithBom(const std::string& bytes, EncodingResult& result) const;
};

} // namespace Distill
