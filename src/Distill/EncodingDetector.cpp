// =================================================================
// src/Distill/EncodingDetector.cpp
// =================================================================
// Implementation for text encoding detection and conversion to UTF-8.

#include "Distill/EncodingDetector.hpp"
#include <algorithm>
#include <cerrno>
#include <iconv.h>
#include <memory>
#include <utility>

namespace Distill {

namespace {

struct IconvCloser {
    void operator()(void* descriptor) const {
        iconv_close(static_cast<iconv_t>(descriptor));
    }
};

using IconvHandle = std::unique_ptr<void, IconvCloser>;

struct ByteOrderMark {
    const char* bytes;
    size_t length;
    const char* iconv_name;
    const char* label;
};

// Longer marks first: the UTF-32LE mark starts with the UTF-16LE one
const ByteOrderMark kByteOrderMarks[] = {
    {"\x00\x00\xFE\xFF", 4, "UTF-32BE", "UTF-32BE"},
    {"\xFF\xFE\x00\x00", 4, "UTF-32LE", "UTF-32LE"},
    {"\xEF\xBB\xBF", 3, "UTF-8", "UTF-8-BOM"},
    {"\xFE\xFF", 2, "UTF-16BE", "UTF-16BE"},
    {"\xFF\xFE", 2, "UTF-16LE", "UTF-16LE"},
};

} // namespace

EncodingDetector::EncodingDetector(EncodingOptions options)
    : m_options(std::move(options)) {
}

EncodingResult EncodingDetector::detect(const std::string& bytes) const {
    EncodingResult result;

    if (m_options.max_file_size_bytes > 0 && bytes.size() > m_options.max_file_size_bytes) {
        result.is_binary = true;
        result.reason = "size " + std::to_string(bytes.size()) + " bytes exceeds limit of " +
                        std::to_string(m_options.max_file_size_bytes) + " bytes";
        return result;
    }

    if (bytes.empty()) {
        result.encoding = "UTF-8";
        return result;
    }

    if (decodeWithBom(bytes, result)) {
        return result;
    }

    std::string binary_reason;
    if (looksBinary(bytes, binary_reason)) {
        result.is_binary = true;
        result.reason = binary_reason;
        return result;
    }

    if (isValidUtf8(bytes)) {
        result.encoding = "UTF-8";
        result.text = bytes;
        return result;
    }

    for (const auto& encoding : m_options.fallback_encodings) {
        std::string converted;
        if (convertToUtf8(bytes, encoding, converted)) {
            result.encoding = encoding;
            result.text = std::move(converted);
            return result;
        }
    }

    std::string tried = "UTF-8";
    for (const auto& encoding : m_options.fallback_encodings) {
        tried += ", " + encoding;
    }
    result.reason = "not valid in any candidate encoding (" + tried + ")";
    return result;
}

bool EncodingDetector::decodeWithBom(const std::string& bytes, EncodingResult& result) const {
    for (const auto& bom : kByteOrderMarks) {
        if (bytes.size() < bom.length || bytes.compare(0, bom.length, bom.bytes, bom.length) != 0) {
            continue;
        }

        std::string payload = bytes.substr(bom.length);
        std::string converted;
        bool ok = false;
        if (std::string(bom.iconv_name) == "UTF-8") {
            ok = isValidUtf8(payload);
            converted = payload;
        } else {
            ok = convertToUtf8(payload, bom.iconv_name, converted);
        }

        // A mark followed by garbage is not trusted; fall through to the heuristics
        if (!ok) {
            return false;
        }

        result.encoding = bom.label;
        result.text = std::move(converted);
        return true;
    }
    return false;
}

bool EncodingDetector::looksBinary(const std::string& bytes, std::string& reason) const {
    size_t sample = std::min(bytes.size(), m_options.sample_size);
    if (sample == 0) {
        return false;
    }

    size_t control_count = 0;
    for (size_t i = 0; i < sample; ++i) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c == 0) {
            reason = "NUL byte at offset " + std::to_string(i);
            return true;
        }
        if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v' && c != 0x1B) || c == 0x7F) {
            ++control_count;
        }
    }

    double ratio = static_cast<double>(control_count) / static_cast<double>(sample);
    if (ratio > m_options.control_ratio_threshold) {
        reason = "control characters make up " + std::to_string(static_cast<int>(ratio * 100)) +
                 "% of the first " + std::to_string(sample) + " bytes";
        return true;
    }

    return false;
}

bool EncodingDetector::isValidUtf8(const std::string& bytes) {
    const size_t length = bytes.size();
    size_t i = 0;

    while (i < length) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t continuation = 0;
        unsigned int code_point = 0;
        if (c >= 0xC2 && c <= 0xDF) {
            continuation = 1;
            code_point = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            continuation = 2;
            code_point = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            continuation = 3;
            code_point = c & 0x07;
        } else {
            // 0x80-0xC1 (stray continuation or overlong lead) and 0xF5+
            return false;
        }

        if (i + continuation >= length) {
            return false;
        }

        for (size_t k = 1; k <= continuation; ++k) {
            unsigned char next = static_cast<unsigned char>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        if ((continuation == 2 && code_point < 0x800) ||
            (continuation == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += continuation + 1;
    }

    return true;
}

bool EncodingDetector::convertToUtf8(const std::string& bytes, const std::string& from_encoding, std::string& output) {
    iconv_t descriptor = iconv_open("UTF-8", from_encoding.c_str());
    if (descriptor == reinterpret_cast<iconv_t>(-1)) {
        return false;
    }
    IconvHandle handle(descriptor);

    std::string input = bytes;
    char* in_ptr = input.empty() ? nullptr : &input[0];
    size_t in_left = input.size();

    std::string converted;
    converted.reserve(bytes.size() + bytes.size() / 2);
    char buffer[8192];

    while (in_left > 0) {
        char* out_ptr = buffer;
        size_t out_left = sizeof(buffer);
        size_t rc = iconv(descriptor, &in_ptr, &in_left, &out_ptr, &out_left);
        converted.append(buffer, sizeof(buffer) - out_left);

        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) {
                continue;
            }
            // EILSEQ or EINVAL: invalid or truncated sequence
            return false;
        }
    }

    char* out_ptr = buffer;
    size_t out_left = sizeof(buffer);
    if (iconv(descriptor, nullptr, nullptr, &out_ptr, &out_left) == static_cast<size_t>(-1)) {
        return false;
    }
    converted.append(buffer, sizeof(buffer) - out_left);

    output = std::move(converted);
    return true;
}

} // namespace Distill
