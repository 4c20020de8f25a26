// =================================================================
// include/Distill/OutputFormatter.hpp
// =================================================================
// Renderers that turn a finished run into a single document.

#pragma once

#include "Distill/Types.hpp"
#include <memory>
#include <string>

namespace Distill {

struct RenderOptions {
    bool include_metadata = true;   ///< Language, encoding, size and token count per file
    std::string generated_at;       ///< Written as generated_at when not empty
};

/**
 * @brief Base class for document renderers
 *
 * Renderers are pure: the same RunResult and options always give the same
 * bytes. Duration and memory figures are left out for that reason.
 */
class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;

    /**
     * @brief Render the document
     * @param result Finalized run result, records sorted by path
     * @param options Rendering options
     * @return Document text
     */
    virtual std::string render(const RunResult& result, const RenderOptions& options) const = 0;

    /**
     * @brief File extension for documents of this format, without the dot
     */
    virtual std::string extension() const = 0;
};

class MarkdownFormatter : public OutputFormatter {
public:
    std::string render(const RunResult& result, const RenderOptions& options) const override;
    std::string extension() const override { return "md"; }

    /**
     * @brief Backtick fence one longer than the longest backtick run in content
     *
     * The result is at least three backticks long.
     */
    static std::string fenceFor(const std::string& content);
};

class JsonFormatter : public OutputFormatter {
public:
    std::string render(const RunResult& result, const RenderOptions& options) const override;
    std::string extension() const override { return "json"; }
};

class YamlFormatter : public OutputFormatter {
public:
    std::string render(const RunResult& result, const RenderOptions& options) const override;
    std::string extension() const override { return "yaml"; }
};

std::unique_ptr<OutputFormatter> createFormatter(OutputFormat format);

/**
 * @brief Verify that writeDocumentAtomically could write path
 *
 * Creates and removes the temporary sibling the write would use.
 * @throws SetupError for a missing or read-only directory, or a directory target
 */
void checkOutputWritable(const std::string& path);

/**
 * @brief Write bytes next to path, flush, then rename over path
 *
 * Readers see either the old file or the complete new one.
 * @throws SetupError when the document cannot be written
 */
void writeDocumentAtomically(const std::string& path, const std::string& bytes);

/**
 * @brief Current UTC time as an ISO 8601 string
 */
std::string currentTimestamp();

} // namespace Distill
