// =================================================================
// src/Distill/Types.cpp
// =================================================================
// String conversions for pipeline enums.

#include "Distill/Types.hpp"
#include "Distill/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace Distill {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string pipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Discovered: return "Discovered";
        case PipelineStage::Read: return "Read";
        case PipelineStage::Decoded: return "Decoded";
        case PipelineStage::Sanitized: return "Sanitized";
        case PipelineStage::Counted: return "Counted";
        case PipelineStage::Done: return "Done";
        default: return "Unknown";
    }
}

std::string overflowPolicyToString(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::Keep: return "keep";
        case OverflowPolicy::Drop: return "drop";
        case OverflowPolicy::Abort: return "abort";
        default: return "keep";
    }
}

OverflowPolicy stringToOverflowPolicy(const std::string& value) {
    std::string lower = toLower(value);
    if (lower == "keep" || lower == "warn") return OverflowPolicy::Keep;
    if (lower == "drop") return OverflowPolicy::Drop;
    if (lower == "abort") return OverflowPolicy::Abort;
    throw ConfigError("Unknown overflow policy: " + value);
}

std::string outputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown: return "markdown";
        case OutputFormat::Json: return "json";
        case OutputFormat::Yaml: return "yaml";
        default: return "markdown";
    }
}

OutputFormat stringToOutputFormat(const std::string& value) {
    std::string lower = toLower(value);
    if (lower == "markdown" || lower == "md") return OutputFormat::Markdown;
    if (lower == "json") return OutputFormat::Json;
    if (lower == "yaml" || lower == "yml") return OutputFormat::Yaml;
    throw ConfigError("Unknown output format: " + value);
}

} // namespace Distill
