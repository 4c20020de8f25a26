// =================================================================
// src/Distill/OutputFormatter.cpp
// =================================================================
// Implementation for the Markdown, JSON and YAML renderers.

#include "Distill/OutputFormatter.hpp"
#include "Distill/Errors.hpp"
#include "Distill/LanguageClassifier.hpp"
#include "Distill/Logger.hpp"
#include "Distill/MetricsReporter.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace Distill {

namespace {

std::string projectName(const RunSummary& summary) {
    std::filesystem::path root(summary.root);
    std::string name = root.filename().string();
    return name.empty() ? summary.root : name;
}

void writeFailureList(std::ostringstream& out, const std::string& title,
                      const std::vector<FailureRecord>& entries, bool with_stage) {
    if (entries.empty()) {
        return;
    }

    out << "\n## " << title << "\n\n";
    for (const auto& entry : entries) {
        out << "- `" << entry.relative_path << "`";
        if (with_stage) {
            out << " (" << pipelineStageToString(entry.stage) << ")";
        }
        out << ": " << entry.reason << "\n";
    }
}

nlohmann::json failureListToJson(const std::vector<FailureRecord>& entries, bool with_stage) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& entry : entries) {
        nlohmann::json item;
        item["path"] = entry.relative_path;
        item["reason"] = entry.reason;
        if (with_stage) {
            item["stage"] = pipelineStageToString(entry.stage);
        }
        list.push_back(item);
    }
    return list;
}

void emitFailureList(YAML::Emitter& out, const std::string& key,
                     const std::vector<FailureRecord>& entries, bool with_stage) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& entry : entries) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << entry.relative_path;
        if (with_stage) {
            out << YAML::Key << "stage" << YAML::Value << pipelineStageToString(entry.stage);
        }
        out << YAML::Key << "reason" << YAML::Value << entry.reason;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emitHistogram(YAML::Emitter& out, const std::string& key, const std::map<std::string, size_t>& histogram) {
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    for (const auto& entry : histogram) {
        out << YAML::Key << entry.first << YAML::Value << entry.second;
    }
    out << YAML::EndMap;
}

} // namespace

// MarkdownFormatter

std::string MarkdownFormatter::render(const RunResult& result, const RenderOptions& options) const {
    const RunSummary& summary = result.summary;
    std::ostringstream out;

    out << "# Project: " << projectName(summary) << "\n\n";

    out << "## Summary\n\n";
    out << "- **Model**: " << summary.model << "\n";
    out << "- **Context ceiling**: " << summary.context_ceiling << " tokens\n";
    out << "- **Files**: " << summary.processed << " processed of " << summary.discovered << " discovered\n";
    out << "- **Skipped (binary)**: " << summary.skipped_binary << "\n";
    out << "- **Failed**: " << summary.failed << "\n";
    out << "- **Truncated**: " << summary.truncated << "\n";
    out << "- **Over ceiling**: " << summary.overflowed << "\n";
    out << "- **Omitted**: " << summary.omitted << "\n";
    out << "- **Total tokens**: " << summary.total_tokens << "\n";
    out << "- **Total size**: " << MetricsReporter::formatSize(summary.total_bytes) << "\n";
    if (summary.cancelled) {
        out << "- **Cancelled**: yes, the file list is partial\n";
    }
    if (!options.generated_at.empty()) {
        out << "- **Generated at**: " << options.generated_at << "\n";
    }

    if (!summary.languages.empty()) {
        out << "\n### Languages\n\n";
        for (const auto& entry : summary.languages) {
            out << "- " << entry.first << ": " << entry.second << "\n";
        }
    }
    if (!summary.encodings.empty()) {
        out << "\n### Encodings\n\n";
        for (const auto& entry : summary.encodings) {
            out << "- " << entry.first << ": " << entry.second << "\n";
        }
    }

    out << "\n## Files\n";
    for (const auto& record : result.records) {
        out << "\n### " << record.relative_path << "\n\n";

        if (options.include_metadata) {
            out << "- **Language**: " << record.language << "\n";
            out << "- **Encoding**: " << record.encoding << "\n";
            out << "- **Size**: " << MetricsReporter::formatSize(record.original_size)
                << " (" << record.original_size << " bytes)\n";
            out << "- **Tokens**: " << record.token_count << "\n";
            if (record.truncated) {
                out << "- **Truncated**: yes\n";
            }
            if (record.overflow) {
                out << "- **Over ceiling**: yes\n";
            }
            out << "\n";
        }

        std::string fence = fenceFor(record.content);
        out << fence << LanguageClassifier::fenceTag(record.language) << "\n";
        out << record.content;
        if (!record.content.empty() && record.content.back() != '\n') {
            out << "\n";
        }
        out << fence << "\n";
    }

    writeFailureList(out, "Skipped files", result.skipped, false);
    writeFailureList(out, "Failed files", result.failures, true);
    writeFailureList(out, "Omitted files", result.omitted, false);

    return out.str();
}

std::string MarkdownFormatter::fenceFor(const std::string& content) {
    size_t longest = 0;
    size_t current = 0;
    for (char c : content) {
        if (c == '`') {
            ++current;
            longest = std::max(longest, current);
        } else {
            current = 0;
        }
    }
    return std::string(std::max<size_t>(3, longest + 1), '`');
}

// JsonFormatter

std::string JsonFormatter::render(const RunResult& result, const RenderOptions& options) const {
    const RunSummary& summary = result.summary;
    nlohmann::json document;

    nlohmann::json summary_json;
    summary_json["project"] = projectName(summary);
    summary_json["model"] = summary.model;
    summary_json["context_ceiling"] = summary.context_ceiling;
    summary_json["discovered"] = summary.discovered;
    summary_json["processed"] = summary.processed;
    summary_json["skipped_binary"] = summary.skipped_binary;
    summary_json["failed"] = summary.failed;
    summary_json["truncated"] = summary.truncated;
    summary_json["overflowed"] = summary.overflowed;
    summary_json["omitted"] = summary.omitted;
    summary_json["total_tokens"] = summary.total_tokens;
    summary_json["total_bytes"] = summary.total_bytes;
    summary_json["languages"] = summary.languages;
    summary_json["encodings"] = summary.encodings;
    summary_json["cancelled"] = summary.cancelled;
    document["summary"] = summary_json;

    nlohmann::json files = nlohmann::json::array();
    for (const auto& record : result.records) {
        nlohmann::json file;
        file["path"] = record.relative_path;
        file["name"] = record.name;
        if (options.include_metadata) {
            file["language"] = record.language;
            file["encoding"] = record.encoding;
            file["size_bytes"] = record.original_size;
            file["token_count"] = record.token_count;
            file["truncated"] = record.truncated;
            file["overflow"] = record.overflow;
        }
        file["content"] = record.content;
        files.push_back(file);
    }
    document["files"] = files;

    document["skipped"] = failureListToJson(result.skipped, false);
    document["failed"] = failureListToJson(result.failures, true);
    document["omitted"] = failureListToJson(result.omitted, false);

    if (!options.generated_at.empty()) {
        document["generated_at"] = options.generated_at;
    }

    // File names are not guaranteed to be UTF-8
    return document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

// YamlFormatter

std::string YamlFormatter::render(const RunResult& result, const RenderOptions& options) const {
    const RunSummary& summary = result.summary;
    YAML::Emitter out;

    out << YAML::BeginDoc << YAML::BeginMap;

    out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "project" << YAML::Value << projectName(summary);
    out << YAML::Key << "model" << YAML::Value << summary.model;
    out << YAML::Key << "context_ceiling" << YAML::Value << summary.context_ceiling;
    out << YAML::Key << "discovered" << YAML::Value << summary.discovered;
    out << YAML::Key << "processed" << YAML::Value << summary.processed;
    out << YAML::Key << "skipped_binary" << YAML::Value << summary.skipped_binary;
    out << YAML::Key << "failed" << YAML::Value << summary.failed;
    out << YAML::Key << "truncated" << YAML::Value << summary.truncated;
    out << YAML::Key << "overflowed" << YAML::Value << summary.overflowed;
    out << YAML::Key << "omitted" << YAML::Value << summary.omitted;
    out << YAML::Key << "total_tokens" << YAML::Value << summary.total_tokens;
    out << YAML::Key << "total_bytes" << YAML::Value << summary.total_bytes;
    emitHistogram(out, "languages", summary.languages);
    emitHistogram(out, "encodings", summary.encodings);
    out << YAML::Key << "cancelled" << YAML::Value << summary.cancelled;
    out << YAML::EndMap;

    if (!options.generated_at.empty()) {
        out << YAML::Key << "generated_at" << YAML::Value << options.generated_at;
    }

    out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto& record : result.records) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << record.relative_path;
        out << YAML::Key << "name" << YAML::Value << record.name;
        if (options.include_metadata) {
            out << YAML::Key << "language" << YAML::Value << record.language;
            out << YAML::Key << "encoding" << YAML::Value << record.encoding;
            out << YAML::Key << "size_bytes" << YAML::Value << record.original_size;
            out << YAML::Key << "token_count" << YAML::Value << record.token_count;
            out << YAML::Key << "truncated" << YAML::Value << record.truncated;
            out << YAML::Key << "overflow" << YAML::Value << record.overflow;
        }

        // yaml-cpp writes "|" without indentation or chomping indicators, so a
        // literal block only round-trips for content that does not start with
        // a blank and ends in exactly one newline
        const std::string& content = record.content;
        bool literal = content.size() >= 2 && content[0] != ' ' && content[0] != '\t' &&
                       content.back() == '\n' && content[content.size() - 2] != '\n';
        out << YAML::Key << "content" << YAML::Value;
        if (literal) {
            out << YAML::Literal << content;
        } else {
            out << YAML::DoubleQuoted << content;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    emitFailureList(out, "skipped", result.skipped, false);
    emitFailureList(out, "failed", result.failures, true);
    emitFailureList(out, "omitted", result.omitted, false);

    out << YAML::EndMap;

    if (!out.good()) {
        throw DistillError("Failed to render YAML document: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::unique_ptr<OutputFormatter> createFormatter(OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:
            return std::make_unique<JsonFormatter>();
        case OutputFormat::Yaml:
            return std::make_unique<YamlFormatter>();
        case OutputFormat::Markdown:
        default:
            return std::make_unique<MarkdownFormatter>();
    }
}

static std::filesystem::path temporarySibling(const std::filesystem::path& target) {
    std::filesystem::path temp = target;
    temp += ".tmp." + std::to_string(::getpid());
    return temp;
}

void checkOutputWritable(const std::string& path) {
    std::filesystem::path target = std::filesystem::absolute(path);
    std::error_code ec;
    if (!std::filesystem::is_directory(target.parent_path(), ec)) {
        throw SetupError("Output directory does not exist: " + target.parent_path().string());
    }
    if (std::filesystem::is_directory(target, ec)) {
        throw SetupError("Output path is a directory: " + path);
    }

    // The atomic write needs to create a file beside the target
    std::filesystem::path temp = temporarySibling(target);
    {
        std::ofstream file_stream(temp, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            throw SetupError("Output directory is not writable: " + target.parent_path().string());
        }
    }
    std::filesystem::remove(temp, ec);
    if (ec) {
        throw SetupError("Cannot remove " + temp.string() + ": " + ec.message());
    }
}

void writeDocumentAtomically(const std::string& path, const std::string& bytes) {
    std::filesystem::path target(path);
    std::filesystem::path temp = temporarySibling(target);

    {
        std::ofstream file_stream(temp, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            throw SetupError("Cannot write output file: " + path);
        }
        file_stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file_stream.flush();
        if (!file_stream.good()) {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw SetupError("Failed while writing output file: " + path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw SetupError("Cannot replace output file " + path + ": " + ec.message());
    }

    LOG_DEBUG("OutputFormatter", "Wrote " + std::to_string(bytes.size()) + " bytes to " + path);
}

std::string currentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace Distill
