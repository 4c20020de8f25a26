// =================================================================
// src/Distill/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Distill/CliParser.hpp"

namespace Distill {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Distill: turn a source tree into one token-budgeted document for LLM prompts.");
    m_app->require_subcommand(1);

    m_app->add_option("--config", m_commands.config_path, "Configuration file (default: <root>/.distill.yml)");
    m_app->add_option("--log-dir", m_commands.log_dir, "Also write rotating log files to this directory");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print debug messages");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
        for (const auto& tracked : m_tracked_options) {
            if (tracked.second->count() > 0) {
                m_commands.provided.insert(tracked.first);
            }
        }
    });

    // Define all commands
    setupIngestCommand(*m_app);
    setupScanCommand(*m_app);
    setupInitCommand(*m_app);
    setupModelsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupIngestCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("ingest", "Builds the document for a project tree.");
    addRunOptions(*sub);
    track("output", sub->add_option("-o,--output", m_commands.output_path,
                                    "Output document path (default: <root name>.distill.<ext>)"));
    track("format", sub->add_option("-f,--format", m_commands.format, "Output format: markdown, json or yaml")
                        ->check(CLI::IsMember({"markdown", "md", "json", "yaml", "yml"}, CLI::ignore_case)));
    track("no_metadata", sub->add_flag("--no-metadata", m_commands.no_metadata,
                                       "Omit language, encoding, size and token count per file"));
    track("timestamp", sub->add_flag("--timestamp", m_commands.timestamp, "Add a generated_at timestamp"));
    track("no_progress", sub->add_flag("--no-progress", m_commands.no_progress,
                                       "Do not report progress on stderr while files are processed"));
    track("overflow", sub->add_option("--overflow", m_commands.overflow,
                                      "What to do past the context ceiling: keep, drop or abort")
                          ->check(CLI::IsMember({"keep", "drop", "abort"}, CLI::ignore_case)));
}

void CliParser::setupScanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("scan", "Lists the files an ingest would process and estimates their tokens.");
    addRunOptions(*sub);
    track("limit", sub->add_option("--limit", m_commands.limit, "Stop after this many files (default: all)"));
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Writes a commented .distill.yml into the current directory.");
    sub->add_flag("--force", m_commands.force, "Overwrite an existing configuration file");
}

void CliParser::setupModelsCommand(CLI::App& app) {
    app.add_subcommand("models", "Lists known models with their encoding and context window.");
}

void CliParser::addRunOptions(CLI::App& sub) {
    sub.add_option("root", m_commands.root_path, "Project directory to read (default: current directory)")
        ->check(CLI::ExistingDirectory);

    track("ignore_file", sub.add_option("--ignore-file", m_commands.ignore_file,
                                        "Supplemental ignore file (default: <root>/.gitignore)"));
    track("bypass_ignore", sub.add_flag("--bypass-ignore", m_commands.bypass_ignore,
                                        "Disable every ignore rule, including the defaults"));
    track("model", sub.add_option("-m,--model", m_commands.model, "Model used for token counting (default: gpt-4o)"));
    track("max_tokens", sub.add_option("--max-tokens", m_commands.max_tokens,
                                       "Per-file token budget, 0 for unlimited"));
    track("context_ceiling", sub.add_option("--context-ceiling", m_commands.context_ceiling,
                                            "Whole-document token ceiling (default: model context window)"));
    track("workers", sub.add_option("-j,--workers", m_commands.workers,
                                    "Worker threads (default: hardware concurrency)"));
    track("max_file_size", sub.add_option("--max-file-size", m_commands.max_file_size,
                                          "Files larger than this many bytes are skipped"));
    track("strip_comments", sub.add_flag("--strip-comments", m_commands.strip_comments,
                                         "Remove comments where the language is known"));
    track("include_extensions", sub.add_option("--include-ext", m_commands.include_extensions,
                                               "Only read files with these extensions")->delimiter(','));
    track("exclude_extensions", sub.add_option("--exclude-ext,--exclude", m_commands.exclude_extensions,
                                               "Never read files with these extensions")->delimiter(','));
    track("follow_symlinks", sub.add_flag("--follow-symlinks", m_commands.follow_symlinks,
                                          "Descend into symlinked directories"));
}

void CliParser::track(const std::string& name, CLI::Option* option) {
    m_tracked_options.emplace_back(name, option);
}

} // namespace Distill
