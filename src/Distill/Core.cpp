// =================================================================
// src/Distill/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Distill/Core.hpp"
#include "Distill/ConfigParser.hpp"
#include "Distill/DirectoryWalker.hpp"
#include "Distill/Errors.hpp"
#include "Distill/IngestConfig.hpp"
#include "Distill/Logger.hpp"
#include "Distill/MetricsReporter.hpp"
#include "Distill/OutputFormatter.hpp"
#include "Distill/ProcessingOrchestrator.hpp"
#include "Distill/TokenAccountant.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace Distill {

namespace fs = std::filesystem;

Core::Core(const Commands& commands)
    : m_commands(commands) {
}

int Core::run() {
    initializeLogging();

    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.root_path);

    int exit_code = 1;
    try {
        if (m_commands.active_command == "ingest") {
            exit_code = handleIngest();
        } else if (m_commands.active_command == "scan") {
            exit_code = handleScan();
        } else if (m_commands.active_command == "init") {
            exit_code = handleInit();
        } else if (m_commands.active_command == "models") {
            exit_code = handleModels();
        } else if (m_commands.active_command.empty()) {
            exit_code = 0;
        } else {
            std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
        }
    } catch (const ConfigError& e) {
        LOG_ERROR("Core", e.what());
        std::cerr << "Configuration error: " << e.what() << std::endl;
        exit_code = 1;
    } catch (const SetupError& e) {
        LOG_ERROR("Core", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration.count()));
    Logger::getInstance().flush();
    return exit_code;
}

void Core::initializeLogging() const {
    Logger& logger = Logger::getInstance();
    logger.initialize(m_commands.log_dir);
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
}

IngestConfig Core::loadConfig() const {
    IngestConfig config;
    config.root_path = m_commands.root_path;

    std::string config_path = m_commands.config_path;
    if (config_path.empty()) {
        config_path = (fs::path(m_commands.root_path) / kConfigFileName).string();
    } else {
        std::error_code ec;
        if (!fs::exists(config_path, ec)) {
            throw ConfigError("Configuration file not found: " + config_path);
        }
    }

    ConfigParser parser(config_path);
    config.loadFromConfig(parser);
    config.applyCommandOverrides(m_commands);

    if (!config.validate()) {
        throw ConfigError("Invalid configuration, see the messages above");
    }
    return config;
}

int Core::handleIngest() {
    IngestConfig config = loadConfig();
    auto formatter = createFormatter(config.output_format);

    if (config.output_path.empty()) {
        std::error_code ec;
        fs::path root = fs::weakly_canonical(config.root_path, ec);
        std::string name = ec ? std::string("project") : root.filename().string();
        if (name.empty()) {
            name = "project";
        }
        config.output_path = (fs::current_path() / (name + ".distill." + formatter->extension())).string();
    }

    // Fail before any work when the document could not be written anyway
    checkOutputWritable(config.output_path);

    std::cout << "Ingesting " << config.root_path << " for model " << config.model << "..." << std::endl;

    ProcessingOrchestrator orchestrator(config);
    // The bar redraws in place, which only makes sense on a terminal
    const bool show_progress = config.show_progress && ::isatty(STDERR_FILENO) == 1;
    if (show_progress) {
        orchestrator.setProgressCallback([](const RunProgress& progress) {
            std::cerr << "\r" << MetricsReporter::formatProgress(progress) << "\033[K" << std::flush;
        });
    }

    RunResult result = orchestrator.run();
    if (show_progress) {
        std::cerr << std::endl;
    }
    const RunSummary& summary = result.summary;

    std::cout << MetricsReporter::summarize(summary);

    if (summary.discovered > 0 && summary.failed == summary.discovered) {
        std::cerr << "Error: every discovered file failed; no document written." << std::endl;
        return 1;
    }
    if (summary.processed == 0) {
        if (summary.discovered == 0) {
            std::cout << "No files found under " << config.root_path
                      << " after applying ignore rules; no document written." << std::endl;
        } else {
            std::cout << "No text files to include (" << summary.skipped_binary << " binary, "
                      << summary.failed << " failed); no document written." << std::endl;
        }
        return 0;
    }

    RenderOptions options;
    options.include_metadata = config.include_metadata;
    if (config.include_timestamp) {
        options.generated_at = currentTimestamp();
    }

    std::string document = formatter->render(result, options);
    writeDocumentAtomically(config.output_path, document);

    std::cout << "Wrote " << MetricsReporter::formatSize(document.size()) << " to " << config.output_path << std::endl;
    if (summary.failed > 0 || summary.skipped_binary > 0) {
        std::cout << "Skipped and failed files are listed at the end of the document." << std::endl;
    }
    return 0;
}

int Core::handleScan() {
    IngestConfig config = loadConfig();
    ProcessingOrchestrator orchestrator(config);

    IgnoreRuleSet rules = orchestrator.buildRuleSet(config.root_path);
    DirectoryWalker walker(config.root_path, rules, orchestrator.buildWalkerOptions());
    std::vector<CandidatePath> candidates = walker.walk(m_commands.limit);

    std::cout << "Scanning " << walker.getRoot() << " (" << rules.size() << " ignore rules)\n" << std::endl;

    size_t total_bytes = 0;
    size_t total_tokens = 0;
    size_t too_large = 0;
    for (const auto& candidate : candidates) {
        size_t estimate = TokenAccountant::estimateTokens(candidate.size_bytes);
        bool skipped = candidate.size_bytes > config.max_file_size_bytes;

        std::cout << "  " << std::left << std::setw(60) << candidate.relative_path
                  << std::right << std::setw(10) << MetricsReporter::formatSize(candidate.size_bytes);
        if (skipped) {
            std::cout << "  (over size limit)";
            too_large++;
        } else {
            std::cout << std::setw(10) << estimate << " tokens";
            total_bytes += candidate.size_bytes;
            total_tokens += estimate;
        }
        std::cout << "\n";
    }

    for (const auto& error : walker.discoveryErrors()) {
        std::cout << "  ! " << error.relative_path << ": " << error.reason << "\n";
    }

    size_t ceiling = orchestrator.getContextCeiling();
    std::cout << "\nCandidates: " << candidates.size();
    if (m_commands.limit > 0 && candidates.size() == m_commands.limit) {
        std::cout << " (limit reached)";
    }
    std::cout << "\nOver size limit: " << too_large << "\n";
    std::cout << "Estimated tokens: ~" << total_tokens << " of " << ceiling << " ("
              << MetricsReporter::formatSize(total_bytes) << ")" << std::endl;
    if (total_tokens > ceiling) {
        std::cout << "The estimate exceeds the context ceiling of " << config.model << "." << std::endl;
    }
    return 0;
}

int Core::handleInit() {
    std::cout << "Initializing Distill configuration..." << std::endl;

    const std::string config_file = kConfigFileName;
    std::error_code ec;
    if (fs::exists(config_file, ec) && !m_commands.force) {
        std::cout << "Configuration file '" << config_file << "' already exists. Skipping." << std::endl;
        std::cout << "Use --force to overwrite it." << std::endl;
        return 0;
    }

    writeDocumentAtomically(config_file, IngestConfig::getDefaultConfigText());
    std::cout << "Created default configuration file: " << config_file << std::endl;
    return 0;
}

int Core::handleModels() {
    TokenAccountant accountant;

    std::cout << std::left << std::setw(28) << "MODEL" << std::setw(14) << "ENCODING"
              << std::right << std::setw(10) << "CONTEXT" << "\n";
    for (const auto& model : accountant.getKnownModels()) {
        std::cout << std::left << std::setw(28) << model << std::setw(14) << accountant.encodingFor(model)
                  << std::right << std::setw(10) << accountant.contextWindow(model) << "\n";
    }
    std::cout << "\nUnknown models are counted with " << TokenAccountant::kDefaultScheme
              << " and a " << TokenAccountant::kDefaultContextWindow << " token window." << std::endl;
    return 0;
}

} // namespace Distill
