// =================================================================
// include/Distill/CliParser.hpp
// =================================================================
// Command-line surface of the distill executable, built on CLI11.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Distill {

/**
 * @brief Everything the command line asked for
 *
 * Numeric zeros and empty strings mean "not given"; `provided` records
 * which options actually appeared so that config file values are only
 * overridden by options the user typed.
 */
struct Commands {
    std::string active_command;

    // Global options
    std::string config_path;
    std::string log_dir;
    bool verbose = false;

    // Options for 'ingest' and 'scan'
    std::string root_path = ".";
    std::string output_path;
    std::string ignore_file;
    bool bypass_ignore = false;
    std::string model;
    size_t max_tokens = 0;
    size_t context_ceiling = 0;
    std::string format;
    bool no_metadata = false;
    bool timestamp = false;
    bool no_progress = false;
    size_t workers = 0;
    size_t max_file_size = 0;
    bool strip_comments = false;
    std::string overflow;
    std::vector<std::string> include_extensions;
    std::vector<std::string> exclude_extensions;
    bool follow_symlinks = false;

    // Options for 'scan'
    size_t limit = 0;

    // Options for 'init'
    bool force = false;

    // Names of the options that appeared on the command line
    std::set<std::string> provided;

    bool isProvided(const std::string& name) const { return provided.count(name) > 0; }
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Build the app with the ingest, scan, init and models subcommands
     */
    std::shared_ptr<CLI::App> setupCli();

    /// Valid after a successful parse.
    const Commands& getCommands() const;

private:
    void setupIngestCommand(CLI::App& app);
    void setupScanCommand(CLI::App& app);
    void setupInitCommand(CLI::App& app);
    void setupModelsCommand(CLI::App& app);

    void addRunOptions(CLI::App& sub);
    void track(const std::string& name, CLI::Option* option);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
    std::vector<std::pair<std::string, CLI::Option*>> m_tracked_options;
};

} // namespace Distill
