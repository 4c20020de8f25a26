// =================================================================
// include/Distill/Core.hpp
// =================================================================
// Defines the application object that dispatches parsed commands.

#pragma once

#include "Distill/CliParser.hpp"
#include <string>

namespace Distill {

struct IngestConfig;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the command selected on the command line.
     * @return 0 on success, 1 on setup or configuration errors or when every file failed.
     */
    int run();

    static constexpr const char* kConfigFileName = ".distill.yml";

private:
    // Command Handlers
    int handleIngest();
    int handleScan();
    int handleInit();
    int handleModels();

    /**
     * @brief Defaults, then the configuration file, then command-line overrides
     * @throws ConfigError on invalid values or a missing explicit --config file
     */
    IngestConfig loadConfig() const;

    void initializeLogging() const;

    const Commands& m_commands;
};

} // namespace Distill
