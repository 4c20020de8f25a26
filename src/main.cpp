#include "Distill/CliParser.hpp"
#include "Distill/Core.hpp"
#include "Distill/Errors.hpp"
#include <iostream>

int main(int argc, char** argv) {
    Distill::CliParser parser;
    std::shared_ptr<CLI::App> app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Covers --help and --version as well as real argument errors
        return app->exit(e);
    }

    try {
        Distill::Core core(parser.getCommands());
        return core.run();
    } catch (const Distill::DistillError& e) {
        std::cerr << "distill: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "distill: internal error: " << e.what() << std::endl;
    }
    return 1;
}
