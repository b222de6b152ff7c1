//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/command.hpp"
#include "cca/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {
    void print_help() {
        std::cout << cca::PROJECT_NAME << " " << cca::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << cca::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* command : cca::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << command->name()
                      << command->description() << "\n";
        }
        std::cout << "\nRun '" << cca::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

    void print_version() {
        std::cout << cca::PROJECT_SHORT_NAME << " " << cca::VERSION_STRING << "\n";
    }
}

int main(const int argc, char** argv) {
    try {
        if (argc < 2) {
            print_help();
            return 2;
        }

        const std::string command_name = argv[1];
        if (command_name == "-h" || command_name == "--help" || command_name == "help") {
            print_help();
            return 0;
        }
        if (command_name == "--version" || command_name == "version") {
            print_version();
            return 0;
        }

        auto* command = cca::cli::CommandRegistry::instance().find(command_name);
        if (!command) {
            std::cerr << "error: Unknown command '" << command_name << "'\n\n";
            print_help();
            return 2;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        return cca::cli::run_command(*command, args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred\n";
        return 1;
    }
}
