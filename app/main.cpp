#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <input.step>\n";
    std::cerr << "\n";
    std::cerr << "Converts thin solids in a STEP (ISO 10303-21) model to a laser-cut SVG layout.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  convert     Write the cutting layout (.svg) for all plates of the target thickness\n";
    std::cerr << "  inspect     Report solids, extents and faces as JSON without writing SVG\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  LASERCUT_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    auto log = lasercut::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    log->debug("Command: {}", command);
    if (command == "convert") {
        return lasercut::cli::command_convert(argc, argv);
    }
    if (command == "inspect") {
        return lasercut::cli::command_inspect(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
