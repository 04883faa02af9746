#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>
#include <common/version.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <mesh.json>\n";
    std::cerr << "\n";
    std::cerr << "Writes OpenFOAM blockMeshDict files from JSON mesh descriptions.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  render      Write the blockMeshDict to a file\n";
    std::cerr << "  print       Write the blockMeshDict to stdout\n";
    std::cerr << "  info        Print element counts as JSON\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>   Output file (render defaults to <mesh>.blockMeshDict)\n";
    std::cerr << "  -c, --config <path>   Render configuration (JSON)\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  --version             Show the version\n";
    std::cerr << "  --help                Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  TETRIS_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "--version") {
        std::cout << "tetris " << tetris::TETRIS_VERSION << "\n";
        return 0;
    }

    tetris::logging::get_logger()->debug("Running command: {}", command);

    if (command == "render") {
        return tetris::cli::command_render(argc, argv);
    }
    if (command == "print") {
        return tetris::cli::command_print(argc, argv);
    }
    if (command == "info") {
        return tetris::cli::command_info(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
