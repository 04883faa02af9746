#include "cli_common.hpp"
#include <serialization/mesh_json.hpp>
#include <iostream>

namespace tetris::cli {

int command_info(int argc, char** argv) {
    auto log = tetris::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: tetris info <mesh.json> [-o <stats.json>]\n";
            return 1;
        }

        MeshDescription description = mesh_from_json(json::read_json_file(ctx.input_path));
        nlohmann::json stats = mesh_stats(description.mesh);
        stats["source_file"] = ctx.input_path;

        if (ctx.output_path.empty()) {
            std::cout << stats.dump(2) << "\n";
        } else {
            json::write_json_file(ctx.output_path, stats);
            log->info("Wrote mesh stats to {}", ctx.output_path);
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace tetris::cli
