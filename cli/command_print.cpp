#include "cli_common.hpp"
#include <serialization/block_mesh_dict.hpp>
#include <serialization/mesh_json.hpp>
#include <iostream>

namespace tetris::cli {

int command_print(int argc, char** argv) {
    auto log = tetris::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: tetris print <mesh.json> [-c <config.json>]\n";
            return 1;
        }

        RenderOptions options = load_render_options(ctx);
        MeshDescription description = mesh_from_json(json::read_json_file(ctx.input_path));

        print_block_mesh_dict(std::cout, description.mesh, options);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace tetris::cli
