#include "cli_common.hpp"
#include <serialization/block_mesh_dict.hpp>
#include <serialization/mesh_json.hpp>
#include <iostream>

namespace tetris::cli {

int command_render(int argc, char** argv) {
    auto log = tetris::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: tetris render <mesh.json> [-o <blockMeshDict>] [-c <config.json>]\n";
            return 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".blockMeshDict",
                                                      ctx.output_path);
        RenderOptions options = load_render_options(ctx);

        log->info("Loading mesh: {}", ctx.input_path);
        MeshDescription description = mesh_from_json(json::read_json_file(ctx.input_path));

        write_block_mesh_dict(output_path, description.mesh, options);

        log->info("Wrote blockMeshDict to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << description.mesh.blocks().size() << " blocks, "
                  << description.mesh.vertices().size() << " vertices)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace tetris::cli
