#ifndef TETRIS_SERIALIZATION_CONFIG_JSON_HPP
#define TETRIS_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <blockmesh/geometry.hpp>
#include <common/errors.hpp>
#include <math/vec3.hpp>
#include <serialization/render_options.hpp>

namespace tetris {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw ConfigurationError("Expected a point as an array of 3 numbers, got " + j.dump());
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
    v.z = j[2].get<double>();
}

// Geometry serialization
inline void to_json(nlohmann::json& j, const Geometry& geometry) {
    j = {
        {"name", geometry.name},
        {"file", geometry.file},
        {"type", geometry.type}
    };
}

inline void from_json(const nlohmann::json& j, Geometry& geometry) {
    geometry.name = j.at("name").get<std::string>();
    geometry.file = j.value("file", "");
    geometry.type = j.value("type", "triSurfaceMesh");
}

// RenderOptions serialization
inline void to_json(nlohmann::json& j, const RenderOptions& options) {
    j = {
        {"header", options.header},
        {"footer", options.footer},
        {"version", options.version},
        {"format", std::string(to_string(options.format))},
        {"fast_merge", options.fast_merge}
    };
    if (options.merge_tolerance) {
        j["merge_tolerance"] = *options.merge_tolerance;
    }
}

inline void from_json(const nlohmann::json& j, RenderOptions& options) {
    options.header = j.value("header", "");
    options.footer = j.value("footer", "");
    options.version = j.value("version", std::string(TETRIS_VERSION));
    options.format = document_format_from_string(j.value("format", "ascii"));
    options.fast_merge = j.value("fast_merge", true);
    if (j.contains("merge_tolerance")) {
        options.merge_tolerance = j["merge_tolerance"].get<double>();
    } else {
        options.merge_tolerance.reset();
    }
}

}  // namespace tetris

#endif // TETRIS_SERIALIZATION_CONFIG_JSON_HPP
