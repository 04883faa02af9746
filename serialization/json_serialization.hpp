#ifndef TETRIS_SERIALIZATION_JSON_SERIALIZATION_HPP
#define TETRIS_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <common/errors.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace tetris::json {

// Read JSON from file. Syntax errors are reported as ConfigurationError
// naming the file.
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
}

// Write JSON to file
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);  // Pretty print with 2-space indent
}

}  // namespace tetris::json

#endif // TETRIS_SERIALIZATION_JSON_SERIALIZATION_HPP
