#ifndef TETRIS_SERIALIZATION_RENDER_OPTIONS_HPP
#define TETRIS_SERIALIZATION_RENDER_OPTIONS_HPP

#include <common/errors.hpp>
#include <common/version.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace tetris {

// Value of the `format` entry in the FoamFile header
enum class DocumentFormat {
    Ascii,
    Binary
};

inline std::string_view to_string(DocumentFormat format) {
    return format == DocumentFormat::Binary ? "binary" : "ascii";
}

inline DocumentFormat document_format_from_string(std::string_view name) {
    if (name == "ascii") return DocumentFormat::Ascii;
    if (name == "binary") return DocumentFormat::Binary;
    throw ConfigurationError("Unknown document format: " + std::string(name));
}

// Everything the writer needs besides the mesh itself
struct RenderOptions {
    std::string header;                     // Free text after the banner line
    std::string footer;                     // Free text after the closing line
    std::string version = TETRIS_VERSION;   // Shown in the banner line
    DocumentFormat format = DocumentFormat::Ascii;
    bool fast_merge = true;
    std::optional<double> merge_tolerance;
};

}  // namespace tetris

#endif // TETRIS_SERIALIZATION_RENDER_OPTIONS_HPP
