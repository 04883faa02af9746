#ifndef TETRIS_SERIALIZATION_FOAM_FORMAT_HPP
#define TETRIS_SERIALIZATION_FOAM_FORMAT_HPP

#include <math/vec3.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace tetris::foam {

// Fixed notation, 6 decimals: 1.0 -> "1.000000"
std::string coordinate(double value);

// "(x y z)" with every component in coordinate() form
std::string point(const Vec3& p);

// Shortest form that reads back to the same double: 1.0 -> "1",
// 1234.5678 -> "1234.5678"
std::string number(double value);

// " // text", or nothing for empty text
std::string comment(std::string_view text);

// "(a b c)"
std::string list(const std::vector<std::string>& items);

template <typename Range, typename Fn>
std::string list(const Range& range, Fn&& to_text) {
    std::vector<std::string> items;
    for (const auto& item : range) {
        items.push_back(to_text(item));
    }
    return list(items);
}

}  // namespace tetris::foam

#endif // TETRIS_SERIALIZATION_FOAM_FORMAT_HPP
