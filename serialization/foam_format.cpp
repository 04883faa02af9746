#include "foam_format.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip>
#include <sstream>

namespace tetris::foam {

std::string coordinate(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6) << value;
    return ss.str();
}

std::string point(const Vec3& p) {
    return "(" + coordinate(p.x) + " " + coordinate(p.y) + " " + coordinate(p.z) + ")";
}

std::string number(double value) {
    return fmt::format("{}", value);
}

std::string comment(std::string_view text) {
    if (text.empty()) {
        return "";
    }
    return " // " + std::string(text);
}

std::string list(const std::vector<std::string>& items) {
    std::string result = "(";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            result += " ";
        }
        result += items[i];
    }
    return result + ")";
}

}  // namespace tetris::foam
