#include "patch.hpp"
#include <common/errors.hpp>

namespace tetris {

Patch::Patch(std::string name, std::string type, std::vector<FaceVertices> faces)
    : name_(std::move(name)), type_(std::move(type))
{
    if (name_.empty()) {
        throw ConfigurationError("Patch name must not be empty");
    }
    if (type_.empty()) {
        throw ConfigurationError("Patch '" + name_ + "' has no type");
    }
    for (const auto& face : faces) {
        add_face(face);
    }
}

void Patch::add_face(const FaceVertices& face) {
    for (const auto& v : face) {
        if (!v) {
            throw TypeContractError("Patch '" + name_ + "': face with a null vertex");
        }
    }
    faces_.push_back(face);
}

}  // namespace tetris
