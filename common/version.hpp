#ifndef TETRIS_COMMON_VERSION_HPP
#define TETRIS_COMMON_VERSION_HPP

namespace tetris {

constexpr const char* TETRIS_VERSION = "0.3.0";

}  // namespace tetris

#endif // TETRIS_COMMON_VERSION_HPP
