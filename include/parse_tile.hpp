#ifndef TILEPOOL_PARSE_TILE_HPP
#define TILEPOOL_PARSE_TILE_HPP

#include "tile.hpp"

#include <string>

namespace tilepool {

/* Parses a tile address of the form "z/x/y", optionally with a
 * leading "/" and a trailing extension such as ".png". Returns false,
 * leaving `t` untouched, if the string isn't of that form or the
 * coordinates are out of range for the zoom level.
 */
bool parse_tile(const std::string &str, tile &t);

} // namespace tilepool

#endif // TILEPOOL_PARSE_TILE_HPP
