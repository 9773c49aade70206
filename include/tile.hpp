#ifndef TILEPOOL_TILE_HPP
#define TILEPOOL_TILE_HPP

#include <string>
#include <vector>
#include <ostream>

namespace tilepool {

/* Axis-aligned rectangle in web mercator (EPSG:3857) metres.
 */
struct extent {
  extent();
  extent(double minx_, double miny_, double maxx_, double maxy_);

  double width() const { return maxx - minx; }
  double height() const { return maxy - miny; }

  // true if the point lies within the extent, edges included.
  bool contains(double x, double y) const;

  double minx, miny, maxx, maxy;
};

bool operator==(const extent &a, const extent &b);
bool operator!=(const extent &a, const extent &b);
std::ostream &operator<<(std::ostream &, const extent &);

/**
 * Address of a tile in the conventional web mercator quadtree. x=0
 * is west-most and increases heading east, y=0 is north-most and
 * increases heading south.
 */
struct tile {
  tile();
  tile(unsigned int z_, unsigned int x_, unsigned int y_);

  /* Returns the tile at zoom `z` which contains the given longitude
   * and latitude, in degrees. Coordinates beyond the edges of the
   * mercator square are clamped to the edge tiles.
   *
   * Throws std::invalid_argument if `z` is 32 or more.
   */
  static tile from_coordinates(double lon, double lat, unsigned int z);

  // true if x and y are both less than 2^z.
  bool valid() const;

  /* Returns this tile and all of its descendants down to (and
   * including) `target_zoom`, deepest tiles first. The last element
   * is always this tile.
   *
   * Throws std::invalid_argument if `target_zoom` < z.
   */
  std::vector<tile> children(unsigned int target_zoom) const;

  unsigned int z, x, y;
};

bool operator==(const tile &a, const tile &b);
bool operator!=(const tile &a, const tile &b);
std::ostream &operator<<(std::ostream &, const tile &);

// bounding box of the tile in mercator coordinates.
extent bounding_box(const tile &t);

// substitutes {z}, {x} and {y} in the template with the tile's
// coordinates.
std::string url_zxy(const tile &t, const std::string &pattern);

// substitutes {bbox} with the tile's comma-separated mercator
// bounding box and {srs} with EPSG:3857, as a WMS GetMap request
// would need.
std::string url_wms(const tile &t, const std::string &pattern);

} // namespace tilepool

#endif // TILEPOOL_TILE_HPP
