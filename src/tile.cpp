#include "tile.hpp"
#include "util.hpp"

#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/algorithm/string/replace.hpp>

namespace tilepool {

namespace {

// converts a coordinate normalised to [0, 1) into a tile index at
// a zoom level with `num_tiles` tiles per axis, clamping values
// outside that range to the edge tiles.
unsigned int tile_index(double normalised, unsigned int num_tiles) {
  if (normalised <= 0.0) {
    return 0;

  } else if (normalised >= 1.0) {
    return num_tiles - 1;

  } else {
    return static_cast<unsigned int>(std::floor(normalised * num_tiles));
  }
}

} // anonymous namespace

extent::extent()
  : minx(0.0), miny(0.0), maxx(0.0), maxy(0.0) {
}

extent::extent(double minx_, double miny_, double maxx_, double maxy_)
  : minx(minx_), miny(miny_), maxx(maxx_), maxy(maxy_) {
}

bool extent::contains(double x, double y) const {
  return (x >= minx) && (x <= maxx) && (y >= miny) && (y <= maxy);
}

bool operator==(const extent &a, const extent &b) {
  return (a.minx == b.minx) && (a.miny == b.miny) &&
    (a.maxx == b.maxx) && (a.maxy == b.maxy);
}

bool operator!=(const extent &a, const extent &b) {
  return !(a == b);
}

std::ostream &operator<<(std::ostream &out, const extent &e) {
  out << boost::format("%.9f,%.9f,%.9f,%.9f") % e.minx % e.miny % e.maxx % e.maxy;
  return out;
}

tile::tile()
  : z(0), x(0), y(0) {
}

tile::tile(unsigned int z_, unsigned int x_, unsigned int y_)
  : z(z_), x(x_), y(y_) {
}

tile tile::from_coordinates(double lon, double lat, unsigned int z) {
  if (z >= 32) {
    throw std::invalid_argument((boost::format("Zoom level %1% is too deep, tile "
                                               "coordinates would overflow.") % z).str());
  }

  const double lat_sin = std::sin(lat * M_PI / 180.0);
  const unsigned int num_tiles = 1u << z;

  const double nx = 0.5 + lon / 360.0;
  const double ny = 0.5 - 0.25 * std::log((1.0 + lat_sin) / (1.0 - lat_sin)) / M_PI;

  return tile(z, tile_index(nx, num_tiles), tile_index(ny, num_tiles));
}

bool tile::valid() const {
  if (z >= 32) {
    return false;
  }
  const unsigned long long num_tiles = 1ull << z;
  return (x < num_tiles) && (y < num_tiles);
}

std::vector<tile> tile::children(unsigned int target_zoom) const {
  if (target_zoom < z) {
    throw std::invalid_argument((boost::format("Target zoom %1% is shallower "
                                               "than tile %2%.") % target_zoom % *this).str());
  }

  std::vector<tile> tiles;
  tiles.push_back(*this);

  // each pass splits the tiles added by the previous pass into
  // their four quadrants at the next zoom level.
  std::size_t level_begin = 0;
  for (unsigned int zoom = z; zoom < target_zoom; ++zoom) {
    const std::size_t level_end = tiles.size();
    for (std::size_t i = level_begin; i < level_end; ++i) {
      const unsigned int px = tiles[i].x, py = tiles[i].y;
      tiles.push_back(tile(zoom + 1, 2 * px,     2 * py));
      tiles.push_back(tile(zoom + 1, 2 * px + 1, 2 * py));
      tiles.push_back(tile(zoom + 1, 2 * px + 1, 2 * py + 1));
      tiles.push_back(tile(zoom + 1, 2 * px,     2 * py + 1));
    }
    level_begin = level_end;
  }

  std::reverse(tiles.begin(), tiles.end());
  return tiles;
}

bool operator==(const tile &a, const tile &b) {
  return (a.z == b.z) && (a.x == b.x) && (a.y == b.y);
}

bool operator!=(const tile &a, const tile &b) {
  return !(a == b);
}

std::ostream &operator<<(std::ostream &out, const tile &t) {
  out << t.z << "/" << t.x << "/" << t.y;
  return out;
}

extent bounding_box(const tile &t) {
  const double half_world = 0.5 * util::earth_circumference;
  const double tile_size = util::earth_circumference / std::pow(2.0, double(t.z));

  const double minx = t.x * tile_size - half_world;
  const double maxy = half_world - t.y * tile_size;

  return extent(minx, maxy - tile_size, minx + tile_size, maxy);
}

std::string url_zxy(const tile &t, const std::string &pattern) {
  std::string url(pattern);
  boost::algorithm::replace_all(url, "{z}", (boost::format("%1%") % t.z).str());
  boost::algorithm::replace_all(url, "{x}", (boost::format("%1%") % t.x).str());
  boost::algorithm::replace_all(url, "{y}", (boost::format("%1%") % t.y).str());
  return url;
}

std::string url_wms(const tile &t, const std::string &pattern) {
  const extent bbox = bounding_box(t);
  std::string url(pattern);
  boost::algorithm::replace_all(url, "{bbox}", (boost::format("%1%") % bbox).str());
  boost::algorithm::replace_all(url, "{srs}", "EPSG:3857");
  return url;
}

} // namespace tilepool
