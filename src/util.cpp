#include "util.hpp"

#include <cmath>

namespace tilepool { namespace util {

const double earth_radius = 6378137.0;
const double earth_circumference = 2.0 * M_PI * earth_radius;

void lonlat_to_merc(double lon, double lat, double &x, double &y) {
  const double lat_rad = lat * M_PI / 180.0;

  x = earth_radius * lon * M_PI / 180.0;
  y = earth_radius * std::log(std::tan(0.25 * M_PI + 0.5 * lat_rad));
}

} } // namespace tilepool::util
