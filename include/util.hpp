#ifndef TILEPOOL_UTIL_HPP
#define TILEPOOL_UTIL_HPP

namespace tilepool { namespace util {

// equatorial radius of the WGS84 ellipsoid, and the length of
// the equator, in metres.
extern const double earth_radius;
extern const double earth_circumference;

// projects a longitude and latitude, in degrees, into mercator
// coordinates.
void lonlat_to_merc(double lon, double lat, double &x, double &y);

} } // namespace tilepool::util

#endif // TILEPOOL_UTIL_HPP
