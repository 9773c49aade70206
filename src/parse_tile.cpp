#include "parse_tile.hpp"

#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace tilepool {

bool parse_tile(const std::string &str, tile &t)
{
  std::vector<std::string> splits;
  boost::algorithm::split(splits, str, boost::algorithm::is_any_of("/."));

  // drop a leading / and a trailing extension, if present, which
  // should leave exactly 3 numbers.
  std::size_t begin = 0, end = splits.size();
  if ((end > 0) && splits[0].empty()) {
    ++begin;
  }
  const std::size_t dot = str.find('.');
  const bool has_extension = (dot != std::string::npos) &&
    ((str.rfind('/') == std::string::npos) || (dot > str.rfind('/')));
  if (((end - begin) == 4) && has_extension) {
    if (splits[end - 1].empty()) {
      return false;
    }
    --end;
  }

  if ((end - begin) != 3) {
    return false;
  }

  try {
    const int z = boost::lexical_cast<int>(splits[begin]);
    const int x = boost::lexical_cast<int>(splits[begin + 1]);
    const int y = boost::lexical_cast<int>(splits[begin + 2]);

    if ((z < 0) || (x < 0) || (y < 0)) {
      return false;
    }

    tile parsed(z, x, y);
    if (!parsed.valid()) {
      return false;
    }

    t = parsed;
    return true;

  } catch (const boost::bad_lexical_cast &) {
    return false;
  }
}

} // namespace tilepool
