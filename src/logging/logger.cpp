#include "logging/logger.hpp"

#include <atomic>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace tilepool { namespace logging {

namespace {

std::atomic<int> g_level(static_cast<int>(boost::log::trivial::trace));

} // anonymous namespace

void set_level(severity lvl) {
  g_level.store(static_cast<int>(lvl));
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= lvl);
}

severity level() {
  return static_cast<severity>(g_level.load());
}

severity severity_from_string(const std::string &str) {
  severity lvl = boost::log::trivial::info;
  if (!boost::log::trivial::from_string(str.c_str(), str.size(), lvl)) {
    throw std::runtime_error((boost::format("Unknown log level \"%1%\".") % str).str());
  }
  return lvl;
}

} } // namespace tilepool::logging
