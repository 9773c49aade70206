#include "pool_options.hpp"

#include <stdexcept>
#include <boost/format.hpp>

namespace pt = boost::property_tree;

namespace {

const std::size_t DEFAULT_THREADS = 4;
const std::chrono::milliseconds DEFAULT_IDLE_TIMEOUT(3600 * 1000);

// like ptree::get_optional, except that a value which is present but
// can't be converted throws rather than being treated as missing.
template <typename T>
boost::optional<T> get_checked(const pt::ptree &config, const std::string &key) {
  boost::optional<const pt::ptree &> child = config.get_child_optional(key);
  if (!child) {
    return boost::none;
  }
  return child->get_value<T>();
}

} // anonymous namespace

namespace tilepool {

pool_options::pool_options()
  : threads(DEFAULT_THREADS),
    idle_timeout(DEFAULT_IDLE_TIMEOUT),
    policy(acquire_policy::blocking) {
}

pool_options load_pool_options(const pt::ptree &config) {
  pool_options options;

  boost::optional<int> threads = get_checked<int>(config, "threads");
  if (threads) {
    if (*threads <= 0) {
      throw std::runtime_error((boost::format("Number of threads must be positive, "
                                              "not %1%.") % *threads).str());
    }
    options.threads = std::size_t(*threads);
  }

  boost::optional<double> timeout = get_checked<double>(config, "idle-timeout");
  if (timeout) {
    if (*timeout < 0.0) {
      throw std::runtime_error((boost::format("Idle timeout must not be negative, "
                                              "not %1%.") % *timeout).str());
    }
    options.idle_timeout = std::chrono::milliseconds(static_cast<long long>(*timeout * 1000.0));
  }

  boost::optional<std::string> policy = get_checked<std::string>(config, "policy");
  if (policy) {
    options.policy = acquire_policy_from_string(*policy);
  }

  return options;
}

acquire_policy acquire_policy_from_string(const std::string &str) {
  if (str == "blocking") {
    return acquire_policy::blocking;

  } else if (str == "non-blocking") {
    return acquire_policy::non_blocking;
  }

  throw std::runtime_error((boost::format("Unknown acquire policy \"%1%\", expected "
                                          "\"blocking\" or \"non-blocking\".") % str).str());
}

std::ostream &operator<<(std::ostream &out, acquire_policy policy) {
  switch (policy) {
  case acquire_policy::blocking:     out << "blocking";     break;
  case acquire_policy::non_blocking: out << "non-blocking"; break;
  default:
    out << "*** Unknown policy ***";
  }
  return out;
}

} // namespace tilepool
