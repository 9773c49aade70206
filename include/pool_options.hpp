#ifndef TILEPOOL_POOL_OPTIONS_HPP
#define TILEPOOL_POOL_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <boost/property_tree/ptree.hpp>

namespace tilepool {

/* What `render_pool::acquire_or_create` does when a new key needs a
 * worker but every worker slot is already taken.
 */
enum class acquire_policy {
  // wait until a worker exits and frees its slot.
  blocking,
  // throw `pool_exhausted` straight away.
  non_blocking
};

struct pool_options {
  // defaults: 4 threads, one hour idle timeout, blocking.
  pool_options();

  /// number of worker slots, which is also the maximum number of
  /// distinct keys with live renderers at any one time. the reaper
  /// gets a thread of its own on top of these.
  std::size_t threads;

  /// how long a worker waits for a request before releasing its
  /// renderer and exiting.
  std::chrono::milliseconds idle_timeout;

  acquire_policy policy;
};

/* Reads options from a configuration tree such as:
 *
 *   { "threads": 8, "idle-timeout": 600, "policy": "non-blocking" }
 *
 * Missing keys keep their defaults. The idle timeout is in seconds
 * and may be fractional. Throws std::runtime_error for a zero thread
 * count, a negative timeout or an unknown policy, and
 * boost::property_tree::ptree_error for values of the wrong type.
 */
pool_options load_pool_options(const boost::property_tree::ptree &config);

// parses "blocking" or "non-blocking".
acquire_policy acquire_policy_from_string(const std::string &str);

std::ostream &operator<<(std::ostream &out, acquire_policy policy);

} // namespace tilepool

#endif // TILEPOOL_POOL_OPTIONS_HPP
