#ifndef TILEPOOL_RENDER_POOL_HPP
#define TILEPOOL_RENDER_POOL_HPP

#include "channel.hpp"
#include "renderer.hpp"
#include "pool_options.hpp"

#include <memory>
#include <string>
#include <stdexcept>
#include <boost/noncopyable.hpp>

namespace tilepool {

/* Thrown by `acquire_or_create` under `acquire_policy::non_blocking`
 * when a new worker is needed but all slots are taken.
 */
struct pool_exhausted : public std::runtime_error {
  explicit pool_exhausted(const std::string &what);
};

/**
 * Keeps at most one live renderer per key, each owned by a worker
 * running on its own thread from a fixed set of slots.
 *
 * The renderers are built, used and destroyed entirely on their
 * worker's thread, and callers talk to them through a
 * `render_channel`. A worker which sees no requests for the idle
 * timeout releases its renderer, removes itself from the pool and
 * frees its slot. Once the pool is empty, the factory's
 * `global_cleanup` is run from a separate reaper thread.
 *
 * Destroying the pool disconnects every worker, waits for them to
 * exit and makes a final, unconditional call to `global_cleanup`.
 */
class render_pool : private boost::noncopyable {
public:
  render_pool(std::shared_ptr<renderer_factory> factory, const pool_options &options);
  ~render_pool();

  /* Returns the channel for the worker owning `key`'s renderer,
   * starting a new worker if there isn't one.
   *
   * The pool's lock is never held while the renderer is built, but
   * this call does wait for the result, so the channel returned is
   * always connected to a constructed renderer (unless it idles out
   * in the meantime).
   *
   * Throws `construction_failure` if the renderer couldn't be built;
   * nothing is left in the pool in that case, so a later call will
   * try again. Throws `pool_exhausted` if no slot is free and the
   * policy is non-blocking; otherwise blocks until one frees up.
   */
  render_channel acquire_or_create(const std::string &key);

  // number of keys with live workers.
  std::size_t size() const;

  bool contains(const std::string &key) const;

  // number of worker slots the pool was created with.
  std::size_t slots() const;

private:
  struct impl;
  std::unique_ptr<impl> m_impl;
};

} // namespace tilepool

#endif // TILEPOOL_RENDER_POOL_HPP
