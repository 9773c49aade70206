#ifndef TILEPOOL_RENDERER_HPP
#define TILEPOOL_RENDERER_HPP

#include "tile.hpp"

#include <memory>
#include <string>
#include <stdexcept>
#include <boost/noncopyable.hpp>

namespace tilepool {

/* Thrown by `renderer_factory::construct` when a renderer can't be
 * built from its key, for example because the map definition is
 * malformed.
 */
struct construction_failure : public std::runtime_error {
  explicit construction_failure(const std::string &what);
};

/* Thrown by `renderer::render` when a single extent can't be
 * rendered. The renderer is expected to still be usable afterwards.
 */
struct render_failure : public std::runtime_error {
  explicit render_failure(const std::string &what);
};

/* A stateful, expensive-to-build object which turns extents into
 * encoded images.
 *
 * Implementations are not expected to be thread-safe. The pool
 * guarantees that a renderer is constructed, used and destroyed on
 * a single thread, and that it is never shared.
 */
struct renderer : private boost::noncopyable {
  virtual ~renderer();

  /// render the extent, returning the encoded image bytes.
  virtual std::string render(const extent &bbox) = 0;
};

/* Creates `renderer` objects, and owns whatever process-wide state
 * they share.
 *
 * `construct` is called from worker threads, possibly several at
 * once for different keys. `global_cleanup` tears down the state
 * shared by all renderers, so it must only be called when no
 * renderer is alive. The pool makes sure that is the case.
 */
struct renderer_factory : private boost::noncopyable {
  virtual ~renderer_factory();

  /// build a renderer from its key, which is the full description
  /// of its configuration. throws `construction_failure` on error.
  virtual std::unique_ptr<renderer> construct(const std::string &key) = 0;

  /// release caches and other global state held on behalf of
  /// renderers.
  virtual void global_cleanup() = 0;
};

} // namespace tilepool

#endif // TILEPOOL_RENDERER_HPP
