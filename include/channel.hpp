#ifndef TILEPOOL_CHANNEL_HPP
#define TILEPOOL_CHANNEL_HPP

#include "tile.hpp"
#include "rendezvous.hpp"
#include "render_result.hpp"

#include <future>
#include <memory>

namespace tilepool {

/* A request travelling to a worker. Each request carries its own
 * reply slot, so concurrent callers sharing a channel can never
 * receive each other's images.
 */
struct render_request {
  render_request();
  explicit render_request(const extent &bbox_);

  extent bbox;
  std::promise<render_response> reply;
};

typedef rendezvous<render_request> request_queue;

/* Handle used to talk to the worker which owns the renderer for a
 * key. Copies are cheap and all refer to the same worker.
 */
class render_channel {
public:
  // creates a new, unconnected request queue.
  render_channel();

  /* Sends the extent to the worker, blocking until the worker picks
   * it up, and then until its reply arrives. If the worker has
   * already exited the response carries
   * `render_status::worker_unavailable`.
   */
  render_response render(const extent &bbox) const;

  // the receiving end, for the worker.
  std::shared_ptr<request_queue> queue() const;

  // disconnect the worker. subsequent renders fail.
  void close() const;

private:
  std::shared_ptr<request_queue> m_queue;
};

} // namespace tilepool

#endif // TILEPOOL_CHANNEL_HPP
