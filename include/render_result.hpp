#ifndef TILEPOOL_RENDER_RESULT_HPP
#define TILEPOOL_RENDER_RESULT_HPP

#include "either.hpp"

#include <cstdint>
#include <string>
#include <ostream>

namespace tilepool {

/* Status codes for failed renders. Like the codes they're modelled
 * on, HTTP status codes, they make it easy to see at a glance what
 * went wrong and map directly onto a reply for a web front end.
 */
enum class render_status : std::uint16_t {
  /* the renderer couldn't draw this particular extent. the worker
   * carries on serving other requests. */
  render_failed = 500,
  /* the worker owning the renderer has already exited, most likely
   * because it was idle for too long. calling `acquire_or_create`
   * again for the same key will start a new one. */
  worker_unavailable = 503,
};

/* Describes why a render didn't produce any bytes.
 */
struct render_result {
  render_result(render_status status_, const std::string &message_);

  render_status status;
  std::string message;
};

// either the encoded image or the reason there isn't one.
typedef either<std::string, render_result> render_response;

std::ostream &operator<<(std::ostream &out, render_status status);
std::ostream &operator<<(std::ostream &out, const render_result &result);

} // namespace tilepool

#endif // TILEPOOL_RENDER_RESULT_HPP
