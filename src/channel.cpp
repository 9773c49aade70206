#include "channel.hpp"

namespace tilepool {

render_request::render_request()
  : bbox(), reply() {
}

render_request::render_request(const extent &bbox_)
  : bbox(bbox_), reply() {
}

render_channel::render_channel()
  : m_queue(std::make_shared<request_queue>()) {
}

render_response render_channel::render(const extent &bbox) const {
  render_request req(bbox);
  std::future<render_response> reply = req.reply.get_future();

  if (!m_queue->send(std::move(req))) {
    return render_response(render_result(render_status::worker_unavailable,
                                         "worker has exited"));
  }

  return reply.get();
}

std::shared_ptr<request_queue> render_channel::queue() const {
  return m_queue;
}

void render_channel::close() const {
  m_queue->close();
}

} // namespace tilepool
