#include "render_result.hpp"

namespace tilepool {

render_result::render_result(render_status status_, const std::string &message_)
  : status(status_), message(message_) {
}

std::ostream &operator<<(std::ostream &out, render_status status) {
  switch (status) {
  case render_status::render_failed:      out << "Render Failed";      break;
  case render_status::worker_unavailable: out << "Worker Unavailable"; break;
  default:
    out << "*** Unknown status ***";
  }
  return out;
}

std::ostream &operator<<(std::ostream &out, const render_result &result) {
  out << result.status;
  if (!result.message.empty()) {
    out << ": " << result.message;
  }
  return out;
}

} // namespace tilepool
