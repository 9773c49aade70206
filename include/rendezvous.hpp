#ifndef TILEPOOL_RENDEZVOUS_HPP
#define TILEPOOL_RENDEZVOUS_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <condition_variable>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

namespace tilepool {

/* A zero-capacity channel: `send` doesn't return until a receiver
 * has taken the value, so neither side ever buffers anything.
 *
 * Any number of threads may send; values are handed over one at a
 * time. Once closed, all pending and future sends fail and the
 * receiver sees `closed`.
 */
template <typename T>
class rendezvous : private boost::noncopyable {
public:
  enum class recv_status { ok, timeout, closed };

  rendezvous() : m_closed(false), m_sent(0), m_taken(0) {}

  /* Blocks until a receiver takes the value. Returns false if the
   * channel was closed before that happened, in which case the value
   * has been discarded.
   */
  bool send(T &&value) {
    std::unique_lock<std::mutex> lock(m_mutex);

    // wait for any other sender's value to be collected first.
    m_cond.wait(lock, [this]() { return m_closed || !m_slot; });
    if (m_closed) {
      return false;
    }

    m_slot = std::move(value);
    const std::uint64_t ticket = ++m_sent;
    m_cond.notify_all();

    m_cond.wait(lock, [this, ticket]() { return m_closed || (m_taken >= ticket); });
    if (m_taken >= ticket) {
      return true;
    }

    // closed with our value still in the slot.
    m_slot = boost::none;
    m_cond.notify_all();
    return false;
  }

  /* Waits up to `timeout` for a sender. On `ok` the value has been
   * moved into `out`.
   */
  template <typename Rep, typename Period>
  recv_status recv(T &out, const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_cond.wait_for(lock, timeout, [this]() { return m_closed || bool(m_slot); });

    if (m_closed) {
      return recv_status::closed;
    }
    if (!m_slot) {
      return recv_status::timeout;
    }

    out = std::move(*m_slot);
    m_slot = boost::none;
    ++m_taken;
    m_cond.notify_all();
    return recv_status::ok;
  }

  void close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    m_cond.notify_all();
  }

private:
  std::mutex m_mutex;
  std::condition_variable m_cond;
  bool m_closed;
  boost::optional<T> m_slot;
  // number of values handed to the slot, and collected from it.
  std::uint64_t m_sent, m_taken;
};

} // namespace tilepool

#endif // TILEPOOL_RENDEZVOUS_HPP
