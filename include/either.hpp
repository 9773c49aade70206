#ifndef TILEPOOL_EITHER_HPP
#define TILEPOOL_EITHER_HPP

#include <utility>
#include <boost/variant.hpp>

namespace tilepool {

/* Sum of two types: by convention a result on the left and a
 * description of why there isn't one on the right.
 *
 * Replies travel from worker threads to callers through promises,
 * where a plain value is much easier to move around than an
 * exception.
 */
template <typename L, typename R>
struct either {
   inline either(const either<L, R> &other) : m_impl(other.m_impl) {}
   inline either(either<L, R> &&other) : m_impl(std::move(other.m_impl)) {}
   inline explicit either(const L &left) : m_impl(left) {}
   inline explicit either(L &&left) : m_impl(std::move(left)) {}
   inline explicit either(const R &right) : m_impl(right) {}
   inline explicit either(R &&right) : m_impl(std::move(right)) {}

   inline either<L, R> &operator=(const either<L, R> &other) { m_impl = other.m_impl; return *this; }
   inline either<L, R> &operator=(either<L, R> &&other) { m_impl = std::move(other.m_impl); return *this; }

   inline bool is_left() const { return boost::get<L>(&m_impl) != nullptr; }
   inline bool is_right() const { return !is_left(); }

   inline const L &left() const { return *boost::get<L>(&m_impl); }
   inline const R &right() const { return *boost::get<R>(&m_impl); }

private:
   boost::variant<L, R> m_impl;
};

} // namespace tilepool

#endif // TILEPOOL_EITHER_HPP
