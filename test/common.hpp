#include <string>
#include <sstream>
#include <chrono>
#include <boost/function.hpp>
#include <boost/format.hpp>
#include <stdexcept>

namespace test{

template <typename T>
void assert_equal(T actual, T expected, std::string message = std::string()) {
   if (actual != expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_less_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual > expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_greater_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual < expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

/* runs the test function, formats the output nicely and returns 1
 * if the test failed.
 */
int run(const std::string &name, boost::function<void ()> test);

/* measures wall-clock time since construction, for tests which
 * check whether things did, or didn't, wait for each other.
 */
struct stopwatch {
   stopwatch();
   // milliseconds since construction.
   long long elapsed_ms() const;
private:
   std::chrono::steady_clock::time_point m_start;
};

/* a DSL to make JSON format files. this is nicer than simply
 * quoting the JSON file because C++ lacks heredoc support and
 * uses the same quote character as JSON, so the quoted strings
 * end up looking really ugly.
 */
struct json {
   enum type { type_NONE, type_DICT, type_LIST };

   json();
   json(const json &j);

   /* use operator() to add dictionary key-value entries.
    */
   template <typename T>
   json &operator()(const std::string &key, const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_DICT; }
      if (m_type != type_DICT) { throw std::runtime_error("Mixed type in JSON: expecting DICT."); }
      if (first) { m_buf << "{"; } else { m_buf << ","; }
      m_buf << "\"" << key << "\":";
      quote(t);
      return *this;
   }

   /* use operator[] to add list entries.
    */
   template <typename T>
   json &operator[](const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_LIST; }
      if (m_type != type_LIST) { throw std::runtime_error("Mixed type in JSON: expecting LIST."); }
      if (first) { m_buf << "["; } else { m_buf << ","; }
      quote(t);
      return *this;
   }

   friend std::ostream &operator<<(std::ostream &, const json &);

private:

   void quote(const json &);
   void quote(const std::string &);
   void quote(const char *);
   void quote(int);
   void quote(double);

   type m_type;
   std::ostringstream m_buf;
};

std::ostream &operator<<(std::ostream &, const json &);

} // namespace test
