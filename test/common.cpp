/*------------------------------------------------------------------------------
 *
 *  This file is part of tilepool, and derives from the test harness of
 *  avecado.
 *
 *  Author: matt.amos@mapquest.com
 *
 *  Copyright 2010-1 Mapquest, Inc.  All Rights reserved.
 *
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 *
 *-----------------------------------------------------------------------------*/

#include "common.hpp"
#include <exception>
#include <stdexcept>
#include <iomanip>
#include <iostream>

using boost::function;
using std::exception;
using std::cout;
using std::cerr;
using std::endl;
using std::setw;
using std::flush;
using std::string;

#define TEST_NAME_WIDTH (45)

namespace {

void unwind_nested_exception(std::ostream &out, const std::exception &e) {
  out << e.what();
  try {
    std::rethrow_if_nested(e);

  } catch (const std::exception &nested) {
    out << ". Caused by: ";
    unwind_nested_exception(out, nested);

  } catch (...) {
    out << ". Caused by UNKNOWN EXCEPTION";
  }
}

} // anonymous namespace

namespace test {

int run(const string &name, function<void ()> test) {
  cout << setw(TEST_NAME_WIDTH) << name << flush;
  try {
    test();
    cout << "  [PASS]" << endl;
    return 0;

  } catch (const exception &ex) {
    cout << "  [FAIL: ";
    unwind_nested_exception(cout, ex);
    cout << "]" << endl;
    return 1;

  } catch (...) {
    cerr << "  [FAIL: Unexpected error]" << endl;
    throw;
  }
}

stopwatch::stopwatch() : m_start(std::chrono::steady_clock::now()) {}

long long stopwatch::elapsed_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - m_start).count();
}

json::json() : m_type(json::type_NONE) {}
json::json(const json &j) : m_type(j.m_type), m_buf(j.m_buf.str(), std::ios_base::out | std::ios_base::ate) {}

std::ostream &operator<<(std::ostream &out, const json &j) {
   if (j.m_type == json::type_NONE) {
      out << "null";

   } else {
      out << j.m_buf.str();
      if (j.m_type == json::type_DICT) {
         out << "}";
      } else {
         out << "]";
      }
   }
   return out;
}

void json::quote(const json &j) { m_buf << j; }
void json::quote(const std::string &s) { m_buf << "\"" << s << "\""; }
void json::quote(const char *s) { m_buf << "\"" << s << "\""; }
void json::quote(int i) { m_buf << i; }
void json::quote(double d) { m_buf << d; }

} // namespace test
