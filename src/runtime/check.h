/*
 * Copyright 2025 The gRPC Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef NET_PROTORPC_RUNTIME_CHECK_H_
#define NET_PROTORPC_RUNTIME_CHECK_H_

#include <iostream>
#include <stdlib.h> // for abort()

namespace protorpc {

class LogHelper {
  std::ostream *os;

public:
  LogHelper(std::ostream *os) : os(os) {}
  [[noreturn]] ~LogHelper() {
    *os << std::endl;
    ::abort();
  }
  std::ostream &get_os() { return *os; }
};

} // namespace protorpc

// Abort the program after logging the message if the given condition is not
// true. Otherwise, do nothing.
#define PROTORPC_CHECK(x)                                                      \
  !(x) && ::protorpc::LogHelper(&std::cerr).get_os()                           \
              << "CHECK FAILED: " << __FILE__ << ":" << __LINE__ << ": "

// Abort the program after logging the message.
#define PROTORPC_FAIL PROTORPC_CHECK(false)

#endif // NET_PROTORPC_RUNTIME_CHECK_H_
