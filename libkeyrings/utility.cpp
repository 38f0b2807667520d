/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "utility.h"

namespace keyrings {

KeyResult<std::string> ReadVariableLength(KeyCtlOperation operation, KeySerial id) {
  std::string buffer;
  while (true) {
    unsigned long address =
        buffer.empty() ? 0 : reinterpret_cast<unsigned long>(buffer.data());
    auto ret = Keyctl(operation, id.raw(), address, buffer.size());
    if (!ret.ok()) {
      return ret.error();
    }
    size_t needed = static_cast<size_t>(*ret);
    if (needed <= buffer.size()) {
      buffer.resize(needed);
      return buffer;
    }
    buffer.resize(needed);
  }
}

void StripTrailingNul(std::string* str) {
  if (!str->empty() && str->back() == '\0') {
    str->pop_back();
  }
}

}  // namespace keyrings
