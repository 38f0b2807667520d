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

#include <keyrings/permissions.h>

namespace keyrings {

namespace {

void AppendClass(uint8_t rights, std::string* out) {
  out->push_back(rights & Permission::kSetAttr ? 'a' : '-');
  out->push_back(rights & Permission::kLink ? 'l' : '-');
  out->push_back(rights & Permission::kSearch ? 's' : '-');
  out->push_back(rights & Permission::kWrite ? 'w' : '-');
  out->push_back(rights & Permission::kRead ? 'r' : '-');
  out->push_back(rights & Permission::kView ? 'v' : '-');
}

}  // namespace

std::string KeyPermissions::ToString() const {
  std::string out;
  out.reserve(24);
  AppendClass(possessor(), &out);
  AppendClass(user(), &out);
  AppendClass(group(), &out);
  AppendClass(other(), &out);
  return out;
}

}  // namespace keyrings
