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

#pragma once

#include <sys/types.h>

#include <string>
#include <string_view>

#include <keyrings/key_error.h>
#include <keyrings/key_serial.h>
#include <keyrings/permissions.h>

namespace keyrings {

// Attributes of a key or keyring as reported by KEYCTL_DESCRIBE.
class Metadata {
 public:
  // Describes the object named by |id|. The object must grant the caller view permission.
  static KeyResult<Metadata> FromId(KeySerial id);

  // Parses the kernel's "type;uid;gid;perm;description" form. The description is the
  // remainder of the string and may itself contain ';'.
  static KeyResult<Metadata> Parse(std::string_view describe);

  KeyType type() const { return type_; }
  const std::string& type_name() const { return type_name_; }
  uid_t uid() const { return uid_; }
  gid_t gid() const { return gid_; }
  KeyPermissions permissions() const { return permissions_; }
  const std::string& description() const { return description_; }

 private:
  Metadata() = default;

  KeyType type_ = KeyType::kOther;
  std::string type_name_;
  uid_t uid_ = 0;
  gid_t gid_ = 0;
  KeyPermissions permissions_;
  std::string description_;
};

}  // namespace keyrings
