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

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <keyrings/key_error.h>
#include <keyrings/key_serial.h>
#include <keyrings/metadata.h>
#include <keyrings/permissions.h>

namespace keyrings {

// A reference to a key. Copying a Key copies the reference only; the kernel owns the key and
// its lifetime.
class Key {
 public:
  static Key FromId(KeySerial id) { return Key(id); }

  KeySerial id() const { return id_; }

  // Requires view permission.
  KeyResult<Metadata> GetMetadata() const;

  // Returns the LSM security label attached to the key. Requires view permission.
  KeyResult<std::string> GetSecurityContext() const;

  // Reads the payload. Requires read permission, or search permission if the key is reachable
  // from one of the caller's keyrings.
  KeyResult<std::string> Read() const;

  // Replaces the payload. Requires write permission.
  KeyResult<void> Update(std::string_view payload) const;

  // Requires setattr permission.
  KeyResult<void> SetPermissions(KeyPermissions permissions) const;

  // Changes the owner. An absent uid or gid is left unchanged. Changing the uid requires
  // CAP_SYS_ADMIN.
  KeyResult<void> Chown(std::optional<uid_t> uid, std::optional<gid_t> gid) const;

  // Sets the key to expire |timeout| from now. A zero timeout clears any expiry.
  KeyResult<void> SetTimeout(std::chrono::seconds timeout) const;

  // Marks the key invalid and schedules it for immediate garbage collection. Requires
  // search permission.
  KeyResult<void> Invalidate() const;

  // Revokes the key. Further operations on it fail with KEY_REVOKED. Requires write or
  // setattr permission.
  KeyResult<void> Revoke() const;

  // The calls below are made by an instantiation helper run by the kernel on behalf of a
  // request_key() with callout information. The helper must assume authority over the
  // key under construction before instantiating or rejecting it.

  KeyResult<void> AssumeAuthority() const;

  // Instantiates the key under construction with |payload| and links it into |ring|.
  KeyResult<void> Instantiate(std::string_view payload, KeySerial ring) const;

  // Negatively instantiates the key: requests for it fail with |error| until |timeout|
  // passes. The key is linked into |ring|.
  KeyResult<void> Reject(std::chrono::seconds timeout, int error, KeySerial ring) const;

  bool operator==(const Key& other) const { return id_ == other.id_; }
  bool operator!=(const Key& other) const { return id_ != other.id_; }
  bool operator<(const Key& other) const { return id_ < other.id_; }

 private:
  explicit Key(KeySerial id) : id_(id) {}

  KeySerial id_;
};

std::ostream& operator<<(std::ostream& os, const Key& key);

}  // namespace keyrings
