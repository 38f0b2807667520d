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

#include <linux/keyctl.h>
#include <stdint.h>
#include <sys/types.h>

#include <ostream>
#include <string>
#include <string_view>

#include <keyrings/key_error.h>

namespace keyrings {

// Serial number of a key or keyring. Positive serials name kernel objects; the kernel alone
// decides whether a serial is still alive, so a KeySerial is never validated beyond its range.
class KeySerial {
 public:
  constexpr explicit KeySerial(int32_t raw) : raw_(raw) {}

  // Range-checks a value returned by the kernel. Fails with INVALID_IDENTIFIER unless
  // 0 < raw <= INT32_MAX.
  static KeyResult<KeySerial> FromRaw(long raw);

  constexpr int32_t raw() const { return raw_; }

  constexpr bool operator==(const KeySerial& other) const { return raw_ == other.raw_; }
  constexpr bool operator!=(const KeySerial& other) const { return raw_ != other.raw_; }
  constexpr bool operator<(const KeySerial& other) const { return raw_ < other.raw_; }

 private:
  int32_t raw_;
};

std::ostream& operator<<(std::ostream& os, const KeySerial& serial);

// Well-known keyrings, resolved by the kernel relative to the calling thread.
enum class SpecialKeyring : int32_t {
  kThread = KEY_SPEC_THREAD_KEYRING,
  kProcess = KEY_SPEC_PROCESS_KEYRING,
  kSession = KEY_SPEC_SESSION_KEYRING,
  kUser = KEY_SPEC_USER_KEYRING,
  kUserSession = KEY_SPEC_USER_SESSION_KEYRING,
  kGroup = KEY_SPEC_GROUP_KEYRING,
  // The authorisation key of a request_key() being instantiated by this process.
  kRequestKeyAuth = KEY_SPEC_REQKEY_AUTH_KEY,
  // The destination keyring of a request_key() being instantiated by this process.
  kRequestor = KEY_SPEC_REQUESTOR_KEYRING,
};

std::string SpecialKeyringName(SpecialKeyring id);

// The serial the kernel accepts in place of a real one for |id|.
constexpr KeySerial ToSerial(SpecialKeyring id) {
  return KeySerial(static_cast<int32_t>(id));
}

// Passed as the uid of KEYCTL_GET_PERSISTENT to mean "the caller's own uid", and as the
// uid/gid of KEYCTL_CHOWN to leave a field unchanged.
constexpr uid_t kNoUid = static_cast<uid_t>(-1);
constexpr gid_t kNoGid = static_cast<gid_t>(-1);

enum class KeyType {
  kKeyring,
  kUser,
  kLogon,
  kBigKey,
  // A type the kernel reported that this library does not name.
  kOther,
};

// Kernel name of a key type. kOther has no name and yields an empty string.
const char* KeyTypeName(KeyType type);
KeyType KeyTypeFromName(std::string_view name);

}  // namespace keyrings
