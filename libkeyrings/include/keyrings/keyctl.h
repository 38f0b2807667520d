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

#include <optional>
#include <string>
#include <string_view>

#include <keyrings/key_error.h>
#include <keyrings/key_serial.h>

namespace keyrings {

// The keyctl(2) operations used by this library.
enum class KeyCtlOperation : int {
  kGetKeyringId = KEYCTL_GET_KEYRING_ID,
  kJoinSessionKeyring = KEYCTL_JOIN_SESSION_KEYRING,
  kUpdate = KEYCTL_UPDATE,
  kRevoke = KEYCTL_REVOKE,
  kChown = KEYCTL_CHOWN,
  kSetPerm = KEYCTL_SETPERM,
  kDescribe = KEYCTL_DESCRIBE,
  kClear = KEYCTL_CLEAR,
  kLink = KEYCTL_LINK,
  kUnlink = KEYCTL_UNLINK,
  kSearch = KEYCTL_SEARCH,
  kRead = KEYCTL_READ,
  kInstantiate = KEYCTL_INSTANTIATE,
  kSetTimeout = KEYCTL_SET_TIMEOUT,
  kAssumeAuthority = KEYCTL_ASSUME_AUTHORITY,
  kGetSecurity = KEYCTL_GET_SECURITY,
  kReject = KEYCTL_REJECT,
  kInvalidate = KEYCTL_INVALIDATE,
  kGetPersistent = KEYCTL_GET_PERSISTENT,
  kRestrictKeyring = KEYCTL_RESTRICT_KEYRING,
};

const char* KeyCtlOperationName(KeyCtlOperation operation);

// Issues a single keyctl(2) call. A negative return becomes a KeyError classified from errno;
// a non-negative return is passed through for the caller to interpret (a serial, a byte
// count, or zero).
KeyResult<long> Keyctl(KeyCtlOperation operation, unsigned long arg2 = 0, unsigned long arg3 = 0,
                       unsigned long arg4 = 0, unsigned long arg5 = 0);

// Creates or updates a key of |type| in |ring| with add_key(2). An absent payload is passed
// as NULL, which is what the keyring type expects.
KeyResult<KeySerial> AddKey(KeyType type, KeySerial ring, std::string_view description,
                            std::optional<std::string_view> payload);

// Looks up a key with request_key(2), linking it into |ring| when found. With a non-empty
// |callout| a missing key is constructed by the kernel's instantiation helper, and this call
// blocks until the helper finishes.
KeyResult<KeySerial> RequestKey(KeyType type, KeySerial ring, std::string_view description,
                                std::optional<std::string_view> callout);

// Converts a description to the NUL-terminated form the kernel expects. Fails with
// INVALID_DESCRIPTION if |description| contains a NUL byte.
KeyResult<std::string> EncodeDescription(std::string_view description);

}  // namespace keyrings
