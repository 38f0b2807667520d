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

#include <errno.h>
#include <stdint.h>

#include <ostream>
#include <string>

#include <android-base/result.h>

namespace keyrings {

// Classified failure of a keyring operation. Kernel failures carry the errno returned by the
// syscall; INVALID_IDENTIFIER, INVALID_DESCRIPTION and INVALID_FORMAT are raised locally,
// before or after the syscall, and carry a representative errno for printing.
//
// KeyError is the error code type of KeyResult<T>, the same way errno is the error code of
// android::base::Result<T>.
class KeyError {
 public:
  enum class ErrorCode : int32_t {
    SUCCESS = 0,
    // Any kernel error not otherwise classified. See value() for the raw errno.
    OTHER,
    // A raw value returned by the kernel is not a valid serial number.
    INVALID_IDENTIFIER,
    // A description cannot be passed to the kernel (it contains a NUL byte).
    INVALID_DESCRIPTION,
    // The kernel's description of an object could not be parsed.
    INVALID_FORMAT,
    KEY_DOES_NOT_EXIST,
    KEY_EXPIRED,
    KEY_REVOKED,
    KEY_REJECTED,
    PERMISSION_DENIED,
    QUOTA_EXCEEDED,
    // Linking would create a cycle in the keyring graph.
    ACCESS_CYCLE,
    // Linking would nest keyrings deeper than the kernel allows.
    NESTING_TOO_DEEP,
};

  KeyError() : KeyError(0) {}

  // Classifies an errno returned by keyctl(2), add_key(2) or request_key(2).
  KeyError(int error_num) : error_code_(CastErrno(error_num)), errno_(error_num) {}

  static KeyError InvalidIdentifier() { return KeyError(ErrorCode::INVALID_IDENTIFIER, ERANGE); }
  static KeyError InvalidDescription() {
    return KeyError(ErrorCode::INVALID_DESCRIPTION, EINVAL);
  }
  static KeyError InvalidFormat() { return KeyError(ErrorCode::INVALID_FORMAT, EINVAL); }

  ErrorCode error_code() const { return error_code_; }
  int value() const { return errno_; }
  bool is_ok() const { return error_code_ == ErrorCode::SUCCESS; }

  // Human readable form, appended to the message of a failed KeyResult.
  std::string print() const;

  bool operator==(const KeyError& other) const {
    return error_code_ == other.error_code_ && errno_ == other.errno_;
  }
  bool operator!=(const KeyError& other) const { return !(*this == other); }

 private:
  KeyError(ErrorCode code, int error_num) : error_code_(code), errno_(error_num) {}

  static ErrorCode CastErrno(int error_num);

  ErrorCode error_code_;
  int errno_;
};

// Name of the code, e.g. "KEY_DOES_NOT_EXIST". For logging and debugging only.
std::string ErrorCodeName(KeyError::ErrorCode code);

std::ostream& operator<<(std::ostream& os, KeyError::ErrorCode code);

template <typename T>
using KeyResult = android::base::Result<T, KeyError>;

// Shorthand for the classified code of a failed result.
template <typename T>
KeyError::ErrorCode ErrorCodeOf(const KeyResult<T>& result) {
  return result.ok() ? KeyError::ErrorCode::SUCCESS : result.error().code().error_code();
}

}  // namespace keyrings
