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

#include <keyrings/key_error.h>

#include <string.h>

namespace keyrings {

std::string KeyError::print() const {
  switch (error_code_) {
    case ErrorCode::SUCCESS:
      return "Success";
    case ErrorCode::INVALID_IDENTIFIER:
      return "Invalid key serial number";
    case ErrorCode::INVALID_DESCRIPTION:
      return "Description contains a NUL byte";
    case ErrorCode::INVALID_FORMAT:
      return "Malformed key description";
    default:
      return strerror(errno_);
  }
}

// errno -> known ErrorCode
KeyError::ErrorCode KeyError::CastErrno(int error_num) {
  switch (error_num) {
    case 0:
      return ErrorCode::SUCCESS;
    case ENOKEY:
    // key_unlink() reports a missing link as ENOENT.
    case ENOENT:
      return ErrorCode::KEY_DOES_NOT_EXIST;
    case EKEYEXPIRED:
      return ErrorCode::KEY_EXPIRED;
    case EKEYREVOKED:
      return ErrorCode::KEY_REVOKED;
    case EKEYREJECTED:
      return ErrorCode::KEY_REJECTED;
    case EACCES:
    case EPERM:
      return ErrorCode::PERMISSION_DENIED;
    case EDQUOT:
      return ErrorCode::QUOTA_EXCEEDED;
    case EDEADLK:
      return ErrorCode::ACCESS_CYCLE;
    case ELOOP:
      return ErrorCode::NESTING_TOO_DEEP;
    default:
      return ErrorCode::OTHER;
  }
}

std::string ErrorCodeName(KeyError::ErrorCode code) {
  using ErrorCode = KeyError::ErrorCode;
  switch (code) {
    case ErrorCode::SUCCESS:
      return "SUCCESS";
    case ErrorCode::OTHER:
      return "OTHER";
    case ErrorCode::INVALID_IDENTIFIER:
      return "INVALID_IDENTIFIER";
    case ErrorCode::INVALID_DESCRIPTION:
      return "INVALID_DESCRIPTION";
    case ErrorCode::INVALID_FORMAT:
      return "INVALID_FORMAT";
    case ErrorCode::KEY_DOES_NOT_EXIST:
      return "KEY_DOES_NOT_EXIST";
    case ErrorCode::KEY_EXPIRED:
      return "KEY_EXPIRED";
    case ErrorCode::KEY_REVOKED:
      return "KEY_REVOKED";
    case ErrorCode::KEY_REJECTED:
      return "KEY_REJECTED";
    case ErrorCode::PERMISSION_DENIED:
      return "PERMISSION_DENIED";
    case ErrorCode::QUOTA_EXCEEDED:
      return "QUOTA_EXCEEDED";
    case ErrorCode::ACCESS_CYCLE:
      return "ACCESS_CYCLE";
    case ErrorCode::NESTING_TOO_DEEP:
      return "NESTING_TOO_DEEP";
  }
  return "UNKNOWN(" + std::to_string(static_cast<int32_t>(code)) + ")";
}

std::ostream& operator<<(std::ostream& os, KeyError::ErrorCode code) {
  return os << ErrorCodeName(code);
}

}  // namespace keyrings
