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

#include <keyrings/keyctl.h>

#include <errno.h>
#include <stdint.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <android-base/logging.h>

// keyctl(2), add_key(2) and request_key(2) are called directly. No libkeyutils is required.

namespace keyrings {

using android::base::Error;

const char* KeyCtlOperationName(KeyCtlOperation operation) {
  switch (operation) {
    case KeyCtlOperation::kGetKeyringId:
      return "GET_KEYRING_ID";
    case KeyCtlOperation::kJoinSessionKeyring:
      return "JOIN_SESSION_KEYRING";
    case KeyCtlOperation::kUpdate:
      return "UPDATE";
    case KeyCtlOperation::kRevoke:
      return "REVOKE";
    case KeyCtlOperation::kChown:
      return "CHOWN";
    case KeyCtlOperation::kSetPerm:
      return "SETPERM";
    case KeyCtlOperation::kDescribe:
      return "DESCRIBE";
    case KeyCtlOperation::kClear:
      return "CLEAR";
    case KeyCtlOperation::kLink:
      return "LINK";
    case KeyCtlOperation::kUnlink:
      return "UNLINK";
    case KeyCtlOperation::kSearch:
      return "SEARCH";
    case KeyCtlOperation::kRead:
      return "READ";
    case KeyCtlOperation::kInstantiate:
      return "INSTANTIATE";
    case KeyCtlOperation::kSetTimeout:
      return "SET_TIMEOUT";
    case KeyCtlOperation::kAssumeAuthority:
      return "ASSUME_AUTHORITY";
    case KeyCtlOperation::kGetSecurity:
      return "GET_SECURITY";
    case KeyCtlOperation::kReject:
      return "REJECT";
    case KeyCtlOperation::kInvalidate:
      return "INVALIDATE";
    case KeyCtlOperation::kGetPersistent:
      return "GET_PERSISTENT";
    case KeyCtlOperation::kRestrictKeyring:
      return "RESTRICT_KEYRING";
  }
  return "UNKNOWN";
}

KeyResult<long> Keyctl(KeyCtlOperation operation, unsigned long arg2, unsigned long arg3,
                       unsigned long arg4, unsigned long arg5) {
  LOG(VERBOSE) << "keyctl(" << KeyCtlOperationName(operation) << ", " << std::hex << arg2
               << ", " << arg3 << ", " << arg4 << ", " << arg5 << ")";
  long ret = syscall(__NR_keyctl, static_cast<int>(operation), arg2, arg3, arg4, arg5);
  if (ret < 0) {
    return Error<KeyError>(errno) << "keyctl(" << KeyCtlOperationName(operation) << ", "
                                  << static_cast<int32_t>(arg2) << ")";
  }
  return ret;
}

KeyResult<std::string> EncodeDescription(std::string_view description) {
  if (description.find('\0') != std::string_view::npos) {
    return Error<KeyError>(KeyError::InvalidDescription())
           << "description of " << description.size() << " bytes";
  }
  return std::string(description);
}

KeyResult<KeySerial> AddKey(KeyType type, KeySerial ring, std::string_view description,
                            std::optional<std::string_view> payload) {
  auto desc = EncodeDescription(description);
  if (!desc.ok()) {
    return desc.error();
  }

  const void* data = payload ? payload->data() : nullptr;
  size_t length = payload ? payload->size() : 0;
  LOG(VERBOSE) << "add_key(" << KeyTypeName(type) << ", " << *desc << ", " << length
               << " bytes, " << ring << ")";
  long ret = syscall(__NR_add_key, KeyTypeName(type), desc->c_str(), data, length, ring.raw());
  if (ret < 0) {
    return Error<KeyError>(errno) << "add_key(" << KeyTypeName(type) << ", " << *desc
                                  << ") into " << ring;
  }
  return KeySerial::FromRaw(ret);
}

KeyResult<KeySerial> RequestKey(KeyType type, KeySerial ring, std::string_view description,
                                std::optional<std::string_view> callout) {
  auto desc = EncodeDescription(description);
  if (!desc.ok()) {
    return desc.error();
  }

  std::string callout_info;
  bool has_callout = callout && !callout->empty();
  if (has_callout) {
    auto encoded = EncodeDescription(*callout);
    if (!encoded.ok()) {
      return encoded.error();
    }
    callout_info = std::move(*encoded);
  }

  LOG(VERBOSE) << "request_key(" << KeyTypeName(type) << ", " << *desc << ", "
               << (has_callout ? "callout" : "no callout") << ", " << ring << ")";
  long ret = syscall(__NR_request_key, KeyTypeName(type), desc->c_str(),
                     has_callout ? callout_info.c_str() : nullptr, ring.raw());
  if (ret < 0) {
    return Error<KeyError>(errno) << "request_key(" << KeyTypeName(type) << ", " << *desc
                                  << ")";
  }
  return KeySerial::FromRaw(ret);
}

}  // namespace keyrings
