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

#include <keyrings/key.h>

#include <keyrings/keyctl.h>

#include "utility.h"

namespace keyrings {

namespace {

KeyResult<void> Run(KeyCtlOperation operation, KeySerial id, unsigned long arg3 = 0,
                    unsigned long arg4 = 0, unsigned long arg5 = 0) {
  auto ret = Keyctl(operation, id.raw(), arg3, arg4, arg5);
  if (!ret.ok()) {
    return ret.error();
  }
  return {};
}

}  // namespace

KeyResult<Metadata> Key::GetMetadata() const {
  return Metadata::FromId(id_);
}

KeyResult<std::string> Key::GetSecurityContext() const {
  auto context = ReadVariableLength(KeyCtlOperation::kGetSecurity, id_);
  if (!context.ok()) {
    return context.error();
  }
  StripTrailingNul(&*context);
  return context;
}

KeyResult<std::string> Key::Read() const {
  return ReadVariableLength(KeyCtlOperation::kRead, id_);
}

KeyResult<void> Key::Update(std::string_view payload) const {
  return Run(KeyCtlOperation::kUpdate, id_, reinterpret_cast<unsigned long>(payload.data()),
             payload.size());
}

KeyResult<void> Key::SetPermissions(KeyPermissions permissions) const {
  return Run(KeyCtlOperation::kSetPerm, id_, permissions.mask());
}

KeyResult<void> Key::Chown(std::optional<uid_t> uid, std::optional<gid_t> gid) const {
  return Run(KeyCtlOperation::kChown, id_, uid.value_or(kNoUid), gid.value_or(kNoGid));
}

KeyResult<void> Key::SetTimeout(std::chrono::seconds timeout) const {
  return Run(KeyCtlOperation::kSetTimeout, id_, static_cast<unsigned long>(timeout.count()));
}

KeyResult<void> Key::Invalidate() const {
  return Run(KeyCtlOperation::kInvalidate, id_);
}

KeyResult<void> Key::Revoke() const {
  return Run(KeyCtlOperation::kRevoke, id_);
}

KeyResult<void> Key::AssumeAuthority() const {
  return Run(KeyCtlOperation::kAssumeAuthority, id_);
}

KeyResult<void> Key::Instantiate(std::string_view payload, KeySerial ring) const {
  return Run(KeyCtlOperation::kInstantiate, id_,
             reinterpret_cast<unsigned long>(payload.data()), payload.size(),
             static_cast<unsigned long>(ring.raw()));
}

KeyResult<void> Key::Reject(std::chrono::seconds timeout, int error, KeySerial ring) const {
  return Run(KeyCtlOperation::kReject, id_, static_cast<unsigned long>(timeout.count()),
             static_cast<unsigned long>(error), static_cast<unsigned long>(ring.raw()));
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
  return os << "key " << key.id();
}

}  // namespace keyrings
