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

#include <keyrings/metadata.h>

#include <string>
#include <vector>

#include <android-base/parseint.h>
#include <android-base/strings.h>

#include "utility.h"

namespace keyrings {

using android::base::Error;

KeyResult<Metadata> Metadata::FromId(KeySerial id) {
  auto describe = ReadVariableLength(KeyCtlOperation::kDescribe, id);
  if (!describe.ok()) {
    return Error<KeyError>(describe.error().code()) << "describe " << id;
  }
  StripTrailingNul(&*describe);
  return Parse(*describe);
}

KeyResult<Metadata> Metadata::Parse(std::string_view describe) {
  std::vector<std::string> fields = android::base::Split(std::string(describe), ";");
  if (fields.size() < 5) {
    return Error<KeyError>(KeyError::InvalidFormat()) << "'" << describe << "'";
  }

  Metadata metadata;
  metadata.type_name_ = fields[0];
  metadata.type_ = KeyTypeFromName(fields[0]);
  if (!android::base::ParseUint(fields[1], &metadata.uid_)) {
    return Error<KeyError>(KeyError::InvalidFormat()) << "bad uid '" << fields[1] << "'";
  }
  if (!android::base::ParseUint(fields[2], &metadata.gid_)) {
    return Error<KeyError>(KeyError::InvalidFormat()) << "bad gid '" << fields[2] << "'";
  }
  // The permission mask is printed as bare hex.
  uint32_t mask;
  if (!android::base::ParseUint("0x" + fields[3], &mask)) {
    return Error<KeyError>(KeyError::InvalidFormat()) << "bad perm '" << fields[3] << "'";
  }
  metadata.permissions_ = KeyPermissions(mask);

  std::vector<std::string> rest(fields.begin() + 4, fields.end());
  metadata.description_ = android::base::Join(rest, ';');
  return metadata;
}

}  // namespace keyrings
