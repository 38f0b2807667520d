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

#include <keyrings/config.h>

#include <android-base/file.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>

namespace keyrings {

using android::base::Error;
using android::base::ErrnoError;
using android::base::Result;

namespace {

Result<uint32_t> ReadUintFile(const std::string& path) {
  std::string content;
  if (!android::base::ReadFileToString(path, &content)) {
    return ErrnoError() << "Failed to read " << path;
  }
  uint32_t value;
  std::string trimmed = android::base::Trim(content);
  if (!android::base::ParseUint(trimmed, &value)) {
    return Error() << "Unexpected content in " << path << ": '" << trimmed << "'";
  }
  return value;
}

}  // namespace

Result<std::chrono::seconds> GetPersistentKeyringExpiry(const std::string& path) {
  auto seconds = ReadUintFile(path);
  if (!seconds.ok()) {
    return seconds.error();
  }
  return std::chrono::seconds(*seconds);
}

Result<KeyQuota> GetKeyQuota(const std::string& max_keys_path, const std::string& max_bytes_path) {
  auto max_keys = ReadUintFile(max_keys_path);
  if (!max_keys.ok()) {
    return max_keys.error();
  }
  auto max_bytes = ReadUintFile(max_bytes_path);
  if (!max_bytes.ok()) {
    return max_bytes.error();
  }
  return KeyQuota{*max_keys, *max_bytes};
}

}  // namespace keyrings
