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

#include <stdint.h>

#include <chrono>
#include <string>

#include <android-base/result.h>

namespace keyrings {

constexpr const char* kPersistentKeyringExpiryPath =
    "/proc/sys/kernel/keys/persistent_keyring_expiry";
constexpr const char* kMaxKeysPath = "/proc/sys/kernel/keys/maxkeys";
constexpr const char* kMaxBytesPath = "/proc/sys/kernel/keys/maxbytes";

// How long a persistent keyring lives after the last Keyring::GetPersistent() call.
android::base::Result<std::chrono::seconds> GetPersistentKeyringExpiry(
    const std::string& path = kPersistentKeyringExpiryPath);

// Per-user quota applied by the kernel to non-root users. Exceeding either limit makes key
// creation fail with QUOTA_EXCEEDED.
struct KeyQuota {
  uint32_t max_keys;
  uint32_t max_bytes;
};

android::base::Result<KeyQuota> GetKeyQuota(const std::string& max_keys_path = kMaxKeysPath,
                                             const std::string& max_bytes_path = kMaxBytesPath);

}  // namespace keyrings
