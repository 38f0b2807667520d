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

#include "keyringctl_utils.h"

#include <errno.h>
#include <stdint.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/parseint.h>

namespace keyrings {

namespace {

std::vector<std::string> SplitBySpace(const std::string& s) {
  std::istringstream iss(s);
  return std::vector<std::string>{std::istream_iterator<std::string>{iss},
                                  std::istream_iterator<std::string>{}};
}

}  // namespace

std::optional<SpecialKeyring> ParseSpecialKeyring(const std::string& name) {
  if (name == "@t") return SpecialKeyring::kThread;
  if (name == "@p") return SpecialKeyring::kProcess;
  if (name == "@s") return SpecialKeyring::kSession;
  if (name == "@u") return SpecialKeyring::kUser;
  if (name == "@us") return SpecialKeyring::kUserSession;
  if (name == "@g") return SpecialKeyring::kGroup;
  if (name == "@a") return SpecialKeyring::kRequestKeyAuth;
  if (name == "@r") return SpecialKeyring::kRequestor;
  return {};
}

std::optional<KeySerial> ParseSerial(const std::string& str) {
  int32_t raw;
  if (!android::base::ParseInt(str.c_str(), &raw, 1)) {
    return {};
  }
  return KeySerial(raw);
}

std::optional<KeySerial> ParseSerialOrSpecial(const std::string& str) {
  if (auto special = ParseSpecialKeyring(str)) {
    return ToSerial(*special);
  }
  return ParseSerial(str);
}

std::optional<KeySerial> FindKeyringInProcKeys(const std::string& keyring_desc,
                                               const std::string& proc_keys) {
  // Only keys allowed by SELinux rules will be shown here.
  std::ifstream proc_keys_file(proc_keys);
  if (!proc_keys_file.is_open()) {
    PLOG(ERROR) << "Failed to open " << proc_keys;
    return {};
  }

  std::string line;
  while (getline(proc_keys_file, line)) {
    std::vector<std::string> tokens = SplitBySpace(line);
    if (tokens.size() < 9) {
      continue;
    }
    std::string key_id = "0x" + tokens[0];
    std::string key_type = tokens[7];
    // The key description may contain space.
    std::string key_desc_prefix = tokens[8];
    // The prefix has a ":" at the end
    std::string key_desc_pattern = keyring_desc + ":";
    if (key_type != "keyring" || key_desc_prefix != key_desc_pattern) {
      continue;
    }
    auto serial = ParseSerial(key_id);
    if (!serial) {
      LOG(ERROR) << "Unexpected key format in " << proc_keys << ": " << key_id;
      return {};
    }
    return serial;
  }
  return {};
}

KeyResult<Keyring> ResolveKeyring(const std::string& arg) {
  if (auto special = ParseSpecialKeyring(arg)) {
    return Keyring::FromSpecialId(*special, true);
  }
  if (auto serial = ParseSerial(arg)) {
    return Keyring::FromId(*serial);
  }
  if (auto serial = FindKeyringInProcKeys(arg)) {
    return Keyring::FromId(*serial);
  }
  return android::base::Error<KeyError>(ENOKEY) << "Can't find keyring '" << arg << "'";
}

}  // namespace keyrings
