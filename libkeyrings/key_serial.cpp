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

#include <keyrings/key_serial.h>

#include <stdint.h>

#include <ios>

namespace keyrings {

KeyResult<KeySerial> KeySerial::FromRaw(long raw) {
  if (raw <= 0 || raw > INT32_MAX) {
    return android::base::Error<KeyError>(KeyError::InvalidIdentifier())
           << "kernel returned serial " << raw;
  }
  return KeySerial(static_cast<int32_t>(raw));
}

std::ostream& operator<<(std::ostream& os, const KeySerial& serial) {
  if (serial.raw() < 0) {
    return os << serial.raw();
  }
  auto flags = os.flags();
  os << "0x" << std::hex << serial.raw();
  os.flags(flags);
  return os;
}

std::string SpecialKeyringName(SpecialKeyring id) {
  switch (id) {
    case SpecialKeyring::kThread:
      return "@t";
    case SpecialKeyring::kProcess:
      return "@p";
    case SpecialKeyring::kSession:
      return "@s";
    case SpecialKeyring::kUser:
      return "@u";
    case SpecialKeyring::kUserSession:
      return "@us";
    case SpecialKeyring::kGroup:
      return "@g";
    case SpecialKeyring::kRequestKeyAuth:
      return "@a";
    case SpecialKeyring::kRequestor:
      return "@r";
  }
  return std::to_string(static_cast<int32_t>(id));
}

const char* KeyTypeName(KeyType type) {
  switch (type) {
    case KeyType::kKeyring:
      return "keyring";
    case KeyType::kUser:
      return "user";
    case KeyType::kLogon:
      return "logon";
    case KeyType::kBigKey:
      return "big_key";
    case KeyType::kOther:
      break;
  }
  return "";
}

KeyType KeyTypeFromName(std::string_view name) {
  if (name == "keyring") return KeyType::kKeyring;
  if (name == "user") return KeyType::kUser;
  if (name == "logon") return KeyType::kLogon;
  if (name == "big_key") return KeyType::kBigKey;
  return KeyType::kOther;
}

}  // namespace keyrings
