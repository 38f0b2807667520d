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

#include <optional>
#include <string>

#include <keyrings/key_error.h>
#include <keyrings/key_serial.h>
#include <keyrings/keyring.h>

namespace keyrings {

// Parses the keyctl(1) shorthands "@t", "@p", "@s", "@u", "@us", "@g", "@a" and "@r".
std::optional<SpecialKeyring> ParseSpecialKeyring(const std::string& name);

// Parses a positive decimal or 0x-prefixed hexadecimal serial.
std::optional<KeySerial> ParseSerial(const std::string& str);

// Parses a serial or a special keyring shorthand, without asking the kernel to resolve the
// latter.
std::optional<KeySerial> ParseSerialOrSpecial(const std::string& str);

// Find the keyring id. request_key(2) only finds keys in the process, session or thread keyring
// hierarchy, but not internal keyrings of a kernel subsystem (e.g. .fs-verity). To support all
// cases, this function looks a keyring up by parsing /proc/keys. Only the first word of the
// description column is compared, since the rest depends on the key type.
std::optional<KeySerial> FindKeyringInProcKeys(const std::string& keyring_desc,
                                               const std::string& proc_keys = "/proc/keys");

// Turns a command line keyring argument into a Keyring: special shorthands are resolved
// (and created) through the kernel, serials are taken as is, and anything else is looked up
// by description in /proc/keys.
KeyResult<Keyring> ResolveKeyring(const std::string& arg);

}  // namespace keyrings
