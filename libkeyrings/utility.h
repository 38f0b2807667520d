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

#include <string>

#include <keyrings/key_error.h>
#include <keyrings/key_serial.h>
#include <keyrings/keyctl.h>

namespace keyrings {

// Runs a keyctl operation of the form (op, id, buffer, buflen) whose result is the full size
// of the data, probing for the size first and growing the buffer if the data grew between
// calls. Returns the raw bytes, including any trailing NUL the kernel wrote.
KeyResult<std::string> ReadVariableLength(KeyCtlOperation operation, KeySerial id);

// Removes a single trailing NUL, as written by DESCRIBE and GET_SECURITY.
void StripTrailingNul(std::string* str);

}  // namespace keyrings
