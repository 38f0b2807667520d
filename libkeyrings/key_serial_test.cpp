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

#include <sstream>

#include <gtest/gtest.h>

namespace keyrings {

TEST(key_serial, from_raw_accepts_positive) {
  auto serial = KeySerial::FromRaw(0x1234);
  ASSERT_TRUE(serial.ok());
  EXPECT_EQ(0x1234, serial->raw());

  auto max = KeySerial::FromRaw(INT32_MAX);
  ASSERT_TRUE(max.ok());
  EXPECT_EQ(INT32_MAX, max->raw());
}

TEST(key_serial, from_raw_rejects_out_of_range) {
  EXPECT_EQ(KeyError::ErrorCode::INVALID_IDENTIFIER, ErrorCodeOf(KeySerial::FromRaw(0)));
  EXPECT_EQ(KeyError::ErrorCode::INVALID_IDENTIFIER, ErrorCodeOf(KeySerial::FromRaw(-1)));
  EXPECT_EQ(KeyError::ErrorCode::INVALID_IDENTIFIER,
            ErrorCodeOf(KeySerial::FromRaw(static_cast<long>(INT32_MAX) + 1)));
}

TEST(key_serial, special_keyrings) {
  EXPECT_EQ(-1, ToSerial(SpecialKeyring::kThread).raw());
  EXPECT_EQ(-3, ToSerial(SpecialKeyring::kSession).raw());
  EXPECT_EQ(-8, ToSerial(SpecialKeyring::kRequestor).raw());
  EXPECT_EQ("@us", SpecialKeyringName(SpecialKeyring::kUserSession));
}

TEST(key_serial, print) {
  std::ostringstream os;
  os << KeySerial(0x2a) << " " << KeySerial(-4) << " " << 10;
  EXPECT_EQ("0x2a -4 10", os.str());
}

TEST(key_serial, key_types) {
  EXPECT_STREQ("user", KeyTypeName(KeyType::kUser));
  EXPECT_STREQ("keyring", KeyTypeName(KeyType::kKeyring));
  EXPECT_EQ(KeyType::kKeyring, KeyTypeFromName("keyring"));
  EXPECT_EQ(KeyType::kBigKey, KeyTypeFromName("big_key"));
  EXPECT_EQ(KeyType::kOther, KeyTypeFromName("asymmetric"));
}

}  // namespace keyrings
