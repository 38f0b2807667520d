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

#include <stdint.h>

#include <string>

#include <android-base/file.h>
#include <gtest/gtest.h>

namespace keyrings {

TEST(KeyringctlUtilsTest, special_keyrings) {
  EXPECT_EQ(SpecialKeyring::kThread, ParseSpecialKeyring("@t"));
  EXPECT_EQ(SpecialKeyring::kProcess, ParseSpecialKeyring("@p"));
  EXPECT_EQ(SpecialKeyring::kSession, ParseSpecialKeyring("@s"));
  EXPECT_EQ(SpecialKeyring::kUser, ParseSpecialKeyring("@u"));
  EXPECT_EQ(SpecialKeyring::kUserSession, ParseSpecialKeyring("@us"));
  EXPECT_EQ(SpecialKeyring::kGroup, ParseSpecialKeyring("@g"));
  EXPECT_EQ(SpecialKeyring::kRequestKeyAuth, ParseSpecialKeyring("@a"));
  EXPECT_EQ(SpecialKeyring::kRequestor, ParseSpecialKeyring("@r"));
  EXPECT_FALSE(ParseSpecialKeyring("@x"));
  EXPECT_FALSE(ParseSpecialKeyring("s"));
  EXPECT_FALSE(ParseSpecialKeyring(""));
}

TEST(KeyringctlUtilsTest, serials) {
  EXPECT_EQ(KeySerial(42), ParseSerial("42"));
  EXPECT_EQ(KeySerial(0x2a), ParseSerial("0x2a"));
  EXPECT_EQ(KeySerial(INT32_MAX), ParseSerial("2147483647"));
  EXPECT_FALSE(ParseSerial("0"));
  EXPECT_FALSE(ParseSerial("-3"));
  EXPECT_FALSE(ParseSerial("2147483648"));
  EXPECT_FALSE(ParseSerial("@s"));
  EXPECT_FALSE(ParseSerial("fsverity"));
}

TEST(KeyringctlUtilsTest, serial_or_special) {
  EXPECT_EQ(ToSerial(SpecialKeyring::kSession), ParseSerialOrSpecial("@s"));
  EXPECT_EQ(KeySerial(7), ParseSerialOrSpecial("7"));
  EXPECT_FALSE(ParseSerialOrSpecial("-3"));
}

TEST(KeyringctlUtilsTest, find_keyring_in_proc_keys) {
  TemporaryFile tf;
  ASSERT_NE(-1, tf.fd);
  const std::string proc_keys =
      "0b0c1e2f I--Q---     1 perm 1f010000     0     0 user      test: 4\n"
      "12345678 I------     1 perm 1f0f0000     0     0 keyring   .fs-verity: 2\n"
      "1a2b3c4d I--Q---     2 perm 3f030000  1000  1000 keyring   _ses: 1\n"
      "truncated line\n"
      "7fffffff I--Q---     1 perm 3f030000  1000  1000 keyring   my ring: empty\n";
  ASSERT_TRUE(android::base::WriteStringToFile(proc_keys, tf.path));

  EXPECT_EQ(KeySerial(0x12345678), FindKeyringInProcKeys(".fs-verity", tf.path));
  EXPECT_EQ(KeySerial(0x1a2b3c4d), FindKeyringInProcKeys("_ses", tf.path));
  // Only keyrings match.
  EXPECT_FALSE(FindKeyringInProcKeys("test", tf.path));
  // Only the first word of the description is compared.
  EXPECT_FALSE(FindKeyringInProcKeys("my ring", tf.path));
  EXPECT_FALSE(FindKeyringInProcKeys("missing", tf.path));
}

TEST(KeyringctlUtilsTest, find_keyring_without_proc_keys) {
  TemporaryDir td;
  EXPECT_FALSE(FindKeyringInProcKeys("_ses", std::string(td.path) + "/keys"));
}

TEST(KeyringctlUtilsTest, resolve_serial_without_lookup) {
  auto keyring = ResolveKeyring("0x10");
  ASSERT_TRUE(keyring.ok()) << keyring.error();
  EXPECT_EQ(KeySerial(16), keyring->id());
}

TEST(KeyringctlUtilsTest, resolve_unknown_description) {
  auto keyring = ResolveKeyring("no such keyring description");
  EXPECT_EQ(KeyError::ErrorCode::KEY_DOES_NOT_EXIST, ErrorCodeOf(keyring));
}

}  // namespace keyrings
