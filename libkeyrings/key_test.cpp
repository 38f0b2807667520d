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

#include <unistd.h>

#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include <keyrings/keyring.h>

#include "test_utils.h"

using namespace std::chrono_literals;
using namespace std::string_literals;

namespace keyrings {

using ErrorCode = KeyError::ErrorCode;

class KeyTest : public SessionKeyringTest {
 protected:
  Key AddTestKey(const std::string& description, const std::string& payload) {
    auto key = session().AddKey(description, payload);
    EXPECT_TRUE(key.ok()) << key.error();
    return key.ok() ? *key : Key::FromId(KeySerial(1));
  }
};

TEST_F(KeyTest, read_and_update) {
  Key key = AddTestKey("test_payload", "first");

  auto payload = key.Read();
  ASSERT_TRUE(payload.ok()) << payload.error();
  EXPECT_EQ("first", *payload);

  // Payloads are bytes, not strings.
  const std::string binary = "a\0b\xff"s;
  ASSERT_TRUE(key.Update(binary).ok());
  payload = key.Read();
  ASSERT_TRUE(payload.ok()) << payload.error();
  EXPECT_EQ(binary, *payload);
}

TEST_F(KeyTest, read_empty_payload) {
  Key key = AddTestKey("test_empty", "");
  auto payload = key.Read();
  ASSERT_TRUE(payload.ok()) << payload.error();
  EXPECT_TRUE(payload->empty());
}

TEST_F(KeyTest, metadata) {
  Key key = AddTestKey("test_describe;with;separators", "data");

  auto info = key.GetMetadata();
  ASSERT_TRUE(info.ok()) << info.error();
  EXPECT_EQ(KeyType::kUser, info->type());
  EXPECT_EQ(geteuid(), info->uid());
  EXPECT_EQ(getegid(), info->gid());
  EXPECT_EQ("test_describe;with;separators", info->description());
}

TEST_F(KeyTest, set_permissions) {
  Key key = AddTestKey("test_perms", "data");
  auto perms = KeyPermissionsBuilder()
                       .Possessor(Permission::kAll)
                       .User(Permission::kView | Permission::kRead)
                       .Build();
  ASSERT_TRUE(key.SetPermissions(perms).ok());

  auto info = key.GetMetadata();
  ASSERT_TRUE(info.ok()) << info.error();
  EXPECT_EQ(perms, info->permissions());
}

TEST_F(KeyTest, chown_to_self) {
  Key key = AddTestKey("test_chown", "data");
  ASSERT_TRUE(key.Chown(std::nullopt, getegid()).ok());
  ASSERT_TRUE(key.Chown(std::nullopt, std::nullopt).ok());

  auto info = key.GetMetadata();
  ASSERT_TRUE(info.ok()) << info.error();
  EXPECT_EQ(geteuid(), info->uid());
  EXPECT_EQ(getegid(), info->gid());
}

TEST_F(KeyTest, revoke) {
  Key key = AddTestKey("test_revoke", "data");
  ASSERT_TRUE(key.Revoke().ok());
  EXPECT_EQ(ErrorCode::KEY_REVOKED, ErrorCodeOf(key.Read()));
}

TEST_F(KeyTest, invalidate) {
  Key key = AddTestKey("test_invalidate", "data");
  ASSERT_TRUE(key.Invalidate().ok());
  EXPECT_FALSE(key.Read().ok());
  EXPECT_EQ(ErrorCode::KEY_DOES_NOT_EXIST, ErrorCodeOf(session().Search("test_invalidate")));
}

TEST_F(KeyTest, timeout) {
  Key key = AddTestKey("test_timeout", "data");
  ASSERT_TRUE(key.SetTimeout(1s).ok());
  sleep(2);
  EXPECT_EQ(ErrorCode::KEY_EXPIRED, ErrorCodeOf(key.Read()));
}

TEST_F(KeyTest, clearing_timeout_keeps_key) {
  Key key = AddTestKey("test_no_timeout", "data");
  ASSERT_TRUE(key.SetTimeout(1s).ok());
  ASSERT_TRUE(key.SetTimeout(0s).ok());
  sleep(2);
  EXPECT_TRUE(key.Read().ok());
}

TEST_F(KeyTest, security_context) {
  Key key = AddTestKey("test_security", "data");
  // Without an LSM the label is empty, but the call still succeeds.
  auto context = key.GetSecurityContext();
  ASSERT_TRUE(context.ok()) << context.error();
  EXPECT_EQ(std::string::npos, context->find('\0'));
}

TEST_F(KeyTest, instantiate_requires_authority) {
  Key key = AddTestKey("test_instantiate", "data");
  // Only a helper holding the authorisation key may instantiate.
  EXPECT_FALSE(key.Instantiate("payload", session().id()).ok());
  EXPECT_FALSE(key.AssumeAuthority().ok());
}

}  // namespace keyrings
