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

#include <keyrings/links.h>

#include <errno.h>
#include <stdint.h>

#include <initializer_list>
#include <vector>

#include <gtest/gtest.h>

namespace keyrings {

namespace {

// Odd serials are keyrings, even serials are keys, and serials above 100 are gone.
KeyResult<LinkNode> FakeClassifier(KeySerial id) {
  if (id.raw() > 100) {
    return android::base::Error<KeyError>(ENOKEY) << "describe " << id;
  }
  if (id.raw() % 2) {
    return LinkNode(Keyring::FromId(id));
  }
  return LinkNode(Key::FromId(id));
}

std::vector<KeySerial> Serials(std::initializer_list<int32_t> raw) {
  std::vector<KeySerial> serials;
  for (auto value : raw) {
    serials.emplace_back(value);
  }
  return serials;
}

}  // namespace

TEST(links, from_metadata_classifies_by_type) {
  auto ring = Metadata::Parse("keyring;1000;1000;3f030000;_ses");
  ASSERT_TRUE(ring.ok()) << ring.error();
  EXPECT_TRUE(LinkNode::FromMetadata(KeySerial(5), *ring).is_keyring());

  auto user = Metadata::Parse("user;1000;1000;3f010000;secret");
  ASSERT_TRUE(user.ok()) << user.error();
  LinkNode node = LinkNode::FromMetadata(KeySerial(6), *user);
  EXPECT_TRUE(node == Key::FromId(KeySerial(6)));

  auto logon = Metadata::Parse("logon;0;0;3f010000;fscrypt:1234");
  ASSERT_TRUE(logon.ok()) << logon.error();
  EXPECT_TRUE(LinkNode::FromMetadata(KeySerial(8), *logon).is_key());
}

TEST(links, decode_keeps_kernel_order) {
  Links links = Links::Decode(Serials({4, 3, 2, 7}), FakeClassifier);
  ASSERT_EQ(4u, links.size());
  EXPECT_EQ(LinkNode(Key::FromId(KeySerial(4))), links[0]);
  EXPECT_EQ(LinkNode(Keyring::FromId(KeySerial(3))), links[1]);
  EXPECT_EQ(LinkNode(Key::FromId(KeySerial(2))), links[2]);
  EXPECT_EQ(LinkNode(Keyring::FromId(KeySerial(7))), links[3]);
}

TEST(links, decode_drops_unresolvable_entries) {
  Links links = Links::Decode(Serials({101, 2, 200, 3}), FakeClassifier);
  ASSERT_EQ(2u, links.size());
  EXPECT_EQ(KeySerial(2), links[0].id());
  EXPECT_EQ(KeySerial(3), links[1].id());
}

TEST(links, decode_empty) {
  EXPECT_TRUE(Links::Decode({}, FakeClassifier).empty());
  EXPECT_TRUE(Links::Decode(Serials({150, 151}), FakeClassifier).empty());
}

TEST(links, contains_matches_kind_and_serial) {
  Links links = Links::Decode(Serials({2, 3}), FakeClassifier);

  EXPECT_TRUE(links.Contains(Key::FromId(KeySerial(2))));
  EXPECT_TRUE(links.Contains(Keyring::FromId(KeySerial(3))));

  // Same serial, different kind.
  EXPECT_FALSE(links.Contains(Keyring::FromId(KeySerial(2))));
  EXPECT_FALSE(links.Contains(Key::FromId(KeySerial(3))));

  EXPECT_FALSE(links.Contains(Key::FromId(KeySerial(4))));
}

TEST(links, get) {
  Links links = Links::Decode(Serials({2, 3}), FakeClassifier);

  auto node = links.Get(Key::FromId(KeySerial(2)));
  ASSERT_TRUE(node.has_value());
  EXPECT_TRUE(node->is_key());
  ASSERT_TRUE(node->AsKey().has_value());
  EXPECT_EQ(Key::FromId(KeySerial(2)), *node->AsKey());
  EXPECT_FALSE(node->AsKeyring().has_value());

  auto ring = links.Get(Keyring::FromId(KeySerial(3)));
  ASSERT_TRUE(ring.has_value());
  EXPECT_EQ(LinkNode::Kind::kKeyring, ring->kind());
  EXPECT_EQ(Keyring::FromId(KeySerial(3)), *ring->AsKeyring());

  EXPECT_FALSE(links.Get(Key::FromId(KeySerial(9))).has_value());
}

TEST(links, iterate) {
  Links links = Links::Decode(Serials({2, 4, 6}), FakeClassifier);
  int32_t expected = 2;
  for (const auto& node : links) {
    EXPECT_EQ(KeySerial(expected), node.id());
    expected += 2;
  }
}

}  // namespace keyrings
