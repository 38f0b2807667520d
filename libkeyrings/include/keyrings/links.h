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

#include <stddef.h>

#include <functional>
#include <optional>
#include <vector>

#include <keyrings/key.h>
#include <keyrings/key_error.h>
#include <keyrings/key_serial.h>
#include <keyrings/keyring.h>
#include <keyrings/metadata.h>

namespace keyrings {

// One entry of a keyring's link list: either a key or another keyring.
class LinkNode {
 public:
  enum class Kind {
    kKey,
    kKeyring,
};

  LinkNode(const Key& key) : kind_(Kind::kKey), id_(key.id()) {}
  LinkNode(const Keyring& keyring) : kind_(Kind::kKeyring), id_(keyring.id()) {}

  // Classifies |id| by describing it: a keyring type yields a keyring node, any other type a
  // key node. Fails if the object cannot be described, e.g. it was destroyed or the caller
  // lacks view permission.
  static KeyResult<LinkNode> FromId(KeySerial id);

  // Classifies |id| from metadata the caller already holds.
  static LinkNode FromMetadata(KeySerial id, const Metadata& metadata);

  Kind kind() const { return kind_; }
  KeySerial id() const { return id_; }
  bool is_key() const { return kind_ == Kind::kKey; }
  bool is_keyring() const { return kind_ == Kind::kKeyring; }

  std::optional<Key> AsKey() const;
  std::optional<Keyring> AsKeyring() const;

  bool operator==(const LinkNode& other) const {
    return kind_ == other.kind_ && id_ == other.id_;
  }
  bool operator!=(const LinkNode& other) const { return !(*this == other); }
  bool operator==(const Key& key) const { return is_key() && id_ == key.id(); }
  bool operator==(const Keyring& keyring) const {
    return is_keyring() && id_ == keyring.id();
  }

 private:
  Kind kind_;
  KeySerial id_;
};

// The links of a keyring in the order the kernel reported them.
class Links {
 public:
  using Classifier = LinkClassifier;
  using const_iterator = std::vector<LinkNode>::const_iterator;

  Links() = default;
  explicit Links(std::vector<LinkNode> nodes) : nodes_(std::move(nodes)) {}

  // Builds a collection from the raw serials of a keyring read. Entries |classify| cannot
  // resolve are dropped; decoding itself never fails.
  static Links Decode(const std::vector<KeySerial>& serials,
                      const Classifier& classify = LinkNode::FromId);

  bool Contains(const Key& key) const { return Get(key).has_value(); }
  bool Contains(const Keyring& keyring) const { return Get(keyring).has_value(); }

  std::optional<LinkNode> Get(const Key& key) const;
  std::optional<LinkNode> Get(const Keyring& keyring) const;

  size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }
  const LinkNode& operator[](size_t index) const { return nodes_[index]; }
  const_iterator begin() const { return nodes_.begin(); }
  const_iterator end() const { return nodes_.end(); }

 private:
  std::vector<LinkNode> nodes_;
};

}  // namespace keyrings
