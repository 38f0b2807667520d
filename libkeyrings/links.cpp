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

#include <algorithm>

#include <android-base/logging.h>


namespace keyrings {

KeyResult<LinkNode> LinkNode::FromId(KeySerial id) {
  auto metadata = Metadata::FromId(id);
  if (!metadata.ok()) {
    return metadata.error();
  }
  return FromMetadata(id, *metadata);
}

LinkNode LinkNode::FromMetadata(KeySerial id, const Metadata& metadata) {
  if (metadata.type() == KeyType::kKeyring) {
    return LinkNode(Keyring::FromId(id));
  }
  return LinkNode(Key::FromId(id));
}

std::optional<Key> LinkNode::AsKey() const {
  if (!is_key()) return {};
  return Key::FromId(id_);
}

std::optional<Keyring> LinkNode::AsKeyring() const {
  if (!is_keyring()) return {};
  return Keyring::FromId(id_);
}

Links Links::Decode(const std::vector<KeySerial>& serials, const Classifier& classify) {
  std::vector<LinkNode> nodes;
  nodes.reserve(serials.size());
  for (const auto& serial : serials) {
    auto node = classify(serial);
    if (!node.ok()) {
      LOG(DEBUG) << "Dropping link to " << serial << ": " << node.error();
      continue;
    }
    nodes.emplace_back(*node);
  }
  return Links(std::move(nodes));
}

std::optional<LinkNode> Links::Get(const Key& key) const {
  auto iter = std::find_if(nodes_.begin(), nodes_.end(),
                           [&key](const LinkNode& node) { return node == key; });
  if (iter == nodes_.end()) return {};
  return *iter;
}

std::optional<LinkNode> Links::Get(const Keyring& keyring) const {
  auto iter = std::find_if(nodes_.begin(), nodes_.end(),
                           [&keyring](const LinkNode& node) { return node == keyring; });
  if (iter == nodes_.end()) return {};
  return *iter;
}

}  // namespace keyrings
