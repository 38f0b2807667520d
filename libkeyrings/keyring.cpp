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

#include <keyrings/keyring.h>

#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include <keyrings/keyctl.h>
#include <keyrings/links.h>

namespace keyrings {

namespace {

KeyResult<Keyring> ToKeyring(const KeyResult<long>& ret) {
  if (!ret.ok()) {
    return ret.error();
  }
  auto serial = KeySerial::FromRaw(*ret);
  if (!serial.ok()) {
    return serial.error();
  }
  return Keyring::FromId(*serial);
}

}  // namespace

KeyResult<Keyring> Keyring::FromSpecialId(SpecialKeyring id, bool create) {
  return ToKeyring(Keyctl(KeyCtlOperation::kGetKeyringId, ToSerial(id).raw(), create ? 1 : 0));
}

KeyResult<Keyring> Keyring::GetPersistent(SpecialKeyring link_with) {
  return ToKeyring(
      Keyctl(KeyCtlOperation::kGetPersistent, kNoUid, ToSerial(link_with).raw()));
}

KeyResult<Keyring> Keyring::GetPersistent(const Keyring& link_with) {
  return ToKeyring(Keyctl(KeyCtlOperation::kGetPersistent, kNoUid, link_with.id().raw()));
}

KeyResult<Keyring> Keyring::JoinSession(std::optional<std::string_view> name) {
  if (!name) {
    return ToKeyring(Keyctl(KeyCtlOperation::kJoinSessionKeyring, 0));
  }
  auto encoded = EncodeDescription(*name);
  if (!encoded.ok()) {
    return encoded.error();
  }
  return ToKeyring(Keyctl(KeyCtlOperation::kJoinSessionKeyring,
                          reinterpret_cast<unsigned long>(encoded->c_str())));
}

KeyResult<Metadata> Keyring::GetMetadata() const {
  return Metadata::FromId(id_);
}

KeyResult<void> Keyring::SetPermissions(KeyPermissions permissions) const {
  auto ret = Keyctl(KeyCtlOperation::kSetPerm, id_.raw(), permissions.mask());
  if (!ret.ok()) {
    return ret.error();
  }
  return {};
}

KeyResult<Key> Keyring::AddKey(std::string_view description, std::string_view secret) const {
  auto serial = keyrings::AddKey(KeyType::kUser, id_, description, secret);
  if (!serial.ok()) {
    return serial.error();
  }
  return Key::FromId(*serial);
}

KeyResult<Keyring> Keyring::AddKeyring(std::string_view description) const {
  auto serial = keyrings::AddKey(KeyType::kKeyring, id_, description, std::nullopt);
  if (!serial.ok()) {
    return serial.error();
  }
  return Keyring::FromId(*serial);
}

KeyResult<Key> Keyring::RequestKey(std::string_view description,
                                   std::optional<std::string_view> callout) const {
  auto serial = keyrings::RequestKey(KeyType::kUser, id_, description, callout);
  if (!serial.ok()) {
    return serial.error();
  }
  return Key::FromId(*serial);
}

KeyResult<Key> Keyring::Search(std::string_view description) const {
  auto desc = EncodeDescription(description);
  if (!desc.ok()) {
    return desc.error();
  }

  // A destination of 0 leaves the found key where it is.
  auto ret = Keyctl(KeyCtlOperation::kSearch, id_.raw(),
                    reinterpret_cast<unsigned long>(KeyTypeName(KeyType::kUser)),
                    reinterpret_cast<unsigned long>(desc->c_str()), 0);
  if (!ret.ok()) {
    return ret.error();
  }
  auto serial = KeySerial::FromRaw(*ret);
  if (!serial.ok()) {
    return serial.error();
  }
  return Key::FromId(*serial);
}

KeyResult<Links> Keyring::GetLinks(size_t max_entries) const {
  return GetLinks(max_entries, LinkNode::FromId);
}

KeyResult<Links> Keyring::GetLinks(size_t max_entries, const LinkClassifier& classify) const {
  if (max_entries == 0) {
    return Links();
  }

  std::vector<int32_t> buffer(max_entries);
  const size_t capacity = buffer.size() * sizeof(int32_t);
  auto ret = Keyctl(KeyCtlOperation::kRead, id_.raw(),
                    reinterpret_cast<unsigned long>(buffer.data()), capacity);
  if (!ret.ok()) {
    return ret.error();
  }

  // The kernel reports the size of the whole list, which may exceed what it copied. Since
  // Linux 5.8 nothing at all is copied when the list does not fit, so slots the kernel did
  // not write are still zero and are skipped below.
  const size_t length = std::min(static_cast<size_t>(*ret), capacity);
  const size_t count = length / sizeof(int32_t);
  CHECK_LE(count, buffer.size());
  if (static_cast<size_t>(*ret) > capacity) {
    LOG(VERBOSE) << *this << " has " << *ret / sizeof(int32_t) << " links, buffer holds "
                 << count;
  }

  std::vector<KeySerial> serials;
  serials.reserve(count);
  for (size_t i = 0; i < count; i++) {
    auto serial = KeySerial::FromRaw(buffer[i]);
    if (!serial.ok()) {
      continue;
    }
    serials.push_back(*serial);
  }
  return Links::Decode(serials, classify);
}

KeyResult<void> Keyring::Link(KeySerial id) const {
  auto ret = Keyctl(KeyCtlOperation::kLink, id.raw(), id_.raw());
  if (!ret.ok()) {
    return ret.error();
  }
  return {};
}

KeyResult<void> Keyring::Unlink(KeySerial id) const {
  auto ret = Keyctl(KeyCtlOperation::kUnlink, id.raw(), id_.raw());
  if (!ret.ok()) {
    return ret.error();
  }
  return {};
}

KeyResult<void> Keyring::LinkKey(const Key& key) const {
  return Link(key.id());
}

KeyResult<void> Keyring::UnlinkKey(const Key& key) const {
  return Unlink(key.id());
}

KeyResult<void> Keyring::LinkKeyring(const Keyring& keyring) const {
  return Link(keyring.id());
}

KeyResult<void> Keyring::LinkKeyring(SpecialKeyring id) const {
  return Link(ToSerial(id));
}

KeyResult<void> Keyring::UnlinkKeyring(const Keyring& keyring) const {
  return Unlink(keyring.id());
}

KeyResult<void> Keyring::UnlinkKeyring(SpecialKeyring id) const {
  return Unlink(ToSerial(id));
}

KeyResult<void> Keyring::Clear() const {
  auto ret = Keyctl(KeyCtlOperation::kClear, id_.raw());
  if (!ret.ok()) {
    return ret.error();
  }
  return {};
}

KeyResult<void> Keyring::Restrict() const {
  // No type and no restriction: nothing may be linked from now on.
  auto ret = Keyctl(KeyCtlOperation::kRestrictKeyring, id_.raw(), 0, 0);
  if (!ret.ok()) {
    return ret.error();
  }
  return {};
}

std::ostream& operator<<(std::ostream& os, const Keyring& keyring) {
  return os << "keyring " << keyring.id();
}

}  // namespace keyrings
