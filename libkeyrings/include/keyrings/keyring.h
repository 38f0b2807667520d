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
#include <ostream>
#include <string_view>

#include <keyrings/key.h>
#include <keyrings/key_error.h>
#include <keyrings/key_serial.h>
#include <keyrings/metadata.h>
#include <keyrings/permissions.h>

namespace keyrings {

class LinkNode;
class Links;

using LinkClassifier = std::function<KeyResult<LinkNode>(KeySerial)>;

// A reference to a keyring, used to locate, create, search, and link/unlink keys and keyrings
// to and from it. Like Key, a Keyring is a plain copyable handle: the kernel owns the keyring,
// and no operation here ever invalidates the handle itself.
//
// Every operation is a single synchronous syscall reflecting live kernel state. Nothing is
// cached and nothing is retried.
class Keyring {
 public:
  static Keyring FromId(KeySerial id) { return Keyring(id); }

  // Resolves a special keyring to its real serial with KEYCTL_GET_KEYRING_ID. If |create| is
  // true the kernel creates the keyring if needed; otherwise the call fails with
  // KEY_DOES_NOT_EXIST if the keyring was never created.
  static KeyResult<Keyring> FromSpecialId(SpecialKeyring id, bool create);

  // Gets the persistent keyring of the current user (see persistent-keyring(7)), creating it
  // if needed, and links it into |link_with|. The caller needs write permission on
  // |link_with|.
  //
  // Every call resets the keyring's expiry to the value in
  // /proc/sys/kernel/keys/persistent_keyring_expiry (see GetPersistentKeyringExpiry()).
  // When it expires, the keyring is removed and everything it pins may be garbage collected.
  static KeyResult<Keyring> GetPersistent(SpecialKeyring link_with);
  static KeyResult<Keyring> GetPersistent(const Keyring& link_with);

  // Joins the session keyring called |name|, creating it if needed, or a new anonymous
  // session keyring if |name| is absent. The joined keyring replaces the session keyring
  // of the calling process.
  static KeyResult<Keyring> JoinSession(std::optional<std::string_view> name = {});

  KeySerial id() const { return id_; }

  // Requires view permission.
  KeyResult<Metadata> GetMetadata() const;

  // Requires setattr permission.
  KeyResult<void> SetPermissions(KeyPermissions permissions) const;

  // Creates a user key with |description| and |secret| and links it into this keyring. If
  // the keyring already holds a user key with the same description, that key is updated
  // in place and its serial is returned; the two cases are indistinguishable to the caller.
  KeyResult<Key> AddKey(std::string_view description, std::string_view secret) const;

  // Creates a keyring named |description| and links it into this keyring. If a keyring with
  // the same description is already linked here, the new one displaces it.
  KeyResult<Keyring> AddKeyring(std::string_view description) const;

  // Finds a user key with |description| and links it into this keyring.
  //
  // If no such key exists and |callout| is absent or empty, fails with KEY_DOES_NOT_EXIST.
  // Otherwise the kernel runs the instantiation helper (/sbin/request-key), passing it
  // |callout|, and this call blocks until the helper instantiates or rejects the key. There
  // is no timeout.
  KeyResult<Key> RequestKey(std::string_view description,
                            std::optional<std::string_view> callout = {}) const;

  // Searches the tree of keyrings rooted at this one for a user key with exactly
  // |description|. The search is breadth-first and recursive; only keyrings granting the
  // caller search permission are descended into, and only keys granting search permission
  // can be found. Fails with KEY_DOES_NOT_EXIST if nothing matches, and with
  // INVALID_DESCRIPTION if |description| contains a NUL byte.
  //
  // If several keys match at different depths, which one is returned is up to the kernel.
  KeyResult<Key> Search(std::string_view description) const;

  // Lists the keys and keyrings linked into this keyring, in link order. Entries that cannot
  // be described (destroyed meanwhile, or not viewable by the caller) are left out.
  //
  // If the keyring holds more than |max_entries| links the result is silently incomplete:
  // older kernels fill the buffer with the first |max_entries| links, while Linux 5.8 and
  // later copy nothing and the result is empty. Pass a large enough |max_entries|.
  //
  // Requires read or search permission.
  KeyResult<Links> GetLinks(size_t max_entries) const;

  // As above, classifying each linked serial with |classify| instead of describing it.
  KeyResult<Links> GetLinks(size_t max_entries, const LinkClassifier& classify) const;

  // Links |key| into this keyring. If the keyring already links a key with the same type
  // and description, that link is displaced. Requires link permission on |key| and write
  // permission on this keyring.
  KeyResult<void> LinkKey(const Key& key) const;

  // Removes the link to |key|. Fails if there is no such link. If this was the last link
  // to |key|, the kernel schedules it for destruction. Requires write permission.
  KeyResult<void> UnlinkKey(const Key& key) const;

  // Links |keyring| into this keyring. Fails with ACCESS_CYCLE if this would create a cycle
  // and with NESTING_TOO_DEEP if keyrings would nest deeper than the kernel permits
  // (KEYRING_SEARCH_MAX_DEPTH, 6). Same permissions as LinkKey().
  KeyResult<void> LinkKeyring(const Keyring& keyring) const;

  // Links a special keyring. A special keyring that does not exist yet is created.
  KeyResult<void> LinkKeyring(SpecialKeyring id) const;

  KeyResult<void> UnlinkKeyring(const Keyring& keyring) const;

  // Unlinks a special keyring. Unlike LinkKeyring(SpecialKeyring), this never creates it:
  // a special keyring that does not exist fails with KEY_DOES_NOT_EXIST.
  KeyResult<void> UnlinkKeyring(SpecialKeyring id) const;

  // Unlinks everything from this keyring in one step. Requires write permission.
  KeyResult<void> Clear() const;

  // Forbids any further links into this keyring. This cannot be undone.
  KeyResult<void> Restrict() const;

  bool operator==(const Keyring& other) const { return id_ == other.id_; }
  bool operator!=(const Keyring& other) const { return id_ != other.id_; }
  bool operator<(const Keyring& other) const { return id_ < other.id_; }

 private:
  explicit Keyring(KeySerial id) : id_(id) {}

  KeyResult<void> Link(KeySerial id) const;
  KeyResult<void> Unlink(KeySerial id) const;

  KeySerial id_;
};

std::ostream& operator<<(std::ostream& os, const Keyring& keyring);

}  // namespace keyrings
