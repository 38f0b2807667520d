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

#include <stdint.h>

#include <string>

namespace keyrings {

// Rights within one permission class.
namespace Permission {
constexpr uint8_t kView = 0x01;
constexpr uint8_t kRead = 0x02;
constexpr uint8_t kWrite = 0x04;
constexpr uint8_t kSearch = 0x08;
constexpr uint8_t kLink = 0x10;
constexpr uint8_t kSetAttr = 0x20;
constexpr uint8_t kAll = 0x3f;
}  // namespace Permission

// The 32-bit permission mask of a key: one byte each for the possessor, the owning user, the
// owning group and everybody else, in that order from the most significant byte.
class KeyPermissions {
 public:
  constexpr KeyPermissions() : mask_(0) {}
  constexpr explicit KeyPermissions(uint32_t mask) : mask_(mask) {}

  constexpr uint32_t mask() const { return mask_; }

  constexpr uint8_t possessor() const { return Get(kPossessorShift); }
  constexpr uint8_t user() const { return Get(kUserShift); }
  constexpr uint8_t group() const { return Get(kGroupShift); }
  constexpr uint8_t other() const { return Get(kOtherShift); }

  // keyctl(1) style rendering, e.g. "alswrv-----v------------".
  std::string ToString() const;

  bool operator==(const KeyPermissions& other) const { return mask_ == other.mask_; }
  bool operator!=(const KeyPermissions& other) const { return mask_ != other.mask_; }

 private:
  friend class KeyPermissionsBuilder;

  static constexpr int kPossessorShift = 24;
  static constexpr int kUserShift = 16;
  static constexpr int kGroupShift = 8;
  static constexpr int kOtherShift = 0;

  constexpr uint8_t Get(int shift) const { return (mask_ >> shift) & Permission::kAll; }

  uint32_t mask_;
};

// Usage:
//   KeyPermissions perms = KeyPermissionsBuilder()
//                                  .Possessor(Permission::kAll)
//                                  .User(Permission::kView | Permission::kRead)
//                                  .Build();
class KeyPermissionsBuilder {
 public:
  KeyPermissionsBuilder& Possessor(uint8_t rights) {
    return Set(KeyPermissions::kPossessorShift, rights);
  }
  KeyPermissionsBuilder& User(uint8_t rights) {
    return Set(KeyPermissions::kUserShift, rights);
  }
  KeyPermissionsBuilder& Group(uint8_t rights) {
    return Set(KeyPermissions::kGroupShift, rights);
  }
  KeyPermissionsBuilder& Other(uint8_t rights) {
    return Set(KeyPermissions::kOtherShift, rights);
  }

  KeyPermissions Build() const { return KeyPermissions(mask_); }

 private:
  KeyPermissionsBuilder& Set(int shift, uint8_t rights) {
    mask_ &= ~(static_cast<uint32_t>(Permission::kAll) << shift);
    mask_ |= static_cast<uint32_t>(rights & Permission::kAll) << shift;
    return *this;
  }

  uint32_t mask_ = 0;
};

}  // namespace keyrings
