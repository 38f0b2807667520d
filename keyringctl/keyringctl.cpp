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

// keyctl(1) style tool for inspecting and editing kernel keyrings.

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <keyrings/key.h>
#include <keyrings/key_error.h>
#include <keyrings/keyring.h>
#include <keyrings/links.h>
#include <keyrings/metadata.h>
#include <keyrings/permissions.h>

#include "keyringctl_utils.h"

using namespace keyrings;

// Largest payload the "user" key type accepts.
constexpr size_t kMaxPayloadSize = 32767;
constexpr size_t kDefaultListSize = 256;

static void Usage(int exit_code) {
  fprintf(stderr, "usage: keyringctl [-v] <action> [args,]\n");
  fprintf(stderr, "       keyringctl add <desc> <data> <keyring>\n");
  fprintf(stderr, "       keyringctl padd <desc> <keyring>\n");
  fprintf(stderr, "       keyringctl request <desc> <keyring> [callout]\n");
  fprintf(stderr, "       keyringctl search <keyring> <desc>\n");
  fprintf(stderr, "       keyringctl newring <desc> <keyring>\n");
  fprintf(stderr, "       keyringctl link <key> <keyring>\n");
  fprintf(stderr, "       keyringctl unlink <key> <keyring>\n");
  fprintf(stderr, "       keyringctl list <keyring> [max]\n");
  fprintf(stderr, "       keyringctl clear <keyring>\n");
  fprintf(stderr, "       keyringctl persistent <keyring>\n");
  fprintf(stderr, "       keyringctl describe <key>\n");
  fprintf(stderr, "       keyringctl print <key>\n");
  fprintf(stderr, "       keyringctl security <key>\n");
  fprintf(stderr, "       keyringctl setperm <key> <mask>\n");
  fprintf(stderr, "       keyringctl timeout <key> <seconds>\n");
  fprintf(stderr, "       keyringctl invalidate <key>\n");
  fprintf(stderr, "       keyringctl revoke <key>\n");
  fprintf(stderr, "       keyringctl restrict_keyring <keyring>\n");
  fprintf(stderr, "       keyringctl instantiate <key> <data> <keyring>\n");
  fprintf(stderr, "       keyringctl reject <key> <seconds> <keyring>\n");
  _exit(exit_code);
}

static Key ParseKeyOrDie(const std::string& str) {
  auto serial = ParseSerial(str);
  if (!serial) {
    LOG(ERROR) << "Unparsable key: '" << str << "'";
    Usage(1);
  }
  return Key::FromId(*serial);
}

static KeySerial ParseDestinationOrDie(const std::string& str) {
  auto serial = ParseSerialOrSpecial(str);
  if (!serial) {
    LOG(ERROR) << "Unparsable keyring: '" << str << "'";
    Usage(1);
  }
  return *serial;
}

static std::chrono::seconds ParseSecondsOrDie(const std::string& str) {
  uint32_t seconds;
  if (!android::base::ParseUint(str.c_str(), &seconds)) {
    LOG(ERROR) << "Unparsable timeout: '" << str << "'";
    Usage(1);
  }
  return std::chrono::seconds(seconds);
}

static void PrintMetadata(KeySerial id, const Metadata& metadata) {
  std::cout << id.raw() << ": " << metadata.permissions().ToString() << " " << metadata.uid()
            << " " << metadata.gid() << " " << metadata.type_name() << ": "
            << metadata.description() << std::endl;
}

static int Add(const std::string& desc, const std::string& data, const std::string& keyring) {
  if (data.size() > kMaxPayloadSize) {
    LOG(ERROR) << "Payload too large";
    return 1;
  }

  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  auto key = ring->AddKey(desc, data);
  if (!key.ok()) {
    LOG(ERROR) << "Failed to add key: " << key.error();
    return 1;
  }

  std::cout << key->id().raw() << std::endl;
  return 0;
}

static int Padd(const std::string& desc, const std::string& keyring) {
  // read from stdin to get the payload
  std::istreambuf_iterator<char> begin(std::cin), end;
  std::string data(begin, end);
  return Add(desc, data, keyring);
}

static int Request(const std::string& desc, const std::string& keyring,
                   std::optional<std::string> callout) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  auto key = callout ? ring->RequestKey(desc, *callout) : ring->RequestKey(desc);
  if (!key.ok()) {
    LOG(ERROR) << "Failed to request key '" << desc << "': " << key.error();
    return 1;
  }

  std::cout << key->id().raw() << std::endl;
  return 0;
}

static int Search(const std::string& keyring, const std::string& desc) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  auto key = ring->Search(desc);
  if (!key.ok()) {
    LOG(ERROR) << "Failed to find key '" << desc << "': " << key.error();
    return 1;
  }

  std::cout << key->id().raw() << std::endl;
  return 0;
}

static int NewRing(const std::string& desc, const std::string& keyring) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  auto created = ring->AddKeyring(desc);
  if (!created.ok()) {
    LOG(ERROR) << "Failed to create keyring '" << desc << "': " << created.error();
    return 1;
  }

  std::cout << created->id().raw() << std::endl;
  return 0;
}

static int Link(const Key& key, const std::string& keyring) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  if (auto result = ring->LinkKey(key); !result.ok()) {
    LOG(ERROR) << "Failed to link " << key << " to " << *ring << ": " << result.error();
    return 1;
  }
  return 0;
}

static int Unlink(const Key& key, const std::string& keyring) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  if (auto result = ring->UnlinkKey(key); !result.ok()) {
    LOG(ERROR) << "Failed to unlink " << key << " from " << *ring << ": " << result.error();
    return 1;
  }
  return 0;
}

static int List(const std::string& keyring, size_t max_entries) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }

  // Keep what classification already described, so each link is described once.
  std::map<KeySerial, Metadata> described;
  auto links = ring->GetLinks(max_entries, [&described](KeySerial id) -> KeyResult<LinkNode> {
    auto metadata = Metadata::FromId(id);
    if (!metadata.ok()) {
      return metadata.error();
    }
    LinkNode node = LinkNode::FromMetadata(id, *metadata);
    described.emplace(id, std::move(*metadata));
    return node;
  });
  if (!links.ok()) {
    LOG(ERROR) << "Failed to list " << *ring << ": " << links.error();
    return 1;
  }

  for (const LinkNode& node : *links) {
    PrintMetadata(node.id(), described.at(node.id()));
  }
  return 0;
}

static int Clear(const std::string& keyring) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  if (auto result = ring->Clear(); !result.ok()) {
    LOG(ERROR) << "Failed to clear " << *ring << ": " << result.error();
    return 1;
  }
  return 0;
}

static int Persistent(const std::string& keyring) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  auto persistent = Keyring::GetPersistent(*ring);
  if (!persistent.ok()) {
    LOG(ERROR) << "Failed to get persistent keyring: " << persistent.error();
    return 1;
  }

  std::cout << persistent->id().raw() << std::endl;
  return 0;
}

static int Describe(const Key& key) {
  auto metadata = key.GetMetadata();
  if (!metadata.ok()) {
    LOG(ERROR) << "Cannot describe " << key << ": " << metadata.error();
    return 1;
  }
  PrintMetadata(key.id(), *metadata);
  return 0;
}

static int Print(const Key& key) {
  auto payload = key.Read();
  if (!payload.ok()) {
    LOG(ERROR) << "Cannot read " << key << ": " << payload.error();
    return 1;
  }
  std::cout << *payload;
  return 0;
}

static int Security(const Key& key) {
  auto context = key.GetSecurityContext();
  if (!context.ok()) {
    LOG(ERROR) << "Cannot get security context of " << key << ": " << context.error();
    return 1;
  }
  std::cout << *context << std::endl;
  return 0;
}

static int SetPerm(const Key& key, const std::string& mask_str) {
  uint32_t mask;
  if (!android::base::ParseUint(mask_str.c_str(), &mask)) {
    LOG(ERROR) << "Unparsable permission mask: '" << mask_str << "'";
    return 1;
  }
  if (auto result = key.SetPermissions(KeyPermissions(mask)); !result.ok()) {
    LOG(ERROR) << "Cannot set permissions of " << key << ": " << result.error();
    return 1;
  }
  return 0;
}

static int Timeout(const Key& key, std::chrono::seconds timeout) {
  if (auto result = key.SetTimeout(timeout); !result.ok()) {
    LOG(ERROR) << "Cannot set timeout of " << key << ": " << result.error();
    return 1;
  }
  return 0;
}

static int Invalidate(const Key& key) {
  if (auto result = key.Invalidate(); !result.ok()) {
    LOG(ERROR) << "Cannot invalidate " << key << ": " << result.error();
    return 1;
  }
  return 0;
}

static int Revoke(const Key& key) {
  if (auto result = key.Revoke(); !result.ok()) {
    LOG(ERROR) << "Cannot revoke " << key << ": " << result.error();
    return 1;
  }
  return 0;
}

static int RestrictKeyring(const std::string& keyring) {
  auto ring = ResolveKeyring(keyring);
  if (!ring.ok()) {
    LOG(ERROR) << ring.error();
    return 1;
  }
  if (auto result = ring->Restrict(); !result.ok()) {
    LOG(ERROR) << "Cannot restrict keyring '" << keyring << "': " << result.error();
    return 1;
  }
  return 0;
}

// Instantiation runs from a request-key(8) handler, so the destination is passed through
// to the kernel unresolved.
static int Instantiate(const Key& key, const std::string& data, KeySerial ring) {
  if (auto result = key.AssumeAuthority(); !result.ok()) {
    LOG(ERROR) << "Cannot assume authority over " << key << ": " << result.error();
    return 1;
  }
  if (auto result = key.Instantiate(data, ring); !result.ok()) {
    LOG(ERROR) << "Cannot instantiate " << key << ": " << result.error();
    return 1;
  }
  return 0;
}

static int Reject(const Key& key, std::chrono::seconds timeout, KeySerial ring) {
  if (auto result = key.AssumeAuthority(); !result.ok()) {
    LOG(ERROR) << "Cannot assume authority over " << key << ": " << result.error();
    return 1;
  }
  if (auto result = key.Reject(timeout, ENOKEY, ring); !result.ok()) {
    LOG(ERROR) << "Cannot reject " << key << ": " << result.error();
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  android::base::InitLogging(argv, android::base::StderrLogger);

  if (argc > 1 && std::string(argv[1]) == "-v") {
    android::base::SetMinimumLogSeverity(android::base::VERBOSE);
    argv++;
    argc--;
  }
  if (argc < 2) Usage(1);
  const std::string action = argv[1];

  if (action == "add") {
    if (argc != 5) Usage(1);
    return Add(argv[2], argv[3], argv[4]);
  } else if (action == "padd") {
    if (argc != 4) Usage(1);
    return Padd(argv[2], argv[3]);
  } else if (action == "request") {
    if (argc != 4 && argc != 5) Usage(1);
    std::optional<std::string> callout;
    if (argc == 5) callout = argv[4];
    return Request(argv[2], argv[3], callout);
  } else if (action == "search") {
    if (argc != 4) Usage(1);
    return Search(argv[2], argv[3]);
  } else if (action == "newring") {
    if (argc != 4) Usage(1);
    return NewRing(argv[2], argv[3]);
  } else if (action == "link") {
    if (argc != 4) Usage(1);
    return Link(ParseKeyOrDie(argv[2]), argv[3]);
  } else if (action == "unlink") {
    if (argc != 4) Usage(1);
    return Unlink(ParseKeyOrDie(argv[2]), argv[3]);
  } else if (action == "list") {
    if (argc != 3 && argc != 4) Usage(1);
    size_t max_entries = kDefaultListSize;
    if (argc == 4 && !android::base::ParseUint(argv[3], &max_entries)) {
      LOG(ERROR) << "Unparsable entry count: '" << argv[3] << "'";
      Usage(1);
    }
    return List(argv[2], max_entries);
  } else if (action == "clear") {
    if (argc != 3) Usage(1);
    return Clear(argv[2]);
  } else if (action == "persistent") {
    if (argc != 3) Usage(1);
    return Persistent(argv[2]);
  } else if (action == "describe") {
    if (argc != 3) Usage(1);
    return Describe(ParseKeyOrDie(argv[2]));
  } else if (action == "print") {
    if (argc != 3) Usage(1);
    return Print(ParseKeyOrDie(argv[2]));
  } else if (action == "security") {
    if (argc != 3) Usage(1);
    return Security(ParseKeyOrDie(argv[2]));
  } else if (action == "setperm") {
    if (argc != 4) Usage(1);
    return SetPerm(ParseKeyOrDie(argv[2]), argv[3]);
  } else if (action == "timeout") {
    if (argc != 4) Usage(1);
    return Timeout(ParseKeyOrDie(argv[2]), ParseSecondsOrDie(argv[3]));
  } else if (action == "invalidate") {
    if (argc != 3) Usage(1);
    return Invalidate(ParseKeyOrDie(argv[2]));
  } else if (action == "revoke") {
    if (argc != 3) Usage(1);
    return Revoke(ParseKeyOrDie(argv[2]));
  } else if (action == "restrict_keyring") {
    if (argc != 3) Usage(1);
    return RestrictKeyring(argv[2]);
  } else if (action == "instantiate") {
    if (argc != 5) Usage(1);
    return Instantiate(ParseKeyOrDie(argv[2]), argv[3], ParseDestinationOrDie(argv[4]));
  } else if (action == "reject") {
    if (argc != 5) Usage(1);
    return Reject(ParseKeyOrDie(argv[2]), ParseSecondsOrDie(argv[3]),
                  ParseDestinationOrDie(argv[4]));
  } else {
    LOG(ERROR) << "Unrecognized action: " << action;
    Usage(1);
  }

  return 0;
}
