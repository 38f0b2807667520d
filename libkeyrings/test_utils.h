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

#include <dirent.h>
#include <fnmatch.h>

#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <android-base/strings.h>
#include <gtest/gtest.h>

#include <keyrings/keyring.h>

namespace keyrings {

// Runs every test inside a fresh anonymous session keyring, so tests neither see nor disturb
// the keys of whoever runs them. Skips when keyrings are unavailable, e.g. when a seccomp
// filter blocks keyctl(2) inside a container.
class SessionKeyringTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto session = Keyring::JoinSession();
    if (!session.ok()) {
      GTEST_SKIP() << "Kernel keyrings unavailable: " << session.error();
    }
    session_.emplace(*session);
  }

  const Keyring& session() const { return *session_; }

 private:
  std::optional<Keyring> session_;
};

// Each thread has its own thread keyring, created on first use. Tests that depend on it not
// existing yet run on a new thread.
template <typename F>
void RunOnNewThread(F&& fn) {
  std::thread thread(std::forward<F>(fn));
  thread.join();
}

// Whether request-key(8) has a "create" rule for |type| keys matching |description|, i.e.
// whether a request_key() with callout info can be satisfied on this machine.
inline bool ConfHasRequestKeyRule(const std::string& path, const std::string& type,
                                  const std::string& description) {
  std::string conf;
  if (!android::base::ReadFileToString(path, &conf)) {
    return false;
  }
  for (const auto& line : android::base::Split(conf, "\n")) {
    std::string trimmed = android::base::Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    std::vector<std::string> tokens;
    for (const auto& token : android::base::Split(trimmed, " \t")) {
      if (!token.empty()) tokens.push_back(token);
    }
    if (tokens.size() < 5 || tokens[0] != "create") {
      continue;
    }
    if (fnmatch(tokens[1].c_str(), type.c_str(), 0) == 0 &&
        fnmatch(tokens[2].c_str(), description.c_str(), 0) == 0) {
      return true;
    }
  }
  return false;
}

inline bool HasRequestKeyRule(const std::string& type, const std::string& description) {
  if (ConfHasRequestKeyRule("/etc/request-key.conf", type, description)) {
    return true;
  }
  std::unique_ptr<DIR, decltype(&closedir)> dir(opendir("/etc/request-key.d"), closedir);
  if (!dir) {
    return false;
  }
  while (dirent* entry = readdir(dir.get())) {
    std::string name = entry->d_name;
    if (!android::base::EndsWith(name, ".conf")) {
      continue;
    }
    if (ConfHasRequestKeyRule("/etc/request-key.d/" + name, type, description)) {
      return true;
    }
  }
  return false;
}

}  // namespace keyrings
