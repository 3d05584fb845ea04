/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_fs_test.hpp"

#include <algorithm>

namespace test {

  void BaseFS_Test::clear() {
    if (fs::exists(base_path)) {
      fs::remove_all(base_path);
    }
  }

  void BaseFS_Test::mkdir() {
    fs::create_directories(base_path);
  }

  std::string BaseFS_Test::getPathString() const {
    return fs::canonical(base_path).string();
  }

  std::vector<std::string> BaseFS_Test::listDirectory() const {
    std::vector<std::string> names;
    for (const auto &entry : fs::directory_iterator(base_path)) {
      names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  BaseFS_Test::~BaseFS_Test() {
    clear();
  }

  namespace {
    gorc::log::Logger testingLogger() {
      testutil::prepareLoggers();
      return gorc::log::createLogger("BaseFS_Test", "testing");
    }
  }  // namespace

  BaseFS_Test::BaseFS_Test(fs::path path)
      : base_path(std::move(path)), logger(testingLogger()) {
    clear();
    mkdir();
    logger->setLevel(gorc::log::Level::DEBUG);
  }

  void BaseFS_Test::SetUp() {
    clear();
    mkdir();
  }

  void BaseFS_Test::TearDown() {
    clear();
  }
}  // namespace test
