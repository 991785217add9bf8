/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_fs_test.hpp"

#include <boost/filesystem/fstream.hpp>

namespace test {

  BaseFS_Test::BaseFS_Test(fs::path path) : base_path(std::move(path)) {
    clear();
    mkdir();
  }

  BaseFS_Test::~BaseFS_Test() {
    clear();
  }

  void BaseFS_Test::clear() {
    if (fs::exists(base_path)) {
      fs::remove_all(base_path);
    }
  }

  void BaseFS_Test::mkdir() {
    fs::create_directory(base_path);
  }

  fs::path BaseFS_Test::path(const fs::path &filename) const {
    return base_path / filename;
  }

  fs::path BaseFS_Test::createFile(const fs::path &filename,
                                   const std::string &content) const {
    auto pathname = path(filename);
    boost::filesystem::ofstream ofs(pathname);
    ofs << content;
    ofs.close();
    return pathname;
  }

  bool BaseFS_Test::exists(const fs::path &entity) const {
    return boost::filesystem::exists(path(entity));
  }

  void BaseFS_Test::SetUp() {
    clear();
    mkdir();
  }

  void BaseFS_Test::TearDown() {
    clear();
  }
}  // namespace test
