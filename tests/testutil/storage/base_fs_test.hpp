/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "testutil/prepare_loggers.hpp"

namespace test {

  namespace fs = std::filesystem;

  /**
   * Base test that owns a scratch directory. The directory is recreated
   * empty before each test and removed after it.
   */
  struct BaseFS_Test : public ::testing::Test {
    explicit BaseFS_Test(fs::path path) : base_path(std::move(path)) {
      clear();
      mkdir();
    }

    ~BaseFS_Test() override {
      clear();
    }

    void clear() {
      std::error_code ec;
      fs::remove_all(base_path, ec);
    }

    void mkdir() {
      fs::create_directories(base_path);
    }

    std::string getPathString() const {
      return base_path.native();
    }

    void SetUp() override {
      clear();
      mkdir();
    }

    void TearDown() override {
      clear();
    }

   protected:
    fs::path base_path;
  };

}  // namespace test
