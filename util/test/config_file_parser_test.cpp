// Voile
//
// Copyright (c) 2023 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "gtest/gtest.h"

#include "config_file_parser.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

using namespace voile::util;

using testing::InitGoogleTest;

class config_file_parser_test : public ::testing::Test {
 protected:
  void SetUp() override {
    char name[] = "/tmp/voile_config_test_XXXXXX";
    const auto fd = mkstemp(name);
    ASSERT_NE(-1, fd);
    close(fd);
    path_ = name;
  }

  void TearDown() override { std::remove(path_.c_str()); }

  void write(const std::string& content) {
    std::ofstream out{path_};
    out << content;
  }

  std::string path_;
  logging::Logger logger_ = logging::getLogger("voile.util.config-test");
};

TEST_F(config_file_parser_test, key_values_lists_and_comments) {
  write(
      "# verifier settings\n"
      "domain_separator: voile_testnet\n"
      "\n"
      "persistence_timeout_ms:   250  \n"
      "peers:\n"
      "  - a\n"
      "  - b\n");
  ConfigFileParser parser{logger_, path_};
  parser.parse();
  ASSERT_EQ("voile_testnet", parser.get_value<std::string>("domain_separator"));
  ASSERT_EQ(250u, parser.get_value<std::uint32_t>("persistence_timeout_ms"));
  ASSERT_EQ(2, parser.count("peers"));
  ASSERT_EQ((std::vector<std::string>{"a", "b"}), parser.get_values<std::string>("peers"));
}

TEST_F(config_file_parser_test, optional_values_fall_back_to_default) {
  write("a: 1\n");
  ConfigFileParser parser{logger_, path_};
  parser.parse();
  ASSERT_EQ(7u, parser.get_optional_value<std::uint32_t>("missing", 7));
  ASSERT_THROW(parser.get_value<std::string>("missing"), std::runtime_error);
}

TEST_F(config_file_parser_test, value_without_key_is_a_parse_error) {
  write("- orphan\n");
  ConfigFileParser parser{logger_, path_};
  ASSERT_THROW(parser.parse(), ConfigFileParser::ParseError);
}

TEST_F(config_file_parser_test, line_without_delimiter_is_a_parse_error) {
  write("just some words\n");
  ConfigFileParser parser{logger_, path_};
  ASSERT_THROW(parser.parse(), ConfigFileParser::ParseError);
}

TEST(config_file_parser, missing_file) {
  auto logger = logging::getLogger("voile.util.config-test");
  ConfigFileParser parser{logger, "/nonexistent/voile.yaml"};
  ASSERT_THROW(parser.parse(), std::runtime_error);
}

TEST(string_utils, split_keeps_empty_tokens) {
  ASSERT_EQ((std::vector<std::string>{"custom", "", "5"}), split("custom::5", ':'));
  ASSERT_EQ((std::vector<std::string>{"standard"}), split("standard", ':'));
}

TEST(string_utils, to_bool) {
  ASSERT_TRUE(to<bool>("true"));
  ASSERT_FALSE(to<bool>("0"));
  ASSERT_THROW(to<bool>("yes"), std::invalid_argument);
}

TEST(string_utils, to_unsigned_rejects_what_does_not_fit) {
  ASSERT_EQ(4294967295u, to<std::uint32_t>("4294967295"));
  ASSERT_THROW(to<std::uint32_t>("4294967296"), std::out_of_range);
  ASSERT_THROW(to<std::uint32_t>("5000000000"), std::out_of_range);
  ASSERT_THROW(to<std::uint32_t>("-1"), std::out_of_range);
  ASSERT_THROW(to<std::uint32_t>(" -7"), std::out_of_range);
  ASSERT_THROW(to<std::uint16_t>("65536"), std::out_of_range);
  ASSERT_EQ(65535u, to<std::uint16_t>("65535"));
  ASSERT_THROW(to<unsigned long long>("-1"), std::out_of_range);
  ASSERT_THROW(to<std::uint32_t>("soon"), std::invalid_argument);
}

}  // namespace

int main(int argc, char* argv[]) {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
