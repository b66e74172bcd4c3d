// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#include "gtest/gtest.h"

#include "config_file_parser.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace {

using cloak::util::ConfigFileParser;

logging::Logger logger = logging::getLogger("cloak.util.config-test");

std::filesystem::path writeFile(const std::string& name, const std::string& contents) {
  auto path = std::filesystem::path{::testing::TempDir()} / name;
  std::ofstream out(path);
  out << contents;
  return path;
}

TEST(config_file_parser, values_lists_and_comments) {
  auto path = writeFile("values.yaml",
                        "# prover settings\n"
                        "prover.worker_threads: 4\n"
                        "\n"
                        "  compliance.conservation_policy :  delta-balanced  \n"
                        "trusted_images:\n"
                        "  - aa\n"
                        "  - bb\n");
  ConfigFileParser parser(logger, path);
  parser.parse();

  ASSERT_EQ(1u, parser.count("prover.worker_threads"));
  ASSERT_EQ(4u, parser.get_value<std::uint32_t>("prover.worker_threads"));
  ASSERT_EQ("delta-balanced", parser.get_value<std::string>("compliance.conservation_policy"));
  ASSERT_EQ((std::vector<std::string>{"aa", "bb"}), parser.get_values<std::string>("trusted_images"));
}

TEST(config_file_parser, missing_keys) {
  auto path = writeFile("missing.yaml", "a: 1\n");
  ConfigFileParser parser(logger, path);
  parser.parse();
  ASSERT_EQ(0u, parser.count("b"));
  ASSERT_EQ(7u, parser.get_optional_value<std::uint64_t>("b", 7));
  ASSERT_THROW(parser.get_value<std::string>("b"), std::runtime_error);
}

TEST(config_file_parser, bad_values) {
  auto path = writeFile("bad_value.yaml", "threads: many\nflag: maybe\n");
  ConfigFileParser parser(logger, path);
  parser.parse();
  ASSERT_THROW(parser.get_value<std::uint32_t>("threads"), ConfigFileParser::ValueError);
  ASSERT_THROW(parser.get_value<bool>("flag"), ConfigFileParser::ValueError);
}

TEST(config_file_parser, malformed_file) {
  ConfigFileParser orphan(logger, writeFile("orphan.yaml", "- value without key\n"));
  ASSERT_THROW(orphan.parse(), ConfigFileParser::ParseError);

  ConfigFileParser no_delimiter(logger, writeFile("no_delimiter.yaml", "just words\n"));
  ASSERT_THROW(no_delimiter.parse(), ConfigFileParser::ParseError);

  ConfigFileParser missing(logger, std::filesystem::path{::testing::TempDir()} / "does_not_exist.yaml");
  ASSERT_THROW(missing.parse(), std::runtime_error);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
