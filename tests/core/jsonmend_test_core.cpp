// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>
#include <string>

using jsonmend::core::ConfigLoader;
using jsonmend::core::Logger;
using jsonmend::test::LogCapture;

TEST_CASE("Logger Basic Levels", "[logger][levels]")
{
  LogCapture capture(Logger::Level::Info);

  Logger::debug("hidden debug");
  Logger::info("visible info");
  Logger::warning("visible warning");
  Logger::error("visible error");

  auto entries = capture.entries();
  REQUIRE(entries.size() == 3);
  REQUIRE(entries[0].level == Logger::Level::Info);
  REQUIRE(entries[0].raw == "visible info");
  REQUIRE(entries[0].formatted.find("[INFO]") != std::string::npos);
  REQUIRE(entries[1].formatted.find("[WARN]") != std::string::npos);
  REQUIRE(entries[2].level == Logger::Level::Error);
}

TEST_CASE("Logger Stream Macros", "[logger][macros]")
{
  LogCapture capture(Logger::Level::Trace);

  int count = 3;
  JSONMEND_LOG_TRACE("trace " << count);
  JSONMEND_LOG_DEBUG("debug " << count + 1);
  JSONMEND_LOG_WARN("warn " << 'x');

  REQUIRE(capture.contains(Logger::Level::Trace, "trace 3"));
  REQUIRE(capture.contains(Logger::Level::Debug, "debug 4"));
  REQUIRE(capture.contains(Logger::Level::Warning, "warn x"));
}

TEST_CASE("Logger Disabled Levels Skip Formatting", "[logger][levels]")
{
  LogCapture capture(Logger::Level::Error);
  int evaluated = 0;
  auto expensive = [&evaluated]()
  {
    ++evaluated;
    return std::string("value");
  };

  JSONMEND_LOG_DEBUG("expensive " << expensive());
  REQUIRE(evaluated == 0);
  REQUIRE(capture.entries().empty());
}

TEST_CASE("Logger Custom Format Strings", "[logger][format]")
{
  const std::string previous = Logger::getLogFormat();
  LogCapture capture(Logger::Level::Info);

  SECTION("Source location placeholders")
  {
    Logger::setLogFormat("%L|%F|%l|%f|%m|%%");
    JSONMEND_LOG_INFO("located");
    auto entries = capture.entries();
    REQUIRE(entries.size() == 1);
    const std::string &line = entries[0].formatted;
    REQUIRE(line.find("INFO|jsonmend_test_core.cpp|") == 0);
    REQUIRE(line.find("|located|%") != std::string::npos);
    REQUIRE(line.find("/") == std::string::npos);
  }

  SECTION("Empty format is ignored")
  {
    Logger::setLogFormat("%m");
    Logger::setLogFormat("");
    REQUIRE(Logger::getLogFormat() == "%m");
    Logger::info("plain");
    REQUIRE(capture.entries().at(0).formatted == "plain");
  }

  Logger::setLogFormat(previous);
}

TEST_CASE("Logger Level Names", "[logger][levels]")
{
  REQUIRE(Logger::levelFromString("DEBUG") == Logger::Level::Debug);
  REQUIRE(Logger::levelFromString("warn") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("Warning") == Logger::Level::Warning);
  REQUIRE_FALSE(Logger::levelFromString("verbose").has_value());
  REQUIRE(std::string(Logger::levelToString(Logger::Level::Fatal)) == "FATAL");
}

TEST_CASE("Logger File Output", "[logger][file]")
{
  jsonmend::test::TempFileManager files;
  const std::string path = "jsonmend_test_logger.log";
  files.write(path, "");

  const Logger::Level previous = Logger::getLevel();
  Logger::init(Logger::Level::Info, path);
  Logger::info("to file");
  Logger::init(previous);

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  REQUIRE(content.str().find("to file") != std::string::npos);
}

TEST_CASE("ConfigLoader basic operations", "[config][ConfigLoader]")
{
  jsonmend::test::TempFileManager files;
  const std::string cfgFile = files.write("jsonmend_test_config.toml",
                                          "[section]\n"
                                          "int_val = 42\n"
                                          "bool_val = true\n"
                                          "str_val = 'hello'\n"
                                          "names = [\"a\", \"b\"]\n"
                                          "mixed = [\"a\", 1]\n"
                                          "[other]\n"
                                          "float_val = 3.14\n");

  ConfigLoader loader(cfgFile);

  SECTION("Typed getters")
  {
    REQUIRE(loader.getInt("section.int_val") == 42);
    REQUIRE(loader.getBool("section.bool_val") == true);
    REQUIRE(loader.getString("section.str_val") == "hello");
    REQUIRE(loader.get<double>("other.float_val").value() == Approx(3.14));
  }

  SECTION("Missing keys and type mismatches are empty")
  {
    REQUIRE_FALSE(loader.getInt("section.missing").has_value());
    REQUIRE_FALSE(loader.getInt("section.str_val").has_value());
    REQUIRE_FALSE(loader.getString("nosuch.table.key").has_value());
  }

  SECTION("String arrays")
  {
    auto names = loader.getStringArray("section.names");
    REQUIRE(names.has_value());
    REQUIRE((*names == std::vector<std::string>{"a", "b"}));
    REQUIRE_THROWS_AS(loader.getStringArray("section.mixed"), std::runtime_error);
    REQUIRE_FALSE(loader.getStringArray("section.int_val").has_value());
  }

  SECTION("Reload picks up changes")
  {
    files.write(cfgFile, "[section]\nint_val = 7\n");
    loader.reload();
    REQUIRE(loader.getInt("section.int_val") == 7);
  }
}

TEST_CASE("ConfigLoader errors", "[config][ConfigLoader]")
{
  SECTION("Missing file names the file")
  {
    try
    {
      ConfigLoader loader("/nonexistent/jsonmend.toml");
      FAIL("expected an exception");
    }
    catch (const std::runtime_error &e)
    {
      REQUIRE(std::string(e.what()).find("/nonexistent/jsonmend.toml") != std::string::npos);
    }
  }

  SECTION("In-memory configuration")
  {
    auto loader = ConfigLoader::fromString("[a]\nb = \"c\"\n");
    REQUIRE(loader.filename().empty());
    REQUIRE(loader.getString("a.b") == "c");
  }
}
