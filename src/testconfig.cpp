#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "log.hpp"

using namespace arbor;
using proof::Lang;
using proof::Mode;

namespace {

  TEST(ConfigTest, Defaults) {
    auto const c = Config::parse("{}");
    EXPECT_EQ(c.lang, Lang::Coq);
    EXPECT_EQ(c.mode, Mode::Proof);
    EXPECT_TRUE(c.preludes);
    EXPECT_FALSE(c.json);
    EXPECT_EQ(c.log, Logger::Warn);
  }

  TEST(ConfigTest, AllFields) {
    auto const c = Config::parse(R"({"lang": "dot", "mode": "term", "preludes": false, "json": true, "log": "debug"})");
    EXPECT_EQ(c.lang, Lang::Dot);
    EXPECT_EQ(c.mode, Mode::Term);
    EXPECT_FALSE(c.preludes);
    EXPECT_TRUE(c.json);
    EXPECT_EQ(c.log, Logger::Debug);
    auto const j = nlohmann::json(c);
    EXPECT_EQ(j["lang"], "dot");
    EXPECT_EQ(j["log"], "debug");
    EXPECT_EQ(j.get<Config>().mode, Mode::Term);
  }

  TEST(ConfigTest, Errors) {
    EXPECT_THROW(Config::parse("{"), ConfigError);
    EXPECT_THROW(Config::parse("[]"), ConfigError);
    EXPECT_THROW(Config::parse(R"({"color": true})"), ConfigError);
    EXPECT_THROW(Config::parse(R"({"lang": "lean"})"), ConfigError);
    EXPECT_THROW(Config::parse(R"({"preludes": "yes"})"), ConfigError);
    EXPECT_THROW(Config::load("/nonexistent/arbor.json"), ConfigError);
  }

  TEST(LoggerTest, LevelsAndSections) {
    EXPECT_EQ(Logger::levelName(Logger::Error), "error");
    EXPECT_EQ(Logger::levelName(Logger::Debug), "debug");
    auto out = std::ostringstream();
    auto log = Logger(out, Logger::Info);
    log.debug("proof", "hidden");
    log.info("proof.prelude", "shown ", 42);
    EXPECT_EQ(out.str(), "[info] proof.prelude: shown 42\n");
    EXPECT_FALSE(log.enabled(Logger::Debug));
  }

  TEST(ConfigTest, Load) {
    auto const path = ::testing::TempDir() + "arbor_config_test.json";
    {
      auto out = std::ofstream(path);
      out << R"({"mode": "term"})";
    }
    EXPECT_EQ(Config::load(path).mode, Mode::Term);
    std::remove(path.c_str());
  }

}
