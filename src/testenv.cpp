#include <sstream>
#include <gtest/gtest.h>
#include "core.hpp"
#include "log.hpp"
#include "proof/env.hpp"

using namespace arbor;
using namespace arbor::proof;

namespace {

  class EnvTest: public ::testing::Test {
  protected:
    std::ostringstream out;
    Logger log{out, Logger::Debug};
    Builder b;
    Coercions coercions{b, log};
    Expr const* A = b.var(b.constant("A", b.prop()));
    Expr const* B = b.var(b.constant("B", b.prop()));
  };

  TEST_F(EnvTest, LocalBindingsShadowGlobalOnes) {
    auto const c = b.constant("c", A);
    auto const h = b.variable("h", A);
    auto const global = Env().declare(c);
    EXPECT_EQ(global.get(A), c);
    auto const env = global.add(h);
    EXPECT_TRUE(env.mem(A));
    EXPECT_EQ(env.get(A), h);
    EXPECT_FALSE(env.mem(B));
    EXPECT_FALSE(env.get(B).has_value());
    EXPECT_EQ(env.count(), 2u);
    // Environments are values
    EXPECT_EQ(global.count(), 1u);
    EXPECT_FALSE(global.exists(h));
  }

  TEST_F(EnvTest, NameConflicts) {
    auto const h = b.variable("h", A);
    auto const h1 = b.variable("h", B);
    auto const env = Env().add(h);
    try {
      auto const bad = env.add(h1);
      FAIL() << "expected a conflict, got " << bad.toString();
    } catch (NameConflict const& e) {
      EXPECT_EQ(e.added, h1);
      EXPECT_EQ(e.existing, h);
    }
    EXPECT_THROW(env.declare(b.constant("h", B)), NameConflict);
  }

  TEST_F(EnvTest, DeclareRejectsVariables) {
    auto const h = b.variable("h", A);
    EXPECT_DEATH(Env().declare(h), "Assertion failed");
  }

  TEST_F(EnvTest, IntroMintsFreshNames) {
    auto env = Env().add(b.variable("H1", A));
    auto names = std::vector<std::string>();
    for (auto i = 0; i < 3; i++) {
      auto [id, next] = env.intro(b, "H", B);
      EXPECT_FALSE(env.exists(id));
      EXPECT_TRUE(next.exists(id));
      EXPECT_TRUE(id->isVar());
      names.push_back(id->name);
      env = std::move(next);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"H0", "H2", "H3"}));
    // Other prefixes have their own counters
    EXPECT_EQ(env.intro(b, "x", A).first->name, "x0");
  }

  TEST_F(EnvTest, HiddenIntro) {
    auto const [id, env] = Env().intro(b, "H", A, true);
    EXPECT_TRUE(env.exists(id));
    EXPECT_FALSE(env.mem(A));
    EXPECT_TRUE(env.bindings().empty());
    EXPECT_EQ(env.intro(b, "H", A).first->name, "H1");
  }

  TEST_F(EnvTest, BindingsAreSorted) {
    auto const env = Env()
                       .declare(b.constant("z", A))
                       .declare(b.constant("a", B))
                       .add(b.variable("y", b.arrow(A, B)))
                       .add(b.variable("b", b.arrow(B, A)));
    auto names = std::vector<std::string>();
    for (auto const& [t, id]: env.bindings()) {
      EXPECT_EQ(*t, *id->type);
      names.push_back(id->name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"b", "y", "a", "z"}));
    auto const s = Sequent{env, A}.toString();
    EXPECT_EQ(s.rfind("sequent:\n  env:\n    b (", 0), 0u);
    EXPECT_NE(s.find("\n  goal: A"), std::string::npos);
  }

  TEST_F(EnvTest, FindThroughCoercions) {
    auto const h = b.variable("h", A);
    auto const env = Env().add(h);
    EXPECT_EQ(*env.find(coercions, A), *b.var(h));
    EXPECT_THROW(env.find(coercions, B), NotIntroduced);
    // A proof of A can be turned into a proof of B
    auto const ab = b.var(b.constant("ab", b.arrow(A, B)));
    coercions.add("weaken", [&](Expr const* f) {
      auto res = std::vector<Coerced>();
      if (*f == *B) res.push_back({A, [&](Expr const* x) { return b.app(ab, x); }});
      return res;
    });
    auto const found = env.find(coercions, B);
    EXPECT_EQ(*found, *b.app(ab, b.var(h)));
    EXPECT_EQ(*found->type(), *B);
  }

  TEST_F(EnvTest, MistypedCoercionIsFatal) {
    auto const env = Env().add(b.variable("h", A));
    coercions.add("broken", [&](Expr const* f) {
      auto res = std::vector<Coerced>();
      if (*f == *B) res.push_back({A, [](Expr const* x) { return x; }});
      return res;
    });
    EXPECT_DEATH(env.find(coercions, B), "Unreachable");
  }

}
