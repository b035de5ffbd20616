#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core.hpp"
#include "log.hpp"
#include "proof/prelude.hpp"

using namespace arbor;
using namespace arbor::proof;
using std::string;
using std::vector;

namespace {

  class PreludeTest: public ::testing::Test {
  protected:
    std::ostringstream out;
    Logger log{out, Logger::Debug};
    core::Builder b;
    PreludeGraph graph{log};

    auto emitted(vector<Prelude const*> const& entries) -> vector<string> {
      auto res = vector<string>();
      graph.emit(entries, [&res](Prelude const& p) { res.push_back(p.tag == Prelude::Require ? p.unit : p.id->name); });
      return res;
    }
  };

  TEST_F(PreludeTest, SharedDependencyEmittedOnce) {
    auto const a = graph.require("A");
    auto const pb = graph.require("B", {a});
    auto const c = graph.require("C", {a});
    EXPECT_EQ(emitted({pb, c}), (vector<string>{"A", "B", "C"}));
    EXPECT_EQ(emitted({c, pb, c}), (vector<string>{"A", "B", "C"}));
    EXPECT_EQ(emitted({c}), (vector<string>{"A", "C"}));
  }

  TEST_F(PreludeTest, OnlyPrerequisitesAreEmitted) {
    auto const a = graph.require("A");
    auto const pb = graph.require("B", {a});
    graph.require("D");
    auto const e = graph.require("E", {pb});
    EXPECT_EQ(emitted({e}), (vector<string>{"A", "B", "E"}));
    EXPECT_EQ(emitted({}), vector<string>());
  }

  TEST_F(PreludeTest, RegistrationIsDeduplicated) {
    auto const a = graph.require("A");
    EXPECT_EQ(graph.require("A"), a);
    EXPECT_EQ(graph.size(), 1u);
    auto const id = b.constant("mp", b.type());
    auto const al = graph.alias(id, b.arrow(b.prop(), b.prop()));
    EXPECT_EQ(graph.alias(id, b.arrow(b.prop(), b.prop())), al);
    EXPECT_EQ(graph.size(), 2u);
  }

  TEST_F(PreludeTest, LaterEdgesAreTakenIntoAccount) {
    auto const y = graph.require("Y");
    EXPECT_EQ(emitted({y}), vector<string>{"Y"});
    auto const x = graph.require("X");
    // Adds an edge X ---> Y to an existing entry
    graph.require("Y", {x});
    EXPECT_EQ(emitted({y}), (vector<string>{"X", "Y"}));
  }

  TEST_F(PreludeTest, UnorderedEntriesKeepRegistrationOrder) {
    auto const x = graph.require("X");
    auto const y = graph.require("Y");
    auto const z = graph.require("Z");
    EXPECT_EQ(emitted({z, x, y}), (vector<string>{"X", "Y", "Z"}));
  }

  TEST_F(PreludeTest, AliasesAndRequires) {
    auto const logic = graph.require("Logic");
    auto const A = b.var(b.constant("A", b.prop()));
    auto const x = b.variable("x", A);
    auto const id = b.constant("idA", b.arrow(A, A));
    auto const al = graph.alias(id, b.lam(x, b.var(x)), {logic});
    EXPECT_EQ(al->tag, Prelude::Alias);
    EXPECT_EQ(al->toString(), "alias: idA -> \\x: A => x");
    EXPECT_EQ(logic->toString(), "require: Logic");
    EXPECT_EQ(emitted({al}), (vector<string>{"Logic", "idA"}));
  }

  TEST_F(PreludeTest, CyclesAreReported) {
    auto const p = graph.require("P");
    auto const q = graph.require("Q", {p});
    graph.require("P", {q});
    EXPECT_EQ(emitted({p}), (vector<string>{"P", "Q"}));
    EXPECT_NE(out.str().find("cycle"), string::npos);
  }

  TEST_F(PreludeTest, MistypedAliasIsFatal) {
    auto const A = b.var(b.constant("A", b.prop()));
    auto const id = b.constant("bad", A);
    EXPECT_DEATH(graph.alias(id, b.prop()), "Assertion failed");
  }

  TEST_F(PreludeTest, ConflictingAliasIsFatal) {
    auto const A = b.var(b.constant("A", b.prop()));
    auto const B = b.var(b.constant("B", b.prop()));
    auto const id = b.constant("t", b.prop());
    graph.alias(id, A);
    EXPECT_DEATH(graph.alias(id, B), "Assertion failed");
  }

}
