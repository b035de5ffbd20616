#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core.hpp"
#include "log.hpp"
#include "proof/json.hpp"
#include "proof/lang.hpp"
#include "proof/print.hpp"
#include "proof/session.hpp"
#include "proof/steps.hpp"
#include "proof/tactics.hpp"
#include "proof/tree.hpp"

using namespace arbor;
using namespace arbor::proof;
using std::string;
using std::vector;

namespace {

  class PrintTest: public ::testing::Test {
  protected:
    std::ostringstream log_out;
    Logger log{log_out, Logger::Debug};
    Session session{log};
    Builder& b = session.builder();
    Expr const* A = b.var(b.constant("A", b.prop()));
    Expr const* B = b.var(b.constant("B", b.prop()));

    // (A -> B) -> A -> B
    auto modusPonens() -> Proof {
      auto proof = mkProof(session, {Env(), b.arrow(b.arrow(A, B), b.arrow(A, B))});
      auto const [ids, pos] = introsTac(session, rootPos(proof), "H");
      auto const args = applyTac(session, pos, b.var(ids[0]), 1);
      exactTac(session, args[0], b.var(ids[1]));
      return proof;
    }

    auto coq(Proof const& proof) -> string {
      auto out = std::ostringstream();
      printCoq(proof, out);
      return out.str();
    }
  };

  TEST_F(PrintTest, CoqScript) {
    EXPECT_EQ(
      coq(modusPonens()),
      "(* PROOF START *)\n"
      "intro H0.\n"
      "intro H1.\n"
      "apply H0.\n"
      "exact H1.\n"
      "(* PROOF END *)\n"
    );
  }

  TEST_F(PrintTest, CoqBullets) {
    auto const g = b.variable("g", b.arrow(A, b.arrow(A, A)));
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(g).add(a), A});
    auto const l0 = applyTac(session, rootPos(proof), b.var(g), 2);
    auto const l1 = applyTac(session, l0[0], b.var(g), 2);
    auto const l2 = applyTac(session, l1[0], b.var(g), 2);
    for (auto const& pos: {l2[0], l2[1], l1[1], l0[1]}) exactTac(session, pos, b.var(a));
    EXPECT_EQ(
      coq(proof),
      "(* PROOF START *)\n"
      "apply g.\n"
      "- apply g.\n"
      "  + apply g.\n"
      "    -- exact a.\n"
      "    -- exact a.\n"
      "  + exact a.\n"
      "- exact a.\n"
      "(* PROOF END *)\n"
    );
  }

  TEST_F(PrintTest, CoqSideConditionsAreBoxed) {
    auto const split = Step<unit, unit>({
      .name = "split3",
      .compute = [](Session&, Sequent const& ctx,
                    unit const&) { return std::pair{unit(), vector<Sequent>(3, ctx)}; },
      .elaborate = [](Session&, unit const&, vector<Expr const*> const& args) { return args.back(); },
      .coq = {Pretty::LastButNotLeast, [](std::ostream& os, unit const&) { os << "split3."; }},
    });
    auto const a1 = b.variable("a1", A);
    auto const a2 = b.variable("a2", A);
    auto const a3 = b.variable("a3", A);
    auto proof = mkProof(session, {Env().add(a1).add(a2).add(a3), A});
    auto const [_, subs] = applyStep(session, rootPos(proof), split, unit());
    ASSERT_EQ(subs.size(), 3u);
    exactTac(session, subs[0], b.var(a1));
    exactTac(session, subs[1], b.var(a2));
    exactTac(session, subs[2], b.var(a3));
    EXPECT_EQ(
      coq(proof),
      "(* PROOF START *)\n"
      "split3.\n"
      "{ exact a1. }\n"
      "{ exact a2. }\n"
      "exact a3.\n"
      "(* PROOF END *)\n"
    );
    // Graph form has no rendering for this step
    auto out = std::ostringstream();
    printDot(proof, out);
    EXPECT_NE(out.str().find("<TD>split3</TD><TD>N/A</TD>"), string::npos);
  }

  TEST_F(PrintTest, CoqCutAndLet) {
    auto const f = b.variable("f", b.arrow(A, B));
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(f).add(a), B});
    auto const [c, side, rest] = cutTac(session, rootPos(proof), "C", A);
    auto const [x, pos] = letinTac(session, side, "x", b.var(a));
    exactTac(session, pos, b.var(x));
    auto const args = applyTac(session, rest, b.var(f), 1);
    exactTac(session, args[0], b.var(c));
    EXPECT_EQ(
      coq(proof),
      "(* PROOF START *)\n"
      "assert (C0: A).\n"
      "{ pose proof (a) as x0.\n"
      "  exact x0. }\n"
      "apply f.\n"
      "exact C0.\n"
      "(* PROOF END *)\n"
    );
  }

  TEST_F(PrintTest, CoqRejectsOpenProofs) {
    auto proof = mkProof(session, {Env(), b.arrow(A, A)});
    introTac(session, rootPos(proof), "H");
    EXPECT_THROW(coq(proof), OpenProof);
  }

  TEST_F(PrintTest, DotGraph) {
    auto proof = mkProof(session, {Env(), b.arrow(b.arrow(A, B), b.arrow(A, B))});
    auto const [h, pos] = introTac(session, rootPos(proof), "H");
    auto out = std::ostringstream();
    printDot(proof, out);
    auto const s = out.str();
    auto const rootId = "node_" + std::to_string(root(proof).id());
    auto const openId = "node_" + std::to_string(pos.node().id());
    EXPECT_EQ(s.rfind("digraph proof {\nroot [shape=plaintext", 0), 0u);
    EXPECT_NE(s.find(R"(<TD BGCOLOR="PURPLE" colspan="3">ROOT</TD>)"), string::npos);
    EXPECT_NE(s.find(R"(<TD BGCOLOR="YELLOW" colspan="3">(A -&gt; B) -&gt; A -&gt; B</TD>)"), string::npos);
    EXPECT_NE(s.find("root -> " + rootId + ";\n"), string::npos);
    EXPECT_NE(s.find(rootId + " -> " + openId + ";\n"), string::npos);
    EXPECT_NE(s.find("<TD>intro</TD><TD>H0: A -&gt; B</TD>"), string::npos);
    auto const openRow = R"(<TD BGCOLOR="RED" rowspan="1">OPEN ()" + std::to_string(pos.node().id()) + ")</TD><TD>H0</TD>";
    EXPECT_NE(s.find(openRow), string::npos);
    EXPECT_EQ(s.substr(s.size() - 2), "}\n");
  }

  TEST_F(PrintTest, Terms) {
    auto const proof = modusPonens();
    auto out = std::ostringstream();
    printTerm(session, Lang::Coq, proof, out);
    EXPECT_EQ(out.str(), "(* PROOF START *)\nfun (H0 : A -> B) => fun (H1 : A) => H0 H1\n(* PROOF END *)\n");
    out.str("");
    printTerm(session, Lang::Dot, proof, out);
    EXPECT_NE(out.str().find("root -> term;\n"), string::npos);
    EXPECT_NE(out.str().find("<TD>\\H0: A -&gt; B =&gt; \\H1: A =&gt; H0 H1</TD>"), string::npos);
    // Post-processing must keep the type
    out.str("");
    printTerm(session, Lang::Coq, proof, out, [this](Expr const* t) { return t->reduce(b); });
    EXPECT_FALSE(out.str().empty());
    EXPECT_DEATH(printTerm(session, Lang::Coq, proof, out, [this](Expr const*) { return A; }), "Unreachable");
  }

  TEST_F(PrintTest, CoqTermSyntax) {
    auto const nat = b.var(b.constant("nat", b.type()));
    auto const P = b.constant("P", b.arrow(nat, b.prop()));
    auto const n = b.variable("n", nat);
    auto const all = b.pi(n, b.app(b.var(P), b.var(n)));
    EXPECT_EQ(coq::term(all), "forall (n : nat), P n");
    EXPECT_EQ(coq::term(b.arrow(all, A)), "(forall (n : nat), P n) -> A");
    auto const v = b.variable("v", A);
    auto const a = b.var(b.variable("a", A));
    EXPECT_EQ(coq::term(b.let(v, a, b.var(v))), "let v : A := a in v");
    auto const f = b.var(b.variable("f", b.arrow(b.arrow(A, A), A)));
    auto const x = b.variable("x", A);
    EXPECT_EQ(coq::term(b.app(f, b.lam(x, b.var(x)))), "f (fun (x : A) => x)");
    EXPECT_EQ(dot::escape("a < b && \"c\" > d"), "a &lt; b &amp;&amp; &quot;c&quot; &gt; d");
  }

  TEST_F(PrintTest, Preludes) {
    auto const logic = session.preludes().require("Logic");
    auto const x = b.variable("x", A);
    auto const idA = b.constant("idA", b.arrow(A, A));
    auto const alias = session.preludes().alias(idA, b.lam(x, b.var(x)), {logic});
    session.preludes().require("Unused");
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().declare(idA).add(a), A});
    auto const args = applyTac(session, rootPos(proof), b.var(idA), 1, {alias});
    exactTac(session, args[0], b.var(a));

    auto out = std::ostringstream();
    print(session, Lang::Coq, proof, out);
    EXPECT_EQ(
      out.str(),
      "(* Prelude: Module import *)\n"
      "Require Import Logic.\n"
      "(* Prelude: Alias *)\n"
      "pose (idA := fun (x : A) => x).\n"
      "(* PROOF START *)\n"
      "apply idA.\n"
      "exact a.\n"
      "(* PROOF END *)\n"
    );
    out.str("");
    printTermPreludes(session, Lang::Coq, proof, out);
    EXPECT_EQ(
      out.str(),
      "(* Prelude: Module import *)\n"
      "Require Import Logic.\n"
      "(* Prelude: Alias *)\n"
      "Definition idA : A -> A := fun (x : A) => x.\n"
    );
    out.str("");
    printTermPreludes(session, Lang::Dot, proof, out);
    EXPECT_TRUE(out.str().empty());
  }

  TEST_F(PrintTest, Json) {
    auto proof = mkProof(session, {Env(), b.arrow(A, A)});
    auto const [h, pos] = introTac(session, rootPos(proof), "H");
    auto j = toJson(proof);
    EXPECT_EQ(j["goal"], "A -> A");
    auto const& r = j["root"];
    EXPECT_EQ(r["id"], root(proof).id());
    EXPECT_EQ(r["open"], false);
    EXPECT_EQ(r["step"], "intro");
    EXPECT_EQ(r["label"], "intro H0.");
    ASSERT_EQ(r["branches"].size(), 1u);
    auto const& child = r["branches"][0];
    EXPECT_EQ(child["open"], true);
    EXPECT_EQ(child["label"], "OPEN (" + std::to_string(pos.node().id()) + ")");
    EXPECT_NE(child["sequent"].get<string>().find("goal: A"), string::npos);
    EXPECT_TRUE(child["branches"].empty());
    exactTac(session, pos, b.var(h));
    j = toJson(proof);
    EXPECT_EQ(j["root"]["branches"][0]["label"], "exact H0.");
  }

}
