#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core.hpp"
#include "log.hpp"
#include "proof/dispatch.hpp"
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

  class TreeTest: public ::testing::Test {
  protected:
    std::ostringstream out;
    Logger log{out, Logger::Debug};
    Session session{log};
    Builder& b = session.builder();
    Expr const* A = b.var(b.constant("A", b.prop()));
    Expr const* B = b.var(b.constant("B", b.prop()));

    auto contains(string const& s, string const& sub) -> bool {
      return s.find(sub) != string::npos;
    }
  };

  TEST_F(TreeTest, ModusPonens) {
    auto const goal = b.arrow(b.arrow(A, B), b.arrow(A, B));
    auto proof = mkProof(session, {Env(), goal});
    EXPECT_TRUE(root(proof).isOpen());
    auto const [h0, p1] = introTac(session, rootPos(proof), "H");
    auto const [h1, p2] = introTac(session, p1, "H");
    EXPECT_EQ(h0->name, "H0");
    EXPECT_EQ(h1->name, "H1");
    auto const& seq = p2.node().sequent();
    EXPECT_EQ(*seq.goal, *B);
    EXPECT_EQ(seq.env.get(A), h1);
    EXPECT_EQ(seq.env.get(b.arrow(A, B)), h0);

    auto const [state, args] = applyStep(session, p2, steps::apply(), {b.var(h0), 1});
    EXPECT_EQ(state.n, 1u);
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(*args[0].node().sequent().goal, *A);
    EXPECT_EQ(args[0].node().sequent().env.count(), 2u);
    exactTac(session, args[0], b.var(h1));

    EXPECT_FALSE(root(proof).isOpen());
    EXPECT_EQ(root(proof).step().name(), "intro");
    auto const t = elaborate(session, proof);
    EXPECT_EQ(*t->type(), *goal);
    EXPECT_EQ(*t, *b.lam(h0, b.lam(h1, b.app(b.var(h0), b.var(h1)))));
  }

  TEST_F(TreeTest, NodesKnowTheirPositions) {
    auto proof = mkProof(session, {Env(), b.arrow(A, A)});
    auto const [h, pos] = introTac(session, rootPos(proof), "H");
    auto& node = pos.node();
    EXPECT_EQ(&node.pos().node(), &node);
    EXPECT_EQ(&root(proof).pos().node(), &root(proof));
    EXPECT_NE(node.id(), root(proof).id());
    EXPECT_GT(node.id(), 0u);
    ASSERT_EQ(root(proof).branches().size(), 1u);
    EXPECT_EQ(&root(proof).branches()[0], &node);
    EXPECT_THROW(node.branches(), OpenProof);
    EXPECT_TRUE(std::holds_alternative<Node::Open>(node.extract()));
    EXPECT_TRUE(std::holds_alternative<Node::Closed>(root(proof).extract()));
    exactTac(session, pos, b.var(h));
    EXPECT_TRUE(node.branches().empty());
  }

  TEST_F(TreeTest, ApplyArityShortfall) {
    auto const f = b.variable("f", b.arrow(A, B));
    auto proof = mkProof(session, {Env().add(f), B});
    auto const pos = rootPos(proof);
    try {
      applyTac(session, pos, b.var(f), 2);
      FAIL() << "expected a build failure";
    } catch (BuildFailure const& e) {
      EXPECT_EQ(e.pos.branches, pos.branches);
      EXPECT_EQ(e.pos.index, pos.index);
      EXPECT_TRUE(contains(e.message, "non-dependent"));
      auto const what = string(e.what());
      EXPECT_EQ(what.rfind("In context: " + std::to_string(root(proof).id()) + ": sequent:", 0), 0u);
      EXPECT_TRUE(contains(what, "f ("));
      EXPECT_TRUE(contains(what, "goal: B"));
    }
    // The node stays open, and another step can be tried
    EXPECT_TRUE(root(proof).isOpen());
    EXPECT_TRUE(contains(out.str(), "[warn] proof:"));
    EXPECT_EQ(applyTac(session, pos, b.var(f), 1).size(), 1u);
  }

  TEST_F(TreeTest, ApplyChecksResultType) {
    auto const f = b.variable("f", b.arrow(A, B));
    auto proof = mkProof(session, {Env().add(f), B});
    try {
      exactTac(session, rootPos(proof), b.var(f));
      FAIL() << "expected a build failure";
    } catch (BuildFailure const& e) {
      EXPECT_TRUE(contains(e.message, "Wrong result type"));
    }
    // Dependent products are not decomposed by `apply`
    auto const nat = b.var(b.constant("nat", b.type()));
    auto const P = b.constant("P", b.arrow(nat, b.prop()));
    auto const n = b.variable("n", nat);
    auto const g = b.variable("g", b.pi(n, b.app(b.var(P), b.var(n))));
    auto other = mkProof(session, {Env().add(g), B});
    EXPECT_THROW(applyTac(session, rootPos(other), b.var(g), 1), BuildFailure);
  }

  TEST_F(TreeTest, ApplyRejectsUnboundVariables) {
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env(), A});
    try {
      exactTac(session, rootPos(proof), b.var(a));
      FAIL() << "expected a build failure";
    } catch (BuildFailure const& e) {
      EXPECT_TRUE(contains(e.message, "[a] are free in"));
    }
  }

  TEST_F(TreeTest, IntroDependentQuantifier) {
    auto const nat = b.var(b.constant("nat", b.type()));
    auto const P = b.constant("P", b.arrow(nat, b.prop()));
    auto const x = b.variable("x", nat);
    auto const goal = b.pi(x, b.app(b.var(P), b.var(x)));
    auto const n = b.variable("n", nat);
    auto const h = b.constant("h", b.pi(n, b.app(b.var(P), b.var(n))));
    auto proof = mkProof(session, {Env().declare(h), goal});

    auto const [id, pos] = introTac(session, rootPos(proof), "H");
    EXPECT_EQ(id, x);
    auto const& seq = pos.node().sequent();
    EXPECT_EQ(*seq.goal, *b.app(b.var(P), b.var(x)));
    EXPECT_TRUE(seq.env.exists(x));
    EXPECT_EQ(seq.env.get(nat), x);

    exactTac(session, pos, b.app(b.var(h), b.var(x)));
    auto const t = elaborate(session, proof);
    ASSERT_EQ(t->tag, core::Expr::Lam);
    EXPECT_EQ(t->lam.v, x);
    EXPECT_EQ(*t->type(), *goal);
  }

  TEST_F(TreeTest, IntroNeedsQuantifier) {
    auto proof = mkProof(session, {Env(), A});
    EXPECT_THROW(introTac(session, rootPos(proof), "H"), BuildFailure);
    EXPECT_TRUE(root(proof).isOpen());
  }

  TEST_F(TreeTest, IntroReducesTheGoal) {
    auto const t = b.variable("t", b.prop());
    auto proof = mkProof(session, {Env(), b.let(t, A, b.arrow(b.var(t), b.var(t)))});
    auto const [h, pos] = introTac(session, rootPos(proof), "H");
    EXPECT_EQ(*h->type, *A);
    exactTac(session, pos, b.var(h));
    auto const res = elaborate(session, proof);
    EXPECT_EQ(*res->type(), *b.arrow(A, A));
  }

  TEST_F(TreeTest, CutProducesSideConditionFirst) {
    auto const f = b.variable("f", b.arrow(A, B));
    auto const a = b.variable("a", A);
    auto const env = Env().add(f).add(a);
    auto proof = mkProof(session, {env, B});
    auto const [c, side, rest] = cutTac(session, rootPos(proof), "C", A);
    EXPECT_EQ(c->name, "C0");
    EXPECT_EQ(*side.node().sequent().goal, *A);
    EXPECT_EQ(side.node().sequent().env.count(), env.count());
    EXPECT_FALSE(side.node().sequent().env.exists(c));
    EXPECT_EQ(*rest.node().sequent().goal, *B);
    EXPECT_TRUE(rest.node().sequent().env.exists(c));

    // Close the continuation first
    auto const args = applyTac(session, rest, b.var(f), 1);
    exactTac(session, args[0], b.var(c));
    EXPECT_THROW(elaborate(session, proof), OpenProof);
    exactTac(session, side, b.var(a));

    auto const t = elaborate(session, proof);
    ASSERT_EQ(t->tag, core::Expr::Let);
    EXPECT_EQ(t->let.v, c);
    EXPECT_EQ(*t->let.t, *b.var(a));
    EXPECT_EQ(*t->type(), *B);
  }

  TEST_F(TreeTest, LetinKeepsTheGoal) {
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(a), A});
    auto const [x, pos] = letinTac(session, rootPos(proof), "x", b.var(a));
    EXPECT_EQ(x->name, "x0");
    EXPECT_EQ(*pos.node().sequent().goal, *A);
    EXPECT_EQ(pos.node().sequent().env.get(A), x);
    exactTac(session, pos, b.var(x));
    auto const t = elaborate(session, proof);
    ASSERT_EQ(t->tag, core::Expr::Let);
    EXPECT_EQ(*t->let.t, *b.var(a));
    EXPECT_EQ(*t->let.r, *b.var(x));
  }

  TEST_F(TreeTest, ClosingTwiceIsFatal) {
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(a), A});
    exactTac(session, rootPos(proof), b.var(a));
    EXPECT_DEATH(exactTac(session, rootPos(proof), b.var(a)), "Unreachable");
  }

  TEST_F(TreeTest, ElaborationIsCached) {
    auto count = 0;
    auto const leaf = Step<Expr const*, Expr const*>({
      .name = "leaf",
      .compute = [](Session&, Sequent const&,
                    Expr const* const& t) { return std::pair{t, vector<Sequent>()}; },
      .elaborate =
        [&count](Session&, Expr const* const& t, vector<Expr const*> const&) {
          count++;
          return t;
        },
      .coq = {Pretty::Branching, [](std::ostream& os, Expr const* const& t) { os << "exact " << t->toString() << "."; }},
    });
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(a), A});
    auto const [c, side, rest] = cutTac(session, rootPos(proof), "C", A);
    applyStep(session, side, leaf, b.var(a));
    applyStep(session, rest, leaf, b.var(c));
    EXPECT_FALSE(root(proof).term().has_value());

    auto const t1 = elaborate(session, proof);
    EXPECT_EQ(count, 2);
    EXPECT_EQ(root(proof).term(), t1);
    auto const t2 = elaborate(session, proof);
    EXPECT_EQ(count, 2);
    EXPECT_EQ(*t1, *t2);
    EXPECT_EQ(*side.node().term().value(), *b.var(a));
  }

  TEST_F(TreeTest, DeepProofs) {
    constexpr auto depth = 500uz;
    log.setLevel(Logger::Warn);
    auto goal = A;
    for (auto i = 0uz; i < depth; i++) goal = b.arrow(A, goal);
    auto proof = mkProof(session, {Env(), goal});
    auto pos = rootPos(proof);
    auto last = static_cast<Ident const*>(nullptr);
    for (auto i = 0uz; i < depth; i++) {
      auto [h, next] = introTac(session, pos, "H");
      last = h;
      pos = std::move(next);
    }
    EXPECT_EQ(last->name, "H" + std::to_string(depth - 1));
    // The most recent hypothesis of a type is the one found
    EXPECT_EQ(pos.node().sequent().env.get(A), last);
    assumptionTac(session, pos);
    auto const t = elaborate(session, proof);
    EXPECT_EQ(*t->type(), *goal);
  }

  TEST_F(TreeTest, IntrosAndAssumption) {
    auto const goal = b.arrow(A, b.arrow(B, A));
    auto proof = mkProof(session, {Env(), goal});
    auto const [ids, pos] = introsTac(session, rootPos(proof), "H");
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(*pos.node().sequent().goal, *A);
    assumptionTac(session, pos);
    EXPECT_EQ(*elaborate(session, proof), *b.lam(ids[0], b.lam(ids[1], b.var(ids[0]))));
    EXPECT_EQ(root(proof).branches()[0].branches()[0].step().name(), "assumption");
    auto other = mkProof(session, {Env(), B});
    try {
      assumptionTac(session, rootPos(other));
      FAIL() << "expected a build failure";
    } catch (BuildFailure const& e) {
      EXPECT_EQ(e.pos.branches, other.nodes);
      EXPECT_TRUE(contains(e.message, "not introduced: B"));
    }
    EXPECT_TRUE(root(other).isOpen());
  }

  TEST_F(TreeTest, IllTypedFormulasAreBuildFailures) {
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(a), A});
    // `a` is a proof, not a formula
    try {
      cutTac(session, rootPos(proof), "C", b.var(a));
      FAIL() << "expected a build failure";
    } catch (BuildFailure const& e) {
      EXPECT_EQ(e.pos.branches, proof.nodes);
      EXPECT_TRUE(contains(e.message, "Cannot assert a"));
    }
    // `Type` has type `Kind`, which no hypothesis can have
    EXPECT_THROW(letinTac(session, rootPos(proof), "x", b.type()), BuildFailure);
    EXPECT_TRUE(root(proof).isOpen());
    assumptionTac(session, rootPos(proof));
    EXPECT_EQ(*elaborate(session, proof), *b.var(a));
  }

  TEST_F(TreeTest, LongContinuationChains) {
    constexpr auto depth = 100000uz;
    log.setLevel(Logger::Warn);
    auto const keep = Step<unit, unit>({
      .name = "keep",
      .compute = [](Session&, Sequent const& ctx,
                    unit const&) { return std::pair{unit(), vector<Sequent>{ctx}}; },
      .elaborate = [](Session&, unit const&, vector<Expr const*> const& args) { return args.at(0); },
      .coq = {Pretty::LastButNotLeast, [](std::ostream& os, unit const&) { os << "keep."; }},
    });
    auto const a = b.variable("a", A);
    {
      auto proof = mkProof(session, {Env().add(a), A});
      auto pos = rootPos(proof);
      for (auto i = 0uz; i < depth; i++) pos = applyStep(session, pos, keep, unit()).second.at(0);
      assumptionTac(session, pos);
      EXPECT_EQ(*elaborate(session, proof), *b.var(a));
      auto out = std::ostringstream();
      printCoq(proof, out);
      auto const s = out.str();
      EXPECT_EQ(s.rfind("(* PROOF START *)\nkeep.\nkeep.\n", 0), 0u);
      EXPECT_TRUE(s.ends_with("keep.\nexact a.\n(* PROOF END *)\n"));
      // Leaving the scope frees the whole chain
    }
    EXPECT_EQ(session.nextId(), depth + 2);
  }

  TEST_F(TreeTest, ProofCopiesShareTheTree) {
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(a), b.arrow(A, A)});
    auto const [h, pos] = introTac(session, rootPos(proof), "H");
    {
      auto const copy = proof;
      EXPECT_EQ(copy.nodes, proof.nodes);
    }
    // The copy is gone, but the tree is still complete
    ASSERT_EQ(root(proof).branches().size(), 1u);
    EXPECT_EQ(&root(proof).branches()[0], &pos.node());
    assumptionTac(session, pos);
    auto const t = elaborate(session, proof);
    // Replacing a proof frees its old tree; other handles to the old tree keep it alive
    auto other = proof;
    proof = mkProof(session, {Env(), A});
    EXPECT_TRUE(root(proof).isOpen());
    EXPECT_EQ(root(other).term(), t);
  }

  TEST_F(TreeTest, PreludesOfClosedNodes) {
    auto const x = session.preludes().require("X");
    auto const y = session.preludes().require("Y", {x});
    auto const f = b.variable("f", b.arrow(A, A));
    auto const a = b.variable("a", A);
    auto proof = mkProof(session, {Env().add(f).add(a), A});
    EXPECT_TRUE(preludes(proof).empty());
    auto const args = applyTac(session, rootPos(proof), b.var(f), 1, {y});
    exactTac(session, args[0], b.var(a), {x});
    auto const res = preludes(proof);
    EXPECT_EQ(res, (vector<Prelude const*>{y, x}));
  }

  TEST_F(TreeTest, LemmaDispatch) {
    auto dispatcher = Dispatcher(log);
    auto const a = b.variable("a", A);
    dispatcher.add("other", [](LemmaInfo const&) -> std::optional<Tactic> { return std::nullopt; });
    dispatcher.add("exact", [&](LemmaInfo const& info) -> std::optional<Tactic> {
      if (info.plugin != "core") return std::nullopt;
      auto const t = info.args.at(0);
      return Tactic([&, t](Pos const& pos) { exactTac(session, pos, t); });
    });
    EXPECT_EQ(dispatcher.size(), 2u);
    auto proof = mkProof(session, {Env().add(a), A});
    dispatcher.dispatch({"core", "refl", {b.var(a)}})(rootPos(proof));
    EXPECT_FALSE(root(proof).isOpen());
    EXPECT_THROW(dispatcher.dispatch({"arith", "lia", {}}), NoHandler);
  }

}
