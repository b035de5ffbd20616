#include <gtest/gtest.h>
#include "core.hpp"

using namespace arbor::core;

namespace {

  class CoreTest: public ::testing::Test {
  protected:
    Builder b;
    Expr const* A = b.var(b.constant("A", b.prop()));
    Expr const* B = b.var(b.constant("B", b.prop()));
  };

  TEST_F(CoreTest, SortsAndArrows) {
    EXPECT_EQ(b.prop()->type(), b.type());
    EXPECT_EQ(b.type()->type(), b.kind());
    EXPECT_EQ(b.kind()->type(), nullptr);
    auto const ab = b.arrow(A, B);
    EXPECT_EQ(ab->tag, Expr::Pi);
    EXPECT_EQ(*ab->type(), *b.prop());
    // Propositions over types are still propositions; types over types are types
    auto const nat = b.var(b.constant("nat", b.type()));
    EXPECT_EQ(*b.arrow(nat, A)->type(), *b.prop());
    EXPECT_EQ(*b.arrow(nat, nat)->type(), *b.type());
  }

  TEST_F(CoreTest, AlphaEquality) {
    auto const x = b.variable("x", A);
    auto const y = b.variable("y", A);
    auto const idx = b.lam(x, b.var(x));
    auto const idy = b.lam(y, b.var(y));
    EXPECT_EQ(*idx, *idy);
    EXPECT_EQ(idx->hash(), idy->hash());
    EXPECT_EQ(ExprHash(idx), ExprHash(idy));
    // Free variables are compared by identity, not by name
    auto const x1 = b.variable("x", A);
    EXPECT_NE(*b.var(x), *b.var(x1));
    // Binders over different types differ
    auto const z = b.variable("z", B);
    EXPECT_NE(*b.lam(z, b.var(z)), *idx);
  }

  TEST_F(CoreTest, ApplicationChecksTypes) {
    auto const f = b.variable("f", b.arrow(A, B));
    auto const a = b.variable("a", A);
    auto const fa = b.app(b.var(f), b.var(a));
    EXPECT_EQ(*fa->type(), *B);
    EXPECT_THROW(b.app(b.var(f), b.var(f)), InvalidExpr);
    EXPECT_THROW(b.app(b.var(a), b.var(a)), InvalidExpr);
    EXPECT_EQ(*b.apply(b.var(f), {b.var(a)}), *fa);
  }

  TEST_F(CoreTest, DependentApplication) {
    auto const nat = b.var(b.constant("nat", b.type()));
    auto const P = b.constant("P", b.arrow(nat, b.prop()));
    auto const n = b.variable("n", nat);
    auto const allP = b.pi(n, b.app(b.var(P), b.var(n)));
    auto const h = b.variable("h", allP);
    auto const zero = b.var(b.constant("zero", nat));
    auto const hz = b.app(b.var(h), zero);
    EXPECT_EQ(*hz->type(), *b.app(b.var(P), zero));
  }

  TEST_F(CoreTest, FreeVariablesAndOccurs) {
    auto const f = b.variable("f", b.arrow(A, b.arrow(A, B)));
    auto const x = b.variable("x", A);
    auto const y = b.variable("y", A);
    auto const body = b.apply(b.var(f), {b.var(y), b.var(x)});
    auto const e = b.lam(x, body);
    EXPECT_TRUE(body->occurs(x));
    EXPECT_FALSE(e->occurs(x));
    EXPECT_TRUE(e->occurs(y));
    auto const fv = e->freeVars();
    ASSERT_EQ(fv.size(), 2u);
    EXPECT_EQ(fv[0], f);
    EXPECT_EQ(fv[1], y);
  }

  TEST_F(CoreTest, SubstitutionAvoidsCapture) {
    auto const x = b.variable("x", A);
    auto const y = b.variable("y", A);
    auto const k = b.lam(y, b.var(x)); // \y: A => x
    auto const res = k->subst(x, b.var(y), b);
    ASSERT_EQ(res->tag, Expr::Lam);
    EXPECT_NE(res->lam.v, y);
    ASSERT_EQ(res->lam.r->tag, Expr::Var);
    EXPECT_EQ(res->lam.r->var.id, y);
    // Untouched terms are shared
    auto const a = b.var(b.variable("a", A));
    EXPECT_EQ(k->subst(b.variable("z", A), a, b), k);
  }

  TEST_F(CoreTest, Reduction) {
    auto const x = b.variable("x", A);
    auto const a = b.var(b.variable("a", A));
    auto const redex = b.app(b.lam(x, b.var(x)), a);
    EXPECT_EQ(*redex->type(), *A);
    EXPECT_EQ(*redex->whnf(b), *a);
    EXPECT_EQ(*redex->reduce(b), *a);
    auto const v = b.variable("v", A);
    auto const l = b.let(v, a, b.var(v));
    EXPECT_EQ(*l->type(), *A);
    EXPECT_EQ(*l->whnf(b), *a);
    EXPECT_TRUE(l->convertible(*a, b));
    EXPECT_FALSE(l->convertible(*b.var(x), b));
    // Head reduction exposes a binder hidden behind a let
    auto const t = b.variable("t", b.prop());
    auto const hidden = b.let(t, A, b.arrow(b.var(t), B));
    EXPECT_EQ(hidden->whnf(b)->tag, Expr::Pi);
  }

  TEST_F(CoreTest, LetChecksDefinitionType) {
    auto const v = b.variable("v", A);
    auto const bb = b.var(b.variable("b", B));
    EXPECT_THROW(b.let(v, bb, b.var(v)), InvalidExpr);
  }

  TEST_F(CoreTest, Printing) {
    EXPECT_EQ(b.arrow(A, B)->toString(), "A -> B");
    EXPECT_EQ(b.arrow(b.arrow(A, B), B)->toString(), "(A -> B) -> B");
    auto const x = b.variable("x", A);
    EXPECT_EQ(b.lam(x, b.var(x))->toString(), "\\x: A => x");
    auto const v = b.variable("v", A);
    auto const a = b.var(b.variable("a", A));
    EXPECT_EQ(b.let(v, a, b.var(v))->toString(), "let v: A := a in v");
  }

  TEST_F(CoreTest, IdentifiersNeedTypes) {
    EXPECT_THROW(b.variable("k", b.kind()), InvalidExpr);
    auto const a = b.var(b.variable("a", A));
    EXPECT_THROW(b.variable("bad", a), InvalidExpr);
    EXPECT_TRUE(b.variable("x", A)->isVar());
    EXPECT_FALSE(b.constant("c", A)->isVar());
  }

}
