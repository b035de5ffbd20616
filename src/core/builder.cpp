#include "builder.hpp"

using std::string;
using std::vector;

namespace arbor::core {
#include "macros_open.hpp"

  Builder::Builder():
      _exprs(),
      _idents(),
      _kind(_exprs.make(Expr::SKind, nullptr)),
      _type(_exprs.make(Expr::SType, _kind)),
      _prop(_exprs.make(Expr::SProp, _type)) {}

  auto Builder::sortExpr(Expr::SortTag s) const -> Expr const* {
    switch (s) {
      case Expr::SProp: return _prop;
      case Expr::SType: return _type;
      case Expr::SKind: return _kind;
    }
    unreachable;
  }

  auto Builder::sortOf(Expr const* e) -> Expr::SortTag {
    if (!e->type()) throw InvalidExpr("\"Kind\" does not have a type", e);
    auto const t = e->type()->whnf(*this);
    if (t->tag != Expr::Sort) throw InvalidExpr("expected proposition or type, got " + t->toString(), e);
    return t->sort.tag;
  }

  auto Builder::ident(Ident::Kind kind, string name, Expr const* type) -> Ident const* {
    sortOf(type);
    return _idents.make(kind, std::move(name), type);
  }

  auto Builder::var(Ident const* id) -> Expr const* {
    return make(id);
  }

  auto Builder::app(Expr const* f, Expr const* x) -> Expr const* {
    if (!f->type()) throw InvalidExpr("expected function, got \"Kind\"", f);
    auto const tf = f->type()->whnf(*this);
    if (tf->tag != Expr::Pi) throw InvalidExpr("expected function, term has type " + tf->toString(), f);
    auto const dom = tf->pi.v->type;
    if (!x->type() || !dom->convertible(*x->type(), *this))
      throw InvalidExpr(
        "argument type mismatch, expected " + dom->toString() + ", got "
          + (x->type() ? x->type()->toString() : string("nothing")),
        x
      );
    return make(f, x, tf->pi.r->subst(tf->pi.v, x, *this));
  }

  auto Builder::apply(Expr const* f, vector<Expr const*> const& xs) -> Expr const* {
    auto res = f;
    for (auto const x: xs) res = app(res, x);
    return res;
  }

  auto Builder::lam(Ident const* v, Expr const* body) -> Expr const* {
    if (!body->type()) throw InvalidExpr("\"Kind\" cannot be abstracted", body);
    return make(Expr::LLam, v, body, pi(v, body->type()));
  }

  auto Builder::pi(Ident const* v, Expr const* body) -> Expr const* {
    auto const s = sortOf(v->type);
    auto const t = sortOf(body);
    return make(Expr::PPi, v, body, sortExpr(imax(s, t)));
  }

  auto Builder::arrow(Expr const* a, Expr const* b) -> Expr const* {
    return pi(variable("", a), b);
  }

  auto Builder::let(Ident const* v, Expr const* t, Expr const* body) -> Expr const* {
    if (!t->type() || !v->type->convertible(*t->type(), *this))
      throw InvalidExpr(
        "definition type mismatch, expected " + v->type->toString() + ", got "
          + (t->type() ? t->type()->toString() : string("nothing")),
        t
      );
    if (!body->type()) throw InvalidExpr("\"Kind\" cannot be let-bound", body);
    return make(Expr::LLet, v, t, body, body->type()->subst(v, t, *this));
  }

#include "macros_close.hpp"
}
