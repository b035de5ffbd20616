#include "expr.hpp"
#include <algorithm>
#include <type_traits>
#include "builder.hpp"

using std::string;
using std::vector;
using std::pair;

namespace arbor::core {
#include "macros_open.hpp"

  namespace {
    using Subs = vector<pair<Ident const*, Expr const*>>;

    auto lookup(Subs const& subs, Ident const* id) -> Expr const* {
      for (auto const& [k, v]: subs)
        if (k == id) return v;
      return nullptr;
    }

    auto substAll(Expr const* e, Subs const& subs, Builder& builder) -> Expr const*;

    // Moves a binder under a substitution.
    // A new binder identifier is created if its type changes, or if it would capture a free variable of the substitution.
    auto substBinder(Ident const* v, Expr const* body, Subs const& subs, Builder& builder)
      -> pair<Ident const*, Expr const*> {
      auto const ty = substAll(v->type, subs, builder);
      auto inner = Subs();
      for (auto const& [k, t]: subs)
        if (k != v) inner.emplace_back(k, t);
      auto const capture = std::ranges::any_of(inner, [v](auto const& p) { return p.second->occurs(v); });
      if (ty == v->type && !capture) return {v, inner.empty() ? body : substAll(body, inner, builder)};
      auto const nv = builder.ident(v->kind, v->name, ty);
      inner.emplace_back(v, builder.var(nv));
      return {nv, substAll(body, inner, builder)};
    }

    auto substAll(Expr const* e, Subs const& subs, Builder& builder) -> Expr const* {
      switch (e->tag) {
        case Expr::Sort: return e;
        case Expr::Var: {
          auto const t = lookup(subs, e->var.id);
          return t ? t : e;
        }
        case Expr::App: {
          auto const l = substAll(e->app.l, subs, builder);
          auto const r = substAll(e->app.r, subs, builder);
          return (l == e->app.l && r == e->app.r) ? e : builder.app(l, r);
        }
        case Expr::Lam: {
          auto const [v, r] = substBinder(e->lam.v, e->lam.r, subs, builder);
          return (v == e->lam.v && r == e->lam.r) ? e : builder.lam(v, r);
        }
        case Expr::Pi: {
          auto const [v, r] = substBinder(e->pi.v, e->pi.r, subs, builder);
          return (v == e->pi.v && r == e->pi.r) ? e : builder.pi(v, r);
        }
        case Expr::Let: {
          auto const t = substAll(e->let.t, subs, builder);
          auto const [v, r] = substBinder(e->let.v, e->let.r, subs, builder);
          return (t == e->let.t && v == e->let.v && r == e->let.r) ? e : builder.let(v, t, r);
        }
      }
      unreachable;
    }

    // Reduces the type of a binder, renaming the binder if it changes.
    auto reduceBinder(Ident const* v, Expr const* body, Builder& builder) -> pair<Ident const*, Expr const*> {
      auto const ty = v->type->reduce(builder);
      if (ty == v->type) return {v, body->reduce(builder)};
      auto const nv = builder.ident(v->kind, v->name, ty);
      return {nv, body->subst(v, builder.var(nv), builder)->reduce(builder)};
    }
  }

  auto Expr::operator==(Expr const& rhs) const noexcept -> bool {
    auto stk = vector<pair<Ident const*, Ident const*>>();
    return equals(rhs, stk);
  }

  auto Expr::equals(Expr const& rhs, vector<pair<Ident const*, Ident const*>>& stk) const noexcept -> bool {
    if (stk.empty() && this == &rhs) return true;
    if (tag != rhs.tag) return false;
    // Mid: tag == rhs.tag
    auto binder = [&stk](Ident const* v, Expr const* r, Ident const* rv, Expr const* rr) {
      if (!v->type->equals(*rv->type, stk)) return false;
      stk.emplace_back(v, rv);
      auto const res = r->equals(*rr, stk);
      stk.pop_back();
      return res;
    };
    switch (tag) {
      case Sort: return sort.tag == rhs.sort.tag;
      case Var:
        // Unsigned count down: https://nachtimwald.com/2019/06/02/unsigned-count-down/
        for (auto i = stk.size(); i-- > 0;) {
          auto const [l, r] = stk[i];
          if (l == var.id || r == rhs.var.id) return l == var.id && r == rhs.var.id;
        }
        return var.id == rhs.var.id;
      case App: return app.l->equals(*rhs.app.l, stk) && app.r->equals(*rhs.app.r, stk);
      case Lam: return binder(lam.v, lam.r, rhs.lam.v, rhs.lam.r); // Ignore bound variable names
      case Pi: return binder(pi.v, pi.r, rhs.pi.v, rhs.pi.r);      // Ignore bound variable names
      case Let: return let.t->equals(*rhs.let.t, stk) && binder(let.v, let.r, rhs.let.v, rhs.let.r);
    }
    unreachable;
  }

  auto Expr::hash() const noexcept -> size_t {
    auto stk = vector<Ident const*>();
    return hash(stk);
  }

  auto Expr::hash(vector<Ident const*>& stk) const noexcept -> size_t {
    auto res = static_cast<size_t>(tag);
    auto binder = [&stk, &res](Ident const* v, Expr const* r) {
      res = combineHash(res, v->type->hash(stk));
      stk.push_back(v);
      res = combineHash(res, r->hash(stk));
      stk.pop_back();
    };
    switch (tag) {
      case Sort: return combineHash(res, static_cast<std::underlying_type_t<SortTag>>(sort.tag));
      case Var:
        // Bound variables are hashed by their distance to the binder
        for (auto i = stk.size(); i-- > 0;)
          if (stk[i] == var.id) return combineHash(res, stk.size() - 1 - i);
        return combineHash(combineHash(res, ~0uz), var.id);
      case App:
        res = combineHash(res, app.l->hash(stk));
        res = combineHash(res, app.r->hash(stk));
        return res;
      case Lam: binder(lam.v, lam.r); return res;
      case Pi: binder(pi.v, pi.r); return res;
      case Let:
        res = combineHash(res, let.t->hash(stk));
        binder(let.v, let.r);
        return res;
    }
    unreachable;
  }

  // Give unnamed bound variables a random name
  auto Expr::newName(size_t i) -> string {
    constexpr size_t Letters = 26;
    string res = "__";
    do {
      res.push_back(static_cast<char>('a' + i % Letters));
      i /= Letters;
    } while (i > 0);
    return res;
  }

  auto Expr::toString() const -> string {
    auto stk = vector<Ident const*>();
    return toString(stk);
  }

  // Undefined variables should be OK, as long as pointers are valid.
  auto Expr::toString(vector<Ident const*>& stk) const -> string {
    auto name = [&stk](Ident const* v) -> string {
      if (!v->name.empty()) return v->name;
      for (auto i = stk.size(); i-- > 0;)
        if (stk[i] == v) return newName(i);
      return newName(stk.size());
    };
    auto atomic = [](Expr const* e) { return e->tag == Sort || e->tag == Var || e->tag == App; };
    switch (tag) {
      case Sort:
        switch (sort.tag) {
          case SProp: return "Prop";
          case SType: return "Type";
          case SKind: return "Kind";
        }
        unreachable;
      case Var: return name(var.id);
      case App: {
        bool fl = (app.l->tag != Sort && app.l->tag != Var && app.l->tag != App);
        bool fr = (app.r->tag != Sort && app.r->tag != Var);
        return (fl ? "(" : "") + app.l->toString(stk) + (fl ? ")" : "") + " " + (fr ? "(" : "") + app.r->toString(stk)
             + (fr ? ")" : "");
      }
      case Lam: {
        auto res = "\\" + name(lam.v) + ": " + lam.v->type->toString(stk);
        stk.push_back(lam.v);
        res += " => " + lam.r->toString(stk);
        stk.pop_back();
        return res;
      }
      case Pi: {
        auto res = string();
        if (pi.r->occurs(pi.v)) res = "(" + name(pi.v) + ": " + pi.v->type->toString(stk) + ")";
        else res = atomic(pi.v->type) ? pi.v->type->toString(stk) : "(" + pi.v->type->toString(stk) + ")";
        stk.push_back(pi.v);
        res += " -> " + pi.r->toString(stk);
        stk.pop_back();
        return res;
      }
      case Let: {
        auto res = "let " + name(let.v) + ": " + let.v->type->toString(stk) + " := " + let.t->toString(stk);
        stk.push_back(let.v);
        res += " in " + let.r->toString(stk);
        stk.pop_back();
        return res;
      }
    }
    unreachable;
  }

  auto Expr::occurs(Ident const* id) const noexcept -> bool {
    switch (tag) {
      case Sort: return false;
      case Var: return var.id == id;
      case App: return app.l->occurs(id) || app.r->occurs(id);
      case Lam: return lam.v->type->occurs(id) || (lam.v != id && lam.r->occurs(id));
      case Pi: return pi.v->type->occurs(id) || (pi.v != id && pi.r->occurs(id));
      case Let: return let.v->type->occurs(id) || let.t->occurs(id) || (let.v != id && let.r->occurs(id));
    }
    unreachable;
  }

  auto Expr::freeVars() const -> vector<Ident const*> {
    auto bound = vector<Ident const*>();
    auto res = vector<Ident const*>();
    freeVars(bound, res);
    return res;
  }

  auto Expr::freeVars(vector<Ident const*>& bound, vector<Ident const*>& res) const -> void {
    auto binder = [&bound, &res](Ident const* v, Expr const* r) {
      v->type->freeVars(bound, res);
      bound.push_back(v);
      r->freeVars(bound, res);
      bound.pop_back();
    };
    switch (tag) {
      case Sort: return;
      case Var:
        if (std::ranges::find(bound, var.id) == bound.end() && std::ranges::find(res, var.id) == res.end())
          res.push_back(var.id);
        return;
      case App:
        app.l->freeVars(bound, res);
        app.r->freeVars(bound, res);
        return;
      case Lam: binder(lam.v, lam.r); return;
      case Pi: binder(pi.v, pi.r); return;
      case Let:
        let.t->freeVars(bound, res);
        binder(let.v, let.r);
        return;
    }
    unreachable;
  }

  auto Expr::size() const noexcept -> size_t {
    switch (tag) {
      case Sort: return 1;
      case Var: return 1;
      case App: return 1 + app.l->size() + app.r->size();
      case Lam: return 1 + lam.v->type->size() + lam.r->size();
      case Pi: return 1 + pi.v->type->size() + pi.r->size();
      case Let: return 1 + let.v->type->size() + let.t->size() + let.r->size();
    }
    unreachable;
  }

  auto Expr::subst(Ident const* id, Expr const* t, Builder& builder) const -> Expr const* {
    return substAll(this, {{id, t}}, builder);
  }

  auto Expr::whnf(Builder& builder) const -> Expr const* {
    switch (tag) {
      case App: {
        auto const l = app.l->whnf(builder);
        if (l->tag == Lam) return l->lam.r->subst(l->lam.v, app.r, builder)->whnf(builder);
        return (l == app.l) ? this : builder.make(l, app.r, _type);
      }
      case Let: return let.r->subst(let.v, let.t, builder)->whnf(builder);
      default: return this;
    }
  }

  auto Expr::reduce(Builder& builder) const -> Expr const* {
    switch (tag) {
      case Sort: return this;
      case Var: return this;
      case App: {
        // Applicative order: reduce subexpressions first
        auto const l = app.l->reduce(builder);
        auto const r = app.r->reduce(builder);
        if (l->tag == Lam) return l->lam.r->subst(l->lam.v, r, builder)->reduce(builder);
        return (l == app.l && r == app.r) ? this : builder.make(l, r, _type);
      }
      case Lam: {
        auto const [v, r] = reduceBinder(lam.v, lam.r, builder);
        return (v == lam.v && r == lam.r) ? this : builder.lam(v, r);
      }
      case Pi: {
        auto const [v, r] = reduceBinder(pi.v, pi.r, builder);
        return (v == pi.v && r == pi.r) ? this : builder.pi(v, r);
      }
      case Let: return let.r->subst(let.v, let.t, builder)->reduce(builder);
    }
    unreachable;
  }

  auto Expr::convertible(Expr const& rhs, Builder& builder) const -> bool {
    return *this == rhs || *reduce(builder) == *rhs.reduce(builder);
  }

#include "macros_close.hpp"
}
