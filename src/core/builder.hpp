#ifndef ARBOR_CORE_BUILDER_HPP
#define ARBOR_CORE_BUILDER_HPP

#include <string>
#include <vector>
#include <common.hpp>
#include "expr.hpp"
#include "ident.hpp"

namespace arbor::core {
#include "macros_open.hpp"

  // Owns every expression and identifier it creates; all of them live as long as the builder.
  // Each constructor computes the type of the new node, throwing `InvalidExpr` on ill-typed input.
  class Builder {
  public:
    Builder();

    Builder(Builder const&) = delete;
    Builder(Builder&&) = delete;
    auto operator=(Builder const&) -> Builder& = delete;
    auto operator=(Builder&&) -> Builder& = delete;
    ~Builder() = default;

    auto prop() const noexcept -> Expr const* {
      return _prop;
    }
    auto type() const noexcept -> Expr const* {
      return _type;
    }
    auto kind() const noexcept -> Expr const* {
      return _kind;
    }

    // New identifiers (the type must itself be typed by a sort).
    auto ident(Ident::Kind kind, std::string name, Expr const* type) -> Ident const*;
    auto variable(std::string name, Expr const* type) -> Ident const* {
      return ident(Ident::Var, std::move(name), type);
    }
    auto constant(std::string name, Expr const* type) -> Ident const* {
      return ident(Ident::Const, std::move(name), type);
    }

    auto var(Ident const* id) -> Expr const*;

    // Π-elimination: `f` must have a (reducible to) Π-type whose domain is convertible to the type of `x`.
    auto app(Expr const* f, Expr const* x) -> Expr const*;
    auto apply(Expr const* f, std::vector<Expr const*> const& xs) -> Expr const*;

    // Π-introduction over `v`.
    auto lam(Ident const* v, Expr const* body) -> Expr const*;

    // Π-formation over `v`.
    auto pi(Ident const* v, Expr const* body) -> Expr const*;

    // Non-dependent Π-formation, `a -> b`.
    auto arrow(Expr const* a, Expr const* b) -> Expr const*;

    // `let v := t in body`; the type of `t` must be convertible to the type of `v`.
    auto let(Ident const* v, Expr const* t, Expr const* body) -> Expr const*;

    // Returns the sort of a type (throws if `e` is not a proposition or type).
    auto sortOf(Expr const* e) -> Expr::SortTag;

    // Controls the Π-formation rule
    static constexpr auto imax(Expr::SortTag s, Expr::SortTag t) -> Expr::SortTag {
      if (t == Expr::SProp)
        return Expr::SProp;
      // Mid: `t` is `Expr::SType` or `Expr::SKind`
      return (s == Expr::SKind || t == Expr::SKind) ? Expr::SKind : Expr::SType;
    }

  private:
    friend class Expr;

    Allocator<Expr> _exprs;
    Allocator<Ident> _idents;
    Expr const* _kind;
    Expr const* _type;
    Expr const* _prop;

    // Raw construction (type already known)
    template <typename... Ts>
    auto make(Ts&&... args) -> Expr const* {
      return _exprs.make(std::forward<Ts>(args)...);
    }

    auto sortExpr(Expr::SortTag s) const -> Expr const*;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_CORE_BUILDER_HPP
