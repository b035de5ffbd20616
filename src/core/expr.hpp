#ifndef ARBOR_CORE_EXPR_HPP
#define ARBOR_CORE_EXPR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <common.hpp>
#include "ident.hpp"

namespace arbor::core {
#include "macros_open.hpp"

  class Builder;

  // Expression node, and related syntactic operations.
  // Immutable. Every node records its type (`Kind` is the only node whose type is null).
  // Variables are named: a binder owns an `Ident`, and occurrences in its body point to that very `Ident`.
  // Pre (for all methods): there is no "cycle" throughout the tree / DAG
  // Pre & invariant (for all methods): all pointers (in the "active variant") are valid
  // Construction goes through `Builder`, which computes (and checks) the type of every new node.
  class Expr {
  public:
    // clang-format off
    enum class Tag: uint32_t { Sort, Var, App, Lam, Pi, Let }; using enum Tag;
    enum class SortTag: uint32_t { SProp, SType, SKind }; using enum SortTag;
    enum class LamTag: uint32_t { LLam }; using enum LamTag;
    enum class PiTag: uint32_t { PPi }; using enum PiTag;
    enum class LetTag: uint32_t { LLet }; using enum LetTag;

    Tag const tag;
    union {
      struct { SortTag const tag; } sort;
      struct { Ident const* const id; } var;
      struct { Expr const *l, *r; } app;
      struct { Ident const* v; Expr const* r; } lam;
      struct { Ident const* v; Expr const* r; } pi;
      struct { Ident const* v; Expr const *t, *r; } let;
    };
    // clang-format on

    // The constructors below guarantee that all pointers in the "active variant" are valid, if parameters are valid
    Expr(SortTag sorttag, Expr const* type):
        tag(Sort),
        sort{sorttag},
        _type(type) {}

    Expr(Ident const* id):
        tag(Var),
        var{id},
        _type(id->type) {}

    Expr(Expr const* l, Expr const* r, Expr const* type):
        tag(App),
        app{l, r},
        _type(type) {}

    Expr(LamTag, Ident const* v, Expr const* r, Expr const* type):
        tag(Lam),
        lam{v, r},
        _type(type) {}

    Expr(PiTag, Ident const* v, Expr const* r, Expr const* type):
        tag(Pi),
        pi{v, r},
        _type(type) {}

    Expr(LetTag, Ident const* v, Expr const* t, Expr const* r, Expr const* type):
        tag(Let),
        let{v, t, r},
        _type(type) {}

    Expr(Expr const&) = delete;
    Expr(Expr&&) = delete;
    auto operator=(Expr const&) -> Expr& = delete;
    auto operator=(Expr&&) -> Expr& = delete;
    ~Expr() = default;

    // The type of this expression (null for `Kind`).
    auto type() const noexcept -> Expr const* {
      return _type;
    }

    // Syntactical equality and hash code (up to alpha-renaming!)
    // O(size)
    auto operator==(Expr const& rhs) const noexcept -> bool;
    auto operator!=(Expr const& rhs) const noexcept -> bool {
      return !(*this == rhs);
    }
    auto hash() const noexcept -> size_t;

    // Give unnamed bound variables a random name
    static auto newName(size_t i) -> std::string;

    // Print
    // O(size)
    auto toString() const -> std::string;

    // Check if given identifier occurs free in the subtree.
    auto occurs(Ident const* id) const noexcept -> bool;

    // Free identifiers, each listed once, in order of first occurrence.
    auto freeVars() const -> std::vector<Ident const*>;

    // Returns the number of symbols of the expression.
    auto size() const noexcept -> size_t;

    // Replace free occurrences of `id` by `t` (capture-avoiding).
    // Lifetime of the resulting expression is bounded by `this`, `t` and `builder`.
    auto subst(Ident const* id, Expr const* t, Builder& builder) const -> Expr const*;

    // Head normal form: beta- and zeta-reduces at the head only, enough to expose the outermost binder.
    auto whnf(Builder& builder) const -> Expr const*;

    // Performs applicative-order beta- and zeta-reduction.
    // It does not terminate on inputs like (\x => x x x) (\x => x x x).
    // Lifetime of the resulting expression is bounded by `this` and `builder`.
    auto reduce(Builder& builder) const -> Expr const*;

    // Equality up to full reduction (used where types are compared).
    auto convertible(Expr const& rhs, Builder& builder) const -> bool;

  private:
    Expr const* const _type;

    auto equals(Expr const& rhs, std::vector<std::pair<Ident const*, Ident const*>>& stk) const noexcept -> bool;
    auto hash(std::vector<Ident const*>& stk) const noexcept -> size_t;
    auto toString(std::vector<Ident const*>& stk) const -> std::string;
    auto freeVars(std::vector<Ident const*>& bound, std::vector<Ident const*>& res) const -> void;
  };

  // "Expression with hash" (a wrapper for `Expr const*` that overloads the `==` operator)
  struct ExprHash {
    Expr const* e;
    size_t hash;

    // `*e` should not be changed after this construction
    explicit ExprHash(Expr const* e) noexcept:
        e(e),
        hash(e->hash()) {}

    auto operator==(ExprHash const& r) const noexcept -> bool {
      return hash == r.hash && *e == *(r.e);
    }

    struct GetHash {
      auto operator()(ExprHash const& eh) const noexcept -> size_t {
        return eh.hash;
      }
    };
  };

  // An exception class representing checking failure
  class InvalidExpr: public std::runtime_error {
  public:
    Expr const* e;
    InvalidExpr(std::string const& s, Expr const* e):
        std::runtime_error("Invalid expression, " + s + ": " + e->toString()),
        e(e) {}
  };

#include "macros_close.hpp"
}

#endif // ARBOR_CORE_EXPR_HPP
