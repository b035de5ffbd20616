#ifndef ARBOR_PROOF_ENV_HPP
#define ARBOR_PROOF_ENV_HPP

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include <log.hpp>

namespace arbor::proof {
#include "macros_open.hpp"

  using core::Builder;
  using core::Expr;
  using core::ExprHash;
  using core::Ident;

  // A lookup found no identifier bound to `term`.
  class NotIntroduced: public std::runtime_error {
  public:
    Expr const* term;
    explicit NotIntroduced(Expr const* term):
        std::runtime_error("Following formula is used in a context where it is not declared: " + term->toString()),
        term(term) {}
  };

  // `added` could not be bound, since `existing` already uses its name.
  class NameConflict: public std::runtime_error {
  public:
    Ident const* added;
    Ident const* existing;
    NameConflict(Ident const* added, Ident const* existing):
        std::runtime_error("Following ids conflict: " + added->name + " <> " + existing->name),
        added(added),
        existing(existing) {}
  };

  // An alternative term to look up, and how to turn a proof of it into a proof of the original term.
  struct Coerced {
    Expr const* term;
    std::function<Expr const*(Expr const*)> wrap;
  };

  struct Coercion {
    std::string name;
    std::function<std::vector<Coerced>(Expr const*)> candidates;
  };

  // Ordered, append-only list of coercions.
  // The trivial coercion ("<id>", plain lookup) is always registered first.
  class Coercions {
  public:
    Coercions(Builder& builder, Logger& log);

    auto add(std::string name, std::function<std::vector<Coerced>(Expr const*)> candidates) -> void {
      _list.push_back({std::move(name), std::move(candidates)});
    }

    auto list() const noexcept -> std::vector<Coercion> const& {
      return _list;
    }
    auto builder() const noexcept -> Builder& {
      return *_builder;
    }
    auto log() const noexcept -> Logger& {
      return *_log;
    }

  private:
    Builder* _builder;
    Logger* _log;
    std::vector<Coercion> _list;
  };

  // Proof environment: identifiers standing for terms (usually, hypotheses standing for the formulas they prove).
  // Immutable: every "modifying" operation returns a new environment and leaves the original unchanged.
  // Invariant: no two identifiers share a name (enforced through `_reverse`).
  class Env {
  public:
    using Bindings = std::unordered_map<ExprHash, Ident const*, ExprHash::GetHash>;

    // Binds `id->type` to `id` locally.
    // Throws `NameConflict` if the name of `id` is already in use.
    auto add(Ident const* id) const -> Env;

    // Binds `id->type` to `id` globally.
    // Pre (checked): `id` is a declared constant, not a plain variable.
    // Throws `NameConflict` if the name of `id` is already in use.
    auto declare(Ident const* id) const -> Env;

    // Mints `prefix<N>` for the smallest available `N` (starting from the prefix's use count) and binds `type` to it.
    // Hidden identifiers reserve their name but are not part of `bindings()`.
    auto intro(Builder& builder, std::string const& prefix, Expr const* type, bool hide = false) const
      -> std::pair<Ident const*, Env>;

    // Whether the name of `id` is used by any identifier (local, global or hidden).
    auto exists(Ident const* id) const -> bool {
      return _reverse.contains(id->name);
    }
    auto exists(std::string const& name) const -> bool {
      return _reverse.contains(name);
    }

    // Exact lookups, local bindings first.
    auto mem(Expr const* f) const -> bool;
    auto get(Expr const* f) const -> std::optional<Ident const*>;

    // Lookup through the registered coercions, in order.
    // Returns a term whose type is `f`. Throws `NotIntroduced` if no coercion succeeds.
    auto find(Coercions const& coercions, Expr const* f) const -> Expr const*;

    // Local, then global bindings, each sorted by name.
    auto bindings() const -> std::vector<std::pair<Expr const*, Ident const*>>;

    auto count() const -> size_t {
      return _names.size() + _global.size();
    }

    // One line per binding.
    auto toString() const -> std::string;

  private:
    Bindings _names;
    Bindings _global;
    Bindings _hidden;
    std::unordered_map<std::string, Ident const*> _reverse;
    std::unordered_map<std::string, size_t> _count;

    auto localCount(std::string const& prefix) const -> size_t;
  };

  // An environment of available bindings paired with a goal to be proved.
  struct Sequent {
    Env env;
    Expr const* goal;

    auto toString() const -> std::string;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_PROOF_ENV_HPP
