#ifndef ARBOR_PROOF_PRELUDE_HPP
#define ARBOR_PROOF_PRELUDE_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include <log.hpp>

namespace arbor::proof {
#include "macros_open.hpp"

  using core::Expr;
  using core::Ident;

  // An auxiliary declaration that has to be emitted before the proofs using it.
  // Immutable.
  class Prelude {
  public:
    enum class Tag: uint32_t { Require, Alias }; using enum Tag;

    Tag const tag;
    std::string const unit;       // Require: name of the external unit
    Ident const* const id;        // Alias: the name introduced
    Expr const* const term;       // Alias: the term it stands for

    explicit Prelude(std::string unit):
        tag(Require),
        unit(std::move(unit)),
        id(nullptr),
        term(nullptr) {}

    Prelude(Ident const* id, Expr const* term):
        tag(Alias),
        unit(),
        id(id),
        term(term) {}

    auto toString() const -> std::string;
  };

  // Dependency graph of all prelude entries, shared by every proof built in one session.
  // Append-only: entries and edges are never removed. Equal entries (same unit, or same alias identifier) are merged.
  class PreludeGraph {
  public:
    explicit PreludeGraph(Logger& log):
        _log(&log) {}

    PreludeGraph(PreludeGraph const&) = delete;
    PreludeGraph(PreludeGraph&&) = delete;
    auto operator=(PreludeGraph const&) -> PreludeGraph& = delete;
    auto operator=(PreludeGraph&&) -> PreludeGraph& = delete;
    ~PreludeGraph() = default;

    // Registers an import, depending on `deps` (which must come from this graph).
    auto require(std::string const& unit, std::vector<Prelude const*> const& deps = {}) -> Prelude const*;

    // Registers an alias `id := term`, depending on `deps` (which must come from this graph).
    // Pre (checked): `id` has the type of `term`.
    auto alias(Ident const* id, Expr const* term, std::vector<Prelude const*> const& deps = {}) -> Prelude const*;

    // Visits every entry some of `entries` (transitively, reflexively) depends on, each exactly once,
    // in dependency order. Entries that are not ordered relative to each other come in registration order.
    auto emit(std::vector<Prelude const*> const& entries, std::function<void(Prelude const&)> const& visit) -> void;

    auto size() const noexcept -> size_t {
      return _vertices.size();
    }

  private:
    Logger* _log;
    Allocator<Prelude> _pool;
    std::vector<Prelude const*> _vertices; // In registration order
    std::unordered_map<Prelude const*, size_t> _index;
    std::unordered_map<std::string, size_t> _requires;
    std::unordered_map<Ident const*, size_t> _aliases;
    std::vector<std::vector<size_t>> _succ;
    std::vector<std::vector<bool>> _closure; // `_closure[u][v]` iff `v` is reachable from `u`
    bool _dirty = true;

    auto addVertex(Prelude const* p) -> size_t;
    auto addEdges(std::vector<Prelude const*> const& deps, size_t v) -> void;
    auto computeClosure() -> void;
    auto topologicalOrder() const -> std::vector<size_t>;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_PROOF_PRELUDE_HPP
