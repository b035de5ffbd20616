#include "prelude.hpp"
#include <algorithm>
#include <functional>
#include <queue>

using std::string;
using std::vector;

namespace arbor::proof {
#include "macros_open.hpp"

  auto Prelude::toString() const -> string {
    switch (tag) {
      case Require: return "require: " + unit;
      case Alias: return "alias: " + id->name + " -> " + term->toString();
    }
    unreachable;
  }

  auto PreludeGraph::addVertex(Prelude const* p) -> size_t {
    auto const v = _vertices.size();
    _vertices.push_back(p);
    _index.emplace(p, v);
    _succ.emplace_back();
    _dirty = true;
    return v;
  }

  auto PreludeGraph::addEdges(vector<Prelude const*> const& deps, size_t v) -> void {
    for (auto const dep: deps) {
      auto const it = _index.find(dep);
      assert(it != _index.end());
      auto& succ = _succ[it->second];
      if (std::ranges::find(succ, v) != succ.end()) continue;
      _log->debug("proof.prelude", dep->toString(), " ---> ", _vertices[v]->toString());
      succ.push_back(v);
      _dirty = true;
    }
  }

  auto PreludeGraph::require(string const& unit, vector<Prelude const*> const& deps) -> Prelude const* {
    auto const it = _requires.find(unit);
    auto const v = (it != _requires.end()) ? it->second : addVertex(_pool.make(unit));
    _requires.emplace(unit, v);
    addEdges(deps, v);
    return _vertices[v];
  }

  auto PreludeGraph::alias(Ident const* id, Expr const* term, vector<Prelude const*> const& deps) -> Prelude const* {
    assert(term->type() && *id->type == *term->type());
    auto const it = _aliases.find(id);
    if (it != _aliases.end()) assert(*_vertices[it->second]->term == *term);
    auto const v = (it != _aliases.end()) ? it->second : addVertex(_pool.make(id, term));
    _aliases.emplace(id, v);
    addEdges(deps, v);
    return _vertices[v];
  }

  auto PreludeGraph::computeClosure() -> void {
    auto const n = _vertices.size();
    _closure.assign(n, vector<bool>(n, false));
    auto stk = vector<size_t>();
    for (auto u = 0uz; u < n; u++) {
      auto& reach = _closure[u];
      reach[u] = true;
      stk.push_back(u);
      while (!stk.empty()) {
        auto const x = stk.back();
        stk.pop_back();
        for (auto const y: _succ[x]) {
          if (reach[y]) continue;
          reach[y] = true;
          stk.push_back(y);
        }
      }
    }
    _dirty = false;
  }

  // Kahn's algorithm, always taking the earliest registered vertex among those ready.
  auto PreludeGraph::topologicalOrder() const -> vector<size_t> {
    auto const n = _vertices.size();
    auto indeg = vector<size_t>(n, 0);
    for (auto const& succ: _succ)
      for (auto const v: succ) indeg[v]++;
    auto ready = std::priority_queue<size_t, vector<size_t>, std::greater<>>();
    for (auto v = 0uz; v < n; v++)
      if (indeg[v] == 0) ready.push(v);
    auto res = vector<size_t>();
    auto done = vector<bool>(n, false);
    while (!ready.empty()) {
      auto const u = ready.top();
      ready.pop();
      res.push_back(u);
      done[u] = true;
      for (auto const v: _succ[u])
        if (--indeg[v] == 0) ready.push(v);
    }
    if (res.size() < n) {
      _log->warn("proof.prelude", "Dependency cycle among ", n - res.size(), " prelude entries");
      for (auto v = 0uz; v < n; v++)
        if (!done[v]) res.push_back(v);
    }
    return res;
  }

  auto PreludeGraph::emit(vector<Prelude const*> const& entries, std::function<void(Prelude const&)> const& visit)
    -> void {
    auto requested = vector<size_t>();
    for (auto const p: entries) {
      auto const it = _index.find(p);
      assert(it != _index.end());
      requested.push_back(it->second);
    }
    if (_dirty) computeClosure();
    for (auto const v: topologicalOrder()) {
      auto const& reach = _closure[v];
      if (std::ranges::any_of(requested, [&reach](size_t s) { return reach[s]; })) visit(*_vertices[v]);
    }
  }

#include "macros_close.hpp"
}
