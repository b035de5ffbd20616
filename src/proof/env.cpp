#include "env.hpp"
#include <algorithm>
#include <sstream>

using std::string;
using std::vector;
using std::pair;
using std::optional;

namespace arbor::proof {
#include "macros_open.hpp"

  Coercions::Coercions(Builder& builder, Logger& log):
      _builder(&builder),
      _log(&log) {
    // Keep the trivial coercion first: most lookups succeed without any coercion
    add("<id>", [](Expr const* term) { return vector<Coerced>{{term, [](Expr const* x) { return x; }}}; });
  }

  auto Env::add(Ident const* id) const -> Env {
    if (auto const it = _reverse.find(id->name); it != _reverse.end()) throw NameConflict(id, it->second);
    auto res = *this;
    res._names.insert_or_assign(ExprHash(id->type), id);
    res._reverse.emplace(id->name, id);
    return res;
  }

  auto Env::declare(Ident const* id) const -> Env {
    assert(!id->isVar());
    if (auto const it = _reverse.find(id->name); it != _reverse.end()) throw NameConflict(id, it->second);
    auto res = *this;
    res._global.insert_or_assign(ExprHash(id->type), id);
    res._reverse.emplace(id->name, id);
    return res;
  }

  auto Env::localCount(string const& prefix) const -> size_t {
    auto const it = _count.find(prefix);
    return it != _count.end() ? it->second : 0;
  }

  // Guaranteed to terminate, since `_reverse` is finite.
  auto Env::intro(Builder& builder, string const& prefix, Expr const* type, bool hide) const -> pair<Ident const*, Env> {
    auto n = localCount(prefix);
    auto name = prefix + std::to_string(n);
    while (_reverse.contains(name)) name = prefix + std::to_string(++n);
    auto const id = builder.variable(name, type);
    auto res = *this;
    (hide ? res._hidden : res._names).insert_or_assign(ExprHash(type), id);
    res._count.insert_or_assign(prefix, n + 1);
    res._reverse.emplace(name, id);
    return {id, std::move(res)};
  }

  auto Env::mem(Expr const* f) const -> bool {
    auto const key = ExprHash(f);
    return _names.contains(key) || _global.contains(key);
  }

  auto Env::get(Expr const* f) const -> optional<Ident const*> {
    auto const key = ExprHash(f);
    if (auto const it = _names.find(key); it != _names.end()) return it->second;
    if (auto const it = _global.find(key); it != _global.end()) return it->second;
    return {};
  }

  auto Env::find(Coercions const& coercions, Expr const* f) const -> Expr const* {
    auto& builder = coercions.builder();
    for (auto const& [name, candidates]: coercions.list()) {
      for (auto const& [term, wrap]: candidates(f)) {
        auto const id = get(term);
        if (!id) continue;
        auto const res = wrap(builder.var(*id));
        if (res->type() && *res->type() == *f) return res;
        coercions.log().error(
          "proof",
          "Originally looking for ",
          f->toString(),
          " coerced to ",
          term->toString(),
          " which found ",
          (*id)->name,
          " but wrapped into ",
          res->toString()
        );
        coercions.log().error("proof", "Coercion '", name, "' returned a wrongly wrapped term.");
        unreachable;
      }
    }
    throw NotIntroduced(f);
  }

  auto Env::bindings() const -> vector<pair<Expr const*, Ident const*>> {
    auto sorted = [](Bindings const& m) {
      auto res = vector<pair<Expr const*, Ident const*>>();
      for (auto const& [k, id]: m) res.emplace_back(k.e, id);
      std::ranges::sort(res, [](auto const& l, auto const& r) { return l.second->name < r.second->name; });
      return res;
    };
    return concat(sorted(_names), sorted(_global));
  }

  auto Env::toString() const -> string {
    auto out = std::ostringstream();
    auto first = true;
    for (auto const& [t, id]: bindings()) {
      if (!first) out << "\n";
      first = false;
      out << id->name << " (" << t->hash() << "): " << t->toString();
    }
    return out.str();
  }

  auto Sequent::toString() const -> string {
    auto res = string("sequent:\n  env:");
    auto const envs = env.toString();
    auto line = string();
    auto in = std::istringstream(envs);
    while (std::getline(in, line)) res += "\n    " + line;
    res += "\n  goal: " + goal->toString();
    return res;
  }

#include "macros_close.hpp"
}
