#include "tactics.hpp"

using std::string;
using std::vector;

namespace arbor::proof {
#include "macros_open.hpp"

  auto applyTac(Session& session, Pos const& pos, Expr const* f, size_t n, vector<Prelude const*> preludes)
    -> vector<Pos> {
    return applyStep(session, pos, steps::apply(), steps::ApplyInput{f, n, std::move(preludes)}).second;
  }

  auto exactTac(Session& session, Pos const& pos, Expr const* f, vector<Prelude const*> preludes) -> void {
    auto const res = applyTac(session, pos, f, 0, std::move(preludes));
    assert(res.empty());
  }

  auto assumptionTac(Session& session, Pos const& pos) -> void {
    applyStep(session, pos, steps::assumption(), unit());
  }

  auto introTac(Session& session, Pos const& pos, string const& prefix) -> std::pair<Ident const*, Pos> {
    auto [id, res] = applyStep(session, pos, steps::intro(), prefix);
    assert(res.size() == 1);
    return {id, res[0]};
  }

  auto introsTac(Session& session, Pos const& pos, string const& prefix) -> std::pair<vector<Ident const*>, Pos> {
    auto ids = vector<Ident const*>();
    auto curr = pos;
    while (curr.node().sequent().goal->whnf(session.builder())->tag == Expr::Pi) {
      auto [id, next] = introTac(session, curr, prefix);
      ids.push_back(id);
      curr = std::move(next);
    }
    return {ids, curr};
  }

  auto letinTac(Session& session, Pos const& pos, string const& prefix, Expr const* t) -> std::pair<Ident const*, Pos> {
    auto [state, res] = applyStep(session, pos, steps::letin(), steps::LetInput{prefix, t});
    assert(res.size() == 1);
    return {state.id, res[0]};
  }

  auto cutTac(Session& session, Pos const& pos, string const& prefix, Expr const* t)
    -> std::tuple<Ident const*, Pos, Pos> {
    auto [id, res] = applyStep(session, pos, steps::cut(), steps::CutInput{prefix, t});
    assert(res.size() == 2);
    return {id, res[0], res[1]};
  }

#include "macros_close.hpp"
}
