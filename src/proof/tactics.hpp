#ifndef ARBOR_PROOF_TACTICS_HPP
#define ARBOR_PROOF_TACTICS_HPP

#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include "session.hpp"
#include "steps.hpp"
#include "tree.hpp"

namespace arbor::proof {

  // Tactics wrap `applyStep` with a canonical step.
  // They return nothing when the branch gets closed, a single position, or several positions when it branches.

  // `f` applied to `n` arguments, one new position per argument.
  auto applyTac(Session& session, Pos const& pos, Expr const* f, size_t n, std::vector<Prelude const*> preludes = {})
    -> std::vector<Pos>;

  // Closes the branch with `f`.
  auto exactTac(Session& session, Pos const& pos, Expr const* f, std::vector<Prelude const*> preludes = {}) -> void;

  // Closes the branch with a hypothesis proving the goal, looked up through the session's coercions.
  // Throws `BuildFailure` if there is none.
  auto assumptionTac(Session& session, Pos const& pos) -> void;

  auto introTac(Session& session, Pos const& pos, std::string const& prefix) -> std::pair<Ident const*, Pos>;

  // Introduces head quantifiers until the goal is no longer one.
  auto introsTac(Session& session, Pos const& pos, std::string const& prefix)
    -> std::pair<std::vector<Ident const*>, Pos>;

  auto letinTac(Session& session, Pos const& pos, std::string const& prefix, Expr const* t)
    -> std::pair<Ident const*, Pos>;

  // Returns the new hypothesis, the position proving it and the position using it.
  auto cutTac(Session& session, Pos const& pos, std::string const& prefix, Expr const* t)
    -> std::tuple<Ident const*, Pos, Pos>;

}

#endif // ARBOR_PROOF_TACTICS_HPP
