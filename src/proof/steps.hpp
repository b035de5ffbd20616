#ifndef ARBOR_PROOF_STEPS_HPP
#define ARBOR_PROOF_STEPS_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include "step.hpp"

namespace arbor::proof {

  // `ty` (after head reduction) as `a -> ret`, where the bound variable does not occur in `ret`.
  auto matchArrow(Builder& builder, Expr const* ty) -> std::optional<std::pair<Expr const*, Expr const*>>;

  // As many leading non-dependent arrows as possible.
  auto matchArrows(Builder& builder, Expr const* ty) -> std::pair<std::vector<Expr const*>, Expr const*>;

  // Exactly `n` leading non-dependent arrows.
  auto matchNArrows(Builder& builder, size_t n, Expr const* ty)
    -> std::optional<std::pair<std::vector<Expr const*>, Expr const*>>;

  namespace steps {

    struct ApplyInput {
      Expr const* f;
      size_t n;
      std::vector<Prelude const*> preludes = {};
    };

    // Name prefix for the new identifier, and the term it stands for.
    struct LetInput {
      std::string prefix;
      Expr const* t;
    };

    struct LetState {
      Ident const* id;
      Expr const* t;
    };

    // Name prefix for the new hypothesis, and the formula it proves.
    struct CutInput {
      std::string prefix;
      Expr const* t;
    };

    using Apply = Step<ApplyInput, ApplyInput>;
    using Intro = Step<Ident const*, std::string>;
    using Letin = Step<LetState, LetInput>;
    using Cut = Step<Ident const*, CutInput>;
    using Assumption = Step<Expr const*, unit>;

    // Closes the goal with `f` applied to `n` arguments; one subgoal per argument.
    auto apply() -> Apply const&;

    // Introduces the head quantifier of the goal.
    auto intro() -> Intro const&;

    // Names a term; the goal is unchanged.
    auto letin() -> Letin const&;

    // Proves an intermediate formula first, then uses it.
    auto cut() -> Cut const&;

    // Closes the goal with a hypothesis, looked up through the session's coercions.
    auto assumption() -> Assumption const&;

  }

}

#endif // ARBOR_PROOF_STEPS_HPP
