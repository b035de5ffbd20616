#ifndef ARBOR_PROOF_STEP_HPP
#define ARBOR_PROOF_STEP_HPP

#include <any>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include "env.hpp"
#include "prelude.hpp"

namespace arbor::proof {
#include "macros_open.hpp"

  class Session;

  // Output languages.
  enum class Lang: uint32_t { Dot, Coq };

  // How the branches of a step are laid out in script form.
  // `Branching`: all branches are peers (e.g. a case split).
  // `LastButNotLeast`: the last branch is the rest of the proof, the others are side conditions (e.g. a cut).
  enum class Pretty: uint32_t { Branching, LastButNotLeast };

  // Prints a step state (type-erased).
  using Printer = std::function<void(std::ostream&, std::any const&)>;

  // "This step does not apply here". Recoverable: the caller may try another step.
  class StepFailure: public std::runtime_error {
  public:
    explicit StepFailure(std::string const& msg):
        std::runtime_error(msg) {}
  };

  // The part of a step that does not depend on its input type; this is what closed nodes refer to.
  class StepBase {
    interface(StepBase);

    virtual auto name() const -> std::string const& required;

    // Builds the term of a node closed by this step, given the terms of its branches (in order).
    virtual auto elaborate(Session& session, std::any const& state, std::vector<Expr const*> const& args) const
      -> Expr const* required;

    // Auxiliary declarations needed by this instantiation.
    virtual auto prelude(std::any const& state) const -> std::vector<Prelude const*> required;

    virtual auto render(Lang lang) const -> std::pair<Pretty, Printer> required;
  };

  // A named, immutable and reusable reasoning step, with private state type `S` and input type `I`.
  template <typename S, typename I>
  class Step: public StepBase {
  public:
    using State = S;
    using Input = I;
    using Render = std::pair<Pretty, std::function<void(std::ostream&, S const&)>>;

    struct Parts {
      std::string name;
      // Must not modify the sequent; returns the state and the new subgoals.
      // May throw `StepFailure`, `NotIntroduced` or `NameConflict`.
      std::function<std::pair<S, std::vector<Sequent>>(Session&, Sequent const&, I const&)> compute;
      std::function<Expr const*(Session&, S const&, std::vector<Expr const*> const&)> elaborate;
      Render coq;
      Render dot = {Pretty::Branching, [](std::ostream& out, S const&) { out << "N/A"; }};
      std::function<std::vector<Prelude const*>(S const&)> prelude = [](S const&) {
        return std::vector<Prelude const*>();
      };
    };

    explicit Step(Parts parts):
        _parts(std::move(parts)) {}

    auto compute(Session& session, Sequent const& sequent, I const& input) const -> std::pair<S, std::vector<Sequent>> {
      return _parts.compute(session, sequent, input);
    }

    auto name() const -> std::string const& override {
      return _parts.name;
    }

    auto elaborate(Session& session, std::any const& state, std::vector<Expr const*> const& args) const
      -> Expr const* override {
      return _parts.elaborate(session, std::any_cast<S const&>(state), args);
    }

    auto prelude(std::any const& state) const -> std::vector<Prelude const*> override {
      return _parts.prelude(std::any_cast<S const&>(state));
    }

    auto render(Lang lang) const -> std::pair<Pretty, Printer> override {
      auto const& [pretty, pp] = (lang == Lang::Coq) ? _parts.coq : _parts.dot;
      return {pretty, [pp](std::ostream& out, std::any const& state) { pp(out, std::any_cast<S const&>(state)); }};
    }

  private:
    Parts _parts;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_PROOF_STEP_HPP
