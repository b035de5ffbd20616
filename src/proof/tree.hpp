#ifndef ARBOR_PROOF_TREE_HPP
#define ARBOR_PROOF_TREE_HPP

#include <any>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include "env.hpp"
#include "session.hpp"
#include "step.hpp"

namespace arbor::proof {
#include "macros_open.hpp"

  class Node;

  // Sibling nodes, allocated at their final length when their parent is closed.
  using Branches = std::vector<Node>;

  // A stable handle to one slot of a `Branches` container. Keeps the container alive.
  struct Pos {
    std::shared_ptr<Branches> branches;
    size_t index;

    auto node() const -> Node&;
  };

  // Elaboration or branch inspection reached a node that is still open.
  class OpenProof: public std::runtime_error {
  public:
    size_t id;
    explicit OpenProof(size_t id):
        std::runtime_error("Proof is still open at node " + std::to_string(id)),
        id(id) {}
  };

  // A step failed to apply at a position.
  // `what()` includes the sequent at `pos`.
  class BuildFailure: public std::runtime_error {
  public:
    std::string message;
    Pos pos;
    BuildFailure(std::string const& message, Pos pos);
  };

  // A proof tree node: either an open sequent, or a step applied to it together with the resulting branches.
  // A node is closed at most once, in place (see `applyStep`); it never goes back to open.
  class Node {
  public:
    struct Open {
      Sequent sequent;
    };
    struct Closed {
      StepBase const* step;
      std::any state;
      std::shared_ptr<Branches> branches;
    };
    using State = std::variant<Open, Closed>;

    // Placeholder, overwritten before use.
    Node():
        _id(0),
        _owner(),
        _index(0),
        _state(Open{Sequent{Env(), nullptr}}) {}

    Node(size_t id, std::shared_ptr<Branches> const& owner, size_t index, Sequent sequent):
        _id(id),
        _owner(owner),
        _index(index),
        _state(Open{std::move(sequent)}) {}

    auto id() const noexcept -> size_t {
      return _id;
    }
    auto isOpen() const noexcept -> bool {
      return std::holds_alternative<Open>(_state);
    }

    // The position of this node in its container.
    auto pos() const -> Pos;

    // Pre (checked): the node is open.
    auto sequent() const -> Sequent const&;

    // Throws `OpenProof` if the node is open.
    auto branches() const -> Branches const&;
    auto step() const -> StepBase const&;

    // Raw contents, without the state type of the step.
    auto extract() const noexcept -> State const& {
      return _state;
    }

    // Cached elaboration result.
    auto term() const noexcept -> std::optional<Expr const*> {
      return _term;
    }

  private:
    size_t _id;
    std::weak_ptr<Branches> _owner;
    size_t _index;
    State _state;
    mutable std::optional<Expr const*> _term;

    friend struct Proof;
    friend auto close(Session&, Pos const&, StepBase const&, std::any, std::vector<Sequent>) -> std::vector<Pos>;
    friend auto elaborate(Session&, Node const&) -> Expr const*;
  };

  // A goal together with the single node proving it.
  // Copies share the tree; the last one to go frees it without recursing into the branches.
  struct Proof {
    Sequent goal;
    std::shared_ptr<Branches> nodes;

    Proof(Sequent goal, std::shared_ptr<Branches> nodes):
        goal(std::move(goal)),
        nodes(std::move(nodes)) {}

    Proof(Proof const&) = default;
    Proof(Proof&&) = default;
    // The previous tree (if this was its last owner) is freed by the destructor of `r`.
    auto operator=(Proof r) -> Proof& {
      std::swap(goal, r.goal);
      std::swap(nodes, r.nodes);
      return *this;
    }
    ~Proof();
  };

  // A fresh proof whose root is open.
  auto mkProof(Session& session, Sequent sequent) -> Proof;

  // Pre (checked): the proof has exactly one root.
  auto root(Proof const& proof) -> Node&;
  auto rootPos(Proof const& proof) -> Pos;

  // Closes the (open) node at `pos` with `step`, allocating one open child per subgoal.
  // Returns the positions of the new children.
  auto close(Session& session, Pos const& pos, StepBase const& step, std::any state, std::vector<Sequent> subgoals)
    -> std::vector<Pos>;

  // Applies `step` to the open node at `pos`: the single growth operation of proof trees.
  // Failures of the step (`StepFailure`, `NotIntroduced`, `NameConflict`, `InvalidExpr`) are rethrown as `BuildFailure` at `pos`.
  // Applying a step to a closed node is an internal error.
  template <typename S, typename I>
  auto applyStep(Session& session, Pos const& pos, Step<S, I> const& step, I const& input)
    -> std::pair<S, std::vector<Pos>> {
    auto& node = pos.node();
    if (!node.isOpen()) {
      session.log().error("proof", "Trying to apply reasoning step to an already closed proof");
      unreachable;
    }
    auto fail = [&](std::string const& msg) {
      session.log().warn("proof", "Step ", step.name(), " failed at node ", node.id(), ": ", msg);
      return BuildFailure(msg, pos);
    };
    auto [state, subgoals] = [&]() {
      try {
        return step.compute(session, node.sequent(), input);
      } catch (StepFailure const& e) {
        throw fail(e.what());
      } catch (NotIntroduced const& e) {
        throw fail("Formula was not introduced: " + e.term->toString());
      } catch (NameConflict const& e) {
        throw fail(e.what());
      } catch (core::InvalidExpr const& e) {
        throw fail(e.what());
      }
    }();
    auto positions = close(session, pos, step, std::any(state), std::move(subgoals));
    return {std::move(state), std::move(positions)};
  }

  // Turns the subtree rooted at `node` into a term, caching the term of every node visited.
  // Throws `OpenProof` if an open node is reached.
  auto elaborate(Session& session, Node const& node) -> Expr const*;

  // Elaborates the root. The type of the result is checked against the goal of the proof.
  auto elaborate(Session& session, Proof const& proof) -> Expr const*;

  // Prelude entries required by the closed nodes of a proof (possibly with repetitions).
  auto preludes(Proof const& proof) -> std::vector<Prelude const*>;

#include "macros_close.hpp"
}

#endif // ARBOR_PROOF_TREE_HPP
