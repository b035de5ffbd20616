#include "tree.hpp"
#include <ranges>

using std::string;
using std::vector;

namespace arbor::proof {
#include "macros_open.hpp"

  auto Pos::node() const -> Node& {
    assert(branches && index < branches->size());
    return (*branches)[index];
  }

  BuildFailure::BuildFailure(string const& message, Pos pos):
      std::runtime_error(
        "In context: " + std::to_string(pos.node().id()) + ": " + pos.node().sequent().toString() + "\n" + message
      ),
      message(message),
      pos(std::move(pos)) {}

  auto Node::pos() const -> Pos {
    auto owner = _owner.lock();
    assert(owner);
    return {std::move(owner), _index};
  }

  auto Node::sequent() const -> Sequent const& {
    auto const open = std::get_if<Open>(&_state);
    assert(open);
    return open->sequent;
  }

  auto Node::branches() const -> Branches const& {
    auto const closed = std::get_if<Closed>(&_state);
    if (!closed) throw OpenProof(_id);
    return *closed->branches;
  }

  auto Node::step() const -> StepBase const& {
    auto const closed = std::get_if<Closed>(&_state);
    if (!closed) throw OpenProof(_id);
    return *closed->step;
  }

  // Branch containers owned by nobody else are detached from their parents before the parents go,
  // so that each container is freed with an empty subtree.
  Proof::~Proof() {
    auto stk = vector<std::shared_ptr<Branches>>();
    if (nodes.use_count() == 1) stk.push_back(std::move(nodes));
    while (!stk.empty()) {
      auto curr = std::move(stk.back());
      stk.pop_back();
      for (auto& node: *curr) {
        auto const closed = std::get_if<Node::Closed>(&node._state);
        if (closed && closed->branches.use_count() == 1) stk.push_back(std::move(closed->branches));
      }
    }
  }

  auto mkProof(Session& session, Sequent sequent) -> Proof {
    auto nodes = std::make_shared<Branches>(1);
    (*nodes)[0] = Node(session.nextId(), nodes, 0, sequent);
    return {std::move(sequent), std::move(nodes)};
  }

  auto root(Proof const& proof) -> Node& {
    assert(proof.nodes && proof.nodes->size() == 1);
    return proof.nodes->front();
  }

  auto rootPos(Proof const& proof) -> Pos {
    assert(proof.nodes && proof.nodes->size() == 1);
    return {proof.nodes, 0};
  }

  auto close(Session& session, Pos const& pos, StepBase const& step, std::any state, vector<Sequent> subgoals)
    -> vector<Pos> {
    auto& node = pos.node();
    assert(node.isOpen());
    // Allocate at full length first, so that every child can refer to its container
    auto branches = std::make_shared<Branches>(subgoals.size());
    auto res = vector<Pos>();
    for (auto i = 0uz; i < subgoals.size(); i++) {
      (*branches)[i] = Node(session.nextId(), branches, i, std::move(subgoals[i]));
      res.push_back({branches, i});
    }
    node._state = Node::Closed{&step, std::move(state), std::move(branches)};
    return res;
  }

  // Post-order traversal with an explicit stack, so that deep proofs do not exhaust the call stack.
  auto elaborate(Session& session, Node const& node) -> Expr const* {
    auto stk = vector<std::pair<Node const*, bool>>{{&node, false}};
    while (!stk.empty()) {
      auto const [curr, expanded] = stk.back();
      stk.pop_back();
      if (curr->_term) continue;
      auto const closed = std::get_if<Node::Closed>(&curr->_state);
      if (!closed) throw OpenProof(curr->_id);
      auto const& branches = *closed->branches;
      if (!expanded) {
        stk.emplace_back(curr, true);
        for (auto const& child: branches | std::views::reverse)
          if (!child._term) stk.emplace_back(&child, false);
        continue;
      }
      auto args = vector<Expr const*>();
      for (auto const& child: branches) {
        assert(child._term);
        args.push_back(*child._term);
      }
      curr->_term = closed->step->elaborate(session, closed->state, args);
      if (session.log().enabled(Logger::Debug))
        session.log().debug(
          "proof.elaboration", "Node ", curr->_id, " (", closed->step->name(), "): ", (*curr->_term)->toString()
        );
    }
    return *node._term;
  }

  auto elaborate(Session& session, Proof const& proof) -> Expr const* {
    auto const res = elaborate(session, root(proof));
    auto const goal = proof.goal.goal;
    if (res->type() && (*res->type() == *goal || res->type()->convertible(*goal, session.builder()))) return res;
    session.log().error(
      "proof.elaboration",
      "Elaborated term has type ",
      res->type() ? res->type()->toString() : string("nothing"),
      " but the goal is ",
      goal->toString()
    );
    unreachable;
  }

  auto preludes(Proof const& proof) -> vector<Prelude const*> {
    auto res = vector<Prelude const*>();
    auto stk = vector<Node const*>{&root(proof)};
    while (!stk.empty()) {
      auto const curr = stk.back();
      stk.pop_back();
      auto const closed = std::get_if<Node::Closed>(&curr->extract());
      if (!closed) continue;
      res = concat(std::move(res), closed->step->prelude(closed->state));
      for (auto const& child: *closed->branches | std::views::reverse) stk.push_back(&child);
    }
    return res;
  }

#include "macros_close.hpp"
}
