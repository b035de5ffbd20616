#ifndef ARBOR_PROOF_PRINT_HPP
#define ARBOR_PROOF_PRINT_HPP

#include <functional>
#include <ostream>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include "prelude.hpp"
#include "session.hpp"
#include "step.hpp"
#include "tree.hpp"

namespace arbor::proof {

  // Whether preludes accompany a proof script or a proof term.
  enum class Mode: uint32_t { Proof, Term };

  // Prints every entry `entries` depends on (and the entries themselves), in dependency order.
  // Nothing is printed for `Lang::Dot`.
  auto printPreludes(Session& session, Lang lang, Mode mode, std::vector<Prelude const*> const& entries, std::ostream& out)
    -> void;

  // Prints a (possibly partial) proof tree as a Graphviz digraph.
  auto printDot(Proof const& proof, std::ostream& out) -> void;

  // Prints a complete proof as a Coq script. Throws `OpenProof` if some node is open.
  auto printCoq(Proof const& proof, std::ostream& out) -> void;

  // Preludes (proof mode) followed by the proof tree.
  auto print(Session& session, Lang lang, Proof const& proof, std::ostream& out) -> void;

  // Elaborates the proof, optionally post-processes the term (which must keep its type) and prints it.
  auto printTerm(
    Session& session,
    Lang lang,
    Proof const& proof,
    std::ostream& out,
    std::function<Expr const*(Expr const*)> const& process = {}
  ) -> void;

  // Preludes (term mode) of the proof.
  auto printTermPreludes(Session& session, Lang lang, Proof const& proof, std::ostream& out) -> void;

}

#endif // ARBOR_PROOF_PRINT_HPP
