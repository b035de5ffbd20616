#ifndef ARBOR_PROOF_LANG_HPP
#define ARBOR_PROOF_LANG_HPP

#include <string>
#include <string_view>
#include <core.hpp>

namespace arbor::proof {

  using core::Expr;
  using core::Ident;

  // Coq syntax.
  namespace coq {
    auto ident(Ident const* id) -> std::string;
    auto term(Expr const* e) -> std::string;
  }

  // Graphviz HTML-like labels (escaped).
  namespace dot {
    auto escape(std::string_view s) -> std::string;
    auto ident(Ident const* id) -> std::string;
    auto term(Expr const* e) -> std::string;
  }

}

#endif // ARBOR_PROOF_LANG_HPP
