#ifndef ARBOR_CORE_IDENT_HPP
#define ARBOR_CORE_IDENT_HPP

#include <string>
#include <utility>
#include <common.hpp>

namespace arbor::core {

  class Expr;

  // A typed name.
  // `Var` identifiers are plain variables (bound by binders, or minted fresh by environments);
  // `Const` identifiers are declared constants.
  // Identity is pointer identity: two distinct `Ident` objects never denote the same variable, even if names agree.
  class Ident {
  public:
    enum class Kind: uint32_t { Var, Const }; using enum Kind;

    Kind const kind;
    std::string const name;
    Expr const* const type;

    Ident(Kind kind, std::string name, Expr const* type):
        kind(kind),
        name(std::move(name)),
        type(type) {}

    Ident(Ident const&) = delete;
    Ident(Ident&&) = delete;
    auto operator=(Ident const&) -> Ident& = delete;
    auto operator=(Ident&&) -> Ident& = delete;
    ~Ident() = default;

    auto isVar() const noexcept -> bool {
      return kind == Var;
    }
  };

}

#endif // ARBOR_CORE_IDENT_HPP
