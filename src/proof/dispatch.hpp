#ifndef ARBOR_PROOF_DISPATCH_HPP
#define ARBOR_PROOF_DISPATCH_HPP

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <common.hpp>
#include <core.hpp>
#include <log.hpp>
#include "tree.hpp"

namespace arbor::proof {

  // Something that grows the proof at a position.
  using Tactic = std::function<void(Pos const&)>;

  // A lemma some decision procedure relied on, to be turned into a proof.
  struct LemmaInfo {
    std::string plugin;
    std::string name;
    std::vector<Expr const*> args;
  };

  class NoHandler: public std::runtime_error {
  public:
    explicit NoHandler(LemmaInfo const& info):
        std::runtime_error("No handler produces a proof for lemma " + info.name + " of " + info.plugin) {}
  };

  // Ordered list of handlers turning lemmas into tactics. Append-only.
  class Dispatcher {
  public:
    using Handler = std::function<std::optional<Tactic>(LemmaInfo const&)>;

    explicit Dispatcher(Logger& log):
        _log(&log) {}

    auto add(std::string name, Handler handler) -> void {
      _handlers.emplace_back(std::move(name), std::move(handler));
    }

    auto size() const noexcept -> size_t {
      return _handlers.size();
    }

    // The tactic of the first handler (in registration order) that claims `info`.
    // Throws `NoHandler` if there is none.
    auto dispatch(LemmaInfo const& info) const -> Tactic;

  private:
    Logger* _log;
    std::vector<std::pair<std::string, Handler>> _handlers;
  };

}

#endif // ARBOR_PROOF_DISPATCH_HPP
