#include "dispatch.hpp"

namespace arbor::proof {

  auto Dispatcher::dispatch(LemmaInfo const& info) const -> Tactic {
    for (auto const& [name, handler]: _handlers) {
      if (auto tactic = handler(info)) {
        _log->debug("proof", "Lemma ", info.name, " of ", info.plugin, " handled by ", name);
        return std::move(*tactic);
      }
    }
    _log->warn("proof", "Lemma ", info.name, " of ", info.plugin, " is not handled");
    throw NoHandler(info);
  }

}
