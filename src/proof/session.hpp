#ifndef ARBOR_PROOF_SESSION_HPP
#define ARBOR_PROOF_SESSION_HPP

#include <common.hpp>
#include <core.hpp>
#include <log.hpp>
#include "env.hpp"
#include "prelude.hpp"

namespace arbor::proof {

  // Everything shared by the proofs built in one run: the term pool, the lookup coercions,
  // the prelude dependency graph and the node counter.
  // Coercions and preludes are append-only and should be registered before the proofs that use them are built.
  class Session {
  public:
    explicit Session(Logger& log):
        _log(&log),
        _builder(),
        _coercions(_builder, log),
        _preludes(log) {}

    Session(Session const&) = delete;
    Session(Session&&) = delete;
    auto operator=(Session const&) -> Session& = delete;
    auto operator=(Session&&) -> Session& = delete;
    ~Session() = default;

    auto log() noexcept -> Logger& { return *_log; }
    auto builder() noexcept -> Builder& { return _builder; }
    auto coercions() noexcept -> Coercions& { return _coercions; }
    auto preludes() noexcept -> PreludeGraph& { return _preludes; }

    // Fresh node identifier (never 0).
    auto nextId() noexcept -> size_t {
      return ++_lastId;
    }

  private:
    Logger* _log;
    Builder _builder;
    Coercions _coercions;
    PreludeGraph _preludes;
    size_t _lastId = 0;
  };

}

#endif // ARBOR_PROOF_SESSION_HPP
