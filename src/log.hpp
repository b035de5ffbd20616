#ifndef ARBOR_LOG_HPP
#define ARBOR_LOG_HPP

#include <iostream>
#include <string>
#include <string_view>
#include <common.hpp>

namespace arbor {
#include "macros_open.hpp"

  // Leveled logging to a stream, tagged with a section name such as "proof.elaboration".
  // Not thread-safe (neither is anything that writes to it).
  class Logger {
  public:
    enum Level: uint32_t { Error, Warn, Info, Debug };

    explicit Logger(std::ostream& out = std::cerr, Level level = Warn):
        _out(&out),
        _level(level) {}

    auto level() const noexcept -> Level {
      return _level;
    }
    auto setLevel(Level level) noexcept -> void {
      _level = level;
    }
    auto setStream(std::ostream& out) noexcept -> void {
      _out = &out;
    }
    auto enabled(Level level) const noexcept -> bool {
      return level <= _level;
    }

    template <typename... Ts>
    auto log(Level level, std::string_view section, Ts const&... args) -> void {
      if (!enabled(level)) return;
      *_out << "[" << levelName(level) << "] " << section << ": ";
      (*_out << ... << args);
      *_out << std::endl;
    }

    template <typename... Ts>
    auto error(std::string_view section, Ts const&... args) -> void {
      log(Error, section, args...);
    }
    template <typename... Ts>
    auto warn(std::string_view section, Ts const&... args) -> void {
      log(Warn, section, args...);
    }
    template <typename... Ts>
    auto info(std::string_view section, Ts const&... args) -> void {
      log(Info, section, args...);
    }
    template <typename... Ts>
    auto debug(std::string_view section, Ts const&... args) -> void {
      log(Debug, section, args...);
    }

    static auto levelName(Level level) -> std::string_view {
      switch (level) {
        case Error: return "error";
        case Warn: return "warn";
        case Info: return "info";
        case Debug: return "debug";
      }
      unreachable;
    }

  private:
    std::ostream* _out;
    Level _level;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_LOG_HPP
