#ifndef ARBOR_CONFIG_HPP
#define ARBOR_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include <log.hpp>
#include <proof/print.hpp>
#include <proof/step.hpp>

namespace arbor {

  class ConfigError: public std::runtime_error {
  public:
    explicit ConfigError(std::string const& msg):
        std::runtime_error("Configuration error: " + msg) {}
  };

  // Output settings of the driver. Missing fields keep their defaults.
  struct Config {
    proof::Lang lang = proof::Lang::Coq;
    proof::Mode mode = proof::Mode::Proof;
    bool preludes = true;
    bool json = false;
    Logger::Level log = Logger::Warn;

    // Throws `ConfigError` on unreadable files, malformed JSON, unknown fields or ill-typed values.
    static auto load(std::string const& path) -> Config;
    static auto parse(std::string const& text) -> Config;
  };

  void to_json(nlohmann::json& j, Config const& o);
  void from_json(nlohmann::json const& j, Config& o);

}

#endif // ARBOR_CONFIG_HPP
