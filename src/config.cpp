#include "config.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace arbor {

  namespace proof {

#define FROM_TO_ENUM(T, ...)                                                                                         \
  void to_json(json& j, T const& e) {                                                                                \
    static_assert(std::is_enum<T>::value, #T " must be an enum!");                                                   \
    static const auto m = std::vector<std::pair<T, json>>(__VA_ARGS__);                                              \
    auto it =                                                                                                        \
      std::find_if(std::begin(m), std::end(m), [e](std::pair<T, json> const& p) -> bool { return p.first == e; });   \
    j = (it != std::end(m) ? it : std::begin(m))->second;                                                            \
  }                                                                                                                  \
  void from_json(json const& j, T& e) {                                                                              \
    static_assert(std::is_enum<T>::value, #T " must be an enum!");                                                   \
    static const auto m = std::vector<std::pair<T, json>>(__VA_ARGS__);                                              \
    auto it =                                                                                                        \
      std::find_if(std::begin(m), std::end(m), [&j](std::pair<T, json> const& p) -> bool { return p.second == j; }); \
    if (it == std::end(m)) throw ConfigError("unknown value " + j.dump() + " for " #T);                             \
    e = it->first;                                                                                                   \
  }

    // clang-format off
    FROM_TO_ENUM(Lang, { {Lang::Dot, "dot"}, {Lang::Coq, "coq"} });
    FROM_TO_ENUM(Mode, { {Mode::Proof, "proof"}, {Mode::Term, "term"} });
    // clang-format on

  }

  using Level = Logger::Level;
  // clang-format off
  FROM_TO_ENUM(Level, { {Level::Error, "error"}, {Level::Warn, "warn"}, {Level::Info, "info"}, {Level::Debug, "debug"} });
  // clang-format on

#undef FROM_TO_ENUM

  // clang-format off
#define TO(name) j[#name] = o.name
#define OPT_FROM(name) if (j.contains(#name)) j.at(#name).get_to(o.name)
  // clang-format on

  void to_json(json& j, Config const& o) {
    j = json::object();
    TO(lang);
    TO(mode);
    TO(preludes);
    TO(json);
    TO(log);
  }

  void from_json(json const& j, Config& o) {
    if (!j.is_object()) throw ConfigError("expected an object, got " + j.dump());
    for (auto const& [key, _]: j.items())
      if (key != "lang" && key != "mode" && key != "preludes" && key != "json" && key != "log")
        throw ConfigError("unknown field \"" + key + "\"");
    o = {};
    try {
      OPT_FROM(lang);
      OPT_FROM(mode);
      OPT_FROM(preludes);
      OPT_FROM(json);
      OPT_FROM(log);
    } catch (json::type_error& e) {
      throw ConfigError(e.what());
    }
  }

#undef TO
#undef OPT_FROM

  auto Config::parse(std::string const& text) -> Config {
    auto j = nlohmann::json();
    try {
      j = nlohmann::json::parse(text);
    } catch (nlohmann::json::parse_error& e) {
      throw ConfigError(e.what());
    }
    return j.get<Config>();
  }

  auto Config::load(std::string const& path) -> Config {
    auto in = std::ifstream(path);
    if (!in) throw ConfigError("cannot open " + path);
    auto ss = std::stringstream();
    ss << in.rdbuf();
    return parse(ss.str());
  }

}
