#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "core.hpp"
#include "log.hpp"
#include "proof/dispatch.hpp"
#include "proof/json.hpp"
#include "proof/print.hpp"
#include "proof/session.hpp"
#include "proof/tactics.hpp"
#include "proof/tree.hpp"

using std::string;
using std::cout, std::cerr, std::endl;
using namespace arbor;
using namespace arbor::proof;

auto output(Session& session, Config const& config, Proof const& proof) -> void {
  switch (config.mode) {
    case Mode::Proof:
      if (config.preludes) print(session, config.lang, proof, cout);
      else if (config.lang == Lang::Dot) printDot(proof, cout);
      else printCoq(proof, cout);
      break;
    case Mode::Term:
      if (config.preludes) printTermPreludes(session, config.lang, proof, cout);
      printTerm(session, config.lang, proof, cout);
      break;
  }
  if (config.json) cout << toJson(proof).dump(2) << endl;
}

int main(int argc, char* argv[]) {
  auto config = Config();
  try {
    if (argc > 1) config = Config::load(argv[1]);
  } catch (ConfigError& e) {
    cerr << e.what() << endl;
    return 1;
  }

  auto log = Logger(cerr, config.log);
  auto session = Session(log);
  auto dispatcher = Dispatcher(log);
  auto& b = session.builder();

  dispatcher.add("assumption", [&session](LemmaInfo const& info) -> std::optional<Tactic> {
    if (info.plugin != "core" || info.name != "hyp") return std::nullopt;
    return Tactic([&session](Pos const& pos) { assumptionTac(session, pos); });
  });

  auto const A = b.var(b.constant("A", b.prop()));
  auto const B = b.var(b.constant("B", b.prop()));

  try {
    // (A -> B) -> A -> B
    auto mp = mkProof(session, {Env(), b.arrow(b.arrow(A, B), b.arrow(A, B))});
    auto const [hs, pos] = introsTac(session, rootPos(mp), "H");
    auto const args = applyTac(session, pos, b.var(hs[0]), 1);
    dispatcher.dispatch({"core", "hyp", {}})(args[0]);
    output(session, config, mp);

    // A -> (A -> B) -> B, through the previous proof as a named lemma
    auto const lemma = b.constant("mp", mp.goal.goal);
    auto const alias = session.preludes().alias(lemma, elaborate(session, mp));
    auto p = mkProof(session, {Env().declare(lemma), b.arrow(A, b.arrow(b.arrow(A, B), B))});
    auto const [hs1, pos1] = introsTac(session, rootPos(p), "H");
    auto const [c, side, rest] = cutTac(session, pos1, "C", B);
    auto const subs = applyTac(session, side, b.var(lemma), 2, {alias});
    for (auto const& sub: subs) assumptionTac(session, sub);
    assumptionTac(session, rest);
    output(session, config, p);
  } catch (BuildFailure& e) {
    cerr << e.what() << endl;
    return 1;
  } catch (OpenProof& e) {
    cerr << e.what() << endl;
    return 1;
  } catch (NoHandler& e) {
    cerr << e.what() << endl;
    return 1;
  }

  return 0;
}
