#include "json.hpp"
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;
using std::vector;

namespace arbor::proof {

  auto toJson(Proof const& proof) -> json {
    auto res = json();
    res["goal"] = proof.goal.goal->toString();
    auto& top = res["root"];
    // Children are pre-sized before their slots are handed out, so the pointers stay valid
    auto stk = vector<std::pair<Node const*, json*>>{{&root(proof), &top}};
    while (!stk.empty()) {
      auto const [node, j] = stk.back();
      stk.pop_back();
      (*j)["id"] = node->id();
      (*j)["open"] = node->isOpen();
      if (node->isOpen()) {
        (*j)["sequent"] = node->sequent().toString();
        (*j)["label"] = "OPEN (" + std::to_string(node->id()) + ")";
        (*j)["branches"] = json::array();
        continue;
      }
      auto const& closed = std::get<Node::Closed>(node->extract());
      auto const [_, pp] = closed.step->render(Lang::Coq);
      auto label = std::ostringstream();
      pp(label, closed.state);
      (*j)["step"] = closed.step->name();
      (*j)["label"] = label.str();
      auto& branches = ((*j)["branches"] = json::array());
      auto const& children = *closed.branches;
      for (auto i = 0uz; i < children.size(); i++) branches.push_back(nullptr);
      for (auto i = children.size(); i-- > 0;) stk.emplace_back(&children[i], &branches[i]);
    }
    return res;
  }

}
