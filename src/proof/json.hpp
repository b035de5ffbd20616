#ifndef ARBOR_PROOF_JSON_HPP
#define ARBOR_PROOF_JSON_HPP

#include <nlohmann/json_fwd.hpp>
#include "tree.hpp"

namespace arbor::proof {

  // Machine-readable dump of a (possibly partial) proof tree.
  // Each node is `{"id", "open", "sequent" (open nodes) or "step" (closed nodes), "label", "branches"}`.
  auto toJson(Proof const& proof) -> nlohmann::json;

}

#endif // ARBOR_PROOF_JSON_HPP
