#include "print.hpp"
#include <ranges>
#include <sstream>
#include "lang.hpp"

using std::string;
using std::vector;

namespace arbor::proof {
#include "macros_open.hpp"

  namespace {

    // Graphviz

    constexpr auto tableOptions = R"(BORDER="0" CELLBORDER="1" CELLSPACING="0" BGCOLOR="LIGHTBLUE")";

    auto dotId(Node const& node) -> string {
      return "node_" + std::to_string(node.id());
    }

    auto dotSequent(std::ostream& out, string const& label, string const& color, Sequent const& seq) -> void {
      out << R"(<TR><TD BGCOLOR="YELLOW" colspan="3">)" << dot::term(seq.goal) << "</TD></TR>";
      auto const hyps = seq.env.bindings();
      if (hyps.empty()) {
        out << R"(<TR><TD BGCOLOR=")" << color << R"(" colspan="3">)" << label << "</TD></TR>";
        return;
      }
      for (auto i = 0uz; i < hyps.size(); i++) {
        auto const& [t, id] = hyps[i];
        out << "<TR>";
        if (i == 0) out << R"(<TD BGCOLOR=")" << color << R"(" rowspan=")" << hyps.size() << R"(">)" << label << "</TD>";
        out << "<TD>" << dot::ident(id) << "</TD><TD>" << dot::term(t) << "</TD></TR>";
      }
    }

    auto dotNode(std::ostream& out, Node const& node) -> void {
      auto stk = vector<Node const*>{&node};
      while (!stk.empty()) {
        auto const& curr = *stk.back();
        stk.pop_back();
        out << dotId(curr) << " [shape=plaintext, label=<<TABLE " << tableOptions << ">";
        match(
          curr.extract(),
          [&](Node::Open const& open) {
            dotSequent(out, "OPEN (" + std::to_string(curr.id()) + ")", "RED", open.sequent);
            out << "</TABLE>>];\n";
          },
          [&](Node::Closed const& closed) {
            auto const [_, pp] = closed.step->render(Lang::Dot);
            out << "<TR><TD>" << dot::escape(closed.step->name()) << "</TD><TD>";
            pp(out, closed.state);
            out << "</TD></TR></TABLE>>];\n";
            for (auto const& child: *closed.branches) out << dotId(curr) << " -> " << dotId(child) << ";\n";
            for (auto const& child: *closed.branches | std::views::reverse) stk.push_back(&child);
          }
        );
      }
    }

    auto dotRoot(std::ostream& out, Sequent const& seq) -> void {
      out << "root [shape=plaintext, label=<<TABLE " << tableOptions << ">";
      dotSequent(out, "ROOT", "PURPLE", seq);
      out << "</TABLE>>];\n";
    }

    // Coq

    auto bullet(size_t depth) -> string {
      static constexpr char bullets[] = {'-', '+'};
      constexpr auto n = std::size(bullets);
      return string(depth / n + 1, bullets[depth % n]);
    }

    // The last branch of a `LastButNotLeast` step (and any single branch) continues on the same level,
    // iteratively rather than recursively.
    auto coqNode(std::ostream& out, Node const* node, size_t depth, string const& indent) -> void {
      while (true) {
        auto const closed = std::get_if<Node::Closed>(&node->extract());
        if (!closed) throw OpenProof(node->id());
        auto const [pretty, pp] = closed->step->render(Lang::Coq);
        pp(out, closed->state);
        auto const& branches = *closed->branches;
        if (branches.empty()) return;
        if (branches.size() == 1) {
          out << "\n" << indent;
          node = &branches.front();
          continue;
        }
        switch (pretty) {
          case Pretty::Branching: {
            auto const b = bullet(depth);
            auto const inner = indent + string(b.size() + 1, ' ');
            for (auto const& child: branches) {
              out << "\n" << indent << b << " ";
              coqNode(out, &child, depth + 1, inner);
            }
            return;
          }
          case Pretty::LastButNotLeast: {
            for (auto i = 0uz; i + 1 < branches.size(); i++) {
              out << "\n" << indent << "{ ";
              coqNode(out, &branches[i], depth, indent + "  ");
              out << " }";
            }
            out << "\n" << indent;
            node = &branches.back();
            continue;
          }
        }
        unreachable;
      }
    }

    auto printPrelude(std::ostream& out, Mode mode, Prelude const& p) -> void {
      switch (p.tag) {
        case Prelude::Require:
          out << "(* Prelude: Module import *)\nRequire Import " << p.unit << ".\n";
          return;
        case Prelude::Alias:
          out << "(* Prelude: Alias *)\n";
          if (mode == Mode::Proof) out << "pose (" << coq::ident(p.id) << " := " << coq::term(p.term) << ").\n";
          else
            out << "Definition " << coq::ident(p.id) << " : " << coq::term(p.id->type) << " := " << coq::term(p.term)
                << ".\n";
          return;
      }
      unreachable;
    }

  }

  auto printPreludes(Session& session, Lang lang, Mode mode, vector<Prelude const*> const& entries, std::ostream& out)
    -> void {
    if (lang == Lang::Dot) return;
    session.preludes().emit(entries, [&out, mode](Prelude const& p) { printPrelude(out, mode, p); });
  }

  auto printDot(Proof const& proof, std::ostream& out) -> void {
    auto const& node = root(proof);
    out << "digraph proof {\n";
    dotRoot(out, proof.goal);
    out << "root -> " << dotId(node) << ";\n";
    dotNode(out, node);
    out << "}\n";
  }

  auto printCoq(Proof const& proof, std::ostream& out) -> void {
    // Render into a buffer first: an open node makes the whole script invalid
    auto body = std::ostringstream();
    coqNode(body, &root(proof), 0, "");
    out << "(* PROOF START *)\n" << body.str() << "\n(* PROOF END *)\n";
  }

  auto print(Session& session, Lang lang, Proof const& proof, std::ostream& out) -> void {
    printPreludes(session, lang, Mode::Proof, preludes(proof), out);
    switch (lang) {
      case Lang::Dot: printDot(proof, out); return;
      case Lang::Coq: printCoq(proof, out); return;
    }
    unreachable;
  }

  auto printTerm(
    Session& session,
    Lang lang,
    Proof const& proof,
    std::ostream& out,
    std::function<Expr const*(Expr const*)> const& process
  ) -> void {
    auto const t = elaborate(session, proof);
    auto const res = process ? process(t) : t;
    if (!res->type() || *res->type() != *t->type()) {
      session.log().error("proof", "Post-processing changed the type of ", t->toString(), " into ", res->toString());
      unreachable;
    }
    switch (lang) {
      case Lang::Dot:
        out << "digraph proof {\n";
        dotRoot(out, proof.goal);
        out << "root -> term;\n";
        out << "term [shape=plaintext, label=<<TABLE " << tableOptions << "><TR><TD>" << dot::term(res)
            << "</TD></TR></TABLE>>];\n";
        out << "}\n";
        return;
      case Lang::Coq:
        out << "(* PROOF START *)\n" << coq::term(res) << "\n(* PROOF END *)\n";
        return;
    }
    unreachable;
  }

  auto printTermPreludes(Session& session, Lang lang, Proof const& proof, std::ostream& out) -> void {
    printPreludes(session, lang, Mode::Term, preludes(proof), out);
  }

#include "macros_close.hpp"
}
