#include "steps.hpp"
#include "lang.hpp"
#include "session.hpp"

using std::string;
using std::vector;
using std::pair;
using std::optional;

namespace arbor::proof {
#include "macros_open.hpp"

  auto matchArrow(Builder& builder, Expr const* ty) -> optional<pair<Expr const*, Expr const*>> {
    auto const t = ty->whnf(builder);
    if (t->tag != Expr::Pi || t->pi.r->occurs(t->pi.v)) return {};
    return pair{t->pi.v->type, t->pi.r};
  }

  auto matchArrows(Builder& builder, Expr const* ty) -> pair<vector<Expr const*>, Expr const*> {
    auto args = vector<Expr const*>();
    while (auto const m = matchArrow(builder, ty)) {
      args.push_back(m->first);
      ty = m->second;
    }
    return {args, ty};
  }

  auto matchNArrows(Builder& builder, size_t n, Expr const* ty) -> optional<pair<vector<Expr const*>, Expr const*>> {
    auto args = vector<Expr const*>();
    for (auto i = 0uz; i < n; i++) {
      auto const m = matchArrow(builder, ty);
      if (!m) return {};
      args.push_back(m->first);
      ty = m->second;
    }
    return pair{args, ty};
  }

  namespace steps {

    namespace {
      // Whether `t` can be the type of a hypothesis.
      auto isFormula(Builder& builder, Expr const* t) -> bool {
        try {
          builder.sortOf(t);
          return true;
        } catch (core::InvalidExpr const&) {
          return false;
        }
      }
    }

    auto apply() -> Apply const& {
      static auto const step = Apply({
        .name = "apply",
        .compute =
          [](Session& session, Sequent const& ctx, ApplyInput const& in) {
            auto& log = session.log();
            auto const f = in.f;
            log.debug("proof", "applying ", f->toString());
            auto const m = f->type() ? matchNArrows(session.builder(), in.n, f->type()) : std::nullopt;
            if (!m) {
              auto const ty = f->type() ? f->type()->toString() : string("nothing");
              log.warn("proof", "Expected a non-dependent product type but got ", ty, " while applying ", f->toString());
              throw StepFailure(
                "Expected " + std::to_string(in.n) + " non-dependent arguments, but got type " + ty + " while applying "
                + f->toString()
              );
            }
            auto const& [args, ret] = *m;
            // Check that the application proves the current goal
            if (*ret != *ctx.goal)
              throw StepFailure(
                "Wrong result type during application, expected " + ctx.goal->toString() + " but got " + ret->toString()
              );
            // Check that the term used is closed in the current environment
            auto unbound = string();
            for (auto const id: f->freeVars()) {
              if (ctx.env.exists(id)) continue;
              unbound += (unbound.empty() ? "" : "; ") + id->name;
            }
            if (!unbound.empty()) throw StepFailure("The variables [" + unbound + "] are free in " + f->toString());
            auto subgoals = vector<Sequent>();
            for (auto const arg: args) {
              log.debug("proof", "Goal left: ", arg->toString());
              subgoals.push_back({ctx.env, arg});
            }
            return pair{in, std::move(subgoals)};
          },
        .elaborate = [](Session& session, ApplyInput const& s,
                        vector<Expr const*> const& args) { return session.builder().apply(s.f, args); },
        .coq = {Pretty::Branching,
                [](std::ostream& out, ApplyInput const& s) {
                  out << (s.n == 0 ? "exact " : "apply ") << coq::term(s.f) << ".";
                }},
        .dot = {Pretty::Branching, [](std::ostream& out, ApplyInput const& s) { out << dot::term(s.f); }},
        .prelude = [](ApplyInput const& s) { return s.preludes; },
      });
      return step;
    }

    auto intro() -> Intro const& {
      static auto const step = Intro({
        .name = "intro",
        .compute =
          [](Session& session, Sequent const& ctx, string const& prefix) {
            auto& log = session.log();
            auto const g = ctx.goal->whnf(session.builder());
            if (g->tag != Expr::Pi) {
              log.warn("proof", "Expected a universal quantification, but got: ", g->toString());
              throw StepFailure("Can't introduce formula");
            }
            auto const v = g->pi.v;
            auto const q = g->pi.r;
            if (q->occurs(v)) {
              log.debug("proof", "Declaring ", v->name, " : ", v->type->toString());
              return pair{v, vector<Sequent>{{ctx.env.add(v), q}}};
            }
            auto [id, env] = ctx.env.intro(session.builder(), prefix, v->type);
            log.debug("proof", "Introduced ", id->name, " : ", v->type->toString());
            return pair{id, vector<Sequent>{{std::move(env), q}}};
          },
        .elaborate =
          [](Session& session, Ident const* const& id, vector<Expr const*> const& args) {
            assert(args.size() == 1);
            return session.builder().lam(id, args[0]);
          },
        .coq = {Pretty::LastButNotLeast,
                [](std::ostream& out, Ident const* const& id) { out << "intro " << coq::ident(id) << "."; }},
        .dot = {Pretty::Branching,
                [](std::ostream& out, Ident const* const& id) {
                  out << dot::ident(id) << ": " << dot::term(id->type);
                }},
      });
      return step;
    }

    auto letin() -> Letin const& {
      static auto const step = Letin({
        .name = "letin",
        .compute =
          [](Session& session, Sequent const& ctx, LetInput const& in) {
            if (!in.t->type()) throw StepFailure("Cannot name a term without type: " + in.t->toString());
            if (!isFormula(session.builder(), in.t->type()))
              throw StepFailure("Cannot name " + in.t->toString() + ", its type is not a proposition or type");
            auto [id, env] = ctx.env.intro(session.builder(), in.prefix, in.t->type());
            session.log().debug("proof", "let_binding ", id->name, " = ", in.t->toString());
            return pair{LetState{id, in.t}, vector<Sequent>{{std::move(env), ctx.goal}}};
          },
        .elaborate =
          [](Session& session, LetState const& s, vector<Expr const*> const& args) {
            assert(args.size() == 1);
            return session.builder().let(s.id, s.t, args[0]);
          },
        .coq = {Pretty::LastButNotLeast,
                [](std::ostream& out, LetState const& s) {
                  out << "pose proof (" << coq::term(s.t) << ") as " << coq::ident(s.id) << ".";
                }},
        .dot = {Pretty::Branching,
                [](std::ostream& out, LetState const& s) { out << dot::ident(s.id) << " = " << dot::term(s.t); }},
      });
      return step;
    }

    auto cut() -> Cut const& {
      static auto const step = Cut({
        .name = "cut",
        .compute =
          [](Session& session, Sequent const& ctx, CutInput const& in) {
            if (!isFormula(session.builder(), in.t))
              throw StepFailure("Cannot assert " + in.t->toString() + ", which is not a proposition or type");
            auto [id, env] = ctx.env.intro(session.builder(), in.prefix, in.t);
            session.log().debug("proof", "cut ", id->name, " : ", in.t->toString());
            return pair{id, vector<Sequent>{{ctx.env, in.t}, {std::move(env), ctx.goal}}};
          },
        .elaborate =
          [](Session& session, Ident const* const& id, vector<Expr const*> const& args) {
            assert(args.size() == 2);
            return session.builder().let(id, args[0], args[1]);
          },
        .coq = {Pretty::LastButNotLeast,
                [](std::ostream& out, Ident const* const& id) {
                  out << "assert (" << coq::ident(id) << ": " << coq::term(id->type) << ").";
                }},
        .dot = {Pretty::Branching,
                [](std::ostream& out, Ident const* const& id) {
                  out << dot::ident(id) << " = " << dot::term(id->type);
                }},
      });
      return step;
    }

    auto assumption() -> Assumption const& {
      static auto const step = Assumption({
        .name = "assumption",
        .compute =
          [](Session& session, Sequent const& ctx, unit const&) {
            auto const t = ctx.env.find(session.coercions(), ctx.goal);
            session.log().debug("proof", "Found ", t->toString(), " for ", ctx.goal->toString());
            return pair{t, vector<Sequent>()};
          },
        .elaborate = [](Session&, Expr const* const& t, vector<Expr const*> const&) { return t; },
        .coq = {Pretty::Branching,
                [](std::ostream& out, Expr const* const& t) { out << "exact " << coq::term(t) << "."; }},
        .dot = {Pretty::Branching, [](std::ostream& out, Expr const* const& t) { out << dot::term(t); }},
      });
      return step;
    }

  }

#include "macros_close.hpp"
}
