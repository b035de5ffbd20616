#include "lang.hpp"
#include <vector>

using std::string;
using std::vector;

namespace arbor::proof {
#include "macros_open.hpp"

  namespace coq {

    namespace {

      // Contexts, from the most to the least permissive
      enum class Prec: uint32_t { Top, ArrowLeft, AppArg };

      auto paren(string const& s, bool cond) -> string {
        return cond ? "(" + s + ")" : s;
      }

      auto name(Ident const* v, vector<Ident const*> const& stk) -> string {
        if (!v->name.empty()) return v->name;
        for (auto i = stk.size(); i-- > 0;)
          if (stk[i] == v) return Expr::newName(i);
        return "_";
      }

      // Name of a binder about to be pushed
      auto binder(Ident const* v, vector<Ident const*> const& stk) -> string {
        return v->name.empty() ? Expr::newName(stk.size()) : v->name;
      }

      auto print(Expr const* e, Prec prec, vector<Ident const*>& stk) -> string {
        switch (e->tag) {
          case Expr::Sort: return e->sort.tag == Expr::SProp ? "Prop" : "Type";
          case Expr::Var: return name(e->var.id, stk);
          case Expr::App: {
            auto args = vector<Expr const*>();
            auto head = e;
            while (head->tag == Expr::App) {
              args.push_back(head->app.r);
              head = head->app.l;
            }
            auto res = print(head, Prec::AppArg, stk);
            for (auto i = args.size(); i-- > 0;) res += " " + print(args[i], Prec::AppArg, stk);
            return paren(res, prec == Prec::AppArg);
          }
          case Expr::Lam: {
            auto const v = e->lam.v;
            auto res = "fun (" + binder(v, stk) + " : " + print(v->type, Prec::Top, stk) + ") => ";
            stk.push_back(v);
            res += print(e->lam.r, Prec::Top, stk);
            stk.pop_back();
            return paren(res, prec != Prec::Top);
          }
          case Expr::Pi: {
            auto const v = e->pi.v;
            auto res = string();
            if (e->pi.r->occurs(v)) {
              res = "forall (" + binder(v, stk) + " : " + print(v->type, Prec::Top, stk) + "), ";
            } else {
              res = print(v->type, Prec::ArrowLeft, stk) + " -> ";
            }
            stk.push_back(v);
            res += print(e->pi.r, Prec::Top, stk);
            stk.pop_back();
            return paren(res, prec != Prec::Top);
          }
          case Expr::Let: {
            auto const v = e->let.v;
            auto res = "let " + binder(v, stk) + " : " + print(v->type, Prec::Top, stk) + " := "
                     + print(e->let.t, Prec::Top, stk) + " in ";
            stk.push_back(v);
            res += print(e->let.r, Prec::Top, stk);
            stk.pop_back();
            return paren(res, prec != Prec::Top);
          }
        }
        unreachable;
      }

    }

    auto ident(Ident const* id) -> string {
      return id->name.empty() ? "_" : id->name;
    }

    auto term(Expr const* e) -> string {
      auto stk = vector<Ident const*>();
      return print(e, Prec::Top, stk);
    }

  }

  namespace dot {

    auto escape(std::string_view s) -> string {
      auto res = string();
      for (auto const c: s) {
        switch (c) {
          case '&': res += "&amp;"; break;
          case '<': res += "&lt;"; break;
          case '>': res += "&gt;"; break;
          case '"': res += "&quot;"; break;
          default: res += c;
        }
      }
      return res;
    }

    auto ident(Ident const* id) -> string {
      return escape(id->name);
    }

    auto term(Expr const* e) -> string {
      return escape(e->toString());
    }

  }

#include "macros_close.hpp"
}
