// gradual/term/term_printer.cpp - One-line concrete syntax of terms
//
#include "gradual/term/term_printer.hpp"

#include <fmt/format.h>

#include <iterator>
#include <string_view>

#include "gradual/term/visitor.hpp"

namespace gradual
{

namespace
{

class TermPrinter : public ConstTermVisitor<TermPrinter, void>
{
public:
  explicit TermPrinter(std::string & out) : out_(out) {}

  // === Shared helpers ===

  template <typename Span>
  void seq(const Span & items, std::string_view sep)
  {
    bool first = true;
    for (const auto * item : items) {
      if (!first) out_ += sep;
      first = false;
      visit(item);
    }
  }

  void multi(gsl::span<Term * const> children)
  {
    out_ += "{ ";
    seq(children, " ");
    out_ += " }";
  }

  void float_literal(double v)
  {
    std::string text = fmt::format("{}", v);
    if (text.find_first_of(".eni") == std::string::npos) text += ".0";
    out_ += text;
  }

  void string_literal(std::string_view v) { fmt::format_to(std::back_inserter(out_), "\"{}\"", v); }

  // === Expressions ===

  void visit_invalid_exp(const InvalidExp * n) { out_ += n->text; }
  void visit_empty_hole_exp(const EmptyHoleExp *) { out_ += "?"; }
  void visit_multi_hole_exp(const MultiHoleExp * n) { multi(n->children); }
  void visit_triv_exp(const TrivExp *) { out_ += "()"; }
  void visit_bool_exp(const BoolExp * n) { out_ += n->value ? "true" : "false"; }
  void visit_int_exp(const IntExp * n) { out_ += std::to_string(n->value); }
  void visit_float_exp(const FloatExp * n) { float_literal(n->value); }
  void visit_string_exp(const StringExp * n) { string_literal(n->value); }

  void visit_list_lit_exp(const ListLitExp * n)
  {
    out_ += "[";
    seq(n->elements, ", ");
    out_ += "]";
  }

  void visit_constructor_exp(const ConstructorExp * n) { out_ += n->tag; }

  void visit_fun_exp(const FunExp * n)
  {
    out_ += "fun ";
    visit(n->pat);
    out_ += " -> ";
    visit(n->body);
  }

  void visit_tuple_exp(const TupleExp * n)
  {
    out_ += "(";
    seq(n->elements, ", ");
    out_ += ")";
  }

  void visit_var_exp(const VarExp * n) { out_ += n->name; }

  void visit_let_exp(const LetExp * n)
  {
    out_ += "let ";
    visit(n->pat);
    out_ += " = ";
    visit(n->def);
    out_ += " in ";
    visit(n->body);
  }

  void visit_ty_alias_exp(const TyAliasExp * n)
  {
    out_ += "type ";
    visit(n->tpat);
    out_ += " = ";
    visit(n->def);
    out_ += " in ";
    visit(n->body);
  }

  void visit_ap_exp(const ApExp * n)
  {
    visit(n->fn);
    out_ += "(";
    visit(n->arg);
    out_ += ")";
  }

  void visit_if_exp(const IfExp * n)
  {
    out_ += "if ";
    visit(n->cond);
    out_ += " then ";
    visit(n->then_branch);
    out_ += " else ";
    visit(n->else_branch);
  }

  void visit_seq_exp(const SeqExp * n)
  {
    visit(n->first);
    out_ += "; ";
    visit(n->second);
  }

  void visit_test_exp(const TestExp * n)
  {
    out_ += "test ";
    visit(n->expr);
    out_ += " end";
  }

  void visit_parens_exp(const ParensExp * n)
  {
    out_ += "(";
    visit(n->expr);
    out_ += ")";
  }

  void visit_cons_exp(const ConsExp * n)
  {
    visit(n->head);
    out_ += " :: ";
    visit(n->tail);
  }

  void visit_list_concat_exp(const ListConcatExp * n)
  {
    visit(n->lhs);
    out_ += " @ ";
    visit(n->rhs);
  }

  void visit_un_op_exp(const UnOpExp * n)
  {
    out_ += to_string(n->op);
    visit(n->operand);
  }

  void visit_bin_op_exp(const BinOpExp * n)
  {
    visit(n->lhs);
    fmt::format_to(std::back_inserter(out_), " {} ", to_string(n->op));
    visit(n->rhs);
  }

  void visit_match_exp(const MatchExp * n)
  {
    out_ += "case ";
    visit(n->scrutinee);
    for (const Rule * rule : n->rules) {
      out_ += " ";
      visit(rule);
    }
    out_ += " end";
  }

  void visit_rule(const Rule * n)
  {
    out_ += "| ";
    visit(n->pat);
    out_ += " => ";
    visit(n->body);
  }

  // === Patterns ===

  void visit_invalid_pat(const InvalidPat * n) { out_ += n->text; }
  void visit_empty_hole_pat(const EmptyHolePat *) { out_ += "?"; }
  void visit_multi_hole_pat(const MultiHolePat * n) { multi(n->children); }
  void visit_wild_pat(const WildPat *) { out_ += "_"; }
  void visit_int_pat(const IntPat * n) { out_ += std::to_string(n->value); }
  void visit_float_pat(const FloatPat * n) { float_literal(n->value); }
  void visit_bool_pat(const BoolPat * n) { out_ += n->value ? "true" : "false"; }
  void visit_string_pat(const StringPat * n) { string_literal(n->value); }
  void visit_triv_pat(const TrivPat *) { out_ += "()"; }

  void visit_list_lit_pat(const ListLitPat * n)
  {
    out_ += "[";
    seq(n->elements, ", ");
    out_ += "]";
  }

  void visit_constructor_pat(const ConstructorPat * n) { out_ += n->tag; }

  void visit_cons_pat(const ConsPat * n)
  {
    visit(n->head);
    out_ += " :: ";
    visit(n->tail);
  }

  void visit_var_pat(const VarPat * n) { out_ += n->name; }

  void visit_tuple_pat(const TuplePat * n)
  {
    out_ += "(";
    seq(n->elements, ", ");
    out_ += ")";
  }

  void visit_parens_pat(const ParensPat * n)
  {
    out_ += "(";
    visit(n->pat);
    out_ += ")";
  }

  void visit_ap_pat(const ApPat * n)
  {
    visit(n->fn);
    out_ += "(";
    visit(n->arg);
    out_ += ")";
  }

  void visit_type_ann_pat(const TypeAnnPat * n)
  {
    visit(n->pat);
    out_ += " : ";
    visit(n->ann);
  }

  // === Types ===

  void visit_invalid_typ(const InvalidTyp * n) { out_ += n->text; }
  void visit_empty_hole_typ(const EmptyHoleTyp *) { out_ += "?"; }
  void visit_multi_hole_typ(const MultiHoleTyp * n) { multi(n->children); }
  void visit_int_typ(const IntTyp *) { out_ += "Int"; }
  void visit_float_typ(const FloatTyp *) { out_ += "Float"; }
  void visit_bool_typ(const BoolTyp *) { out_ += "Bool"; }
  void visit_string_typ(const StringTyp *) { out_ += "String"; }

  void visit_list_typ(const ListTyp * n)
  {
    out_ += "[";
    visit(n->elem);
    out_ += "]";
  }

  void visit_var_typ(const VarTyp * n) { out_ += n->name; }

  void visit_arrow_typ(const ArrowTyp * n)
  {
    visit(n->param);
    out_ += " -> ";
    visit(n->result);
  }

  void visit_tuple_typ(const TupleTyp * n)
  {
    out_ += "(";
    seq(n->elements, ", ");
    out_ += ")";
  }

  void visit_parens_typ(const ParensTyp * n)
  {
    out_ += "(";
    visit(n->typ);
    out_ += ")";
  }

  void visit_sum_typ(const SumTyp * n)
  {
    bool first = true;
    for (const VariantTerm * v : n->variants) {
      out_ += first ? "+ " : " + ";
      first = false;
      visit(v);
    }
  }

  // === Type patterns and sum entries ===

  void visit_invalid_tpat(const InvalidTPat * n) { out_ += n->text; }
  void visit_empty_hole_tpat(const EmptyHoleTPat *) { out_ += "?"; }
  void visit_multi_hole_tpat(const MultiHoleTPat * n) { multi(n->children); }
  void visit_var_tpat(const VarTPat * n) { out_ += n->name; }

  void visit_variant(const Variant * n)
  {
    out_ += n->tag;
    if (n->arg) {
      out_ += "(";
      visit(n->arg);
      out_ += ")";
    }
  }

  void visit_bad_variant_entry(const BadVariantEntry * n) { visit(n->typ); }

private:
  std::string & out_;
};

}  // namespace

std::string print_term(const Term * term)
{
  std::string out;
  TermPrinter printer(out);
  printer.visit(term);
  return out;
}

std::string print_term(const Term * term, size_t max_width)
{
  std::string out = print_term(term);
  if (out.size() > max_width) {
    const size_t keep = max_width > 3 ? max_width - 3 : 0;
    out.resize(keep);
    out += "...";
  }
  return out;
}

}  // namespace gradual
