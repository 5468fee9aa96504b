#include "condition.hpp"
#include "errors.hpp"
#include "projection.hpp"
#include <utility>

namespace quasar
{

  static FieldPredicate parse_predicate(const std::string &field, const Value &pred)
  {
    FieldPredicate out{};
    out.field = field;
    if (!pred.is_object() || pred.empty())
    {
      out.comparisons.push_back(Comparison{CompareOp::Eq, pred});
      return out;
    }
    for (auto it = pred.begin(); it != pred.end(); ++it)
      out.comparisons.push_back(Comparison{parseCompareOp(it.key()), it.value()});
    return out;
  }

  static bool holds(const FieldPredicate &p, const Value &mapping)
  {
    const Value *field = resolveField(mapping, p.field);
    for (const auto &c : p.comparisons)
    {
      if (!compare(c.op, field, c.operand))
        return false;
    }
    return true;
  }

  Logic parseLogic(std::string_view token)
  {
    if (token == "and")
      return Logic::And;
    if (token == "or")
      return Logic::Or;
    if (token == "not")
      return Logic::Not;
    throw ValidationError("unknown _logic value: " + std::string(token));
  }

  CompareOp parseCompareOp(std::string_view token)
  {
    if (token == "eq")
      return CompareOp::Eq;
    if (token == "ne")
      return CompareOp::Ne;
    if (token == "gt")
      return CompareOp::Gt;
    if (token == "gte")
      return CompareOp::Gte;
    if (token == "lt")
      return CompareOp::Lt;
    if (token == "lte")
      return CompareOp::Lte;
    throw ValidationError("unknown comparison operator: " + std::string(token));
  }

  bool compare(CompareOp op, const Value *field, const Value &operand)
  {
    if (field == nullptr)
      return false;
    if (op == CompareOp::Eq)
      return *field == operand;
    if (op == CompareOp::Ne)
      return *field != operand;

    // ordering only between numbers or between strings
    bool numbers = field->is_number() && operand.is_number();
    bool strings = field->is_string() && operand.is_string();
    if (!numbers && !strings)
      return false;
    switch (op)
    {
    case CompareOp::Gt:
      return *field > operand;
    case CompareOp::Gte:
      return *field >= operand;
    case CompareOp::Lt:
      return *field < operand;
    case CompareOp::Lte:
      return *field <= operand;
    default:
      return false;
    }
  }

  Condition::Condition(std::vector<FieldPredicate> predicates, Logic logic)
      : predicates_(std::move(predicates)), logic_(logic)
  {
  }

  Condition Condition::parse(const Value &query)
  {
    if (query.is_null())
      return Condition{};
    if (!query.is_object())
      throw ValidationError("condition must be an object, got " + std::string(query.type_name()));

    Logic logic = Logic::And;
    std::vector<FieldPredicate> predicates;
    for (auto it = query.begin(); it != query.end(); ++it)
    {
      if (it.key() == kLogicKey)
      {
        if (!it->is_string())
          throw ValidationError("_logic must be a string");
        logic = parseLogic(it->get_ref<const std::string &>());
        continue;
      }
      predicates.push_back(parse_predicate(it.key(), it.value()));
    }
    return Condition(std::move(predicates), logic);
  }

  bool Condition::matches(const Value &mapping) const
  {
    if (predicates_.empty())
      return true;

    size_t held = 0;
    for (const auto &p : predicates_)
    {
      if (holds(p, mapping))
        ++held;
    }
    switch (logic_)
    {
    case Logic::Or:
      return held > 0;
    case Logic::Not:
      return held != predicates_.size();
    case Logic::And:
    default:
      return held == predicates_.size();
    }
  }

} // namespace quasar
