#pragma once
#include "types.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace quasar
{

  inline constexpr const char *kLogicKey = "_logic";

  enum class Logic : uint8_t
  {
    And = 0,
    Or = 1,
    Not = 2 // NOT(all predicates hold), not a per-predicate negation
  };

  enum class CompareOp : uint8_t
  {
    Eq,
    Ne,
    Gt,
    Gte,
    Lt,
    Lte
  };

  struct Comparison
  {
    CompareOp op{CompareOp::Eq};
    Value operand{};
  };

  struct FieldPredicate
  {
    std::string field{};
    std::vector<Comparison> comparisons{}; // all must hold
  };

  // Field predicates combined under one logic mode, evaluated against an
  // exported mapping. A condition without predicates matches everything.
  class Condition
  {
  public:
    Condition() = default;
    explicit Condition(std::vector<FieldPredicate> predicates, Logic logic = Logic::And);

    // {"name": "Alice", "age": {"gt": 35}, "_logic": "or"}
    // A non-object predicate (or {}) is an equality literal; an object is a
    // map of comparison operators. null parses to the empty condition.
    static Condition parse(const Value &query);

    bool matches(const Value &mapping) const;

    bool empty() const { return predicates_.empty(); }
    Logic logic() const { return logic_; }
    const std::vector<FieldPredicate> &predicates() const { return predicates_; }

  private:
    std::vector<FieldPredicate> predicates_{};
    Logic logic_{Logic::And};
  };

  Logic parseLogic(std::string_view token);
  CompareOp parseCompareOp(std::string_view token);

  // field is nullptr when the mapping lacks it; absence fails every operator
  bool compare(CompareOp op, const Value *field, const Value &operand);

} // namespace quasar
