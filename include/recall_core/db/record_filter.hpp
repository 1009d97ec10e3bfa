#pragma once

#include <string>
#include <vector>

#include "recall_core/types/vector_record.hpp"

namespace recall_core {

enum class RecordField { Id, Owner, Source, Visibility };

/*
A predicate over record attributes, composed from equality tests with AND/OR.
The store renders it into a parameterised SQL WHERE clause, so values never
reach the statement text.
*/
class RecordFilter {
 public:
  static RecordFilter all();
  static RecordFilter id_is(const std::string &id);
  static RecordFilter owner_is(const std::string &owner);
  static RecordFilter source_is(const std::string &source);
  static RecordFilter visibility_is(Visibility visibility);

  RecordFilter operator&&(const RecordFilter &other) const;
  RecordFilter operator||(const RecordFilter &other) const;

  // True if any equality test in the tree targets the given field
  bool references(RecordField field) const;

  // Appends bound values to params in placeholder order
  std::string to_sql(std::vector<std::string> &params) const;

  // Evaluates the predicate against an in-memory fragment
  bool matches(const DocumentFragment &fragment) const;

 private:
  enum class Op { True, Equals, And, Or };

  RecordFilter(Op op, RecordField field, std::string value);
  RecordFilter(Op op, const RecordFilter &lhs, const RecordFilter &rhs);

  static std::string column_name(RecordField field);

  Op op_;
  RecordField field_;
  std::string value_;
  std::vector<RecordFilter> children_;
};

}  // namespace recall_core
