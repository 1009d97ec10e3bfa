#include "recall_core/db/record_filter.hpp"

#include <stdexcept>

namespace recall_core {

RecordFilter::RecordFilter(Op op, RecordField field, std::string value)
    : op_(op), field_(field), value_(std::move(value)) {}

RecordFilter::RecordFilter(Op op, const RecordFilter &lhs, const RecordFilter &rhs)
    : op_(op), field_(RecordField::Id), children_{lhs, rhs} {}

RecordFilter RecordFilter::all() {
  return RecordFilter(Op::True, RecordField::Id, "");
}

RecordFilter RecordFilter::id_is(const std::string &id) {
  return RecordFilter(Op::Equals, RecordField::Id, id);
}

RecordFilter RecordFilter::owner_is(const std::string &owner) {
  return RecordFilter(Op::Equals, RecordField::Owner, owner);
}

RecordFilter RecordFilter::source_is(const std::string &source) {
  return RecordFilter(Op::Equals, RecordField::Source, source);
}

RecordFilter RecordFilter::visibility_is(Visibility visibility) {
  return RecordFilter(Op::Equals, RecordField::Visibility, to_string(visibility));
}

RecordFilter RecordFilter::operator&&(const RecordFilter &other) const {
  return RecordFilter(Op::And, *this, other);
}

RecordFilter RecordFilter::operator||(const RecordFilter &other) const {
  return RecordFilter(Op::Or, *this, other);
}

bool RecordFilter::references(RecordField field) const {
  if (op_ == Op::Equals) {
    return field_ == field;
  }
  for (const auto &child : children_) {
    if (child.references(field)) {
      return true;
    }
  }
  return false;
}

std::string RecordFilter::column_name(RecordField field) {
  switch (field) {
    case RecordField::Id:
      return "id";
    case RecordField::Owner:
      return "user_id";
    case RecordField::Source:
      return "source";
    case RecordField::Visibility:
      return "visibility";
    default:
      throw std::invalid_argument("Unknown record field");
  }
}

std::string RecordFilter::to_sql(std::vector<std::string> &params) const {
  switch (op_) {
    case Op::True:
      return "1 = 1";
    case Op::Equals:
      params.push_back(value_);
      return column_name(field_) + " = ?";
    case Op::And:
      return "(" + children_[0].to_sql(params) + " AND " + children_[1].to_sql(params) + ")";
    case Op::Or:
      return "(" + children_[0].to_sql(params) + " OR " + children_[1].to_sql(params) + ")";
    default:
      throw std::logic_error("Unhandled filter operator");
  }
}

bool RecordFilter::matches(const DocumentFragment &fragment) const {
  switch (op_) {
    case Op::True:
      return true;
    case Op::Equals:
      switch (field_) {
        case RecordField::Id:
          return fragment.id == value_;
        case RecordField::Owner:
          return fragment.owner == value_;
        case RecordField::Source:
          return fragment.source == value_;
        case RecordField::Visibility:
          return to_string(fragment.visibility) == value_;
      }
      return false;
    case Op::And:
      return children_[0].matches(fragment) && children_[1].matches(fragment);
    case Op::Or:
      return children_[0].matches(fragment) || children_[1].matches(fragment);
    default:
      throw std::logic_error("Unhandled filter operator");
  }
}

}  // namespace recall_core
