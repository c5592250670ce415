#include "json_table/shape.hpp"
#include "json_table/errors.hpp"

namespace jt {

namespace {
constexpr const char* kNoData       = "No JSON data to process";
constexpr const char* kNotTabular   = "JSON data must be an array or object";
constexpr const char* kNullFirstRow = "Invalid array data: null first element";
}

std::string_view to_string(ArrayMode mode) noexcept {
  switch (mode) {
    case ArrayMode::ObjectRows: return "object_rows";
    case ArrayMode::RawRows:    return "raw_rows";
    case ArrayMode::ScalarRows: return "scalar_rows";
  }
  return "object_rows";
}

Shape classify(const JsonValue& value) {
  using simdjson::dom::element_type;

  Shape s;
  switch (value.type()) {
    case element_type::NULL_VALUE:
      throw EmptyDataError(kNoData);

    case element_type::OBJECT: {
      simdjson::dom::object obj = value.get_object().value_unsafe();
      if (obj.begin() == obj.end()) throw EmptyDataError(kNoData);
      s.mode = ArrayMode::ObjectRows;
      s.single_object = true;
      s.estimated_size = 1;
      return s;
    }

    case element_type::ARRAY: {
      simdjson::dom::array arr = value.get_array().value_unsafe();
      auto first_it = arr.begin();
      if (first_it == arr.end()) throw EmptyDataError(kNoData);

      const JsonValue first = *first_it;
      switch (first.type()) {
        case element_type::OBJECT:     s.mode = ArrayMode::ObjectRows; break;
        case element_type::ARRAY:      s.mode = ArrayMode::RawRows;    break;
        case element_type::NULL_VALUE: throw InvalidShapeError(kNullFirstRow);
        default:                       s.mode = ArrayMode::ScalarRows; break;
      }
      s.estimated_size = element_count(arr);
      return s;
    }

    default:
      throw InvalidShapeError(kNotTabular);
  }
}

}
