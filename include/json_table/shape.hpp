#pragma once
#include <cstddef>
#include <string_view>

#include "json_table/json_value.hpp"

namespace jt {

// How the elements of a top-level array become rows; fixed from the first
// element for the whole conversion.
enum class ArrayMode { ObjectRows, RawRows, ScalarRows };

std::string_view to_string(ArrayMode mode) noexcept;

struct Shape {
  ArrayMode mode = ArrayMode::ObjectRows;
  bool single_object = false;     // top-level mapping wrapped as one record
  std::size_t estimated_size = 0; // 1 for a mapping, element count otherwise
};

// Throws EmptyDataError for null / {} / [] and InvalidShapeError for a
// top-level scalar or a null first element.
Shape classify(const JsonValue& value);

}
