#pragma once
#include <cstddef>
#include <simdjson.h>

namespace jt {

// Untrusted input value. A view into a document owned by a dom::parser;
// the engine never mutates it.
using JsonValue = simdjson::dom::element;

// Exact element count. dom::array::size() saturates at 0xFFFFFF.
std::size_t element_count(simdjson::dom::array arr) noexcept;

}
