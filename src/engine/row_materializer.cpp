#include "json_table/row_materializer.hpp"
#include <stdexcept>
#include <string_view>
#include <unordered_map>

namespace jt {

std::string stringify(const JsonValue& v) {
  using simdjson::dom::element_type;
  switch (v.type()) {
    case element_type::NULL_VALUE:
      return std::string{};
    case element_type::STRING:
      return std::string(v.get_string().value_unsafe());
    case element_type::BOOL:
      return v.get_bool().value_unsafe() ? "true" : "false";
    case element_type::INT64:
      return std::to_string(v.get_int64().value_unsafe());
    case element_type::UINT64:
      return std::to_string(v.get_uint64().value_unsafe());
    default:
      // doubles, arrays, objects
      return simdjson::to_string(v);
  }
}

Row object_row(const JsonValue& record, const HeaderSet& header) {
  const auto& keys = header.keys();

  if (!is_mapping_record(record)) {
    // mixed array: element in the first column; width is always the header's
    Row row(keys.size());
    if (!row.empty()) row[0] = stringify(record);
    return row;
  }

  std::unordered_map<std::string_view, JsonValue> fields;
  for (auto field : record.get_object().value_unsafe()) {
    fields.insert_or_assign(field.key, field.value); // last duplicate wins
  }

  Row row;
  row.reserve(keys.size());
  for (const auto& k : keys) {
    auto it = fields.find(std::string_view(k));
    row.push_back(it == fields.end() ? std::string{} : stringify(it->second));
  }
  return row;
}

Row raw_row(const JsonValue& element) {
  simdjson::dom::array arr;
  if (element.get_array().get(arr) != simdjson::SUCCESS) {
    return Row{stringify(element)};
  }
  Row row;
  for (JsonValue cell : arr) row.push_back(stringify(cell));
  return row;
}

Row scalar_row(const JsonValue& element) {
  return Row{stringify(element)};
}

TableMatrix materialize(const std::vector<JsonValue>& records,
                        ArrayMode mode,
                        const HeaderSet* header,
                        bool include_header) {
  TableMatrix table;
  table.reserve(records.size() + 1);

  switch (mode) {
    case ArrayMode::ObjectRows:
      if (!header) throw std::invalid_argument("object rows need a header set");
      if (include_header) table.push_back(header->keys());
      for (const auto& r : records) table.push_back(object_row(r, *header));
      break;

    case ArrayMode::RawRows:
      // row 0 of a 2D array already plays the header role
      for (const auto& r : records) table.push_back(raw_row(r));
      break;

    case ArrayMode::ScalarRows:
      if (include_header) table.push_back(Row{"Value"});
      for (const auto& r : records) table.push_back(scalar_row(r));
      break;
  }
  return table;
}

}
