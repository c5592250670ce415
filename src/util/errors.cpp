#include "json_table/errors.hpp"

namespace jt {

std::string format_error(std::string_view context, const std::exception& e) {
  std::string out(context);
  out += ": ";
  out += e.what();
  return out;
}

}
