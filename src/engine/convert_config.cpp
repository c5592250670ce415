#include "json_table/convert_config.hpp"
#include <stdexcept>

namespace jt {

void ConvertConfig::validate() const {
  if (default_cap == 0)    throw std::invalid_argument("default_cap must be positive");
  if (max_objects == 0)    throw std::invalid_argument("max_objects must be positive");
  if (max_keys == 0)       throw std::invalid_argument("max_keys must be positive");
  if (max_key_length == 0) throw std::invalid_argument("max_key_length must be positive");
}

}
