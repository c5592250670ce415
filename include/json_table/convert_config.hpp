#pragma once
#include <cstddef>

namespace jt {

struct ConvertConfig {
  std::size_t default_cap    = 10000; // implicit row cap when no limit is given
  std::size_t max_objects    = 10000; // records scanned for header keys
  std::size_t max_keys       = 1000;  // unique header keys
  std::size_t max_key_length = 255;   // code points; longer keys are dropped
  bool        skip_empty_keys = true;

  // Throws std::invalid_argument when a cap is zero.
  void validate() const;
};

}
