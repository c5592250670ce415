#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jt {

// Base of every error the table pipeline raises on purpose.
class JsonTableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Nothing to convert: null, {} or [].
class EmptyDataError : public JsonTableError {
public:
  using JsonTableError::JsonTableError;
};

// Top-level value (or first array element) fits no row variant.
class InvalidShapeError : public JsonTableError {
public:
  using JsonTableError::JsonTableError;
};

// Loader failures: missing file, unsafe path, bad bytes, malformed JSON.
class LoadError : public JsonTableError {
public:
  using JsonTableError::JsonTableError;
};

// "<context>: <what>"
std::string format_error(std::string_view context, const std::exception& e);

}
