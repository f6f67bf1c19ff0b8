#include "meta_value.hpp"
#include "errors.hpp"
#include <charconv>
#include <cmath>
#include <utility>

MetaValue MetaValue::number(double value) {
  if (!std::isfinite(value)) {
    throw MalformedScalarError(std::to_string(value));
  }

  // Shortest round-trip digits in plain decimal: 1e16 -> "10000000000000000".
  char buffer[400];
  auto result = std::to_chars(buffer, buffer + sizeof(buffer), value,
                              std::chars_format::fixed);

  MetaValue v;
  v.type = NUMBER;
  v.text.assign(buffer, result.ptr);
  return v;
}

MetaValue MetaValue::number(long long value) {
  MetaValue v;
  v.type = NUMBER;
  v.text = std::to_string(value);
  return v;
}

MetaValue MetaValue::atom(const std::string &name) {
  MetaValue v;
  v.type = ATOM;
  v.text = name;
  return v;
}

MetaValue MetaValue::string(const std::string &value) {
  MetaValue v;
  v.type = STRING;
  v.text = value;
  return v;
}

MetaValue MetaValue::list(std::vector<MetaValue> values) {
  MetaValue v;
  v.type = LIST;
  v.items = std::move(values);
  return v;
}

MetaValue MetaValue::string_list(const std::vector<std::string> &values) {
  std::vector<MetaValue> items;
  items.reserve(values.size());
  for (const auto &value : values) {
    items.push_back(string(value));
  }
  return list(std::move(items));
}

bool MetaValue::is_omitted() const {
  switch (type) {
  case ABSENT:
    return true;
  case STRING:
    return text.empty();
  case LIST:
    return items.empty();
  default:
    return false;
  }
}

std::string MetaValue::describe() const {
  switch (type) {
  case ABSENT:
    return "nil";
  case NUMBER:
    return text;
  case ATOM:
    return "'" + text;
  case STRING:
    return "\"" + text + "\"";
  case LIST: {
    std::string result = "(";
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0)
        result += " ";
      result += items[i].describe();
    }
    return result + ")";
  }
  }
  return "?";
}
