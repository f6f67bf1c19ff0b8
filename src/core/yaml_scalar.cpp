#include "yaml_scalar.hpp"
#include "errors.hpp"
#include <regex>

bool YamlScalar::is_timestamp(const std::string &text) {
  static const std::regex timestamp{
      R"(\d{4}-\d{2}-\d{2}(T\d{2}:\d{2}:\d{2}(Z|[+-]\d{2}:\d{2})?)?)"};
  return std::regex_match(text, timestamp);
}

bool YamlScalar::is_literal(const std::string &text) {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return true;
  }
  if (text == "true" || text == "false") {
    return true;
  }
  return is_timestamp(text);
}

std::string YamlScalar::escape(const std::string &text) {
  std::string result;
  result.reserve(text.size() + 2);

  for (char c : text) {
    if (c == '\\') {
      result += "\\\\";
    } else if (c == '"') {
      result += "\\\"";
    } else {
      result += c;
    }
  }

  return result;
}

std::string YamlScalar::quote_string(const std::string &text) {
  // Must run before escaping, or pre-quoted values get escaped twice.
  if (is_literal(text)) {
    return text;
  }
  return "\"" + escape(text) + "\"";
}

std::string YamlScalar::quote(const MetaValue &value) {
  switch (value.type) {
  case MetaValue::ABSENT:
    return "";
  case MetaValue::NUMBER:
    return value.text;
  case MetaValue::ATOM:
    return "\"" + escape(value.text) + "\"";
  case MetaValue::STRING:
    return quote_string(value.text);
  case MetaValue::LIST:
    break;
  }
  throw MalformedScalarError(value.describe());
}

std::string YamlScalar::serialize_list(const std::string &field,
                                       const std::vector<MetaValue> &items) {
  std::string result = "[";

  for (size_t i = 0; i < items.size(); ++i) {
    const MetaValue &item = items[i];

    bool valid = item.type == MetaValue::NUMBER ||
                 item.type == MetaValue::ATOM ||
                 (item.type == MetaValue::STRING && !item.text.empty());
    if (!valid) {
      throw InvalidListElementError(field, item.describe());
    }

    if (i > 0)
      result += ", ";
    result += quote(item);
  }

  return result + "]";
}
