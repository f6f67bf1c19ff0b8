#ifndef META_VALUE_HPP
#define META_VALUE_HPP

#include <string>
#include <vector>

// A front-matter value as handed over by the host: nothing, a scalar, or an
// ordered sequence of scalars.
struct MetaValue {
  enum Type { ABSENT, NUMBER, ATOM, STRING, LIST };

  Type type;
  std::string text;
  std::vector<MetaValue> items;

  MetaValue() : type(ABSENT) {}

  // Throws MalformedScalarError for NaN and infinities.
  static MetaValue number(double value);
  static MetaValue number(long long value);
  static MetaValue number(int value) {
    return number(static_cast<long long>(value));
  }
  static MetaValue atom(const std::string &name);
  static MetaValue string(const std::string &value);
  static MetaValue list(std::vector<MetaValue> values);
  static MetaValue string_list(const std::vector<std::string> &values);

  bool is_absent() const { return type == ABSENT; }
  bool is_list() const { return type == LIST; }

  // Absent values, empty strings and empty sequences produce no field line.
  bool is_omitted() const;

  // Human readable rendering used in diagnostics.
  std::string describe() const;
};

#endif
