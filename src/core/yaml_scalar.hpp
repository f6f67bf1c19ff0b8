#ifndef YAML_SCALAR_HPP
#define YAML_SCALAR_HPP

#include "meta_value.hpp"
#include <string>
#include <vector>

class YamlScalar {
public:
  // YYYY-MM-DD, optionally followed by THH:MM:SS and a Z or +HH:MM offset.
  // Shared by quoting and by date field resolution.
  static bool is_timestamp(const std::string &text);

  // Strings that already read as a bare or self-quoted YAML scalar.
  static bool is_literal(const std::string &text);

  static std::string quote(const MetaValue &value);
  static std::string quote_string(const std::string &text);

  static std::string serialize_list(const std::string &field,
                                    const std::vector<MetaValue> &items);

private:
  static std::string escape(const std::string &text);
};

#endif
