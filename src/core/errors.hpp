#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

class InvalidListElementError : public std::runtime_error {
private:
  std::string field_;
  std::string value_;

public:
  InvalidListElementError(const std::string &field, const std::string &value)
      : std::runtime_error("Invalid element " + value + " in list field '" +
                           field + "'"),
        field_(field), value_(value) {}

  const std::string &field() const { return field_; }
  const std::string &value() const { return value_; }
};

class MalformedScalarError : public std::runtime_error {
public:
  explicit MalformedScalarError(const std::string &value)
      : std::runtime_error("Value " + value + " is not a YAML scalar") {}
};

class ReferenceResolutionError : public std::runtime_error {
private:
  std::string path_;

public:
  explicit ReferenceResolutionError(const std::string &path)
      : std::runtime_error("Cannot resolve note reference: " + path),
        path_(path) {}

  const std::string &path() const { return path_; }
};

#endif
