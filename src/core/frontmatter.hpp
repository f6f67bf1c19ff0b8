#ifndef FRONTMATTER_H
#define FRONTMATTER_H

#include "meta_value.hpp"
#include "note.hpp"
#include <chrono>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

struct FieldDescriptor {
  enum Kind { TITLE, DATE, LAST_UPDATED_AT, ALIASES, TAGS, CATEGORY, OTHER };

  Kind kind;
  std::string name;

  static FieldDescriptor from_name(const std::string &name);
  static std::vector<FieldDescriptor>
  from_names(const std::vector<std::string> &names);
};

class FrontMatterSynthesizer {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit FrontMatterSynthesizer(std::vector<FieldDescriptor> fields,
                                  Clock clock = std::chrono::system_clock::now);

  MetaValue resolve(const FieldDescriptor &field,
                    const NoteMetadata &metadata) const;

  // Throws InvalidListElementError; nothing is returned for a note whose
  // list fields are malformed.
  std::string synthesize(const NoteMetadata &metadata) const;

  const std::vector<FieldDescriptor> &get_fields() const { return fields; }

  static std::string format_date(const std::tm &tm);

private:
  std::vector<FieldDescriptor> fields;
  Clock clock;

  static MetaValue quoted_date(const std::tm &tm);
  static MetaValue split_aliases(const std::string &annotation);
};

std::string synthesize_front_matter(const std::vector<FieldDescriptor> &fields,
                                    const NoteMetadata &metadata);

#endif
