#include "frontmatter.hpp"
#include "yaml_scalar.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

FieldDescriptor FieldDescriptor::from_name(const std::string &name) {
  static const std::pair<const char *, Kind> known[] = {
      {"title", TITLE},     {"date", DATE},
      {"last_updated_at", LAST_UPDATED_AT},
      {"aliases", ALIASES}, {"tags", TAGS},
      {"category", CATEGORY}};

  for (const auto &[known_name, kind] : known) {
    if (name == known_name) {
      return {kind, name};
    }
  }
  return {OTHER, name};
}

std::vector<FieldDescriptor>
FieldDescriptor::from_names(const std::vector<std::string> &names) {
  std::vector<FieldDescriptor> fields;
  fields.reserve(names.size());
  for (const auto &name : names) {
    fields.push_back(from_name(name));
  }
  return fields;
}

FrontMatterSynthesizer::FrontMatterSynthesizer(
    std::vector<FieldDescriptor> fields, Clock clock)
    : fields(std::move(fields)), clock(std::move(clock)) {}

std::string FrontMatterSynthesizer::format_date(const std::tm &tm) {
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d");
  return ss.str();
}

MetaValue FrontMatterSynthesizer::quoted_date(const std::tm &tm) {
  std::string date = format_date(tm);
  if (!YamlScalar::is_timestamp(date)) {
    return MetaValue();
  }
  return MetaValue::string("\"" + date + "\"");
}

MetaValue FrontMatterSynthesizer::split_aliases(const std::string &annotation) {
  std::vector<std::string> tokens;
  std::istringstream iss(annotation);
  std::string token;

  while (iss >> token) {
    tokens.push_back(token);
  }
  return MetaValue::string_list(tokens);
}

MetaValue FrontMatterSynthesizer::resolve(const FieldDescriptor &field,
                                          const NoteMetadata &metadata) const {
  switch (field.kind) {
  case FieldDescriptor::TITLE:
    return MetaValue::string(metadata.title);

  case FieldDescriptor::DATE:
    return metadata.created ? quoted_date(*metadata.created) : MetaValue();

  case FieldDescriptor::LAST_UPDATED_AT: {
    auto time = std::chrono::system_clock::to_time_t(clock());
    std::tm tm = {};
    if (localtime_r(&time, &tm) == nullptr) {
      return MetaValue();
    }
    return quoted_date(tm);
  }

  case FieldDescriptor::ALIASES:
    return metadata.aliases ? split_aliases(*metadata.aliases) : MetaValue();

  case FieldDescriptor::TAGS:
    return MetaValue::string_list(metadata.tags);

  // Explicit annotation only, never derived from the file name.
  case FieldDescriptor::CATEGORY:
    return metadata.category ? MetaValue::string(*metadata.category)
                             : MetaValue();

  case FieldDescriptor::OTHER:
    break;
  }

  return metadata.option(field.name);
}

std::string
FrontMatterSynthesizer::synthesize(const NoteMetadata &metadata) const {
  std::string block = "---\n";

  for (const auto &field : fields) {
    MetaValue value = resolve(field, metadata);
    if (value.is_omitted()) {
      continue;
    }

    std::string rendered = value.is_list()
                               ? YamlScalar::serialize_list(field.name, value.items)
                               : YamlScalar::quote(value);

    block += field.name + ": " + rendered + "\n";
  }

  block += "---\n";
  return block;
}

std::string synthesize_front_matter(const std::vector<FieldDescriptor> &fields,
                                    const NoteMetadata &metadata) {
  return FrontMatterSynthesizer(fields).synthesize(metadata);
}
