#ifndef NOTE_HPP
#define NOTE_HPP

#include "meta_value.hpp"
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

// Per-note metadata environment read by the front-matter synthesizer.
struct NoteMetadata {
  std::string title;
  std::optional<std::tm> created;
  std::optional<std::string> aliases;
  std::vector<std::string> tags;
  std::optional<std::string> category;

  // Keys are stored normalized, see NoteParser::normalize_key.
  std::unordered_map<std::string, MetaValue> options;

  MetaValue option(const std::string &name) const;
  void set_option(const std::string &name, MetaValue value);
};

struct NoteDocument {
  fs::path source_path;
  std::string identifier;
  NoteMetadata metadata;
  std::string body;
  std::vector<std::string> warnings;
};

class NoteParser {
public:
  static NoteDocument parse(const std::string &content,
                            const fs::path &source_path = fs::path());

  static std::optional<std::tm> parse_date(const std::string &date_str);
  static std::optional<std::tm> parse_identifier(const std::string &id);
  static bool is_identifier(const std::string &text);

  // "20240101T120000--title__tag.org" -> "20240101T120000"
  static std::string identifier_from_filename(const fs::path &path);

  // Lowercase, '_' -> '-', leading ':' dropped: "HUGO_SECTION" and
  // ":hugo-section" both become "hugo-section".
  static std::string normalize_key(const std::string &key);

  static std::vector<std::string> split_tags(const std::string &filetags);

private:
  static std::string trim(const std::string &s);
};

#endif
