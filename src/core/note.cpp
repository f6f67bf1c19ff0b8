#include "note.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

MetaValue NoteMetadata::option(const std::string &name) const {
  auto it = options.find(NoteParser::normalize_key(name));
  return (it != options.end()) ? it->second : MetaValue();
}

void NoteMetadata::set_option(const std::string &name, MetaValue value) {
  options[NoteParser::normalize_key(name)] = std::move(value);
}

std::string NoteParser::trim(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string NoteParser::normalize_key(const std::string &key) {
  std::string normalized;
  normalized.reserve(key.size());

  for (char c : key) {
    if (c == '_') {
      normalized += '-';
    } else {
      normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }

  if (!normalized.empty() && normalized[0] == ':') {
    normalized.erase(0, 1);
  }
  return normalized;
}

std::vector<std::string> NoteParser::split_tags(const std::string &filetags) {
  std::vector<std::string> tags;
  std::istringstream iss(filetags);
  std::string part;

  while (std::getline(iss, part, ':')) {
    part = trim(part);
    if (!part.empty()) {
      tags.push_back(part);
    }
  }
  return tags;
}

bool NoteParser::is_identifier(const std::string &text) {
  static const std::regex identifier{R"(\d{8}T\d{6})"};
  return std::regex_match(text, identifier);
}

std::string NoteParser::identifier_from_filename(const fs::path &path) {
  std::string stem = path.stem().string();
  std::string candidate = stem.substr(0, std::min(stem.find("--"), stem.find("__")));
  return is_identifier(candidate) ? candidate : "";
}

std::optional<std::tm> NoteParser::parse_identifier(const std::string &id) {
  if (!is_identifier(id)) {
    return std::nullopt;
  }

  std::tm tm = {};
  std::istringstream ss(id);
  ss >> std::get_time(&tm, "%Y%m%dT%H%M%S");
  if (ss.fail()) {
    return std::nullopt;
  }
  return tm;
}

std::optional<std::tm> NoteParser::parse_date(const std::string &date_str) {
  std::string text = trim(date_str);

  // Org timestamps: [2024-01-04 Thu 12:00] or <2024-01-04 Thu>
  if (!text.empty() && (text.front() == '[' || text.front() == '<')) {
    text = text.substr(1);
  }

  for (const char *format : {"%Y-%m-%d", "%Y/%m/%d"}) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, format);
    if (!ss.fail()) {
      return tm;
    }
  }

  return parse_identifier(text);
}

NoteDocument NoteParser::parse(const std::string &content,
                               const fs::path &source_path) {
  NoteDocument note;
  note.source_path = source_path;

  std::istringstream stream(content);
  std::string line;
  std::string date_text;
  size_t body_start = 0;
  size_t offset = 0;

  while (std::getline(stream, line)) {
    size_t next = offset + line.size() + 1;
    std::string stripped = trim(line);

    if (stripped.empty()) {
      offset = next;
      body_start = std::min(next, content.size());
      continue;
    }

    if (stripped.rfind("#+", 0) != 0 || stripped.rfind("#+begin", 0) == 0 ||
        stripped.rfind("#+BEGIN", 0) == 0) {
      break;
    }

    size_t colon = stripped.find(':');
    if (colon == std::string::npos) {
      break;
    }

    std::string key = normalize_key(stripped.substr(2, colon - 2));
    std::string value = trim(stripped.substr(colon + 1));

    if (key == "title") {
      note.metadata.title = value;
    } else if (key == "date") {
      date_text = value;
    } else if (key == "identifier") {
      note.identifier = value;
    } else if (key == "filetags") {
      note.metadata.tags = split_tags(value);
    } else if (key == "aliases" || key == "alias") {
      note.metadata.aliases = value;
    } else if (key == "category") {
      note.metadata.category = value;
    } else {
      note.metadata.set_option(key, MetaValue::string(value));
    }

    offset = next;
    body_start = std::min(next, content.size());
  }

  note.body = content.substr(body_start);

  if (note.identifier.empty() && !source_path.empty()) {
    note.identifier = identifier_from_filename(source_path);
  }

  if (!date_text.empty()) {
    note.metadata.created = parse_date(date_text);
    if (!note.metadata.created) {
      note.warnings.push_back("Unrecognized date '" + date_text + "'");
    }
  }

  if (!note.metadata.created) {
    note.metadata.created = parse_identifier(note.identifier);
  }

  return note;
}
