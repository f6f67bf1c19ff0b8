#ifndef NOTE_INDEX_HPP
#define NOTE_INDEX_HPP

#include "link_transformer.hpp"
#include <filesystem>
#include <string>
#include <unordered_map>

namespace fs = std::filesystem;

// Identifier -> source file for every note in the corpus. Acts as the
// reference resolver for internal links.
class NoteIndex {
private:
  std::unordered_map<std::string, fs::path> notes;

public:
  // Returns false when the identifier is already taken by another file.
  bool add(const std::string &identifier, const fs::path &path);
  bool contains(const std::string &identifier) const;
  void clear() { notes.clear(); }
  size_t size() const { return notes.size(); }

  // Throws ReferenceResolutionError for identifiers not in the corpus.
  ResolvedReference resolve(const std::string &path) const;

  // The returned resolver refers to this index and must not outlive it.
  ReferenceResolver resolver() const;
};

#endif
