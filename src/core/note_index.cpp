#include "note_index.hpp"
#include "errors.hpp"

bool NoteIndex::add(const std::string &identifier, const fs::path &path) {
  return notes.emplace(identifier, path).second;
}

bool NoteIndex::contains(const std::string &identifier) const {
  return notes.find(identifier) != notes.end();
}

ResolvedReference NoteIndex::resolve(const std::string &path) const {
  ResolvedReference ref = LinkTransformer::split_reference(path);
  if (!contains(ref.identifier)) {
    throw ReferenceResolutionError(path);
  }
  return ref;
}

ReferenceResolver NoteIndex::resolver() const {
  return [this](const std::string &path) { return resolve(path); };
}
