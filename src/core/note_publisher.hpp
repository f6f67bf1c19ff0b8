#ifndef NOTE_PUBLISHER_HPP
#define NOTE_PUBLISHER_HPP

#include "frontmatter.hpp"
#include "note.hpp"
#include "note_index.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

struct PublishSummary {
  int published = 0;
  int failed = 0;
};

class NotePublisher {
private:
  fs::path project_root;
  fs::path content_dir;
  fs::path publish_dir;

  PublishConfig config;
  FrontMatterSynthesizer synthesizer;
  std::vector<NoteDocument> notes;
  NoteIndex index;
  int load_failures = 0;
  mutable std::mutex publish_mutex_;

  std::unordered_set<std::string> note_extensions;

  std::string read_file(const fs::path &path);
  void write_file(const fs::path &path, const std::string &content);

  void apply_defaults(NoteMetadata &metadata) const;

public:
  explicit NotePublisher(const fs::path &root);
  NotePublisher(const fs::path &root, PublishConfig config,
                FrontMatterSynthesizer::Clock clock =
                    std::chrono::system_clock::now);

  // A note that cannot be read is reported and counted as failed; the
  // rest of the corpus is still discovered.
  void discover_notes();

  // Reads and parses one note, with configured defaults applied.
  NoteDocument load_note(const fs::path &path);

  // Front matter followed by the Markdown body. Throws on synthesis or
  // link resolution failure.
  std::string render_note(const NoteDocument &note) const;

  fs::path output_path(const NoteDocument &note) const;
  void publish_note(const NoteDocument &note);
  PublishSummary publish_all();

  // discover_notes() + publish_all() under one lock, for watch mode.
  PublishSummary republish();

  bool is_note_file(const fs::path &path) const;

  const std::vector<NoteDocument> &get_notes() const { return notes; }
  const NoteIndex &get_index() const { return index; }
  int get_load_failures() const { return load_failures; }
  const PublishConfig &get_config() const { return config; }
  const FrontMatterSynthesizer &get_synthesizer() const { return synthesizer; }
  const fs::path &get_content_dir() const { return content_dir; }
  const fs::path &get_publish_dir() const { return publish_dir; }

  void print_summary(const PublishSummary &summary,
                     const std::chrono::high_resolution_clock::time_point &start);
};

#endif
