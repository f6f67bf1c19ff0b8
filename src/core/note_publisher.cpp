#include "note_publisher.hpp"
#include "link_transformer.hpp"
#include "markdown.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <termcolor/termcolor.hpp>

NotePublisher::NotePublisher(const fs::path &root)
    : NotePublisher(root, PublishConfig::load(root / "notepub.yaml")) {}

NotePublisher::NotePublisher(const fs::path &root, PublishConfig cfg,
                             FrontMatterSynthesizer::Clock clock)
    : project_root(root), config(std::move(cfg)),
      synthesizer(FieldDescriptor::from_names(config.fields), std::move(clock)),
      note_extensions({".org", ".txt"}) {
  content_dir = root / config.content_dir;
  publish_dir = config.publish_path(root);
}

std::string NotePublisher::read_file(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void NotePublisher::write_file(const fs::path &path,
                               const std::string &content) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write file: " + path.string());
  }
  file << content;
  file.flush();
  file.close();

  if (file.fail()) {
    std::error_code ec;
    fs::remove(path, ec);
    throw std::runtime_error("Cannot write file: " + path.string());
  }
}

bool NotePublisher::is_note_file(const fs::path &path) const {
  return note_extensions.find(path.extension().string()) !=
         note_extensions.end();
}

void NotePublisher::apply_defaults(NoteMetadata &metadata) const {
  for (const auto &[key, value] : config.defaults) {
    metadata.options.try_emplace(NoteParser::normalize_key(key), value);
  }
}

NoteDocument NotePublisher::load_note(const fs::path &path) {
  NoteDocument note = NoteParser::parse(read_file(path), path);
  apply_defaults(note.metadata);
  return note;
}

void NotePublisher::discover_notes() {
  notes.clear();
  index.clear();
  load_failures = 0;

  if (!fs::exists(content_dir)) {
    std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
              << "Content directory not found: " << termcolor::bright_white
              << content_dir << termcolor::reset << "\n";
    return;
  }

  std::vector<fs::path> paths;
  std::error_code ec;
  fs::recursive_directory_iterator it(
      content_dir, fs::directory_options::skip_permission_denied, ec);

  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && is_note_file(it->path())) {
      paths.push_back(it->path());
    }
  }

  if (ec) {
    load_failures++;
    std::cerr << termcolor::bright_red << "  ✗ " << termcolor::reset
              << "Scanning " << content_dir.string() << termcolor::bright_blue
              << ": " << ec.message() << termcolor::reset << "\n";
  }

  std::sort(paths.begin(), paths.end());

  std::unordered_set<std::string> outputs;

  for (const auto &path : paths) {
    fs::path relative = fs::relative(path, content_dir);

    NoteDocument note;
    try {
      note = load_note(path);
    } catch (const std::exception &e) {
      load_failures++;
      std::cerr << termcolor::bright_red << "  ✗ " << termcolor::reset
                << termcolor::white << relative.string() << termcolor::reset
                << termcolor::bright_blue << ": " << e.what()
                << termcolor::reset << "\n";
      continue;
    }

    fs::path output = output_path(note);
    if (!outputs.insert(output.string()).second) {
      load_failures++;
      std::cerr << termcolor::bright_red << "  ✗ " << termcolor::reset
                << termcolor::white << relative.string() << termcolor::reset
                << termcolor::bright_blue << ": output " << output.string()
                << " already belongs to another note" << termcolor::reset
                << "\n";
      continue;
    }

    for (const auto &warning : note.warnings) {
      std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
                << relative.string() << ": " << warning << "\n";
    }

    if (note.identifier.empty()) {
      std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
                << relative.string()
                << ": no identifier, internal links to it cannot resolve\n";
    } else if (!index.add(note.identifier, path)) {
      std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
                << "Duplicate identifier " << termcolor::bright_white
                << note.identifier << termcolor::reset << " in "
                << relative.string() << "\n";
    }

    notes.push_back(std::move(note));
  }
}

std::string NotePublisher::render_note(const NoteDocument &note) const {
  std::string front_matter = synthesizer.synthesize(note.metadata);

  LinkTransformer transformer(config.link_class, index.resolver());
  std::string body = MarkdownExporter::from_org(note.body, transformer.hook());

  return front_matter + body;
}

// Mirrors the note's place under the content directory, so "a/index.org"
// and "b/index.org" publish to different files.
fs::path NotePublisher::output_path(const NoteDocument &note) const {
  fs::path relative = note.source_path.lexically_relative(content_dir);
  if (relative.empty() || *relative.begin() == "..") {
    relative = note.source_path.filename();
  }
  return publish_dir / relative.replace_extension(".md");
}

void NotePublisher::publish_note(const NoteDocument &note) {
  // Rendered in full before anything touches the output file.
  std::string document = render_note(note);
  write_file(output_path(note), document);
}

PublishSummary NotePublisher::publish_all() {
  auto start = std::chrono::high_resolution_clock::now();

  std::cout << "\n"
            << termcolor::bright_cyan << "📝 Publishing notes"
            << termcolor::reset << "\n";

  PublishSummary summary;
  summary.failed = load_failures;

  for (const auto &note : notes) {
    fs::path relative = fs::relative(note.source_path, content_dir);
    try {
      publish_note(note);
      summary.published++;
      std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
                << termcolor::white << relative.string() << termcolor::reset
                << "\n";
    } catch (const std::exception &e) {
      summary.failed++;
      std::cerr << termcolor::bright_red << "  ✗ " << termcolor::reset
                << termcolor::white << relative.string() << termcolor::reset
                << termcolor::bright_blue << ": " << e.what()
                << termcolor::reset << "\n";
    }
  }

  print_summary(summary, start);
  return summary;
}

PublishSummary NotePublisher::republish() {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  discover_notes();
  return publish_all();
}

void NotePublisher::print_summary(
    const PublishSummary &summary,
    const std::chrono::high_resolution_clock::time_point &start) {
  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  std::cout << "\n"
            << termcolor::bright_green << "✓ " << termcolor::reset
            << "Published " << termcolor::bright_white << summary.published
            << termcolor::reset << " notes";
  if (summary.failed > 0) {
    std::cout << termcolor::bright_red << " (" << summary.failed << " failed)"
              << termcolor::reset;
  }
  std::cout << termcolor::bright_blue << " in " << duration.count() << "ms"
            << termcolor::reset << "\n";

  std::cout << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║  " << termcolor::reset << "Output: "
            << termcolor::bright_white << std::setw(32) << std::left
            << publish_dir.string() << termcolor::reset
            << termcolor::bright_green << " ║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";
}
