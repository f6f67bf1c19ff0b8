#include "core/note_publisher.hpp"
#include "utils/file_watcher_listener.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "notepub - publish plain-text notes as Markdown\n\n";
  std::cout << "Commands:\n";
  std::cout << "  notepub publish              Publish all notes\n";
  std::cout << "  notepub watch                Publish, then republish on "
               "change\n";
  std::cout << "  notepub frontmatter <file>   Print the front matter of one "
               "note\n";
  std::cout << "  notepub --help               Show this help\n";
}

static int print_front_matter(const fs::path &project_root,
                              const fs::path &note_path) {
  NotePublisher publisher(project_root);
  NoteDocument note = publisher.load_note(note_path);

  for (const auto &warning : note.warnings) {
    std::cerr << "Warning: " << warning << std::endl;
  }

  std::cout << publisher.get_synthesizer().synthesize(note.metadata);
  return 0;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  fs::path project_root = fs::current_path();

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  try {

    if (command == "publish") {
      NotePublisher publisher(project_root);

      publisher.discover_notes();
      PublishSummary summary = publisher.publish_all();
      return summary.failed > 0 ? 1 : 0;
    } else if (command == "watch") {
      NotePublisher publisher(project_root);

      start_watch(publisher, project_root);
    } else if (command == "frontmatter") {
      if (argc < 3) {
        std::cerr << "Missing note file" << std::endl;
        print_usage();
        return 1;
      }
      return print_front_matter(project_root, argv[2]);
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
