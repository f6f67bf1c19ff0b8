#include "file_watcher_listener.hpp"
#include "core/note_publisher.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <termcolor/termcolor.hpp>

namespace fs = std::filesystem;

PublishListener::PublishListener(const fs::path &root, NotePublisher *p)
    : project_root(root), publisher(p),
      watched_extensions({".org", ".txt", ".yaml", ".yml"}) {}

void PublishListener::handleFileAction(efsw::WatchID watchid,
                                       const std::string &dir,
                                       const std::string &filename,
                                       efsw::Action action,
                                       std::string oldFilename) {
  (void)watchid;
  (void)oldFilename;

  if (filename.empty() || filename[0] == '.' || filename[0] == '~' ||
      filename[0] == '#') {
    return;
  }

  fs::path modified = fs::path(dir) / filename;
  std::string ext = modified.extension().string();

  if (watched_extensions.find(ext) == watched_extensions.end()) {
    return;
  }

  if (action != efsw::Actions::Modified && action != efsw::Actions::Add &&
      action != efsw::Actions::Moved) {
    return;
  }

  fs::path relative = fs::relative(modified, project_root);

  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm = {};
  localtime_r(&time, &tm);

  std::cout << "\n"
            << termcolor::bright_blue << std::put_time(&tm, "%H:%M:%S")
            << termcolor::reset << " ";

  if (action == efsw::Actions::Modified) {
    std::cout << termcolor::bright_cyan << "📝 Modified" << termcolor::reset;
  } else if (action == efsw::Actions::Moved) {
    std::cout << termcolor::bright_magenta << "🔀 Moved" << termcolor::reset;
  } else {
    std::cout << termcolor::bright_green << "➕ Added" << termcolor::reset;
  }

  std::cout << " " << termcolor::bright_white << relative.string()
            << termcolor::reset;

  if (ext == ".yaml" || ext == ".yml") {
    std::cout << termcolor::bright_cyan << " [config]" << termcolor::reset
              << "\n"
              << termcolor::bright_yellow
              << "  ⚠ Configuration is read at startup, restart to apply"
              << termcolor::reset << "\n";
    return;
  }

  std::cout << termcolor::bright_blue << " [note]" << termcolor::reset << "\n";

  try {
    PublishSummary summary = publisher->republish();
    if (summary.failed > 0) {
      std::cerr << termcolor::bright_red << "  ✗ " << summary.failed
                << " notes failed" << termcolor::reset << "\n";
    }
  } catch (const std::exception &e) {
    std::cerr << termcolor::bright_red
              << "  ✗ Republish failed: " << termcolor::reset
              << termcolor::bright_white << e.what() << termcolor::reset
              << "\n\n";
  }
}

void start_watch(NotePublisher &publisher, const fs::path &project_root) {
  publisher.republish();

  std::cout << termcolor::bright_cyan << "👁️  Setting up file watchers"
            << termcolor::reset << "\n";

  efsw::FileWatcher fileWatcher;
  PublishListener listener(project_root, &publisher);

  const fs::path &content_dir = publisher.get_content_dir();
  if (!fs::exists(content_dir)) {
    std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
              << "Nothing to watch, " << content_dir << " does not exist\n";
    return;
  }

  fileWatcher.addWatch(content_dir.string(), &listener, true);
  fileWatcher.addWatch(project_root.string(), &listener, false);
  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Watching " << termcolor::bright_white
            << fs::relative(content_dir, project_root).string()
            << termcolor::reset << "\n";

  fileWatcher.watch();

  std::cout << "\n"
            << termcolor::bright_blue << "Press ENTER to stop watching..."
            << termcolor::reset << "\n\n";

  std::cin.get();

  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Watcher stopped cleanly\n\n";
}
