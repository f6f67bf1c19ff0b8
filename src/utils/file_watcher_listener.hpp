#pragma once

#include <efsw/efsw.hpp>
#include <filesystem>
#include <string>
#include <unordered_set>

class NotePublisher;

class PublishListener : public efsw::FileWatchListener {
private:
  std::filesystem::path project_root;
  NotePublisher *publisher;
  std::unordered_set<std::string> watched_extensions;

public:
  PublishListener(const std::filesystem::path &root, NotePublisher *p);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;
};

// Publishes once, then republishes on every change until ENTER is pressed.
void start_watch(NotePublisher &publisher, const std::filesystem::path &root);
