// file_watcher_listener_test.cpp - change reporting in watch mode

#include <gtest/gtest.h>
#include "core/note_publisher.hpp"
#include "test_support.hpp"
#include "utils/file_watcher_listener.hpp"
#include <fstream>
#include <memory>
#include <string>

class PublishListenerTest : public ::testing::Test {
protected:
  fs::path root;
  std::unique_ptr<NotePublisher> publisher;

  void SetUp() override {
    root = fs::temp_directory_path() /
           ("notepub_watch_" + std::string(::testing::UnitTest::GetInstance()
                                               ->current_test_info()
                                               ->name()));
    fs::remove_all(root);
    fs::create_directories(root / "notes");
    std::ofstream(root / "notes/20240101T120000--a.org") << "#+title: A\n";

    publisher = std::make_unique<NotePublisher>(
        root, PublishConfig(), [] { return local_noon(2025, 3, 9); });
  }

  void TearDown() override { fs::remove_all(root); }

  std::string report(efsw::Action action) {
    PublishListener listener(root, publisher.get());
    ::testing::internal::CaptureStdout();
    listener.handleFileAction(1, (root / "notes").string(),
                              "20240101T120000--a.org", action);
    return ::testing::internal::GetCapturedStdout();
  }
};

TEST_F(PublishListenerTest, MovedIsNotReportedAsAdded) {
  std::string out = report(efsw::Actions::Moved);

  EXPECT_NE(out.find("Moved"), std::string::npos);
  EXPECT_EQ(out.find("Added"), std::string::npos);
  EXPECT_TRUE(fs::exists(root / "public/posts/20240101T120000--a.md"));
}

TEST_F(PublishListenerTest, AddAndModifyKeepTheirLabels) {
  EXPECT_NE(report(efsw::Actions::Add).find("Added"), std::string::npos);
  EXPECT_NE(report(efsw::Actions::Modified).find("Modified"),
            std::string::npos);
}

TEST_F(PublishListenerTest, DeleteIsIgnored) {
  EXPECT_EQ(report(efsw::Actions::Delete), "");
}
