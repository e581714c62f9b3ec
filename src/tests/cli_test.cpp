#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>
#include "app/bootstrap.hpp"
#include "catalog/file_catalog.hpp"
#include "cli/cli.hpp"
#include "store/store_error.hpp"
#include "task/task_error.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace datastore;
using namespace std::chrono_literals;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path root;
  config::Config settings;
  std::unique_ptr<app::Bootstrap> bootstrap;
  std::istringstream input;
  std::ostringstream output;
  std::unique_ptr<cli::CLI> shell;

  void SetUp() override {
    root = make_test_dir("cli_test");
    settings.data_dir = (root / "data").string();
    settings.snapshot_path = (root / "tasks.snapshot").string();
    settings.chunk_size = 4;
    settings.poll_interval = 20ms;
    start();
  }

  void TearDown() override {
    shell.reset();
    bootstrap.reset();
    std::filesystem::remove_all(root);
  }

  void start() {
    bootstrap = std::make_unique<app::Bootstrap>(settings);
    ASSERT_TRUE(bootstrap->start());
    shell = std::make_unique<cli::CLI>(*bootstrap, input, output);
  }

  // Runs one command and returns what it printed
  std::string run(const std::string& line) {
    output.str("");
    EXPECT_TRUE(shell->execute(line));
    return output.str();
  }

  std::string create_task() {
    const std::string reply = run("create");
    EXPECT_EQ(reply.rfind("200 ", 0), 0u) << reply;
    return reply.substr(4, reply.size() - 5);
  }
};

TEST_F(CLITest, TaskLifecycle) {
  const std::string task_id = create_task();
  EXPECT_EQ(task_id.size(), 22u);

  EXPECT_EQ(run("status " + task_id), "200 assigned=no paused=no\n");
  EXPECT_EQ(run("pause " + task_id), "200 Task paused\n");
  EXPECT_EQ(run("pause " + task_id).substr(0, 4), "409 ");
  EXPECT_EQ(run("resume " + task_id), "200 Task resumed\n");
  EXPECT_EQ(run("resume " + task_id).substr(0, 4), "409 ");
  EXPECT_EQ(run("abort " + task_id), "200 Task aborted\n");
  EXPECT_EQ(run("status " + task_id).substr(0, 4), "404 ");
  EXPECT_EQ(run("abort " + task_id).substr(0, 4), "404 ");
}

TEST_F(CLITest, UploadListDownloadDelete) {
  const auto local = root / "local.txt";
  write_file(local, "hello datastore");

  const std::string upload_id = create_task();
  EXPECT_EQ(run("upload " + upload_id + " " + local.string() + " stored.txt"),
            "200 Upload of stored.txt started\n");
  EXPECT_EQ(run("wait " + upload_id), "200 Completed\n");
  EXPECT_EQ(read_file(root / "data" / "stored.txt"), "hello datastore");
  EXPECT_EQ(run("status " + upload_id).substr(0, 4), "404 ");

  EXPECT_EQ(run("list *.txt"), "200 1 files\n  stored.txt\n");

  const std::string download_id = create_task();
  const auto copy = root / "copy.txt";
  EXPECT_EQ(run("download " + download_id + " stored.txt " + copy.string()),
            "200 Download of stored.txt started\n");
  EXPECT_EQ(run("wait " + download_id), "200 Completed\n");
  EXPECT_EQ(read_file(copy), "hello datastore");

  const std::string delete_id = create_task();
  EXPECT_EQ(run("delete " + delete_id + " stored*"), "200 Deleting 1 files\n");
  EXPECT_EQ(run("wait " + delete_id), "200 Completed\n");
  EXPECT_FALSE(std::filesystem::exists(root / "data" / "stored.txt"));
}

TEST_F(CLITest, AbortPausedUpload) {
  const auto local = root / "local.txt";
  write_file(local, "partial upload");

  const std::string task_id = create_task();
  run("pause " + task_id);
  run("upload " + task_id + " " + local.string());
  EXPECT_EQ(run("status " + task_id), "200 assigned=yes paused=yes transferred=0\n");
  EXPECT_EQ(run("upload " + task_id + " " + local.string()).substr(0, 4), "409 ");

  run("abort " + task_id);
  EXPECT_EQ(run("wait " + task_id), "200 Aborted\n");
  EXPECT_FALSE(std::filesystem::exists(root / "data" / "local.txt"));
}

TEST_F(CLITest, RejectsBadInput) {
  EXPECT_EQ(run("frobnicate").substr(0, 4), "400 ");
  EXPECT_EQ(run("pause").substr(0, 4), "400 ");
  EXPECT_EQ(run("wait unknown").substr(0, 4), "404 ");

  const std::string task_id = create_task();
  EXPECT_EQ(run("download " + task_id + " missing.txt " + (root / "out").string()).substr(0, 4), "404 ");
  EXPECT_EQ(run("upload " + task_id + " " + (root / "x").string() + " ../escape").substr(0, 4), "400 ");
  EXPECT_EQ(run("delete " + task_id + " * not-a-time").substr(0, 4), "400 ");
  EXPECT_EQ(run(""), "");
  EXPECT_FALSE(shell->execute("quit"));
}

TEST_F(CLITest, RunLoopReadsUntilQuit) {
  input.str("help\ncreate\nquit\ncreate\n");
  shell->run();

  const std::string transcript = output.str();
  EXPECT_NE(transcript.find("Available commands:"), std::string::npos);
  EXPECT_EQ(bootstrap->get_store().size(), 1u);
}

TEST_F(CLITest, SnapshotSurvivesRestart) {
  const std::string task_id = create_task();
  run("pause " + task_id);

  shell.reset();
  ASSERT_TRUE(bootstrap->shutdown());
  EXPECT_TRUE(std::filesystem::exists(settings.snapshot_path));
  bootstrap.reset();

  start();
  EXPECT_EQ(run("status " + task_id), "200 assigned=no paused=yes\n");
}

TEST_F(CLITest, InterruptedUploadRunsAfterRestart) {
  const auto local = root / "local.txt";
  write_file(local, "resumable upload");

  const std::string task_id = create_task();
  run("pause " + task_id);
  EXPECT_EQ(run("upload " + task_id + " " + local.string() + " up.bin"), "200 Upload of up.bin started\n");

  shell.reset();
  ASSERT_TRUE(bootstrap->shutdown());
  bootstrap.reset();
  EXPECT_FALSE(std::filesystem::exists(root / "data" / "up.bin"));

  start();
  EXPECT_EQ(run("status " + task_id), "200 assigned=no paused=yes\n");
  EXPECT_EQ(run("upload " + task_id + " " + local.string() + " up.bin"), "200 Upload of up.bin started\n");
  EXPECT_EQ(run("resume " + task_id), "200 Task resumed\n");
  EXPECT_EQ(run("wait " + task_id), "200 Completed\n");
  EXPECT_EQ(read_file(root / "data" / "up.bin"), "resumable upload");
}

TEST_F(CLITest, UnwaitedUploadsAreReleased) {
  const auto local = root / "local.txt";
  write_file(local, "0123456789");

  std::vector<std::string> task_ids;
  for (int i = 0; i < 3; ++i) {
    task_ids.push_back(create_task());
    const std::string name = "copy" + std::to_string(i) + ".bin";
    EXPECT_EQ(run("upload " + task_ids.back() + " " + local.string() + " " + name),
              "200 Upload of " + name + " started\n");
  }

  auto& scheduler = bootstrap->get_scheduler();
  ASSERT_TRUE(wait_until([&] { return scheduler.tracked().empty(); }));
  for (const auto& task_id : task_ids) {
    EXPECT_EQ(run("status " + task_id).substr(0, 4), "404 ");
  }
  EXPECT_EQ(run("list *.bin"), "200 3 files\n  copy0.bin\n  copy1.bin\n  copy2.bin\n");
}

TEST(StatusCodeTest, MapsErrorTypes) {
  EXPECT_EQ(cli::status_code_for(task::ConflictError("t", "is already paused")), 409);
  EXPECT_EQ(cli::status_code_for(store::NotFoundError("t")), 404);
  EXPECT_EQ(cli::status_code_for(catalog::FileNotFoundError("x")), 404);
  EXPECT_EQ(cli::status_code_for(catalog::CatalogError("Catalog: Invalid file name: ..")), 400);
  // Only the type decides, not the wording
  EXPECT_EQ(cli::status_code_for(catalog::CatalogError("Catalog: Timestamp not found in range")), 400);
  EXPECT_EQ(cli::status_code_for(store::ConnectionError("refused")), 503);
  EXPECT_EQ(cli::status_code_for(transfer::TransferError("boom")), 500);
}
