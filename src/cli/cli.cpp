#include "cli/cli.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <system_error>
#include <boost/log/trivial.hpp>
#include "catalog/file_catalog.hpp"
#include "store/store_error.hpp"
#include "task/task_error.hpp"
#include "transfer/io.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_job.hpp"

namespace datastore {
namespace cli {

int status_code_for(const std::exception& error) {
  if (dynamic_cast<const task::ConflictError*>(&error) != nullptr) {
    return 409;
  }
  if (dynamic_cast<const store::NotFoundError*>(&error) != nullptr) {
    return 404;
  }
  if (dynamic_cast<const catalog::FileNotFoundError*>(&error) != nullptr) {
    return 404;
  }
  if (dynamic_cast<const catalog::CatalogError*>(&error) != nullptr) {
    return 400;
  }
  if (dynamic_cast<const store::InvalidTTLError*>(&error) != nullptr) {
    return 400;
  }
  if (dynamic_cast<const store::ConnectionError*>(&error) != nullptr) {
    return 503;
  }
  return 500;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(app::Bootstrap& bootstrap, std::istream& input, std::ostream& output)
  : running_(false)
  , bootstrap_(bootstrap)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "datastore> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "datastore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }

  try {
    process_command(command, args);
  }
  catch (const std::exception& e) {
    log_and_display_error("Command '" + command + "' failed", e);
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "create" && args.empty()) {
    handle_create_command();
  }
  else if (command == "status" && args.size() == 1) {
    handle_status_command(args[0]);
  }
  else if (command == "pause" && args.size() == 1) {
    handle_pause_command(args[0]);
  }
  else if (command == "resume" && args.size() == 1) {
    handle_resume_command(args[0]);
  }
  else if (command == "abort" && args.size() == 1) {
    handle_abort_command(args[0]);
  }
  else if (command == "upload" && (args.size() == 2 || args.size() == 3)) {
    handle_upload_command(args);
  }
  else if (command == "download" && args.size() == 3) {
    handle_download_command(args);
  }
  else if (command == "delete" && !args.empty() && args.size() <= 4) {
    handle_delete_command(args);
  }
  else if (command == "list" && args.size() <= 1) {
    handle_list_command(args);
  }
  else if (command == "wait" && args.size() == 1) {
    handle_wait_command(args[0]);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    reply(400, "Unknown command or invalid arguments, try 'help'");
  }
}

void CLI::handle_create_command() {
  reply(200, bootstrap_.get_registry().create_task());
}

void CLI::handle_status_command(const std::string& task_id) {
  const task::TaskState state = bootstrap_.get_registry().read(task_id);

  std::ostringstream status;
  status << "assigned=" << (state.is_assigned ? "yes" : "no")
         << " paused=" << (state.is_paused ? "yes" : "no");
  if (auto transferred = bootstrap_.get_scheduler().transferred(task_id)) {
    status << " transferred=" << *transferred;
  }
  reply(200, status.str());
}

void CLI::handle_pause_command(const std::string& task_id) {
  bootstrap_.get_registry().pause(task_id);
  reply(200, "Task paused");
}

void CLI::handle_resume_command(const std::string& task_id) {
  bootstrap_.get_registry().resume(task_id);
  reply(200, "Task resumed");
}

void CLI::handle_abort_command(const std::string& task_id) {
  bootstrap_.get_registry().remove(task_id);
  reply(200, "Task aborted");
}

void CLI::handle_upload_command(const std::vector<std::string>& args) {
  const std::string& task_id = args[0];
  const std::filesystem::path local_file(args[1]);
  const std::string name = args.size() == 3 ? args[2] : local_file.filename().string();

  const std::filesystem::path destination = bootstrap_.get_catalog().resolve(name);

  // Opening the job truncates the destination, so refuse a claimed task first
  if (bootstrap_.get_registry().read(task_id).is_assigned) {
    throw task::ConflictError(task_id, "is already assigned");
  }

  auto job = std::make_unique<transfer::UploadJob>(
    std::make_unique<transfer::FileSource>(local_file), destination);
  bootstrap_.get_scheduler().start(task_id, std::move(job));
  reply(200, "Upload of " + name + " started");
}

void CLI::handle_download_command(const std::vector<std::string>& args) {
  const std::string& task_id = args[0];
  const std::string& name = args[1];
  const std::filesystem::path destination(args[2]);

  if (bootstrap_.get_registry().read(task_id).is_assigned) {
    throw task::ConflictError(task_id, "is already assigned");
  }

  const catalog::FileCatalog::StagedFile staged =
    bootstrap_.get_catalog().stage(name, bootstrap_.get_scratch_root());

  try {
    auto job = std::make_unique<transfer::DownloadJob>(
      staged.file, std::make_unique<transfer::FileSink>(destination), staged.scratch_dir);
    bootstrap_.get_scheduler().start(task_id, std::move(job));
  }
  catch (const std::exception&) {
    std::error_code ec;
    std::filesystem::remove_all(staged.scratch_dir, ec);
    throw;
  }
  reply(200, "Download of " + name + " started");
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  const std::string& task_id = args[0];
  const std::string pattern = args.size() > 1 ? args[1] : "*";

  std::optional<catalog::FileCatalog::TimePoint> from;
  std::optional<catalog::FileCatalog::TimePoint> to;
  if (args.size() > 2) {
    from = catalog::parse_timestamp(args[2]);
  }
  if (args.size() > 3) {
    to = catalog::parse_timestamp(args[3]);
  }

  auto paths = bootstrap_.get_catalog().select(pattern, from, to);
  const std::size_t count = paths.size();

  auto job = std::make_unique<transfer::DeleteJob>(
    std::make_unique<transfer::VectorPathSource>(std::move(paths)));
  bootstrap_.get_scheduler().start(task_id, std::move(job));
  reply(200, "Deleting " + std::to_string(count) + " files");
}

void CLI::handle_list_command(const std::vector<std::string>& args) {
  const std::string pattern = args.empty() ? "*" : args[0];
  const auto files = bootstrap_.get_catalog().select(pattern);

  reply(200, std::to_string(files.size()) + " files");
  for (const auto& file : files) {
    output_ << "  " << file.filename().string() << std::endl;
  }
}

void CLI::handle_wait_command(const std::string& task_id) {
  const transfer::TransferOutcome outcome = bootstrap_.get_scheduler().wait(task_id);
  reply(200, transfer::to_string(outcome));
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                                   Display this help message" << std::endl;
  output_ << "  create                                 Create a task and print its id" << std::endl;
  output_ << "  status <id>                            Show the state of a task" << std::endl;
  output_ << "  pause <id>                             Pause the task's transfer" << std::endl;
  output_ << "  resume <id>                            Resume the task's transfer" << std::endl;
  output_ << "  abort <id>                             Abort the task" << std::endl;
  output_ << "  upload <id> <local-file> [name]        Store a local file" << std::endl;
  output_ << "  download <id> <name> <local-dest>      Copy a stored file out" << std::endl;
  output_ << "  delete <id> [pattern] [from] [to]      Delete matching stored files" << std::endl;
  output_ << "  list [pattern]                         List stored files" << std::endl;
  output_ << "  wait <id>                              Wait for the task's transfer to end" << std::endl;
  output_ << "  quit                                   Exit the shell" << std::endl << std::endl;
}


//==============================================
// REPLIES
//==============================================

void CLI::reply(int status, const std::string& message) {
  output_ << status << " " << message << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::exception& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error.what();
  reply(status_code_for(error), error.what());
}

} // namespace cli
} // namespace datastore
