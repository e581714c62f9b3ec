#ifndef DATASTORE_CLI_HPP
#define DATASTORE_CLI_HPP

#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "app/bootstrap.hpp"

namespace datastore {
namespace cli {

// HTTP-style status for a failed command: 404 missing task or file,
// 409 conflicting state, 400 bad argument, 503 store unreachable, 500 otherwise
int status_code_for(const std::exception& error);

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(app::Bootstrap& bootstrap, std::istream& input = std::cin,
                 std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Executes one input line. Returns false once the shell should exit.
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    app::Bootstrap& bootstrap_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_create_command();
    void handle_status_command(const std::string& task_id);
    void handle_pause_command(const std::string& task_id);
    void handle_resume_command(const std::string& task_id);
    void handle_abort_command(const std::string& task_id);
    void handle_upload_command(const std::vector<std::string>& args);
    void handle_download_command(const std::vector<std::string>& args);
    void handle_delete_command(const std::vector<std::string>& args);
    void handle_list_command(const std::vector<std::string>& args);
    void handle_wait_command(const std::string& task_id);
    void handle_help_command();


    // ---- REPLIES ----
    void reply(int status, const std::string& message);
    void log_and_display_error(const std::string& message, const std::exception& error);
};

} // namespace cli
} // namespace datastore

#endif // DATASTORE_CLI_HPP
