#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/services/retrieval_engine.hpp"

namespace recall_cli
{

  enum class Command
  {
    Record,
    Recall,
    History,
    Clear,
    Users,
    Ingest,
    Retrieve,
    Sources,
    Purge,
    Health,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path;
    std::string user_id;
    std::string text;
    std::string query;
    std::optional<int> top_k;
    std::string source;
    std::string visibility = "private";
    std::vector<std::string> texts;
    std::string file_path;
    recall_core::Metadata metadata;
    bool all = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::shared_ptr<recall_core::RetrievalEngine> engine,
                        std::ostream &out = std::cout);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments; needs no engine
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Returns the process exit code: 0 on success, 2 when the failure is
    // retryable, 1 otherwise
    int execute_command(const CliOptions &options);

    static void print_help(std::ostream &out);

  private:
    std::shared_ptr<recall_core::RetrievalEngine> engine_;
    std::ostream &out_;

    // Command handlers
    void handle_record_command(const CliOptions &options);
    void handle_recall_command(const CliOptions &options);
    void handle_history_command(const CliOptions &options);
    void handle_clear_command(const CliOptions &options);
    void handle_users_command();
    void handle_ingest_command(const CliOptions &options);
    void handle_retrieve_command(const CliOptions &options);
    void handle_sources_command();
    void handle_purge_command(const CliOptions &options);
    void handle_health_command();

    // Helper methods
    void print_turns(const std::vector<recall_core::RetrievalEngine::TurnDTO> &turns,
                     bool with_distance);
    void print_fragments(const std::vector<recall_core::RetrievalEngine::FragmentDTO> &fragments);
    static std::vector<std::string> read_fragments_file(const std::string &path);
  };

}
