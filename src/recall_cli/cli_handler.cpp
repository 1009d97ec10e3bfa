#include "recall_cli/cli_handler.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace recall_cli {

namespace {

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

int parse_top_k(const std::string& value) {
    try {
        size_t consumed = 0;
        int k = std::stoi(value, &consumed);
        if (consumed != value.size() || k <= 0) {
            throw CliError("--top-k must be a positive integer, got '" + value + "'");
        }
        return k;
    } catch (const std::logic_error&) {
        throw CliError("--top-k must be a positive integer, got '" + value + "'");
    }
}

void require(const std::string& value, const std::string& usage) {
    if (value.empty()) {
        throw CliError(usage);
    }
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<recall_core::RetrievalEngine> engine, std::ostream& out)
    : engine_(std::move(engine)), out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--all" || flag == "-a") {
            options.all = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else if (flag == "--user" || flag == "-u") {
            options.user_id = value;
        } else if (flag == "--text" || flag == "-t") {
            options.text = value;
            options.texts.push_back(value);
        } else if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_top_k(value);
        } else if (flag == "--source" || flag == "-s") {
            options.source = value;
        } else if (flag == "--visibility" || flag == "-v") {
            if (value != "private" && value != "shared") {
                throw CliError("--visibility must be 'private' or 'shared'");
            }
            options.visibility = value;
        } else if (flag == "--file" || flag == "-f") {
            options.file_path = value;
        } else if (flag == "--meta" || flag == "-m") {
            auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw CliError("--meta expects key=value, got '" + value + "'");
            }
            options.metadata[value.substr(0, eq)] = value.substr(eq + 1);
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    if (command == "record") {
        options.command = Command::Record;
        require(options.user_id, "Usage: record --user <id> --text <text>");
        require(options.text, "Usage: record --user <id> --text <text>");
    } else if (command == "recall") {
        options.command = Command::Recall;
        require(options.user_id, "Usage: recall --user <id> --query <text> [--top-k <k>]");
        require(options.query, "Usage: recall --user <id> --query <text> [--top-k <k>]");
    } else if (command == "history") {
        options.command = Command::History;
        require(options.user_id, "Usage: history --user <id>");
    } else if (command == "clear") {
        options.command = Command::Clear;
        if (!options.all) {
            require(options.user_id, "Usage: clear --user <id> | clear --all");
        }
    } else if (command == "users") {
        options.command = Command::Users;
    } else if (command == "ingest") {
        options.command = Command::Ingest;
        const std::string usage =
            "Usage: ingest --user <id> --source <name> (--text <fragment>... | --file <path>) "
            "[--visibility private|shared] [--meta key=value]...";
        require(options.user_id, usage);
        require(options.source, usage);
        if (options.texts.empty() && options.file_path.empty()) {
            throw CliError(usage);
        }
    } else if (command == "retrieve") {
        options.command = Command::Retrieve;
        require(options.user_id, "Usage: retrieve --user <id> --query <text> [--top-k <k>]");
        require(options.query, "Usage: retrieve --user <id> --query <text> [--top-k <k>]");
    } else if (command == "sources") {
        options.command = Command::Sources;
    } else if (command == "purge") {
        options.command = Command::Purge;
        if (!options.all && options.source.empty() && options.user_id.empty()) {
            throw CliError("Usage: purge --source <name> [--user <id>] | purge --user <id> | purge --all");
        }
    } else if (command == "health") {
        options.command = Command::Health;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    try {
        switch (options.command) {
            case Command::Record:
                handle_record_command(options);
                break;
            case Command::Recall:
                handle_recall_command(options);
                break;
            case Command::History:
                handle_history_command(options);
                break;
            case Command::Clear:
                handle_clear_command(options);
                break;
            case Command::Users:
                handle_users_command();
                break;
            case Command::Ingest:
                handle_ingest_command(options);
                break;
            case Command::Retrieve:
                handle_retrieve_command(options);
                break;
            case Command::Sources:
                handle_sources_command();
                break;
            case Command::Purge:
                handle_purge_command(options);
                break;
            case Command::Health:
                handle_health_command();
                break;
            case Command::Help:
                print_help(out_);
                break;
        }
    } catch (const recall_core::RetrievalError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (e.retryable()) {
            std::cerr << "The failure is temporary; try again shortly." << std::endl;
            return 2;
        }
        return 1;
    } catch (const CliError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

void CliHandler::handle_record_command(const CliOptions& options) {
    engine_->record_turn(options.user_id, options.text);
    out_ << "Recorded turn for " << options.user_id << std::endl;
}

void CliHandler::handle_recall_command(const CliOptions& options) {
    print_turns(engine_->recall(options.user_id, options.query, options.top_k), true);
}

void CliHandler::handle_history_command(const CliOptions& options) {
    print_turns(engine_->history(options.user_id), false);
}

void CliHandler::handle_clear_command(const CliOptions& options) {
    if (options.all) {
        out_ << "Cleared " << engine_->clear_all_history() << " turn(s) for all users" << std::endl;
    } else {
        out_ << "Cleared " << engine_->clear_history(options.user_id) << " turn(s) for "
             << options.user_id << std::endl;
    }
}

void CliHandler::handle_users_command() {
    auto users = engine_->list_users();
    if (users.empty()) {
        out_ << "No users with history." << std::endl;
        return;
    }
    for (const auto& user : users) {
        out_ << user << std::endl;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::vector<std::string> texts = options.texts;
    if (!options.file_path.empty()) {
        auto from_file = read_fragments_file(options.file_path);
        texts.insert(texts.end(), from_file.begin(), from_file.end());
    }

    std::vector<recall_core::FragmentInput> fragments;
    fragments.reserve(texts.size());
    for (auto& text : texts) {
        fragments.push_back({std::move(text), options.metadata});
    }

    std::size_t inserted =
        engine_->ingest(fragments, options.user_id, options.source, options.visibility);
    out_ << "Ingested " << inserted << " fragment(s) from " << options.source << " ("
         << options.visibility << ")" << std::endl;
}

void CliHandler::handle_retrieve_command(const CliOptions& options) {
    print_fragments(engine_->retrieve(options.user_id, options.query, options.top_k));
}

void CliHandler::handle_sources_command() {
    auto sources = engine_->list_sources();
    if (sources.empty()) {
        out_ << "No sources." << std::endl;
        return;
    }
    for (const auto& entry : sources) {
        out_ << entry.source << "\t" << entry.uploader << std::endl;
    }
}

void CliHandler::handle_purge_command(const CliOptions& options) {
    std::size_t removed = 0;
    if (options.all) {
        removed = engine_->purge_all();
    } else if (!options.source.empty() && !options.user_id.empty()) {
        removed = engine_->purge_by_source_and_user(options.source, options.user_id);
    } else if (!options.source.empty()) {
        removed = engine_->purge_by_source(options.source);
    } else {
        removed = engine_->purge_by_user(options.user_id);
    }
    out_ << "Purged " << removed << " fragment(s)" << std::endl;
}

void CliHandler::handle_health_command() {
    auto status = engine_->health();
    out_ << "store:     " << (status.store_ok ? "ok" : "unavailable");
    if (!status.store_ok && !status.store_error.empty()) {
        out_ << " (" << status.store_error << ")";
    }
    out_ << std::endl;
    out_ << "embedding: " << (status.embedding_ok ? "ok" : "unavailable") << std::endl;
    if (!status.healthy()) {
        throw recall_core::RetrievalUnavailable("health check failed");
    }
}

void CliHandler::print_turns(const std::vector<recall_core::RetrievalEngine::TurnDTO>& turns,
                             bool with_distance) {
    if (turns.empty()) {
        out_ << "No turns found." << std::endl;
        return;
    }
    for (const auto& turn : turns) {
        out_ << "[" << format_timestamp(turn.timestamp) << "] " << turn.owner << ": " << turn.text;
        if (with_distance) {
            out_ << " (distance: " << std::fixed << std::setprecision(3) << turn.distance << ")";
        }
        out_ << std::endl;
    }
}

void CliHandler::print_fragments(
    const std::vector<recall_core::RetrievalEngine::FragmentDTO>& fragments) {
    if (fragments.empty()) {
        out_ << "No fragments found." << std::endl;
        return;
    }
    for (const auto& fragment : fragments) {
        out_ << "  - " << fragment.source << " by " << fragment.owner << " ["
             << recall_core::to_string(fragment.visibility) << "] | distance: " << std::fixed
             << std::setprecision(3) << fragment.distance << std::endl;
        for (const auto& [key, value] : fragment.metadata) {
            out_ << "    " << key << ": " << value << std::endl;
        }
        out_ << "    " << fragment.text.substr(0, 200);
        if (fragment.text.length() > 200) {
            out_ << "...";
        }
        out_ << std::endl;
    }
}

// One fragment per non-empty line
std::vector<std::string> CliHandler::read_fragments_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw CliError("Failed to open fragments file: " + path);
    }
    std::vector<std::string> fragments;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            fragments.push_back(line);
        }
    }
    return fragments;
}

void CliHandler::print_help(std::ostream& out) {
    out << R"(
Recall CLI - retrieval-augmented memory store

Usage: recall_cli <command> [options] [--config <path>]

Conversation memory:
  record      --user <id> --text <text>           Record a conversation turn
  recall      --user <id> --query <text> [-k N]   Most similar turns of a user
  history     --user <id>                         All turns of a user, oldest first
  clear       --user <id> | --all                 Delete conversation history
  users                                           Users that have history

Documents:
  ingest      --user <id> --source <name> (--text <fragment>... | --file <path>)
              [--visibility private|shared] [--meta key=value]...
  retrieve    --user <id> --query <text> [-k N]   Own and shared fragments by similarity
  sources                                         Ingested (source, uploader) pairs
  purge       --source <name> [--user <id>] | --user <id> | --all

Other:
  health                                          Check store and embedding server
  help                                            Show this message

The database key is read from db_key in the config file or from RECALL_DB_KEY.
)";
}

}  // namespace recall_cli
