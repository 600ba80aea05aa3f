/**
 * Vine Chat Application
 *
 * CLI front-end for a documentation/version tool server driven by a hosted
 * language model.
 *
 * Usage:
 *   ./vine_chat <command> [options]
 *
 * Commands:
 *   chat                     Interactive conversation (needs LLM_API_KEY)
 *   test                     Run two predefined tool calls against the server
 *   call <tool> <json-args>  Invoke one tool directly
 *
 * Options:
 *   --server-cmd <command>   Server command line, split on whitespace
 *                            (default: "cargo run --bin grape-mcp-devtools")
 *   --timeout <ms>           Per-request timeout (default: 10000)
 *   --system <prompt>        Override the system instruction (chat only)
 *   --log-config <path>      log4cplus property file
 *   --verbose                Log at DEBUG level when no property file is given
 *   --help                   Show this help message
 */

#include "vine/vine.hpp"

#include <log4cplus/initializer.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Global flag for Ctrl+C handling
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

struct CLIArgs {
    std::string command;
    std::vector<std::string> positional;
    std::string server_cmd = "cargo run --bin grape-mcp-devtools";
    int timeout_ms = 10000;
    std::string system_prompt;
    std::string log_config;
    bool verbose = false;
    bool help = false;
    bool invalid = false;
};

void print_usage(const char* program_name) {
    std::cout << "Vine Chat\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  chat                     Interactive conversation (needs LLM_API_KEY)\n";
    std::cout << "  test                     Run two predefined tool calls against the server\n";
    std::cout << "  call <tool> <json-args>  Invoke one tool directly\n\n";
    std::cout << "Options:\n";
    std::cout << "  --server-cmd <command>   Server command line (default: \"cargo run --bin grape-mcp-devtools\")\n";
    std::cout << "  --timeout <ms>           Per-request timeout (default: 10000)\n";
    std::cout << "  --system <prompt>        Override the system instruction (chat only)\n";
    std::cout << "  --log-config <path>      log4cplus property file\n";
    std::cout << "  --verbose                Log at DEBUG level when no property file is given\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Environment:\n";
    std::cout << "  LLM_API_BASE_URL, LLM_API_KEY, LLM_MODEL_NAME\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /quit, /exit    Exit the application\n";
    std::cout << "  /clear          Clear conversation history\n";
    std::cout << "  /tools          List the server's tools\n";
    std::cout << "  /help           Show available commands\n";
    std::cout << "  Ctrl+C          Interrupt the current turn\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--server-cmd" && i + 1 < argc) {
            args.server_cmd = argv[++i];
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                size_t used = 0;
                args.timeout_ms = std::stoi(value, &used);
                if (used != value.size() || args.timeout_ms <= 0) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::logic_error&) {
                std::cerr << "Invalid --timeout value: " << value << " (expected a positive number of ms)\n";
                args.help = true;
                args.invalid = true;
                return args;
            }
        }
        else if (arg == "--system" && i + 1 < argc) {
            args.system_prompt = argv[++i];
        }
        else if (arg == "--log-config" && i + 1 < argc) {
            args.log_config = argv[++i];
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            args.invalid = true;
            return args;
        }
        else if (args.command.empty()) {
            args.command = arg;
        }
        else {
            args.positional.push_back(arg);
        }
    }

    if (args.command.empty()) {
        args.help = true;
    }
    return args;
}

std::vector<std::string> split_command(const std::string& command_line) {
    std::istringstream stream(command_line);
    std::vector<std::string> parts;
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_tools(const std::vector<vine::protocol::ToolDescriptor>& tools) {
    std::cout << "Available tools (" << tools.size() << "):\n";
    for (const auto& tool : tools) {
        std::cout << "  - " << tool.name;
        if (!tool.description.empty()) {
            std::cout << ": " << tool.description;
        }
        std::cout << "\n";
    }
}

// ============================================================================
// Direct server access (test / call)
// ============================================================================

struct ServerConnection {
    std::shared_ptr<vine::process::ProcessSession> session;
    std::shared_ptr<vine::protocol::ProtocolClient> protocol;
    std::shared_ptr<vine::engine::ToolCatalog> catalog;
};

vine::Expected<ServerConnection> connect(const std::vector<std::string>& command_line, int timeout_ms) {
    if (command_line.empty()) {
        return tl::unexpected(vine::Error{vine::ErrorCode::MissingServerCommand, "Server command cannot be empty"});
    }

    ServerConnection connection;
    connection.session = std::make_shared<vine::process::ProcessSession>();
    std::vector<std::string> server_args(command_line.begin() + 1, command_line.end());
    if (auto started = connection.session->start(command_line[0], server_args); !started) {
        return tl::unexpected(started.error());
    }

    vine::protocol::ProtocolClient::Config protocol_config;
    protocol_config.request_timeout = std::chrono::milliseconds(timeout_ms);
    connection.protocol = std::make_shared<vine::protocol::ProtocolClient>(connection.session, protocol_config);
    if (auto ack = connection.protocol->initialize(); !ack) {
        return tl::unexpected(ack.error());
    }

    connection.catalog = std::make_shared<vine::engine::ToolCatalog>(connection.protocol);
    if (auto loaded = connection.catalog->refresh(); !loaded) {
        return tl::unexpected(loaded.error());
    }
    return connection;
}

int run_test(const CLIArgs& args) {
    auto connection = connect(split_command(args.server_cmd), args.timeout_ms);
    if (!connection) {
        std::cerr << "Error: " << connection.error().to_string() << "\n";
        return 1;
    }
    print_tools(connection->catalog->tools());

    struct TestCase {
        std::string tool;
        nlohmann::json arguments;
        std::string description;
    };
    const std::vector<TestCase> cases = {
        {"search_docs", {{"query", "http client"}, {"language", "rust"}, {"limit", 3}},
         "Search Rust HTTP client documentation"},
        {"check_version", {{"package", "serde"}, {"language", "rust"}},
         "Check the latest serde version"}
    };

    int failures = 0;
    for (size_t i = 0; i < cases.size(); ++i) {
        std::cout << "\nTest " << (i + 1) << ": " << cases[i].description << "\n";
        auto result = connection->protocol->call_tool(cases[i].tool, cases[i].arguments);
        if (!result) {
            std::cout << "  FAILED: " << result.error().to_string() << "\n";
            ++failures;
            continue;
        }
        std::string text = result->dump(2);
        if (text.size() > 300) {
            text = text.substr(0, 300) + "...";
        }
        std::cout << "  OK\n";
        print_separator();
        std::cout << text << "\n";
        print_separator();
    }

    connection->session->stop();
    return failures == 0 ? 0 : 1;
}

int run_call(const CLIArgs& args) {
    if (args.positional.size() != 2) {
        std::cerr << "Usage: call <tool> <json-args>\n";
        return 1;
    }
    const std::string& tool_name = args.positional[0];
    auto arguments = vine::engine::parse_tool_arguments(args.positional[1]);
    if (!arguments) {
        std::cerr << "Error: " << arguments.error().to_string() << "\n";
        return 1;
    }

    auto connection = connect(split_command(args.server_cmd), args.timeout_ms);
    if (!connection) {
        std::cerr << "Error: " << connection.error().to_string() << "\n";
        return 1;
    }

    if (auto tool = connection->catalog->lookup(tool_name); !tool) {
        std::cerr << "Error: " << tool.error().to_string() << "\n";
        print_tools(connection->catalog->tools());
        return 1;
    }

    std::cout << "Calling " << tool_name << " with " << arguments->dump() << "\n";
    auto result = connection->protocol->call_tool(tool_name, *arguments);
    connection->session->stop();
    if (!result) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return 1;
    }
    print_separator();
    std::cout << result->dump(2) << "\n";
    print_separator();
    return 0;
}

// ============================================================================
// Interactive chat
// ============================================================================

vine::Expected<std::unique_ptr<vine::Client>> create_client(const vine::Client::Config& config) {
    std::cout << "Starting server: " << config.server_command;
    for (const auto& part : config.server_args) {
        std::cout << " " << part;
    }
    std::cout << "\n";
    return vine::Client::create(config);
}

int run_chat(const CLIArgs& args) {
    auto command_line = split_command(args.server_cmd);
    if (command_line.empty()) {
        std::cerr << "Error: --server-cmd is empty\n";
        return 1;
    }

    vine::Client::Config config;
    config.server_command = command_line[0];
    config.server_args.assign(command_line.begin() + 1, command_line.end());
    config.protocol.request_timeout = std::chrono::milliseconds(args.timeout_ms);
    config.language_model = vine::backend::LanguageModelConfig::from_environment();
    if (!args.system_prompt.empty()) {
        config.system_instruction = args.system_prompt;
    }

    auto client_result = create_client(config);
    if (!client_result) {
        std::cerr << "Error: " << client_result.error().to_string() << "\n";
        return 1;
    }
    auto client = std::move(*client_result);

    std::cout << "\n";
    print_separator();
    std::cout << "Vine Chat\n";
    print_separator();
    std::cout << "Model: " << config.language_model.model << "\n";
    std::cout << "Endpoint: " << config.language_model.base_url << "\n";
    print_tools(client->tools());
    print_separator();
    std::cout << "\nAsk about packages, documentation or versions. Type '/quit' to exit.\n";

    std::string line;
    while (true) {
        std::cout << "\nYou: ";
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            break;
        }
        g_interrupted = false;

        line.erase(0, line.find_first_not_of(" \t\n\r"));
        line.erase(line.find_last_not_of(" \t\n\r") + 1);

        if (line.empty()) {
            continue;
        }

        if (line == "quit" || line == "exit" || line == "bye") {
            break;
        }
        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            }
            else if (line == "/clear") {
                client->clear_history();
                std::cout << "Conversation history cleared.\n";
            }
            else if (line == "/tools") {
                print_tools(client->tools());
            }
            else if (line == "/help") {
                std::cout << "\nAvailable commands:\n";
                std::cout << "  /quit, /exit    Exit the application\n";
                std::cout << "  /clear          Clear conversation history\n";
                std::cout << "  /tools          List the server's tools\n";
                std::cout << "  /help           Show this help\n";
            }
            else {
                std::cout << "Unknown command: " << line << "\n";
                std::cout << "Type '/help' for available commands.\n";
            }
            continue;
        }

        auto handle = client->chat(line);

        // Poll for interrupt while the turn runs
        bool interrupted = false;
        while (handle.future.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout) {
            if (g_interrupted && !interrupted) {
                interrupted = true;
                client->interrupt();
            }
        }

        auto result = handle.future.get();
        if (interrupted) {
            std::cout << "\n[Turn interrupted]\n";

            // The server was taken down; start a fresh one.
            client->stop();
            client_result = create_client(config);
            if (!client_result) {
                std::cerr << "Error: " << client_result.error().to_string() << "\n";
                return 1;
            }
            client = std::move(*client_result);
            continue;
        }

        if (!result) {
            std::cerr << "\nError: " << result.error().to_string() << "\n";
            continue;
        }

        std::cout << "\nAssistant: " << result->text << "\n";
        if (result->used_tools()) {
            std::cout << "  (" << result->tool_results.size() << " tool call(s), ";
        } else {
            std::cout << "  (";
        }
        std::cout << result->llm_calls << " model call(s), "
                  << result->usage.total_tokens << " tokens, "
                  << result->latency_ms.count() << " ms)\n";
    }

    client->stop();
    std::cout << "Goodbye!\n";
    return 0;
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return (args.invalid || args.command.empty()) ? 1 : 0;
    }

    log4cplus::Initializer initializer;
    vine::log::init_logging(args.log_config,
                            args.verbose ? log4cplus::DEBUG_LOG_LEVEL : log4cplus::WARN_LOG_LEVEL);

    std::signal(SIGINT, signal_handler);

    if (args.command == "chat") {
        return run_chat(args);
    }
    if (args.command == "test") {
        return run_test(args);
    }
    if (args.command == "call") {
        return run_call(args);
    }

    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage(argv[0]);
    return 1;
}
