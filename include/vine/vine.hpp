#pragma once

/**
 * @file vine.hpp
 * @brief Convenience header for the vine tool-orchestration client
 *
 * vine supervises a tool server running as a child process, talks to it
 * with newline-delimited JSON requests over stdin/stdout, and lets a
 * hosted language model pick and call the server's tools to answer a
 * user's question.
 *
 * Quick Start:
 * @code
 * #include <vine/vine.hpp>
 *
 * int main() {
 *     log4cplus::Initializer initializer;
 *     vine::log::init_logging();
 *
 *     vine::Client::Config config;
 *     config.server_command = "doc-server";
 *     config.language_model = vine::backend::LanguageModelConfig::from_environment();
 *
 *     auto client = vine::Client::create(config);
 *     if (!client) {
 *         std::cerr << "Error: " << client.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto result = (*client)->chat("Which version of serde is current?").future.get();
 *     if (result) {
 *         std::cout << result->text << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - vine::process::ProcessSession: child process lifecycle and line I/O
 * - vine::protocol::ProtocolClient: request/response correlation with timeouts
 * - vine::engine::ToolCatalog: cached tool list and model-facing descriptors
 * - vine::engine::Orchestrator: the two-call tool loop for one user turn
 * - vine::Client: ties them together behind a worker thread
 */

// Core types
#include "types.hpp"
#include "cancellation.hpp"
#include "log.hpp"

// Process and protocol
#include "process/line_channel.hpp"
#include "process/process_session.hpp"
#include "protocol/types.hpp"
#include "protocol/codec.hpp"
#include "protocol/protocol_client.hpp"

// Engine
#include "engine/history_manager.hpp"
#include "engine/turn_queue.hpp"
#include "engine/tool_catalog.hpp"
#include "engine/orchestrator.hpp"

// Language model
#include "backend/ILanguageModel.hpp"
#include "backend/chat_completion.hpp"

// Main API
#include "client.hpp"
