#pragma once

#include "types.hpp"
#include "cancellation.hpp"
#include "log.hpp"
#include "backend/ILanguageModel.hpp"
#include "engine/history_manager.hpp"
#include "engine/orchestrator.hpp"
#include "engine/tool_catalog.hpp"
#include "engine/turn_queue.hpp"
#include "process/line_channel.hpp"
#include "process/process_session.hpp"
#include "protocol/protocol_client.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vine {

/**
 * @brief Main entry point: a supervised tool server plus a model-driven
 *        conversation over it
 *
 * Thread Model:
 * - Calling Thread: chat() returns a TurnHandle immediately
 * - Worker Thread: runs turns one at a time through the Orchestrator
 * - interrupt()/stop() may be called from any thread
 *
 * Example Usage:
 * @code
 * Client::Config config;
 * config.server_command = "doc-server";
 * config.server_args = {"--stdio"};
 * config.language_model = backend::LanguageModelConfig::from_environment();
 *
 * auto client_result = Client::create(config);
 * if (!client_result) {
 *     std::cerr << client_result.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto client = std::move(*client_result);
 *
 * auto handle = client->chat("What is the latest serde release?");
 * auto result = handle.future.get();
 * if (result) {
 *     std::cout << result->text << std::endl;
 * }
 * @endcode
 */
class Client {
public:
    struct Config {
        std::string server_command;                           ///< Tool server executable (required)
        std::vector<std::string> server_args;                 ///< Its arguments
        process::ProcessSession::Options process;             ///< Grace and shutdown bounds
        protocol::ProtocolClient::Config protocol;            ///< Handshake identity and read timeout
        backend::LanguageModelConfig language_model;          ///< Hosted model endpoint
        std::optional<std::string> system_instruction;        ///< Overrides the default instruction
        size_t request_queue_capacity = 0;                    ///< Maximum queued turns (0 = unlimited)

        Expected<void> validate() const {
            if (server_command.empty()) {
                return tl::unexpected(Error{ErrorCode::MissingServerCommand, "Server command cannot be empty"});
            }
            if (auto result = process.validate(); !result) {
                return result;
            }
            return protocol.validate();
        }
    };

    /**
     * @brief Launch the server, handshake, load the tool catalog, start the worker
     *
     * Any failure aborts creation and tears the server down; no partially
     * initialized client is returned.
     *
     * @param model Injected language model (tests); defaults to create_language_model()
     * @param channel Injected line channel (tests); when set no process is launched
     */
    static Expected<std::unique_ptr<Client>> create(
        const Config& config,
        std::unique_ptr<backend::ILanguageModel> model = nullptr,
        std::shared_ptr<process::ILineChannel> channel = nullptr
    ) {
        if (channel) {
            if (auto result = config.protocol.validate(); !result) {
                return tl::unexpected(result.error());
            }
        } else if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }

        if (!model) {
            model = backend::create_language_model();
            if (!model) {
                return tl::unexpected(Error{
                    ErrorCode::LanguageModelTransportError,
                    "Failed to create language model"
                });
            }
        }
        if (auto result = model->initialize(config.language_model); !result) {
            return tl::unexpected(result.error());
        }

        auto cancel = std::make_shared<CancellationToken>();

        if (!channel) {
            auto session = std::make_shared<process::ProcessSession>(config.process, cancel);
            if (auto started = session->start(config.server_command, config.server_args); !started) {
                return tl::unexpected(started.error());
            }
            channel = std::move(session);
        } else {
            std::weak_ptr<process::ILineChannel> weak = channel;
            cancel->on_cancel([weak]() {
                if (auto ch = weak.lock()) {
                    ch->close();
                }
            });
        }

        auto protocol = std::make_shared<protocol::ProtocolClient>(channel, config.protocol);
        if (auto ack = protocol->initialize(); !ack) {
            channel->close();
            return tl::unexpected(ack.error());
        }

        auto catalog = std::make_shared<engine::ToolCatalog>(protocol);
        if (auto loaded = catalog->refresh(); !loaded) {
            channel->close();
            return tl::unexpected(loaded.error());
        }

        return std::unique_ptr<Client>(new Client(
            config, std::move(model), std::move(cancel), std::move(channel),
            std::move(protocol), std::move(catalog)));
    }

    /// Stops the worker thread and the server.
    ~Client() {
        stop();
    }

    // Non-copyable and non-movable (worker thread captures `this`)
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) = delete;
    Client& operator=(Client&&) = delete;

    /**
     * @brief Queue one user turn
     *
     * @return Handle whose future resolves with the turn result, or with
     *         ClientNotRunning / QueueFull immediately
     */
    TurnHandle chat(std::string text) {
        TurnRequest request(std::move(text));
        request.id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
        auto promise = request.promise;
        std::future<Expected<TurnResult>> future = promise->get_future();
        const RequestId id = request.id;

        if (!running_.load(std::memory_order_acquire)) {
            promise->set_value(tl::unexpected(Error{ErrorCode::ClientNotRunning, "Client is not running"}));
            return TurnHandle{id, std::move(future)};
        }

        if (!queue_->push(std::move(request))) {
            promise->set_value(tl::unexpected(Error{
                ErrorCode::QueueFull,
                "Turn queue is full or client is shutting down"
            }));
        }
        return TurnHandle{id, std::move(future)};
    }

    /**
     * @brief Abort the current turn and take the server down
     *
     * Cancels the shared token: the server process is stopped (waking any
     * blocked read), an in-flight model call is aborted, and queued turns
     * resolve with RequestCancelled. Runs the process shutdown on the
     * calling thread, so it blocks for up to ProcessSession::Options::shutdown_timeout.
     * The client cannot run further turns and should be stopped and recreated.
     */
    void interrupt() {
        LOG4CPLUS_INFO(log::engine_logger(), "Interrupt requested");
        cancel_->cancel();
    }

    bool is_interrupted() const {
        return cancel_->is_cancelled();
    }

    /**
     * @brief Stop the worker thread and the server
     *
     * Idempotent. Turns still queued resolve with RequestCancelled.
     */
    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }

        queue_->shutdown();
        cancel_->cancel();

        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }

        for (auto& request : queue_->drain()) {
            request.promise->set_value(tl::unexpected(Error{ErrorCode::ClientNotRunning, "Client stopped"}));
        }

        channel_->close();
    }

    bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    /// Invoke a tool directly, bypassing the model. Serialized with running turns.
    Expected<nlohmann::json> call_tool(const std::string& name, const nlohmann::json& arguments) {
        if (auto tool = catalog_->lookup(name); !tool) {
            return tl::unexpected(tool.error());
        }
        return protocol_->call_tool(name, arguments);
    }

    /// Re-issue tools/list; the cache is unchanged on failure.
    Expected<size_t> refresh_tools() {
        return catalog_->refresh();
    }

    std::vector<protocol::ToolDescriptor> tools() const {
        return catalog_->tools();
    }

    /// Thread-safe copy of the conversation so far.
    std::vector<Message> get_history() const {
        return history_->get_messages();
    }

    void clear_history() {
        history_->clear();
    }

    process::SessionState session_state() const {
        return channel_->state();
    }

    std::optional<nlohmann::json> server_acknowledgement() const {
        return protocol_->server_acknowledgement();
    }

    const Config& get_config() const {
        return config_;
    }

private:
    Client(const Config& config,
           std::unique_ptr<backend::ILanguageModel> model,
           std::shared_ptr<CancellationToken> cancel,
           std::shared_ptr<process::ILineChannel> channel,
           std::shared_ptr<protocol::ProtocolClient> protocol,
           std::shared_ptr<engine::ToolCatalog> catalog)
        : config_(config)
        , cancel_(std::move(cancel))
        , channel_(std::move(channel))
        , protocol_(std::move(protocol))
        , catalog_(std::move(catalog))
        , history_(std::make_shared<engine::HistoryManager>())
        , queue_(std::make_shared<engine::TurnQueue>(config.request_queue_capacity))
        , running_(true)
    {
        engine::Orchestrator::Options options;
        if (config.system_instruction.has_value()) {
            options.system_instruction = *config.system_instruction;
        }
        orchestrator_ = std::make_unique<engine::Orchestrator>(
            std::shared_ptr<backend::ILanguageModel>(std::move(model)),
            catalog_, protocol_, history_, std::move(options));

        worker_thread_ = std::thread([this]() {
            worker_loop();
        });
    }

    void worker_loop() {
        while (auto request = queue_->pop()) {
            Expected<TurnResult> result = orchestrator_->run_turn(request->text, cancel_.get());
            request->promise->set_value(std::move(result));
        }
    }

    Config config_;
    std::shared_ptr<CancellationToken> cancel_;
    std::shared_ptr<process::ILineChannel> channel_;
    std::shared_ptr<protocol::ProtocolClient> protocol_;
    std::shared_ptr<engine::ToolCatalog> catalog_;
    std::shared_ptr<engine::HistoryManager> history_;
    std::shared_ptr<engine::TurnQueue> queue_;
    std::unique_ptr<engine::Orchestrator> orchestrator_;

    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::atomic<RequestId> next_request_id_{1};
};

} // namespace vine
