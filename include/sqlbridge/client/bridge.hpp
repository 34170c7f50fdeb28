/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file bridge.hpp
 * @brief Host-facing entry point: connection lifecycle and query submission.
 *
 * @details
 * This header declares the `Bridge` class. A host creates one bridge per logical database
 * connection, calls `connect`, and then submits SQL text. The bridge runs the worker,
 * performs the `connected` handshake, multiplexes any number of concurrent queries over
 * the worker's single stdin/stdout pair, and fans the answers back out to the right callers.
 */

#pragma once

#include "sqlbridge/channel/channel.hpp"
#include "sqlbridge/client/options.hpp"
#include "sqlbridge/core/correlator.hpp"
#include "sqlbridge/core/error.hpp"
#include "sqlbridge/infra/dispatcher.hpp"
#include "sqlbridge/infra/string.hpp"
#include "sqlbridge/protocol/document.hpp"
#include "sqlbridge/protocol/line_decoder.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sqlbridge::client {

/**
 * @enum ConnectionState
 * @brief Lifecycle of a bridge's connection to its worker.
 *
 * ```
 * DISCONNECTED --connect--> CONNECTING --"connected"--> CONNECTED --disconnect--> DISCONNECTED
 *                               |                           |
 *                               +--other line/stderr/exit--> FAILED   (worker exit -> DISCONNECTED)
 * ```
 */
enum class ConnectionState {
    DISCONNECTED, ///< No worker, or the worker was stopped.
    CONNECTING,   ///< Worker spawned, handshake line not yet received.
    CONNECTED,    ///< Handshake done; queries are accepted.
    FAILED        ///< Spawn or handshake failed; only a new `connect` leaves this state.
};

/// @brief Upper-case name of a connection state.
const char* to_string(ConnectionState state);

/**
 * @brief Continuation of `connect`.
 *
 * On success `error` is empty and `banner` holds the handshake text (`connected`).
 */
using ConnectCallback = std::function<void(std::optional<core::BridgeError> error,
                                           std::string banner)>;

/**
 * @class Bridge
 * @brief One connection to one worker.
 *
 * @details
 * **Threading:**
 * - Public methods may be called from any thread.
 * - Worker traffic is processed on the bridge's dispatcher thread, in arrival order.
 *   Query and connect continuations fire there, except for failures detected
 *   synchronously (`NOT_CONNECTED`, `SPAWN_FAILURE`, a failed write, `INVALID_STATE`),
 *   which fire on the calling thread before the call returns.
 * - Continuations run without any bridge lock held and may call back into the bridge.
 *   They must not destroy it.
 */
class Bridge {
  public:
    /// Produces the channel for a new worker session.
    using ChannelFactory =
        std::function<std::unique_ptr<channel::Channel>(const BridgeOptions& options)>;

    /**
     * @brief Creates a bridge that runs its worker as a child process.
     * @throws std::invalid_argument If `options` fail validation.
     */
    explicit Bridge(BridgeOptions options);

    /**
     * @brief Creates a bridge with a custom channel source.
     * @throws std::invalid_argument If `options` fail validation.
     */
    Bridge(BridgeOptions options, ChannelFactory factory);

    /**
     * @brief Stops the worker and fails whatever is still pending with `DISCONNECTED`.
     */
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /**
     * @brief Starts a worker and performs the handshake.
     *
     * The callback fires exactly once: success when the worker's first output line is
     * `connected`, otherwise a `SPAWN_FAILURE`, `HANDSHAKE_FAILURE`, `WORKER_EXITED`,
     * `DISCONNECTED` (aborted by `disconnect`) or `INVALID_STATE` error.
     *
     * @param callback The connect continuation.
     */
    void connect(ConnectCallback callback);

    /**
     * @brief Future front end of `connect`.
     * @return std::future<std::string> Resolves with the handshake text or holds the
     * `core::BridgeError`.
     */
    std::future<std::string> connect_async();

    /**
     * @brief Submits a query.
     *
     * @param sql The SQL text; may span several lines.
     * @param callback Fires exactly once with the result or a `core::BridgeError`.
     * @return std::uint64_t The request identifier, or 0 if the bridge is not connected
     * (the callback has then already received `NOT_CONNECTED`) or the SQL text contains a
     * NUL character (`QUERY_FAILURE`, nothing is sent).
     *
     * @code
     * bridge.query("SELECT name FROM users", [](auto error, sqlbridge::protocol::Document rs) {
     *     if (error) {
     *         std::cerr << error->what() << "\n";
     *         return;
     *     }
     *     std::cout << rs.dump() << "\n";
     * });
     * @endcode
     */
    std::uint64_t query(const std::string& sql, core::QueryCallback callback);

    /**
     * @brief Future front end of `query`, backed by the same pending table.
     *
     * A single result-set arrives as a bare object, several as an array in statement order.
     */
    std::future<protocol::Document> query_async(const std::string& sql);

    /**
     * @brief Stops the worker.
     *
     * Pending queries fail with `DISCONNECTED`; an unfinished connect fails likewise.
     * A no-op when nothing is running.
     */
    void disconnect();

    /// @brief True exactly in `ConnectionState::CONNECTED`.
    bool is_connected() const;

    ConnectionState state() const;

    /// @brief Number of queries awaiting a response.
    std::size_t pending() const;

    /// @brief Identifier of the most recent query, 0 before the first one.
    std::uint64_t last_request_id() const;

    /**
     * @brief Blocks until every worker event received so far has been processed.
     *
     * Useful for hosts that need a quiescent point (for instance before inspecting
     * `pending()`). Returns immediately when called from a continuation.
     */
    void wait_idle();

  private:
    /**
     * @struct Session
     * @brief One spawned worker and the framing state of its output.
     */
    struct Session {
        std::uint64_t generation = 0;
        std::shared_ptr<channel::Channel> channel;

        /// Touched only on the dispatcher thread.
        protocol::LineDecoder decoder;
    };

    std::shared_ptr<Session> current_session(std::uint64_t generation) const;

    void on_stdout(std::uint64_t generation, const std::string& bytes);
    void on_stderr(std::uint64_t generation, const std::string& bytes);
    void on_closed(std::uint64_t generation);
    void on_line(const std::shared_ptr<Session>& session, const std::string& line);

    void finish_handshake(const std::shared_ptr<Session>& session, const std::string& line);
    void fail_handshake(const std::shared_ptr<Session>& session, const core::BridgeError& error);
    void on_channel_fault(const std::shared_ptr<Session>& session, const std::string& text);
    void on_worker_exit(const std::shared_ptr<Session>& session);

    void trace(const std::string& message) const;

    BridgeOptions options_;
    infra::TextEncoding encoding_;
    ChannelFactory factory_;
    core::Correlator correlator_;

    /// @brief Guards `state_`, `generation_`, `session_` and `pending_connect_`.
    mutable std::mutex state_mutex_;
    ConnectionState state_;
    std::uint64_t generation_;
    std::shared_ptr<Session> session_;
    ConnectCallback pending_connect_;

    /// @brief Declared last: stopped (and destroyed) before the members its tasks use.
    infra::Dispatcher dispatcher_;
};

} // namespace sqlbridge::client
