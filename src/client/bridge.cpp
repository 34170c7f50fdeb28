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
 * @file bridge.cpp
 * @brief Implementation of the connection lifecycle and the query front ends.
 *
 * @details
 * Every worker event is tagged with the generation of the session that produced it and
 * re-posted to the dispatcher. Handlers drop events whose generation is no longer current,
 * which is how a restarted or stopped worker's late output is kept away from the new
 * session. State transitions happen under `state_mutex_`; continuations are invoked only
 * after it has been released.
 */

#include "sqlbridge/client/bridge.hpp"

#include "sqlbridge/channel/worker_process.hpp"
#include "sqlbridge/infra/logger.hpp"

#include <exception>
#include <stdexcept>
#include <vector>

namespace sqlbridge::client {

namespace {

/// The handshake token the worker prints once its database connection is up.
const char* const kHandshakeToken = "connected";

BridgeOptions validated(BridgeOptions options)
{
    options.validate();
    return options;
}

infra::TextEncoding resolve_encoding(const std::string& name)
{
    infra::TextEncoding encoding = infra::TextEncoding::UTF8;
    if (!infra::String::parse_encoding(name, encoding)) {
        throw std::invalid_argument("Unsupported worker output encoding: '" + name + "'");
    }
    return encoding;
}

std::unique_ptr<channel::Channel> spawn_worker_process(const BridgeOptions& options)
{
    return std::make_unique<channel::WorkerProcess>(options.command_line(),
                                                    options.terminate_grace);
}

} // namespace

const char* to_string(ConnectionState state)
{
    switch (state) {
    case ConnectionState::DISCONNECTED:
        return "DISCONNECTED";
    case ConnectionState::CONNECTING:
        return "CONNECTING";
    case ConnectionState::CONNECTED:
        return "CONNECTED";
    case ConnectionState::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

Bridge::Bridge(BridgeOptions options) : Bridge(std::move(options), spawn_worker_process) {}

Bridge::Bridge(BridgeOptions options, ChannelFactory factory)
    : options_(validated(std::move(options))), encoding_(resolve_encoding(options_.encoding)),
      factory_(std::move(factory)),
      correlator_(core::CorrelatorOptions{options_.log_timing, options_.logs}),
      state_(ConnectionState::DISCONNECTED), generation_(0)
{
    if (!factory_) {
        throw std::invalid_argument("Bridge requires a channel factory");
    }

    // `logs` traces are DEBUG entries; the logger threshold is process-wide.
    if (options_.logs && !infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        infra::Logger::set_level(infra::LogLevel::DEBUG);
    }
}

Bridge::~Bridge()
{
    disconnect();
    dispatcher_.stop();
}

// ============================================================================
//  CONNECTION LIFECYCLE
// ============================================================================

/**
 * @brief Starts a worker session.
 *
 * Operational Logic:
 * 1. **Claim**: Move to `CONNECTING` and park the callback, unless a session is active.
 * 2. **Spawn**: Build the channel and open it; spawn failures are reported right here.
 * 3. **Listen**: From now on the worker's events arrive through the dispatcher and the
 *    first output line decides between `CONNECTED` and `FAILED`.
 */
void Bridge::connect(ConnectCallback callback)
{
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::CONNECTING && state_ != ConnectionState::CONNECTED) {
            session = std::make_shared<Session>();
            session->generation = ++generation_;
            session_ = session;
            state_ = ConnectionState::CONNECTING;
            pending_connect_ = std::move(callback);
        }
    }

    if (!session) {
        if (callback) {
            callback(core::BridgeError(core::ErrorKind::INVALID_STATE,
                                       "Bridge is already connecting or connected"),
                     "");
        }
        return;
    }

    const std::uint64_t generation = session->generation;
    trace("Bridge: Starting worker session " + std::to_string(generation));

    channel::ChannelEvents events;
    events.on_stdout = [this, generation](std::string bytes) {
        dispatcher_.post(
            [this, generation, bytes = std::move(bytes)] { on_stdout(generation, bytes); });
    };
    events.on_stderr = [this, generation](std::string bytes) {
        dispatcher_.post(
            [this, generation, bytes = std::move(bytes)] { on_stderr(generation, bytes); });
    };
    events.on_closed = [this, generation] {
        dispatcher_.post([this, generation] { on_closed(generation); });
    };

    std::shared_ptr<channel::Channel> channel;
    std::optional<core::BridgeError> spawn_failure;

    try {
        channel = factory_(options_);
        if (!channel) {
            throw core::BridgeError(core::ErrorKind::SPAWN_FAILURE,
                                    "Channel factory produced no channel");
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            session->channel = channel;
        }

        channel->open(std::move(events));
    } catch (const core::BridgeError& e) {
        spawn_failure = e;
    } catch (const std::exception& e) {
        spawn_failure = core::BridgeError(core::ErrorKind::SPAWN_FAILURE, e.what());
    }

    if (spawn_failure) {
        ConnectCallback pending;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (generation == generation_ && state_ == ConnectionState::CONNECTING) {
                state_ = ConnectionState::FAILED;
                pending = std::move(pending_connect_);
                pending_connect_ = nullptr;
            }
        }

        infra::Logger::log(infra::LogLevel::ERROR,
                           "Bridge: Worker spawn failed: " + std::string(spawn_failure->what()));
        if (pending) {
            pending(*spawn_failure, "");
        }
        return;
    }

    // A disconnect() that raced with open() could not stop a worker that did not exist yet.
    bool superseded;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        superseded = generation != generation_;
    }
    if (superseded) {
        channel->terminate();
    }
}

std::future<std::string> Bridge::connect_async()
{
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future = promise->get_future();

    connect([promise](std::optional<core::BridgeError> error, std::string banner) {
        if (error) {
            promise->set_exception(std::make_exception_ptr(*error));
        } else {
            promise->set_value(std::move(banner));
        }
    });
    return future;
}

void Bridge::disconnect()
{
    std::shared_ptr<Session> session;
    ConnectCallback pending;
    ConnectionState previous;
    std::vector<core::PendingRequest> in_flight;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        if (previous == ConnectionState::CONNECTING || previous == ConnectionState::CONNECTED) {
            state_ = ConnectionState::DISCONNECTED;
        }
        session = std::move(session_);
        session_.reset();
        ++generation_;
        pending = std::move(pending_connect_);
        pending_connect_ = nullptr;
        // Only this session's queries; a connect() racing with terminate() starts clean.
        in_flight = correlator_.drain();
    }

    if (session && session->channel) {
        session->channel->terminate();
    }

    if (previous == ConnectionState::CONNECTING || previous == ConnectionState::CONNECTED) {
        trace("Bridge: Disconnected (was " + std::string(to_string(previous)) + ")");
    }

    if (pending) {
        pending(core::BridgeError(core::ErrorKind::DISCONNECTED,
                                  "Disconnected before the worker completed the handshake"),
                "");
    }

    correlator_.fail(std::move(in_flight),
                     core::BridgeError(core::ErrorKind::DISCONNECTED,
                                       "Connection closed before a response was received"));
}

bool Bridge::is_connected() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == ConnectionState::CONNECTED;
}

ConnectionState Bridge::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::size_t Bridge::pending() const
{
    return correlator_.pending();
}

std::uint64_t Bridge::last_request_id() const
{
    return correlator_.last_id();
}

void Bridge::wait_idle()
{
    dispatcher_.wait_idle();
}

// ============================================================================
//  QUERY SUBMISSION
// ============================================================================

/**
 * @details
 * The state check and the pending-table insert share one critical section: a concurrent
 * `disconnect()` either runs first (the query is refused) or runs after the insert (and
 * then fails the query). The write itself happens outside the lock.
 */
std::uint64_t Bridge::query(const std::string& sql, core::QueryCallback callback)
{
    if (sql.find('\0') != std::string::npos) {
        if (callback) {
            callback(core::BridgeError(core::ErrorKind::QUERY_FAILURE,
                                       "SQL text contains a NUL character"),
                     protocol::Document());
        }
        return 0;
    }

    core::Submission submission;
    std::shared_ptr<channel::Channel> channel;
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::CONNECTED && session_ && session_->channel) {
            submission = correlator_.submit(sql, std::move(callback));
            channel = session_->channel;
            accepted = true;
        }
    }

    if (!accepted) {
        if (callback) {
            callback(core::BridgeError(core::ErrorKind::NOT_CONNECTED, "Database isn't connected."),
                     protocol::Document());
        }
        return 0;
    }

    if (!channel->write_line(submission.line)) {
        correlator_.abandon(submission.id,
                            core::BridgeError(core::ErrorKind::CHANNEL_FAULT,
                                              "Failed to write request " +
                                                  std::to_string(submission.id) +
                                                  " to the worker"));
        return submission.id;
    }

    trace("Bridge: SQL request written: " + submission.line);
    return submission.id;
}

std::future<protocol::Document> Bridge::query_async(const std::string& sql)
{
    auto promise = std::make_shared<std::promise<protocol::Document>>();
    std::future<protocol::Document> future = promise->get_future();

    query(sql, [promise](std::optional<core::BridgeError> error, protocol::Document result) {
        if (error) {
            promise->set_exception(std::make_exception_ptr(*error));
        } else {
            promise->set_value(std::move(result));
        }
    });
    return future;
}

// ============================================================================
//  WORKER EVENTS (dispatcher thread)
// ============================================================================

std::shared_ptr<Bridge::Session> Bridge::current_session(std::uint64_t generation) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (session_ && session_->generation == generation) {
        return session_;
    }
    return nullptr;
}

void Bridge::on_stdout(std::uint64_t generation, const std::string& bytes)
{
    std::shared_ptr<Session> session = current_session(generation);
    if (!session) {
        return;
    }

    std::string text = infra::String::to_utf8(bytes, encoding_);
    if (options_.logs && infra::Logger::enabled(infra::LogLevel::TRACE)) {
        infra::Logger::log(infra::LogLevel::TRACE, "Bridge: <- " + text);
    }

    for (const std::string& line : session->decoder.feed(text)) {
        on_line(session, line);
    }
}

void Bridge::on_line(const std::shared_ptr<Session>& session, const std::string& line)
{
    ConnectionState state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session->generation != generation_) {
            return;
        }
        state = state_;
    }

    if (state == ConnectionState::CONNECTING) {
        finish_handshake(session, line);
    } else if (state == ConnectionState::CONNECTED) {
        if (infra::String::trim(line).empty()) {
            return;
        }
        correlator_.dispatch_line(line);
    }
}

void Bridge::finish_handshake(const std::shared_ptr<Session>& session, const std::string& line)
{
    std::string token = infra::String::trim(line);
    if (token != kHandshakeToken) {
        fail_handshake(session, core::BridgeError(core::ErrorKind::HANDSHAKE_FAILURE,
                                                  "Error connecting " + token));
        return;
    }

    ConnectCallback pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session->generation != generation_ || state_ != ConnectionState::CONNECTING) {
            return;
        }
        state_ = ConnectionState::CONNECTED;
        pending = std::move(pending_connect_);
        pending_connect_ = nullptr;
    }

    trace("Bridge: Worker session " + std::to_string(session->generation) + " connected");
    if (pending) {
        pending(std::nullopt, token);
    }
}

/**
 * @details
 * Whichever handshake-phase event wins moves the state out of `CONNECTING`; every later
 * one finds the state changed and returns without touching the callback.
 */
void Bridge::fail_handshake(const std::shared_ptr<Session>& session,
                            const core::BridgeError& error)
{
    ConnectCallback pending;
    std::shared_ptr<channel::Channel> channel;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session->generation != generation_ || state_ != ConnectionState::CONNECTING) {
            return;
        }
        state_ = ConnectionState::FAILED;
        pending = std::move(pending_connect_);
        pending_connect_ = nullptr;
        channel = session->channel;
    }

    infra::Logger::log(infra::LogLevel::ERROR,
                       "Bridge: Handshake failed: " + std::string(error.what()));

    if (channel) {
        channel->terminate();
    }
    if (pending) {
        pending(error, "");
    }
}

void Bridge::on_stderr(std::uint64_t generation, const std::string& bytes)
{
    std::shared_ptr<Session> session = current_session(generation);
    if (!session) {
        return;
    }

    std::string text = infra::String::trim(infra::String::to_utf8(bytes, encoding_));
    if (text.empty()) {
        text = "Worker wrote to its error stream";
    }

    ConnectionState state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session->generation != generation_) {
            return;
        }
        state = state_;
    }

    if (state == ConnectionState::CONNECTING) {
        fail_handshake(session, core::BridgeError(core::ErrorKind::HANDSHAKE_FAILURE, text));
    } else if (state == ConnectionState::CONNECTED) {
        on_channel_fault(session, text);
    } else {
        trace("Bridge: Ignoring worker stderr in state " + std::string(to_string(state)) +
              ": " + text);
    }
}

/**
 * @brief Fails every in-flight query after the worker wrote to stderr.
 *
 * The connection stays up unless `disconnect_on_channel_fault` is set; in that case the
 * session is torn down before the broadcast so that no query submitted from a failing
 * continuation can be stranded. The in-flight queries are detached in the same critical
 * section that checks the session, so a newer session never loses its own.
 */
void Bridge::on_channel_fault(const std::shared_ptr<Session>& session, const std::string& text)
{
    infra::Logger::log(infra::LogLevel::ERROR, "Bridge: Worker reported an error: " + text);

    std::shared_ptr<channel::Channel> channel;
    std::vector<core::PendingRequest> in_flight;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session->generation != generation_ || state_ != ConnectionState::CONNECTED) {
            return;
        }
        if (options_.disconnect_on_channel_fault) {
            state_ = ConnectionState::DISCONNECTED;
            channel = session->channel;
            session_.reset();
            ++generation_;
        }
        in_flight = correlator_.drain();
    }

    if (channel) {
        channel->terminate();
    }
    correlator_.fail(std::move(in_flight),
                     core::BridgeError(core::ErrorKind::CHANNEL_FAULT, text));
}

void Bridge::on_closed(std::uint64_t generation)
{
    std::shared_ptr<Session> session = current_session(generation);
    if (!session) {
        return;
    }

    // A last line without a terminator still counts (e.g. a bare "boom" before exit).
    std::string tail;
    if (session->decoder.finish(tail)) {
        on_line(session, tail);
    }

    on_worker_exit(session);
}

void Bridge::on_worker_exit(const std::shared_ptr<Session>& session)
{
    ConnectionState previous;
    std::shared_ptr<channel::Channel> channel;
    std::vector<core::PendingRequest> in_flight;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session->generation != generation_) {
            return;
        }
        previous = state_;
        if (previous == ConnectionState::CONNECTED) {
            state_ = ConnectionState::DISCONNECTED;
            channel = session->channel;
            session_.reset();
            ++generation_;
            in_flight = correlator_.drain();
        }
    }

    if (previous == ConnectionState::CONNECTING) {
        fail_handshake(session,
                       core::BridgeError(core::ErrorKind::WORKER_EXITED,
                                         "Worker exited before completing the handshake"));
        return;
    }
    if (previous != ConnectionState::CONNECTED) {
        return;
    }

    infra::Logger::log(infra::LogLevel::ERROR, "Bridge: Worker process exited");

    // Reaps the child.
    if (channel) {
        channel->terminate();
    }
    correlator_.fail(std::move(in_flight),
                     core::BridgeError(core::ErrorKind::WORKER_EXITED, "Worker process exited"));
}

void Bridge::trace(const std::string& message) const
{
    if (options_.logs) {
        infra::Logger::log(infra::LogLevel::DEBUG, message);
    }
}

} // namespace sqlbridge::client
