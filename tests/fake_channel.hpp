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
 * @file fake_channel.hpp
 * @brief In-memory worker channel for deterministic bridge tests.
 *
 * @details
 * `FakeWire` is the test's handle on every channel a bridge creates through
 * `FakeWire::factory()`. The test plays the worker: it injects stdout/stderr bytes and
 * end-of-stream into any session (including ones the bridge has already stopped) and
 * inspects the lines the bridge wrote.
 */

#pragma once

#include "sqlbridge/channel/channel.hpp"
#include "sqlbridge/client/bridge.hpp"
#include "sqlbridge/core/error.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlbridge::test {

class FakeWire : public std::enable_shared_from_this<FakeWire> {
  public:
    /// When set, the next `open` throws `SPAWN_FAILURE`.
    bool fail_open = false;

    /// When set, `write_line` reports failure.
    bool fail_write = false;

    /// Runs once, inside the next `terminate` that stops a live channel, with no lock held.
    std::function<void()> on_terminate;

    client::Bridge::ChannelFactory factory();

    /// @brief Delivers bytes on the worker's stdout. `session` -1 means the latest.
    void say(const std::string& bytes, int session = -1)
    {
        channel::ChannelEvents events = events_of(session);
        if (events.on_stdout) {
            events.on_stdout(bytes);
        }
    }

    /// @brief Delivers bytes on the worker's stderr.
    void complain(const std::string& bytes, int session = -1)
    {
        channel::ChannelEvents events = events_of(session);
        if (events.on_stderr) {
            events.on_stderr(bytes);
        }
    }

    /// @brief Signals end of the worker's stdout.
    void hang_up(int session = -1)
    {
        channel::ChannelEvents events = events_of(session);
        if (events.on_closed) {
            events.on_closed();
        }
    }

    std::vector<std::string> written() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    int sessions() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(sessions_.size());
    }

    int terminations() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminations_;
    }

  private:
    friend class FakeChannel;

    channel::ChannelEvents events_of(int session) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.empty()) {
            return channel::ChannelEvents();
        }
        if (session < 0) {
            return sessions_.back();
        }
        return sessions_.at(static_cast<std::size_t>(session));
    }

    mutable std::mutex mutex_;
    std::vector<channel::ChannelEvents> sessions_;
    std::vector<std::string> written_;
    int terminations_ = 0;
};

/**
 * @class FakeChannel
 * @brief One session of a `FakeWire`.
 */
class FakeChannel : public channel::Channel {
  public:
    explicit FakeChannel(std::shared_ptr<FakeWire> wire) : wire_(std::move(wire)) {}

    void open(channel::ChannelEvents events) override
    {
        std::lock_guard<std::mutex> lock(wire_->mutex_);
        if (wire_->fail_open) {
            throw core::BridgeError(core::ErrorKind::SPAWN_FAILURE,
                                    "Failed to start worker 'java': No such file or directory");
        }
        wire_->sessions_.push_back(std::move(events));
        alive_ = true;
    }

    bool write_line(const std::string& line) override
    {
        std::lock_guard<std::mutex> lock(wire_->mutex_);
        if (!alive_ || wire_->fail_write) {
            return false;
        }
        wire_->written_.push_back(line);
        return true;
    }

    void terminate() override
    {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(wire_->mutex_);
            if (alive_) {
                alive_ = false;
                wire_->terminations_++;
                hook = std::move(wire_->on_terminate);
                wire_->on_terminate = nullptr;
            }
        }
        if (hook) {
            hook();
        }
    }

    bool is_alive() const override
    {
        std::lock_guard<std::mutex> lock(wire_->mutex_);
        return alive_;
    }

  private:
    std::shared_ptr<FakeWire> wire_;
    bool alive_ = false;
};

inline client::Bridge::ChannelFactory FakeWire::factory()
{
    std::shared_ptr<FakeWire> self = shared_from_this();
    return [self](const client::BridgeOptions&) -> std::unique_ptr<channel::Channel> {
        return std::make_unique<FakeChannel>(self);
    };
}

} // namespace sqlbridge::test
