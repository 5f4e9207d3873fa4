/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_STREAMER_HPP
#define __ORBITCAST_STREAMER_HPP

#include <orbitcast/delivery.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <asio.hpp>

namespace orbitcast {

// Produces the next frame, or nothing once the sequence is exhausted
using FrameSource = std::function<std::optional<Frame>()>;

// Delivers a frame, returns false once the consumer has gone away
using FrameSink = std::function<bool(const Frame &)>;

enum class StreamerStatus {
    IDLE,
    RUNNING,
    STOPPED
};

/**
 * Paces a frame sequence onto a sink with a fixed delay between frames.
 *
 * Runs on the thread calling io.run(). The first frame is sent as soon as
 * the loop runs, each following frame after the delay. Streaming stops when
 * the source is exhausted, the sink returns false, or stop() is called.
 */
class FrameStreamer {
public:
    FrameStreamer(asio::io_context &io, std::chrono::milliseconds delay);
    ~FrameStreamer() = default;

    /**
     * @param onFinished Called once when streaming stops for any reason
     */
    void start(FrameSource source, FrameSink sink, std::function<void()> onFinished = {});
    void stop();

    StreamerStatus status() const;
    std::size_t framesSent() const;

private:
    void tick();
    void scheduleNext();
    void finish();

    asio::io_context &io;
    asio::steady_timer timer;
    std::chrono::milliseconds delay;
    FrameSource source;
    FrameSink sink;
    std::function<void()> onFinished;
    StreamerStatus _status = StreamerStatus::IDLE;
    std::size_t frames = 0;
};

/**
 * Reads newline terminated control messages from a file descriptor.
 *
 * Takes ownership of the descriptor. A trailing carriage return is removed and
 * empty lines are skipped. Reading stops at end of file, and any unterminated
 * text left at that point is delivered as a final line.
 */
class ControlReader {
public:
    using LineHandler = std::function<void(const std::string &)>;

    ControlReader(asio::io_context &io, int fd, LineHandler onLine);
    ~ControlReader() = default;

    void start();
    void stop();

private:
    void readNextLine();
    void deliver(std::string line);

    asio::posix::stream_descriptor input;
    asio::streambuf readBuffer;
    LineHandler onLine;
};

}

#endif
