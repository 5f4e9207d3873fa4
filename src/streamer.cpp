/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/streamer.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::error;

namespace orbitcast {

FrameStreamer::FrameStreamer(asio::io_context &io, std::chrono::milliseconds delay)
    : io(io), timer(io), delay(delay) {}

StreamerStatus FrameStreamer::status() const {
    return _status;
}

std::size_t FrameStreamer::framesSent() const {
    return frames;
}

void FrameStreamer::start(FrameSource source, FrameSink sink, std::function<void()> onFinished) {
    if (_status == StreamerStatus::RUNNING) {
        return;
    }
    this->source = std::move(source);
    this->sink = std::move(sink);
    this->onFinished = std::move(onFinished);
    frames = 0;
    _status = StreamerStatus::RUNNING;

    debug("Starting stream with {} ms between frames", delay.count());
    asio::post(io, [this] { tick(); });
}

void FrameStreamer::stop() {
    if (_status != StreamerStatus::RUNNING) {
        return;
    }
    timer.cancel();
    finish();
}

void FrameStreamer::finish() {
    _status = StreamerStatus::STOPPED;
    debug("Stream finished after {} frames", frames);
    if (onFinished) {
        auto callback = std::move(onFinished);
        onFinished = nullptr;
        callback();
    }
}

void FrameStreamer::tick() {
    if (_status != StreamerStatus::RUNNING) {
        return;
    }

    std::optional<Frame> frame;
    try {
        frame = source();
    } catch (const std::exception &e) {
        error("Failed to produce frame: {}", e.what());
        finish();
        return;
    }

    if (!frame) {
        finish();
        return;
    }

    if (!sink(*frame)) {
        info("Consumer closed the stream");
        finish();
        return;
    }
    ++frames;

    scheduleNext();
}

void FrameStreamer::scheduleNext() {
    timer.expires_after(delay);
    timer.async_wait([this](const asio::error_code &ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            error("Frame timer error: {}", ec.message());
            finish();
            return;
        }
        tick();
    });
}

ControlReader::ControlReader(asio::io_context &io, int fd, LineHandler onLine)
    : input(io, fd), onLine(std::move(onLine)) {}

void ControlReader::start() {
    readNextLine();
}

void ControlReader::stop() {
    asio::error_code ec;
    input.cancel(ec);
    if (ec) {
        debug("Error cancelling control reader: {}", ec.message());
    }
}

void ControlReader::readNextLine() {
    asio::async_read_until(input, readBuffer, '\n',
        [this](const asio::error_code &ec, std::size_t bytes_transferred) {
            if (ec == asio::error::eof) {
                if (readBuffer.size() > 0) {
                    auto bufs = readBuffer.data();
                    std::string line(asio::buffers_begin(bufs), asio::buffers_end(bufs));
                    readBuffer.consume(readBuffer.size());
                    deliver(std::move(line));
                }
                debug("Control input closed");
                return;
            }
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                error("Control input read error: {}", ec.message());
                return;
            }

            // Strip the terminator
            auto bufs = readBuffer.data();
            std::string line(asio::buffers_begin(bufs), asio::buffers_begin(bufs) + bytes_transferred - 1);
            readBuffer.consume(bytes_transferred);
            deliver(std::move(line));

            readNextLine();
        });
}

void ControlReader::deliver(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (!line.empty()) {
        debug("Received control message: {}", line);
        onLine(line);
    }
}

}
