#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "serial.h"
#include "../protocol/frame.h"

namespace hacklet::test {

    // Replays canned replies. Each write releases the next batch of reply chunks.
    struct scripted_transport : serial::transport {

        std::deque<std::vector<std::vector<std::byte>>> replies;
        std::deque<std::vector<std::byte>> pending;
        std::vector<std::vector<std::byte>> writes;
        std::optional<std::string> write_error;
        std::optional<std::string> read_error;
        bool closed = false;

        void reply(const std::vector<protocol::frame> &frames) {
            std::vector<std::vector<std::byte>> batch;
            for (const auto &message : frames) batch.push_back(protocol::encode(message));
            replies.push_back(batch);
        }

        std::optional<std::string> write(const std::vector<std::byte> &data) override {
            if (write_error) return write_error;
            writes.push_back(data);
            if (!replies.empty()) {
                for (auto &chunk : replies.front()) pending.push_back(chunk);
                replies.pop_front();
            }
            return std::nullopt;
        }

        tl::expected<std::vector<std::byte>, std::string> read() override {
            if (read_error) return tl::make_unexpected(*read_error);
            if (pending.empty()) return std::vector<std::byte>();
            auto chunk = pending.front();
            pending.pop_front();
            return chunk;
        }

        void close() override {
            closed = true;
        }

        std::vector<protocol::frame> written_frames() const {
            std::vector<protocol::frame> frames;
            for (const auto &data : writes) {
                if (const auto message = protocol::decode(data); message.has_value()) frames.push_back(*message);
            }
            return frames;
        }
    };

    inline serial::settings fast_settings() {
        serial::settings config;
        config.poll_interval = std::chrono::milliseconds(1);
        config.read_timeout = std::chrono::milliseconds(50);
        return config;
    }

    inline std::vector<std::byte> bytes(const std::vector<int> &values) {
        std::vector<std::byte> buffer;
        for (const auto value : values) buffer.push_back(static_cast<std::byte>(value));
        return buffer;
    }
}
