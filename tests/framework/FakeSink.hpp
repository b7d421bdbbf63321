#pragma once

#include "audio/AudioSink.hpp"
#include <set>
#include <string>
#include <vector>

namespace cadence::test {

/// In-memory sink that records every command.
class FakeSink : public audio::AudioSink {
public:
    bool load(const std::string& path) override {
        commands.push_back("load " + path);
        if (unloadable.count(path)) {
            loaded.clear();
            return false;
        }
        loaded = path;
        empty = false;
        return true;
    }
    void clear() override {
        commands.push_back("clear");
        loaded.clear();
        empty = true;
    }
    void play() override {
        commands.push_back("play");
        paused = false;
    }
    void pause() override {
        commands.push_back("pause");
        paused = true;
    }
    bool is_paused() const override { return paused; }

    std::chrono::milliseconds position() const override { return seek_position; }
    bool try_seek(std::chrono::milliseconds position) override {
        commands.push_back("seek " + std::to_string(position.count()));
        if (!seekable) return false;
        seek_position = position;
        return true;
    }

    float volume() const override { return level; }
    void set_volume(float volume) override {
        commands.push_back("volume");
        level = volume;
    }

    bool is_empty() const override { return empty; }

    size_t count(const std::string& command) const {
        size_t n = 0;
        for (const auto& c : commands) {
            if (c == command) ++n;
        }
        return n;
    }

    std::vector<std::string> commands;
    std::set<std::string> unloadable;
    std::string loaded;
    std::chrono::milliseconds seek_position{0};
    bool paused = false;
    bool seekable = true;
    bool empty = true;
    float level = 1.0f;
};

}  // namespace cadence::test
