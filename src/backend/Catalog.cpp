#include "backend/Catalog.hpp"
#include "backend/MetadataParser.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/PathHasher.hpp"
#include "util/Platform.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace cadence::backend {

Catalog::Catalog() {
    set_tracks({});
}

std::vector<model::Track> Catalog::scan(const std::filesystem::path& root,
                                        const ProgressCallback& progress) {
    auto found = util::DirectoryScanner::scan_directory(root);
    const auto& files = found.audio_files;
    const size_t total = files.size();

    if (total == 0) {
        util::Logger::warn("Catalog: No audio files under " + root.string());
        return {placeholder()};
    }

    const size_t num_threads = std::clamp<size_t>(std::thread::hardware_concurrency(), 1, total);
    util::Logger::info("Catalog: Reading tags of " + std::to_string(total) + " files with " +
                       std::to_string(num_threads) + " threads");

    std::vector<model::Track> results(total);
    std::atomic<size_t> next{0};
    std::atomic<size_t> completed{0};

    {
        std::vector<std::jthread> workers;
        workers.reserve(num_threads);
        for (size_t t = 0; t < num_threads; ++t) {
            workers.emplace_back([&] {
                while (true) {
                    size_t idx = next.fetch_add(1);
                    if (idx >= total) break;
                    results[idx] = MetadataParser::parse_file(files[idx]);
                    completed.fetch_add(1);
                }
            });
        }

        // Progress is reported from the calling thread only
        if (progress) {
            while (completed.load() < total) {
                progress(completed.load(), total);
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
    }

    if (progress) {
        progress(total, total);
    }

    size_t failed = std::count_if(results.begin(), results.end(),
                                  [](const model::Track& t) { return !t.error.empty(); });
    if (failed > 0) {
        util::Logger::warn("Catalog: " + std::to_string(failed) + " files had unreadable tags");
    }
    return results;
}

std::filesystem::path Catalog::resolve_scan_root(const std::string& configured) {
    std::error_code ec;
    if (!configured.empty()) {
        auto dir = util::Platform::expand_home(configured);
        if (std::filesystem::is_directory(dir, ec)) {
            return dir;
        }
        util::Logger::warn("Catalog: Configured music directory not found: " + dir.string());
    }

    auto music = util::Platform::get_music_directory();
    if (std::filesystem::is_directory(music, ec)) {
        return music;
    }

    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return ".";
    }
    return cwd;
}

model::Track Catalog::placeholder() {
    model::Track track;
    track.id = util::PathHasher::track_id("");
    track.title = "No songs in \"Music\" and current directory!";
    track.artist = "No Title";
    track.album = "None";
    MetadataParser::fill_search_keys(track);
    return track;
}

void Catalog::load(const std::filesystem::path& root, const ProgressCallback& progress) {
    set_tracks(scan(root, progress));
}

void Catalog::set_tracks(std::vector<model::Track> tracks) {
    if (tracks.empty()) {
        tracks.push_back(placeholder());
    }

    tracks_ = std::move(tracks);
    index_.clear();
    index_.reserve(tracks_.size());
    playing_.reset();
    ++revision_;

    for (size_t i = 0; i < tracks_.size(); ++i) {
        tracks_[i].is_playing = false;
        // First occurrence wins if a path was listed twice
        index_.emplace(tracks_[i].id, i);
    }
}

bool Catalog::is_placeholder() const {
    return tracks_.size() == 1 && tracks_.front().path.empty();
}

const model::Track* Catalog::find(const model::TrackId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &tracks_[it->second];
}

std::optional<size_t> Catalog::index_of(const model::TrackId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<model::TrackId> Catalog::ids() const {
    std::vector<model::TrackId> out;
    out.reserve(tracks_.size());
    for (const auto& t : tracks_) {
        out.push_back(t.id);
    }
    return out;
}

void Catalog::set_playing(const model::TrackId& id) {
    clear_playing();
    auto idx = index_of(id);
    if (!idx) return;
    tracks_[*idx].is_playing = true;
    playing_ = idx;
}

void Catalog::clear_playing() {
    if (playing_) {
        tracks_[*playing_].is_playing = false;
        playing_.reset();
    }
}

std::optional<model::TrackId> Catalog::playing() const {
    if (!playing_) return std::nullopt;
    return tracks_[*playing_].id;
}

}  // namespace cadence::backend
