#include "backend/AlbumGenerator.hpp"
#include "backend/Id3Tagger.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <map>
#include <utility>
#include <vector>

namespace maestro::backend {

namespace {

struct ScannedTrack {
    std::filesystem::path path;
    FileTags tags;
};

// Most frequent value; ties go to the value seen first
template <typename T, typename Get>
std::optional<T> most_common(const std::vector<ScannedTrack>& tracks, Get get) {
    std::vector<std::pair<T, int>> counts;
    for (const auto& track : tracks) {
        std::optional<T> value = get(track.tags);
        if (!value) continue;
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& entry) { return entry.first == *value; });
        if (it == counts.end()) {
            counts.emplace_back(*value, 1);
        } else {
            ++it->second;
        }
    }

    std::optional<T> best;
    int best_count = 0;
    for (const auto& [value, count] : counts) {
        if (count > best_count) {
            best = value;
            best_count = count;
        }
    }
    return best;
}

}  // namespace

model::Album AlbumGenerator::generate(const std::filesystem::path& root) {
    std::vector<ScannedTrack> scanned;
    for (const auto& path : util::DirectoryScanner::scan_mp3_files(root)) {
        ScannedTrack track{path, {}};
        try {
            track.tags = Id3Tagger::read(path);
        } catch (const TagError& e) {
            util::Logger::warn("AlbumGenerator: " + std::string(e.what()) + ", using filename only");
        }
        scanned.push_back(std::move(track));
    }

    model::Album album;
    album.title = model::Text(most_common<std::string>(scanned, [](const FileTags& t) { return t.album; })
                                  .value_or(""));

    auto artist = most_common<std::string>(scanned, [](const FileTags& t) { return t.album_artist; });
    if (!artist) {
        artist = most_common<std::string>(scanned, [](const FileTags& t) { return t.artist; });
    }
    album.artists.push_back(model::Text(artist.value_or("")));
    album.year = most_common<int>(scanned, [](const FileTags& t) { return t.year; });
    if (auto genre = most_common<std::string>(scanned, [](const FileTags& t) { return t.genre; })) {
        album.genre = model::Text(*genre);
    }

    std::filesystem::path base = root;
    if (!base.has_filename() && base.has_parent_path()) {
        base = base.parent_path();  // "dir/" -> "dir"
    }

    std::map<size_t, std::vector<model::Track>> discs;
    for (const auto& entry : scanned) {
        model::Track track;
        track.title = model::Text(entry.tags.title.value_or(entry.path.stem().string()));
        if (entry.tags.artist) {
            track.artists = std::vector<model::Text>{model::Text(*entry.tags.artist)};
        }
        track.year = entry.tags.year;
        if (entry.tags.genre) {
            track.genre = model::Text(*entry.tags.genre);
        }
        track.filename = entry.path.lexically_relative(base).generic_string();

        discs[entry.tags.disc_number.value_or(1)].push_back(std::move(track));
    }

    for (auto& disc : discs) {
        album.discs.push_back(model::Disc{std::move(disc.second)});
    }

    util::Logger::info("AlbumGenerator: " + std::to_string(scanned.size()) + " tracks on " +
                       std::to_string(album.discs.size()) + " discs under " + root.string());
    return album;
}

}  // namespace maestro::backend
