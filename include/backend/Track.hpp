#pragma once

#include "backend/Disc.hpp"
#include "backend/TagData.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace maestro::backend {

/**
 * A track positioned within its disc and album.
 *
 * Attribute lookups fall back Track -> Album (artists, year, genre); comment
 * and lyrics are track-only. Covers fall back Track -> Disc -> Album, each
 * level memoizing its own lookup.
 */
class TrackInContext {
public:
    TrackInContext(std::shared_ptr<const DiscInContext> disc, const model::Track& track, size_t track_number);

    TrackInContext(TrackInContext&&) = default;

    const model::Track& definition() const { return track_; }
    const DiscInContext& disc() const { return *disc_; }
    const Album& album() const { return disc_->album(); }
    size_t track_number() const { return track_number_; }

    const model::Text& title() const { return track_.title; }
    const std::vector<model::Text>& artists() const;
    model::Text artist() const;
    // The album's artists when they differ from artists(), else nullptr
    const std::vector<model::Text>* album_artists() const;
    std::optional<model::Text> album_artist() const;
    std::optional<int> year() const;
    const model::Text* genre() const;
    const model::Text* comment() const;
    const model::Text* lyrics() const;

    std::string canonical_filename() const;
    // Explicit filename (relative to the album root) or the canonical one
    std::string filename() const;
    std::string filename_vw() const;
    std::filesystem::path canonical_path() const;
    std::filesystem::path path() const;

    const Image* cover() const;
    const Image* cover_vw() const;

    // Throw CoverError if a cover can't be resolved
    TagData tag_data() const;
    TagData tag_data_vw() const;

private:
    const Image* own_cover(const util::LazyCell<std::optional<Image>>& cell, CoverVariant variant) const;

    std::shared_ptr<const DiscInContext> disc_;
    const model::Track& track_;
    size_t track_number_;

    util::LazyCell<std::optional<Image>> cover_;
    util::LazyCell<std::optional<Image>> cover_vw_;
};

}  // namespace maestro::backend
