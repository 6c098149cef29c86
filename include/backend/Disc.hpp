#pragma once

#include "backend/Album.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace maestro::backend {

// A disc positioned within its album. Always owned by a shared_ptr so that
// track views can keep their disc alive.
class DiscInContext : public std::enable_shared_from_this<DiscInContext> {
public:
    DiscInContext(const Album& album, const model::Disc& disc, size_t disc_number);

    DiscInContext(const DiscInContext&) = delete;
    DiscInContext& operator=(const DiscInContext&) = delete;

    const Album& album() const { return album_; }
    const model::Disc& definition() const { return disc_; }

    size_t disc_number() const { return disc_number_; }
    size_t num_tracks() const { return disc_.tracks.size(); }
    bool is_only_disc() const { return album_.num_discs() == 1; }

    // 1-based; nullopt when out of range
    std::optional<TrackInContext> track(size_t track_number) const;
    std::vector<TrackInContext> tracks() const;

    // "Disc N", or nullopt on a single-disc album
    std::optional<std::string> filename() const;
    std::filesystem::path path() const;

    // Own cover, else the album's
    const Image* cover() const;
    const Image* cover_vw() const;

private:
    const Image* own_cover(const util::LazyCell<std::optional<Image>>& cell, CoverVariant variant) const;

    const Album& album_;
    const model::Disc& disc_;
    size_t disc_number_;

    util::LazyCell<std::optional<Image>> cover_;
    util::LazyCell<std::optional<Image>> cover_vw_;
};

}  // namespace maestro::backend
