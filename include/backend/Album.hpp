#pragma once

#include "backend/CoverResolver.hpp"
#include "backend/Image.hpp"
#include "model/Definition.hpp"
#include "util/LazyCell.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace maestro::backend {

class DiscInContext;
class TrackInContext;

/**
 * An album definition bound to its folder on disk.
 *
 * Album owns the raw definition; disc and track views hold references into it,
 * so an Album must outlive every view it hands out. It is neither copyable nor
 * movable.
 *
 * Folder layout:
 *   <path>/extras/album.yaml
 *   <path>/extras/images/              source covers
 *   <path>/extras/.cache/covers/       transformed covers
 *   <path>/extras/.cache/covers-vw/    car-safe covers
 */
class Album {
public:
    // resolver may be null, in which case no covers are resolved
    Album(model::Album definition, std::filesystem::path path,
          std::shared_ptr<const CoverResolver> resolver = nullptr);

    Album(const Album&) = delete;
    Album& operator=(const Album&) = delete;
    Album(Album&&) = delete;
    Album& operator=(Album&&) = delete;

    // Reads <path>/extras/album.yaml. Throws DefinitionError.
    static std::unique_ptr<Album> load(const std::filesystem::path& path,
                                       std::shared_ptr<const CoverResolver> resolver = nullptr);

    const model::Album& definition() const { return definition_; }

    const model::Text& title() const { return definition_.title; }
    const std::vector<model::Text>& artists() const { return definition_.artists; }
    model::Text artist() const;
    std::optional<int> year() const { return definition_.year; }
    const model::Text* genre() const;

    size_t num_discs() const { return definition_.discs.size(); }
    size_t num_tracks() const;

    // 1-based; nullptr when out of range
    std::shared_ptr<const DiscInContext> disc(size_t disc_number) const;
    std::vector<std::shared_ptr<const DiscInContext>> discs() const;
    // All tracks in order; tracks on the same disc share one disc view
    std::vector<TrackInContext> tracks() const;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path extras_path() const;
    std::filesystem::path definition_path() const;
    std::filesystem::path image_path() const;
    std::filesystem::path cache_path() const;
    std::filesystem::path covers_path() const;
    std::filesystem::path covers_vw_path() const;

    // nullptr when there is no cover. Throws CoverError.
    const Image* cover() const;
    const Image* cover_vw() const;

    // Looks up <name> for this album without memoizing. Throws CoverError.
    std::optional<Image> resolve_cover(const std::string& name, CoverVariant variant) const;

private:
    model::Album definition_;
    std::filesystem::path path_;
    std::shared_ptr<const CoverResolver> resolver_;

    util::LazyCell<std::optional<Image>> cover_;
    util::LazyCell<std::optional<Image>> cover_vw_;
};

}  // namespace maestro::backend
