#include "backend/Album.hpp"
#include "backend/DefinitionLoader.hpp"
#include "backend/Disc.hpp"
#include "backend/PathNamer.hpp"
#include "backend/Track.hpp"
#include "util/Logger.hpp"

namespace maestro::backend {

Album::Album(model::Album definition, std::filesystem::path path,
             std::shared_ptr<const CoverResolver> resolver)
    : definition_(std::move(definition)), path_(std::move(path)), resolver_(std::move(resolver)) {}

std::unique_ptr<Album> Album::load(const std::filesystem::path& path,
                                   std::shared_ptr<const CoverResolver> resolver) {
    auto definition_file = path / "extras" / "album.yaml";
    util::Logger::info("Album: Loading " + definition_file.string());
    auto definition = DefinitionLoader::load_file(definition_file);
    return std::make_unique<Album>(std::move(definition), path, std::move(resolver));
}

model::Text Album::artist() const {
    return model::comma_separated(definition_.artists);
}

const model::Text* Album::genre() const {
    return definition_.genre ? &*definition_.genre : nullptr;
}

size_t Album::num_tracks() const {
    size_t total = 0;
    for (const auto& disc : definition_.discs) {
        total += disc.tracks.size();
    }
    return total;
}

std::shared_ptr<const DiscInContext> Album::disc(size_t disc_number) const {
    if (disc_number == 0 || disc_number > definition_.discs.size()) {
        return nullptr;
    }
    return std::make_shared<DiscInContext>(*this, definition_.discs[disc_number - 1], disc_number);
}

std::vector<std::shared_ptr<const DiscInContext>> Album::discs() const {
    std::vector<std::shared_ptr<const DiscInContext>> result;
    result.reserve(definition_.discs.size());
    for (size_t i = 0; i < definition_.discs.size(); ++i) {
        result.push_back(std::make_shared<DiscInContext>(*this, definition_.discs[i], i + 1));
    }
    return result;
}

std::vector<TrackInContext> Album::tracks() const {
    std::vector<TrackInContext> result;
    result.reserve(num_tracks());
    for (const auto& disc : discs()) {
        for (auto& track : disc->tracks()) {
            result.push_back(std::move(track));
        }
    }
    return result;
}

std::filesystem::path Album::extras_path() const { return path_ / "extras"; }
std::filesystem::path Album::definition_path() const { return extras_path() / "album.yaml"; }
std::filesystem::path Album::image_path() const { return extras_path() / "images"; }
std::filesystem::path Album::cache_path() const { return extras_path() / ".cache"; }
std::filesystem::path Album::covers_path() const { return cache_path() / "covers"; }
std::filesystem::path Album::covers_vw_path() const { return cache_path() / "covers-vw"; }

std::optional<Image> Album::resolve_cover(const std::string& name, CoverVariant variant) const {
    if (!resolver_) {
        return std::nullopt;
    }
    const auto cache_dir = variant == CoverVariant::Standard ? covers_path() : covers_vw_path();
    return resolver_->load_with_cache(image_path(), cache_dir, name, variant);
}

const Image* Album::cover() const {
    const auto& image = cover_.get_or_init([this] {
        return resolve_cover(std::string(FRONT_COVER), CoverVariant::Standard);
    });
    return image ? &*image : nullptr;
}

const Image* Album::cover_vw() const {
    const auto& image = cover_vw_.get_or_init([this] {
        return resolve_cover(std::string(FRONT_COVER), CoverVariant::CarSafe);
    });
    return image ? &*image : nullptr;
}

}  // namespace maestro::backend
