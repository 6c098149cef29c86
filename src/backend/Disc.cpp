#include "backend/Disc.hpp"
#include "backend/PathNamer.hpp"
#include "backend/Track.hpp"

namespace maestro::backend {

DiscInContext::DiscInContext(const Album& album, const model::Disc& disc, size_t disc_number)
    : album_(album), disc_(disc), disc_number_(disc_number) {}

std::optional<TrackInContext> DiscInContext::track(size_t track_number) const {
    if (track_number == 0 || track_number > disc_.tracks.size()) {
        return std::nullopt;
    }
    return std::optional<TrackInContext>(std::in_place, shared_from_this(),
                                         disc_.tracks[track_number - 1], track_number);
}

std::vector<TrackInContext> DiscInContext::tracks() const {
    std::vector<TrackInContext> result;
    result.reserve(disc_.tracks.size());
    auto self = shared_from_this();
    for (size_t i = 0; i < disc_.tracks.size(); ++i) {
        result.emplace_back(self, disc_.tracks[i], i + 1);
    }
    return result;
}

std::optional<std::string> DiscInContext::filename() const {
    return disc_folder_name(disc_number_, album_.num_discs());
}

std::filesystem::path DiscInContext::path() const {
    if (auto name = filename()) {
        return album_.path() / *name;
    }
    return album_.path();
}

const Image* DiscInContext::own_cover(const util::LazyCell<std::optional<Image>>& cell,
                                      CoverVariant variant) const {
    const auto& image = cell.get_or_init([this, variant]() -> std::optional<Image> {
        auto name = filename();
        if (!name) {
            return std::nullopt;
        }
        return album_.resolve_cover(*name, variant);
    });
    return image ? &*image : nullptr;
}

const Image* DiscInContext::cover() const {
    if (const Image* own = own_cover(cover_, CoverVariant::Standard)) {
        return own;
    }
    return album_.cover();
}

const Image* DiscInContext::cover_vw() const {
    if (const Image* own = own_cover(cover_vw_, CoverVariant::CarSafe)) {
        return own;
    }
    return album_.cover_vw();
}

}  // namespace maestro::backend
