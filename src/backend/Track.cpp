#include "backend/Track.hpp"
#include "backend/PathNamer.hpp"

namespace maestro::backend {

TrackInContext::TrackInContext(std::shared_ptr<const DiscInContext> disc, const model::Track& track,
                               size_t track_number)
    : disc_(std::move(disc)), track_(track), track_number_(track_number) {}

const std::vector<model::Text>& TrackInContext::artists() const {
    return track_.artists ? *track_.artists : album().artists();
}

model::Text TrackInContext::artist() const {
    return model::comma_separated(artists());
}

const std::vector<model::Text>* TrackInContext::album_artists() const {
    const auto& album_artists = album().artists();
    if (album_artists != artists()) {
        return &album_artists;
    }
    return nullptr;
}

std::optional<model::Text> TrackInContext::album_artist() const {
    if (const auto* artists = album_artists()) {
        return model::comma_separated(*artists);
    }
    return std::nullopt;
}

std::optional<int> TrackInContext::year() const {
    return track_.year ? track_.year : album().year();
}

const model::Text* TrackInContext::genre() const {
    return track_.genre ? &*track_.genre : album().genre();
}

const model::Text* TrackInContext::comment() const {
    return track_.comment ? &*track_.comment : nullptr;
}

const model::Text* TrackInContext::lyrics() const {
    return track_.lyrics ? &*track_.lyrics : nullptr;
}

std::string TrackInContext::canonical_filename() const {
    return track_filename(track_number_, disc_->num_tracks(), album().num_discs(), title());
}

std::string TrackInContext::filename() const {
    return track_.filename ? *track_.filename : canonical_filename();
}

std::string TrackInContext::filename_vw() const {
    return track_filename_vw(disc_->disc_number(), album().num_discs(),
                             track_number_, disc_->num_tracks(), title());
}

std::filesystem::path TrackInContext::canonical_path() const {
    return disc_->path() / canonical_filename();
}

std::filesystem::path TrackInContext::path() const {
    if (track_.filename) {
        return album().path() / *track_.filename;
    }
    return canonical_path();
}

const Image* TrackInContext::own_cover(const util::LazyCell<std::optional<Image>>& cell,
                                       CoverVariant variant) const {
    const auto& image = cell.get_or_init([this, variant] {
        return album().resolve_cover(title().file_safe(), variant);
    });
    return image ? &*image : nullptr;
}

const Image* TrackInContext::cover() const {
    if (const Image* own = own_cover(cover_, CoverVariant::Standard)) {
        return own;
    }
    return disc_->cover();
}

const Image* TrackInContext::cover_vw() const {
    if (const Image* own = own_cover(cover_vw_, CoverVariant::CarSafe)) {
        return own;
    }
    return disc_->cover_vw();
}

TagData TrackInContext::tag_data() const {
    TagData data;
    data.title = title().value();
    if (!artists().empty()) {
        data.artist = artist().value();
    }
    if (auto album_artist_text = album_artist()) {
        data.album_artist = album_artist_text->value();
    }
    data.track_number = track_number_;
    if (!disc_->is_only_disc()) {
        data.disc_number = disc_->disc_number();
    }
    data.album = album().title().value();
    data.year = year();
    if (const auto* g = genre()) data.genre = g->value();
    if (const auto* c = comment()) data.comment = c->value();
    if (const auto* l = lyrics()) data.lyrics = l->value();
    if (const Image* image = cover()) {
        data.cover = *image;
    }
    return data;
}

TagData TrackInContext::tag_data_vw() const {
    TagData data;
    data.title = title().ascii();
    if (!artists().empty()) {
        data.artist = artist().ascii();
    }
    if (auto album_artist_text = album_artist()) {
        data.album_artist = album_artist_text->ascii();
    }
    data.track_number = track_number_;
    if (!disc_->is_only_disc()) {
        data.disc_number = disc_->disc_number();
    }
    data.album = album().title().ascii();
    if (const Image* image = cover_vw()) {
        data.cover = *image;
    }
    return data;
}

}  // namespace maestro::backend
