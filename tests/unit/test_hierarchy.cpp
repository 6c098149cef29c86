#include "../framework/SimpleTest.hpp"
#include "backend/Album.hpp"
#include "backend/Disc.hpp"
#include "backend/Track.hpp"

using namespace maestro::backend;
using maestro::model::Text;
namespace model = maestro::model;

namespace {

model::Track track(const std::string& title) {
    model::Track t;
    t.title = Text(title);
    return t;
}

model::Album single_disc_album() {
    model::Album album;
    album.title = Text("Álbum");
    album.artists = {Text("Main Artist")};
    album.year = 1999;
    album.genre = Text("Rock");

    model::Disc disc;
    disc.tracks.push_back(track("First"));

    model::Track guest = track("Second");
    guest.artists = std::vector<Text>{Text("Guest"), Text("Main Artist")};
    guest.year = 2001;
    guest.genre = Text("Jazz");
    guest.comment = Text("Recorded live");
    guest.lyrics = Text("la la la");
    disc.tracks.push_back(guest);

    model::Track moved = track("Third");
    moved.filename = "bonus/third take.mp3";
    disc.tracks.push_back(moved);

    album.discs.push_back(disc);
    return album;
}

model::Album double_disc_album() {
    model::Album album;
    album.title = Text("Double");
    album.artists = {Text("Band")};
    album.discs.resize(2);
    for (int i = 1; i <= 10; ++i) {
        album.discs[0].tracks.push_back(track("One " + std::to_string(i)));
    }
    album.discs[1].tracks.push_back(track("Two 1"));
    album.discs[1].tracks.push_back(track("Two 2"));
    return album;
}

}  // namespace

TEST_CASE(test_artists_are_inherited_from_album) {
    Album album(single_disc_album(), "/music/Album");
    auto first = album.disc(1)->track(1);
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->artist(), Text("Main Artist"));
    ASSERT_TRUE(first->album_artists() == nullptr);
    ASSERT_FALSE(first->album_artist().has_value());
}

TEST_CASE(test_artists_are_overridden_by_track) {
    Album album(single_disc_album(), "/music/Album");
    auto second = album.disc(1)->track(2);
    ASSERT_EQ(second->artist().value(), "Guest, Main Artist");
    ASSERT_TRUE(second->album_artists() != nullptr);
    ASSERT_EQ(second->album_artist()->value(), "Main Artist");
}

TEST_CASE(test_identical_track_artists_are_not_an_override) {
    auto definition = single_disc_album();
    definition.discs[0].tracks[0].artists = std::vector<Text>{Text("Main Artist")};
    Album album(std::move(definition), "/music/Album");
    ASSERT_TRUE(album.disc(1)->track(1)->album_artists() == nullptr);
}

TEST_CASE(test_year_and_genre_fall_back_to_album) {
    Album album(single_disc_album(), "/music/Album");
    auto first = album.disc(1)->track(1);
    auto second = album.disc(1)->track(2);

    ASSERT_EQ(*first->year(), 1999);
    ASSERT_EQ(first->genre()->value(), "Rock");
    ASSERT_EQ(*second->year(), 2001);
    ASSERT_EQ(second->genre()->value(), "Jazz");
}

TEST_CASE(test_comment_and_lyrics_are_track_only) {
    Album album(single_disc_album(), "/music/Album");
    ASSERT_TRUE(album.disc(1)->track(1)->comment() == nullptr);
    ASSERT_TRUE(album.disc(1)->track(1)->lyrics() == nullptr);
    ASSERT_EQ(album.disc(1)->track(2)->comment()->value(), "Recorded live");
    ASSERT_EQ(album.disc(1)->track(2)->lyrics()->value(), "la la la");
}

TEST_CASE(test_missing_attributes_are_absent) {
    model::Album definition;
    definition.title = Text("Bare");
    definition.discs.resize(1);
    definition.discs[0].tracks.push_back(track("Only"));
    Album album(std::move(definition), "/music/Bare");

    auto only = album.disc(1)->track(1);
    ASSERT_TRUE(only->artists().empty());
    ASSERT_FALSE(only->year().has_value());
    ASSERT_TRUE(only->genre() == nullptr);
}

TEST_CASE(test_out_of_range_lookups) {
    Album album(double_disc_album(), "/music/Double");
    ASSERT_TRUE(album.disc(0) == nullptr);
    ASSERT_TRUE(album.disc(3) == nullptr);
    ASSERT_FALSE(album.disc(2)->track(0).has_value());
    ASSERT_FALSE(album.disc(2)->track(3).has_value());
    ASSERT_TRUE(album.disc(2)->track(2).has_value());
}

TEST_CASE(test_numbering_and_counts) {
    Album album(double_disc_album(), "/music/Double");
    ASSERT_EQ(album.num_discs(), 2u);
    ASSERT_EQ(album.num_tracks(), 12u);

    auto tracks = album.tracks();
    ASSERT_EQ(tracks.size(), 12u);
    ASSERT_EQ(tracks[0].track_number(), 1u);
    ASSERT_EQ(tracks[0].disc().disc_number(), 1u);
    ASSERT_EQ(tracks[10].track_number(), 1u);
    ASSERT_EQ(tracks[10].disc().disc_number(), 2u);
    ASSERT_EQ(tracks[11].title().value(), "Two 2");
}

TEST_CASE(test_tracks_share_disc_views) {
    Album album(double_disc_album(), "/music/Double");
    auto tracks = album.tracks();
    ASSERT_TRUE(&tracks[0].disc() == &tracks[9].disc());
    ASSERT_TRUE(&tracks[0].disc() != &tracks[10].disc());
    ASSERT_TRUE(&tracks[10].album() == &album);
}

TEST_CASE(test_single_disc_paths) {
    Album album(single_disc_album(), "/music/Album");
    auto disc = album.disc(1);
    ASSERT_TRUE(disc->is_only_disc());
    ASSERT_FALSE(disc->filename().has_value());
    ASSERT_EQ(disc->path(), std::filesystem::path("/music/Album"));

    auto first = disc->track(1);
    ASSERT_EQ(first->canonical_filename(), "1 - First.mp3");
    ASSERT_EQ(first->filename(), "1 - First.mp3");
    ASSERT_EQ(first->filename_vw(), "1 - First.mp3");
    ASSERT_EQ(first->path(), std::filesystem::path("/music/Album/1 - First.mp3"));
}

TEST_CASE(test_explicit_filename_is_relative_to_album_root) {
    Album album(single_disc_album(), "/music/Album");
    auto third = album.disc(1)->track(3);
    ASSERT_EQ(third->filename(), "bonus/third take.mp3");
    ASSERT_EQ(third->path(), std::filesystem::path("/music/Album/bonus/third take.mp3"));
    ASSERT_EQ(third->canonical_path(), std::filesystem::path("/music/Album/3 - Third.mp3"));
    ASSERT_EQ(third->filename_vw(), "3 - Third.mp3");
}

TEST_CASE(test_multi_disc_paths) {
    Album album(double_disc_album(), "/music/Double");
    auto disc = album.disc(1);
    ASSERT_FALSE(disc->is_only_disc());
    ASSERT_EQ(*disc->filename(), "Disc 1");

    auto tenth = disc->track(10);
    ASSERT_EQ(tenth->canonical_filename(), "10 - One 10.mp3");
    ASSERT_EQ(tenth->path(), std::filesystem::path("/music/Double/Disc 1/10 - One 10.mp3"));
    ASSERT_EQ(disc->track(2)->filename_vw(), "1-02 - One 2.mp3");
    ASSERT_EQ(album.disc(2)->track(2)->filename_vw(), "2-2 - Two 2.mp3");
}

TEST_CASE(test_album_layout_paths) {
    Album album(single_disc_album(), "/music/Album");
    ASSERT_EQ(album.definition_path(), std::filesystem::path("/music/Album/extras/album.yaml"));
    ASSERT_EQ(album.image_path(), std::filesystem::path("/music/Album/extras/images"));
    ASSERT_EQ(album.covers_path(), std::filesystem::path("/music/Album/extras/.cache/covers"));
    ASSERT_EQ(album.covers_vw_path(), std::filesystem::path("/music/Album/extras/.cache/covers-vw"));
}

TEST_CASE(test_tag_data) {
    Album album(single_disc_album(), "/music/Album");
    auto second = album.disc(1)->track(2);
    TagData data = second->tag_data();

    ASSERT_EQ(data.title, "Second");
    ASSERT_EQ(*data.artist, "Guest, Main Artist");
    ASSERT_EQ(*data.album_artist, "Main Artist");
    ASSERT_EQ(data.track_number, 2u);
    ASSERT_FALSE(data.disc_number.has_value());
    ASSERT_EQ(data.album, "Álbum");
    ASSERT_EQ(*data.year, 2001);
    ASSERT_EQ(*data.genre, "Jazz");
    ASSERT_EQ(*data.comment, "Recorded live");
    ASSERT_EQ(*data.lyrics, "la la la");
    ASSERT_FALSE(data.cover.has_value());
}

TEST_CASE(test_tag_data_multi_disc_has_disc_number) {
    Album album(double_disc_album(), "/music/Double");
    TagData data = album.disc(2)->track(1)->tag_data();
    ASSERT_EQ(*data.disc_number, 2u);
    ASSERT_FALSE(data.album_artist.has_value());
}

TEST_CASE(test_tag_data_omits_artist_when_none) {
    model::Album definition;
    definition.title = Text("Bare");
    definition.discs.resize(1);
    definition.discs[0].tracks.push_back(track("Only"));
    Album album(std::move(definition), "/music/Bare");
    ASSERT_FALSE(album.disc(1)->track(1)->tag_data().artist.has_value());
}

TEST_CASE(test_car_safe_tag_data) {
    Album album(single_disc_album(), "/music/Album");
    TagData data = album.disc(1)->track(2)->tag_data_vw();
    ASSERT_EQ(data.album, "Album");
    ASSERT_EQ(*data.artist, "Guest, Main Artist");
    ASSERT_FALSE(data.year.has_value());
    ASSERT_FALSE(data.genre.has_value());
    ASSERT_FALSE(data.comment.has_value());
    ASSERT_FALSE(data.lyrics.has_value());
}

TEST_CASE(test_no_resolver_means_no_cover) {
    Album album(single_disc_album(), "/music/Album");
    ASSERT_TRUE(album.cover() == nullptr);
    ASSERT_TRUE(album.disc(1)->cover_vw() == nullptr);
    ASSERT_TRUE(album.disc(1)->track(1)->cover() == nullptr);
}

int main() {
    return maestro::test::TestRunner::instance().run_all();
}
