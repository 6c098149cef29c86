#include "../framework/SimpleTest.hpp"
#include "backend/PathNamer.hpp"

using namespace maestro::backend;
using maestro::model::Text;

TEST_CASE(test_num_digits) {
    ASSERT_EQ(num_digits(0), 1);
    ASSERT_EQ(num_digits(9), 1);
    ASSERT_EQ(num_digits(10), 2);
    ASSERT_EQ(num_digits(99), 2);
    ASSERT_EQ(num_digits(100), 3);
}

TEST_CASE(test_disc_folder_name) {
    ASSERT_FALSE(disc_folder_name(1, 1).has_value());
    ASSERT_EQ(*disc_folder_name(2, 3), "Disc 2");
    ASSERT_EQ(*disc_folder_name(3, 12), "Disc 03");
    ASSERT_EQ(*disc_folder_name(12, 12), "Disc 12");
}

TEST_CASE(test_single_track_album_has_no_number) {
    ASSERT_EQ(track_filename(1, 1, 1, Text("Song")), "Song.mp3");
}

TEST_CASE(test_single_track_disc_of_multi_disc_album_keeps_number) {
    ASSERT_EQ(track_filename(1, 1, 2, Text("Song")), "1 - Song.mp3");
}

TEST_CASE(test_track_number_padding) {
    ASSERT_EQ(track_filename(3, 9, 1, Text("Song")), "3 - Song.mp3");
    ASSERT_EQ(track_filename(3, 12, 1, Text("Song")), "03 - Song.mp3");
    ASSERT_EQ(track_filename(12, 12, 1, Text("Song")), "12 - Song.mp3");
    ASSERT_EQ(track_filename(7, 100, 1, Text("Song")), "007 - Song.mp3");
}

TEST_CASE(test_track_filename_is_file_safe) {
    ASSERT_EQ(track_filename(1, 2, 1, Text("Who?")), "1 - Who.mp3");
    ASSERT_EQ(track_filename(2, 2, 1, Text("Café: Live")), "2 - Cafe - Live.mp3");
}

TEST_CASE(test_vw_name_on_single_disc_is_canonical) {
    ASSERT_EQ(track_filename_vw(1, 1, 5, 12, Text("X")), "05 - X.mp3");
    ASSERT_EQ(track_filename_vw(1, 1, 1, 1, Text("X")), "X.mp3");
}

TEST_CASE(test_vw_name_on_multi_disc_prefixes_disc) {
    ASSERT_EQ(track_filename_vw(2, 10, 5, 12, Text("X")), "02-05 - X.mp3");
    ASSERT_EQ(track_filename_vw(2, 3, 5, 9, Text("X")), "2-5 - X.mp3");
    ASSERT_EQ(track_filename_vw(2, 2, 1, 1, Text("X")), "2-1 - X.mp3");
}

int main() {
    return maestro::test::TestRunner::instance().run_all();
}
