#pragma once

#include "backend/Image.hpp"
#include "backend/TagData.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace maestro::backend {

class TagError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Tag values as found in a file; every frame may be absent.
struct FileTags {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album_artist;
    std::optional<size_t> track_number;
    std::optional<size_t> disc_number;
    std::optional<std::string> album;
    std::optional<int> year;
    std::optional<std::string> genre;
    std::optional<std::string> comment;
    std::optional<std::string> lyrics;
    std::optional<Image> cover;
};

struct ValidationIssue {
    enum class Kind { MissingFrame, UnexpectedFrame, IncorrectData };

    Kind kind;
    std::string frame;  // "title", "artist", "track", ...
    std::string found;  // for IncorrectData

    std::string message() const;
};

// ID3v2.4 reading and writing for MP3 files (TagLib)
class Id3Tagger {
public:
    static FileTags read(const std::filesystem::path& path);

    // Replaces all tags with data. Returns false if the file already matched.
    static bool write(const std::filesystem::path& path, const TagData& data);

    // Removes ID3v1, ID3v2 and APE tags
    static void clear(const std::filesystem::path& path);

    static std::vector<ValidationIssue> validate(const std::filesystem::path& path, const TagData& data);
    static std::vector<ValidationIssue> compare(const FileTags& found, const TagData& expected);
};

}  // namespace maestro::backend
