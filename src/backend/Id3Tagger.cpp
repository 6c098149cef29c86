#include "backend/Id3Tagger.hpp"
#include "util/Logger.hpp"

#include <taglib/tstring.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/id3v2frame.h>
#include <taglib/textidentificationframe.h>
#include <taglib/attachedpictureframe.h>
#include <taglib/commentsframe.h>
#include <taglib/unsynchronizedlyricsframe.h>

#include <cctype>

namespace maestro::backend {

namespace {

std::string to_utf8(const TagLib::String& s) {
    return s.to8Bit(true);
}

TagLib::String from_utf8(const std::string& s) {
    return TagLib::String(s, TagLib::String::UTF8);
}

// "3/12" -> 3, "2021-04-02" -> 2021
std::optional<long> leading_number(const std::string& s) {
    size_t end = 0;
    while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) ++end;
    if (end == 0) return std::nullopt;
    try {
        return std::stol(s.substr(0, end));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::string> text_frame(TagLib::ID3v2::Tag* tag, const char* id) {
    const auto& map = tag->frameListMap();
    auto it = map.find(id);
    if (it == map.end() || it->second.isEmpty()) {
        return std::nullopt;
    }
    return to_utf8(it->second.front()->toString());
}

void add_text_frame(TagLib::ID3v2::Tag* tag, const char* id, const std::string& value) {
    auto frame = new TagLib::ID3v2::TextIdentificationFrame(id, TagLib::String::UTF8);
    frame->setText(from_utf8(value));
    tag->addFrame(frame);
}

template <typename T, typename Fmt>
void check_frame(std::vector<ValidationIssue>& issues, const char* name,
                 const std::optional<T>& expected, const std::optional<T>& found, Fmt format) {
    if (expected && !found) {
        issues.push_back({ValidationIssue::Kind::MissingFrame, name, ""});
    } else if (!expected && found) {
        issues.push_back({ValidationIssue::Kind::UnexpectedFrame, name, ""});
    } else if (expected && found && !(*expected == *found)) {
        issues.push_back({ValidationIssue::Kind::IncorrectData, name, format(*found)});
    }
}

std::string same(const std::string& s) { return s; }
std::string number(size_t n) { return std::to_string(n); }
std::string year_str(int n) { return std::to_string(n); }
std::string image_str(const Image& image) {
    return std::string(image.mime_type()) + ", " + std::to_string(image.data.size()) + " bytes";
}

}  // namespace

std::string ValidationIssue::message() const {
    switch (kind) {
        case Kind::MissingFrame: return "missing frame " + frame;
        case Kind::UnexpectedFrame: return "unexpected frame " + frame;
        case Kind::IncorrectData: return "incorrect data in frame " + frame + ": " + found;
    }
    return frame;
}

FileTags Id3Tagger::read(const std::filesystem::path& path) {
    TagLib::MPEG::File file(path.c_str(), false);
    if (!file.isValid()) {
        throw TagError("couldn't open " + path.string() + " as MP3");
    }

    FileTags tags;
    TagLib::ID3v2::Tag* tag = file.ID3v2Tag(false);
    if (!tag) {
        return tags;
    }

    tags.title = text_frame(tag, "TIT2");
    tags.artist = text_frame(tag, "TPE1");
    tags.album_artist = text_frame(tag, "TPE2");
    tags.album = text_frame(tag, "TALB");
    tags.genre = text_frame(tag, "TCON");
    if (auto trck = text_frame(tag, "TRCK")) {
        if (auto n = leading_number(*trck)) tags.track_number = static_cast<size_t>(*n);
    }
    if (auto tpos = text_frame(tag, "TPOS")) {
        if (auto n = leading_number(*tpos)) tags.disc_number = static_cast<size_t>(*n);
    }
    if (auto tdrc = text_frame(tag, "TDRC")) {
        if (auto n = leading_number(*tdrc)) tags.year = static_cast<int>(*n);
    }

    for (auto* frame : tag->frameList("COMM")) {
        auto* comment = dynamic_cast<TagLib::ID3v2::CommentsFrame*>(frame);
        if (comment && comment->description().isEmpty()) {
            tags.comment = to_utf8(comment->text());
            break;
        }
    }
    for (auto* frame : tag->frameList("USLT")) {
        if (auto* lyrics = dynamic_cast<TagLib::ID3v2::UnsynchronizedLyricsFrame*>(frame)) {
            tags.lyrics = to_utf8(lyrics->text());
            break;
        }
    }
    for (auto* frame : tag->frameList("APIC")) {
        auto* picture = dynamic_cast<TagLib::ID3v2::AttachedPictureFrame*>(frame);
        if (!picture || picture->type() != TagLib::ID3v2::AttachedPictureFrame::FrontCover) {
            continue;
        }
        const TagLib::ByteVector bytes = picture->picture();
        Image image;
        image.data.assign(bytes.begin(), bytes.end());
        if (auto format = detect_format(image.data)) {
            image.format = *format;
        } else {
            image.format = to_utf8(picture->mimeType()) == "image/png" ? ImageFormat::Png : ImageFormat::Jpeg;
        }
        tags.cover = std::move(image);
        break;
    }
    return tags;
}

bool Id3Tagger::write(const std::filesystem::path& path, const TagData& data) {
    if (compare(read(path), data).empty()) {
        util::Logger::debug("Id3Tagger: Up to date: " + path.string());
        return false;
    }

    TagLib::MPEG::File file(path.c_str(), false);
    if (!file.isValid()) {
        throw TagError("couldn't open " + path.string() + " as MP3");
    }

    TagLib::ID3v2::Tag* tag = file.ID3v2Tag(true);
    const TagLib::ID3v2::FrameList old_frames = tag->frameList();
    for (auto* frame : old_frames) {
        tag->removeFrame(frame, true);
    }

    add_text_frame(tag, "TIT2", data.title);
    if (data.artist) add_text_frame(tag, "TPE1", *data.artist);
    add_text_frame(tag, "TRCK", std::to_string(data.track_number));
    if (data.album_artist) add_text_frame(tag, "TPE2", *data.album_artist);
    if (data.disc_number) add_text_frame(tag, "TPOS", std::to_string(*data.disc_number));
    add_text_frame(tag, "TALB", data.album);
    if (data.year) add_text_frame(tag, "TDRC", std::to_string(*data.year));
    if (data.genre) add_text_frame(tag, "TCON", *data.genre);

    if (data.comment) {
        auto frame = new TagLib::ID3v2::CommentsFrame(TagLib::String::UTF8);
        frame->setLanguage("eng");
        frame->setText(from_utf8(*data.comment));
        tag->addFrame(frame);
    }
    if (data.lyrics) {
        auto frame = new TagLib::ID3v2::UnsynchronizedLyricsFrame(TagLib::String::UTF8);
        frame->setLanguage("eng");
        frame->setText(from_utf8(*data.lyrics));
        tag->addFrame(frame);
    }
    if (data.cover) {
        auto frame = new TagLib::ID3v2::AttachedPictureFrame();
        frame->setPicture(TagLib::ByteVector(reinterpret_cast<const char*>(data.cover->data.data()),
                                             static_cast<unsigned int>(data.cover->data.size())));
        frame->setMimeType(TagLib::String(std::string(data.cover->mime_type())));
        frame->setType(TagLib::ID3v2::AttachedPictureFrame::FrontCover);
        tag->addFrame(frame);
    }

    bool saved = file.save(TagLib::MPEG::File::ID3v2,
                           TagLib::File::StripOthers,
                           TagLib::ID3v2::v4,
                           TagLib::File::DoNotDuplicate);
    if (!saved) {
        throw TagError("couldn't write tag to " + path.string());
    }
    util::Logger::info("Id3Tagger: Wrote tag to " + path.string());
    return true;
}

void Id3Tagger::clear(const std::filesystem::path& path) {
    TagLib::MPEG::File file(path.c_str(), false);
    if (!file.isValid()) {
        throw TagError("couldn't open " + path.string() + " as MP3");
    }
    if (!file.strip(TagLib::MPEG::File::AllTags)) {
        throw TagError("couldn't remove tag from " + path.string());
    }
    util::Logger::info("Id3Tagger: Cleared " + path.string());
}

std::vector<ValidationIssue> Id3Tagger::validate(const std::filesystem::path& path, const TagData& data) {
    return compare(read(path), data);
}

std::vector<ValidationIssue> Id3Tagger::compare(const FileTags& found, const TagData& expected) {
    std::vector<ValidationIssue> issues;
    check_frame<std::string>(issues, "title", expected.title, found.title, same);
    check_frame(issues, "artist", expected.artist, found.artist, same);
    check_frame<size_t>(issues, "track", expected.track_number, found.track_number, number);
    check_frame(issues, "album artist", expected.album_artist, found.album_artist, same);
    check_frame(issues, "disc", expected.disc_number, found.disc_number, number);
    check_frame<std::string>(issues, "album", expected.album, found.album, same);
    check_frame(issues, "year", expected.year, found.year, year_str);
    check_frame(issues, "genre", expected.genre, found.genre, same);
    check_frame(issues, "comments", expected.comment, found.comment, same);
    check_frame(issues, "lyrics", expected.lyrics, found.lyrics, same);
    check_frame(issues, "cover", expected.cover, found.cover, image_str);
    return issues;
}

}  // namespace maestro::backend
