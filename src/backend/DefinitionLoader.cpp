#include "backend/DefinitionLoader.hpp"
#include "util/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace maestro::backend {

namespace {

[[noreturn]] void fail(const std::string& where, const std::string& what) {
    throw DefinitionError(where + ": " + what);
}

std::string scalar(const YAML::Node& node, const std::string& where) {
    if (!node.IsScalar()) {
        fail(where, "expected a string");
    }
    return node.Scalar();
}

model::Text parse_text(const YAML::Node& node, const std::string& where) {
    if (node.IsScalar()) {
        return model::Text(node.Scalar());
    }
    if (node.IsMap()) {
        const YAML::Node text = node["text"];
        if (!text) {
            fail(where, "missing \"text\" key");
        }
        std::optional<std::string> ascii;
        if (const YAML::Node ascii_node = node["ascii"]) {
            ascii = scalar(ascii_node, where + ".ascii");
        }
        return model::Text(scalar(text, where + ".text"), std::move(ascii));
    }
    fail(where, "expected a string or a {text, ascii} map");
}

std::optional<int> parse_year(const YAML::Node& map, const std::string& where) {
    const YAML::Node node = map["year"];
    if (!node) return std::nullopt;
    try {
        return node.as<int>();
    } catch (const YAML::BadConversion&) {
        fail(where + ".year", "expected a number");
    }
}

std::optional<model::Text> parse_optional_text(const YAML::Node& map, const char* key,
                                               const std::string& where) {
    const YAML::Node node = map[key];
    if (!node) return std::nullopt;
    return parse_text(node, where + "." + key);
}

// "artist: x" and "artists: [x, ...]" are equivalent; giving both is an error.
std::optional<std::vector<model::Text>> parse_artists(const YAML::Node& map, const std::string& where) {
    const YAML::Node single = map["artist"];
    const YAML::Node list = map["artists"];
    if (single && list) {
        fail(where, "both \"artist\" and \"artists\" given");
    }
    if (single) {
        if (single.IsSequence()) {
            fail(where + ".artist", "expected a single artist (use \"artists\" for a list)");
        }
        return std::vector<model::Text>{parse_text(single, where + ".artist")};
    }
    if (list) {
        if (!list.IsSequence()) {
            fail(where + ".artists", "expected a list of artists");
        }
        std::vector<model::Text> artists;
        for (size_t i = 0; i < list.size(); ++i) {
            artists.push_back(parse_text(list[i], where + ".artists[" + std::to_string(i) + "]"));
        }
        return artists;
    }
    return std::nullopt;
}

model::Track parse_track(const YAML::Node& node, const std::string& where) {
    model::Track track;
    if (node.IsScalar()) {
        track.title = model::Text(node.Scalar());
        return track;
    }
    if (!node.IsMap()) {
        fail(where, "expected a title or a track map");
    }

    const YAML::Node title = node["title"];
    if (!title) {
        fail(where, "missing \"title\"");
    }
    track.title = parse_text(title, where + ".title");
    track.artists = parse_artists(node, where);
    track.year = parse_year(node, where);
    track.genre = parse_optional_text(node, "genre", where);
    track.comment = parse_optional_text(node, "comment", where);
    track.lyrics = parse_optional_text(node, "lyrics", where);
    if (const YAML::Node filename = node["filename"]) {
        track.filename = scalar(filename, where + ".filename");
    }
    return track;
}

model::Disc parse_disc(const YAML::Node& node, const std::string& where) {
    if (!node.IsSequence()) {
        fail(where, "expected a list of tracks");
    }
    model::Disc disc;
    for (size_t i = 0; i < node.size(); ++i) {
        disc.tracks.push_back(parse_track(node[i], where + "[" + std::to_string(i) + "]"));
    }
    return disc;
}

model::Album parse_album(const YAML::Node& root) {
    if (!root.IsMap()) {
        fail("album", "expected a map");
    }

    model::Album album;
    const YAML::Node title = root["title"];
    if (!title) {
        fail("album", "missing \"title\"");
    }
    album.title = parse_text(title, "title");

    auto artists = parse_artists(root, "album");
    if (!artists) {
        fail("album", "missing \"artist\" or \"artists\"");
    }
    album.artists = std::move(*artists);
    album.year = parse_year(root, "album");
    album.genre = parse_optional_text(root, "genre", "album");

    const YAML::Node tracks = root["tracks"];
    const YAML::Node discs = root["discs"];
    if (tracks && discs) {
        fail("album", "both \"tracks\" and \"discs\" given");
    }
    if (tracks) {
        album.discs.push_back(parse_disc(tracks, "tracks"));
    } else if (discs) {
        if (!discs.IsSequence()) {
            fail("discs", "expected a list of discs");
        }
        for (size_t i = 0; i < discs.size(); ++i) {
            album.discs.push_back(parse_disc(discs[i], "discs[" + std::to_string(i) + "]"));
        }
    } else {
        fail("album", "missing \"tracks\" or \"discs\"");
    }
    return album;
}

void emit_text(YAML::Emitter& out, const model::Text& text) {
    if (text.has_overridden_ascii()) {
        out << YAML::BeginMap;
        out << YAML::Key << "text" << YAML::Value << text.value();
        out << YAML::Key << "ascii" << YAML::Value << text.ascii();
        out << YAML::EndMap;
    } else {
        out << text.value();
    }
}

void emit_artists(YAML::Emitter& out, const std::vector<model::Text>& artists) {
    if (artists.size() == 1) {
        out << YAML::Key << "artist" << YAML::Value;
        emit_text(out, artists.front());
        return;
    }
    out << YAML::Key << "artists" << YAML::Value << YAML::BeginSeq;
    for (const auto& artist : artists) {
        emit_text(out, artist);
    }
    out << YAML::EndSeq;
}

void emit_optional_text(YAML::Emitter& out, const char* key, const std::optional<model::Text>& text) {
    if (!text) return;
    out << YAML::Key << key << YAML::Value;
    emit_text(out, *text);
}

void emit_track(YAML::Emitter& out, const model::Track& track) {
    bool title_only = !track.artists && !track.year && !track.genre && !track.comment &&
                      !track.lyrics && !track.filename;
    if (title_only && !track.title.has_overridden_ascii()) {
        out << track.title.value();
        return;
    }

    out << YAML::BeginMap;
    out << YAML::Key << "title" << YAML::Value;
    emit_text(out, track.title);
    if (track.artists) emit_artists(out, *track.artists);
    if (track.year) out << YAML::Key << "year" << YAML::Value << *track.year;
    emit_optional_text(out, "genre", track.genre);
    emit_optional_text(out, "comment", track.comment);
    // Literal blocks always read back with a trailing newline
    if (track.lyrics && !track.lyrics->has_overridden_ascii() && track.lyrics->value().ends_with('\n')) {
        out << YAML::Key << "lyrics" << YAML::Value << YAML::Literal << track.lyrics->value();
    } else {
        emit_optional_text(out, "lyrics", track.lyrics);
    }
    if (track.filename) out << YAML::Key << "filename" << YAML::Value << *track.filename;
    out << YAML::EndMap;
}

void emit_disc(YAML::Emitter& out, const model::Disc& disc) {
    out << YAML::BeginSeq;
    for (const auto& track : disc.tracks) {
        emit_track(out, track);
    }
    out << YAML::EndSeq;
}

}  // namespace

model::Album DefinitionLoader::parse(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::ParserException& e) {
        throw DefinitionError(std::string("invalid YAML: ") + e.what());
    }
    return parse_album(root);
}

model::Album DefinitionLoader::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw DefinitionError("couldn't read " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        auto album = parse(buffer.str());
        util::Logger::debug("DefinitionLoader: Parsed " + path.string() + " (" +
                            std::to_string(album.discs.size()) + " discs)");
        return album;
    } catch (const DefinitionError& e) {
        util::Logger::error("DefinitionLoader: " + path.string() + ": " + e.what());
        throw DefinitionError(path.string() + ": " + e.what());
    }
}

std::string DefinitionLoader::emit(const model::Album& album) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "title" << YAML::Value;
    emit_text(out, album.title);
    emit_artists(out, album.artists);
    if (album.year) out << YAML::Key << "year" << YAML::Value << *album.year;
    emit_optional_text(out, "genre", album.genre);

    if (album.discs.size() == 1) {
        out << YAML::Key << "tracks" << YAML::Value;
        emit_disc(out, album.discs.front());
    } else {
        out << YAML::Key << "discs" << YAML::Value << YAML::BeginSeq;
        for (const auto& disc : album.discs) {
            emit_disc(out, disc);
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        throw DefinitionError("couldn't emit album definition: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

void DefinitionLoader::save_file(const model::Album& album, const std::filesystem::path& path) {
    std::string yaml = emit(album);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream file(path, std::ios::trunc);
    file << yaml;
    file.close();
    if (ec || !file) {
        throw DefinitionError("couldn't write " + path.string());
    }
    util::Logger::info("DefinitionLoader: Wrote " + path.string());
}

}  // namespace maestro::backend
