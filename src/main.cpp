#include "backend/Album.hpp"
#include "backend/AlbumGenerator.hpp"
#include "backend/Config.hpp"
#include "backend/CoverResolver.hpp"
#include "backend/DefinitionLoader.hpp"
#include "backend/Id3Tagger.hpp"
#include "backend/StbImageCodec.hpp"
#include "backend/Track.hpp"
#include "util/Logger.hpp"
#include <getopt.h>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using maestro::backend::TrackInContext;
using maestro::util::Logger;

namespace {

struct Options {
    fs::path folder = ".";
    int verbosity = 0;
    bool dry_run = false;
    std::optional<fs::path> config_file;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] <command> [command options]\n"
              << "\n"
              << "Music album organization and tagging.\n"
              << "\n"
              << "Options:\n"
              << "  -f, --folder DIR     Album folder (default: .)\n"
              << "  -v, --verbose        More log output (repeatable)\n"
              << "  -n, --dry-run        Print actions instead of doing them\n"
              << "  -c, --config FILE    Config file (default: ~/.config/maestro/config.toml)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  update               Write tags to every track\n"
              << "  export [--root DIR] [--format full|vw] [OUTPUT]\n"
              << "                       Copy the album to OUTPUT, or to ROOT/<artist>/<title>\n"
              << "  validate             Check every track's tags\n"
              << "  show                 Print the album definition\n"
              << "  clear                Remove tags from every track\n"
              << "  rename               Rename files to their canonical names\n"
              << "  generate             Write extras/album.yaml from the folder's MP3 tags\n";
}

std::shared_ptr<const maestro::backend::CoverResolver> make_resolver(const maestro::backend::Config& cfg) {
    auto codec = std::make_shared<maestro::backend::StbImageCodec>();
    return std::make_shared<maestro::backend::CoverResolver>(codec, cfg.cover_settings());
}

// Runs action on every track. A failure is recorded and the batch continues;
// all failures are printed at the end.
template <typename F>
int run_all_tracks(const maestro::backend::Album& album, const std::string& verb, F action) {
    auto tracks = album.tracks();
    std::vector<std::pair<std::string, std::string>> errors;

    size_t pos = 0;
    for (const auto& track : tracks) {
        ++pos;
        std::cout << "(" << pos << "/" << tracks.size() << ") " << verb
                  << " \"" << track.title().value() << "\"..." << std::endl;
        try {
            action(track);
        } catch (const std::exception& e) {
            Logger::error("main: " + verb + " \"" + track.title().value() + "\" failed: " + e.what());
            errors.emplace_back(track.title().value(), e.what());
        }
    }
    std::cout << "Finished." << std::endl;

    if (errors.empty()) {
        return 0;
    }
    std::cout << "Errors:" << std::endl;
    for (const auto& [title, message] : errors) {
        std::cout << "\"" << title << "\": " << message << std::endl;
    }
    return 1;
}

int run_export(const maestro::backend::Album& album, const maestro::backend::Config& cfg,
               int argc, char** argv) {
    fs::path root = cfg.export_root;
    std::string format = cfg.export_format;

    static const struct option long_options[] = {
        {"root",   required_argument, nullptr, 'r'},
        {"format", required_argument, nullptr, 'F'},
        {nullptr,  0,                 nullptr,  0 }
    };

    optind = 0;  // GNU: reinitialize for the command's own arguments
    int opt;
    while ((opt = getopt_long(argc, argv, "r:F:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'r':
                root = optarg;
                break;
            case 'F':
                format = optarg;
                break;
            default:
                return 2;
        }
    }
    if (format != "full" && format != "vw") {
        std::cerr << "Invalid export format \"" << format << "\"" << std::endl;
        return 2;
    }

    fs::path output;
    if (optind < argc) {
        output = argv[optind];
    } else if (!root.empty()) {
        output = root / album.artist().file_safe() / album.title().file_safe();
    } else {
        std::cerr << "export: an output folder or --root is required" << std::endl;
        return 2;
    }
    Logger::info("main: Exporting to " + output.string() + " (" + format + ")");

    if (format == "vw") {
        fs::create_directories(output);
        return run_all_tracks(album, "Copying", [&](const TrackInContext& track) {
            fs::path target = output / track.filename_vw();
            fs::copy_file(track.path(), target, fs::copy_options::overwrite_existing);
            maestro::backend::Id3Tagger::clear(target);
            maestro::backend::Id3Tagger::write(target, track.tag_data_vw());
        });
    }

    return run_all_tracks(album, "Copying", [&](const TrackInContext& track) {
        fs::path folder = output;
        if (auto disc = track.disc().filename()) {
            folder /= *disc;
        }
        fs::create_directories(folder);
        fs::copy_file(track.path(), folder / track.filename_vw(), fs::copy_options::overwrite_existing);
    });
}

}  // namespace

int main(int argc, char** argv) {
    Options options;

    static const struct option long_options[] = {
        {"folder",  required_argument, nullptr, 'f'},
        {"verbose", no_argument,       nullptr, 'v'},
        {"dry-run", no_argument,       nullptr, 'n'},
        {"config",  required_argument, nullptr, 'c'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr,   0,                 nullptr,  0 }
    };

    // '+' stops at the first non-option so commands can have their own flags
    int opt;
    while ((opt = getopt_long(argc, argv, "+f:vnc:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'f':
                options.folder = optarg;
                break;
            case 'v':
                options.verbosity++;
                break;
            case 'n':
                options.dry_run = true;
                break;
            case 'c':
                options.config_file = fs::path(optarg);
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        print_usage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];
    int command_argc = argc - optind;
    char** command_argv = argv + optind;

    try {
        auto cfg = options.config_file
            ? maestro::backend::ConfigLoader::load_from_file(*options.config_file)
            : maestro::backend::ConfigLoader::load_config();

        Logger::Level level = Logger::parse_level(cfg.log_level, Logger::Level::Warn);
        if (options.verbosity == 1) level = std::min(level, Logger::Level::Info);
        if (options.verbosity >= 2) level = Logger::Level::Debug;
        Logger::init(cfg.log_file, level);
        Logger::info("maestro: " + command + " in " + options.folder.string());

        if (command == "generate") {
            auto definition = maestro::backend::AlbumGenerator::generate(options.folder);
            if (options.dry_run) {
                std::cout << maestro::backend::DefinitionLoader::emit(definition);
                return 0;
            }
            maestro::backend::Album album(std::move(definition), options.folder);
            maestro::backend::DefinitionLoader::save_file(album.definition(), album.definition_path());
            std::cout << "Wrote " << album.definition_path().string() << std::endl;
            return 0;
        }

        auto album = maestro::backend::Album::load(options.folder, make_resolver(cfg));

        if (command == "show") {
            std::cout << maestro::backend::DefinitionLoader::emit(album->definition());
            return 0;
        }
        if (command == "update") {
            return run_all_tracks(*album, "Updating", [](const TrackInContext& track) {
                maestro::backend::Id3Tagger::write(track.path(), track.tag_data());
            });
        }
        if (command == "export") {
            return run_export(*album, cfg, command_argc, command_argv);
        }
        if (command == "validate") {
            return run_all_tracks(*album, "Validating", [](const TrackInContext& track) {
                auto issues = maestro::backend::Id3Tagger::validate(track.path(), track.tag_data());
                if (issues.empty()) return;
                std::string message;
                for (const auto& issue : issues) {
                    if (!message.empty()) message += "; ";
                    message += issue.message();
                }
                throw maestro::backend::TagError(message);
            });
        }
        if (command == "clear") {
            return run_all_tracks(*album, "Clearing", [](const TrackInContext& track) {
                maestro::backend::Id3Tagger::clear(track.path());
            });
        }
        if (command == "rename") {
            const bool dry_run = options.dry_run;
            return run_all_tracks(*album, "Renaming", [dry_run](const TrackInContext& track) {
                fs::path from = track.path();
                fs::path to = track.canonical_path();
                if (from == to) return;
                if (dry_run) {
                    std::cout << "  " << from.string() << " -> " << to.string() << std::endl;
                    return;
                }
                fs::create_directories(to.parent_path());
                fs::rename(from, to);
            });
        }

        std::cerr << "Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return 2;
    } catch (const std::exception& e) {
        Logger::error("maestro: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
