#include "backend/CoverResolver.hpp"
#include "util/Logger.hpp"
#include <fstream>
#include <iterator>

namespace maestro::backend {

namespace fs = std::filesystem;

namespace {

constexpr const char* PROBE_EXTENSIONS[] = {"png", "jpg", "jpeg"};

bool read_file(const fs::path& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

}  // namespace

CoverResolver::CoverResolver(std::shared_ptr<const ImageCodec> codec, CoverSettings settings)
    : codec_(std::move(codec)), settings_(settings) {}

std::optional<fs::path> CoverResolver::probe(const fs::path& dir, const std::string& name) {
    for (const char* ext : PROBE_EXTENSIONS) {
        fs::path candidate = dir / (name + "." + ext);
        std::error_code ec;
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<Image> CoverResolver::load_with_cache(const fs::path& images_dir,
                                                    const fs::path& cache_dir,
                                                    const std::string& name,
                                                    CoverVariant variant) const {
    if (auto cached = probe(cache_dir, name)) {
        Image image;
        if (!read_file(*cached, image.data)) {
            throw CoverError(CoverError::Kind::CacheRead, "couldn't read cached cover " + cached->string());
        }
        auto format = detect_format(image.data);
        if (!format) {
            throw CoverError(CoverError::Kind::CacheRead, "cached cover is not a PNG or JPEG: " + cached->string());
        }
        image.format = *format;
        util::Logger::debug("CoverResolver: Cache hit " + cached->string());
        return image;
    }

    auto source = probe(images_dir, name);
    if (!source) {
        util::Logger::debug("CoverResolver: No image named '" + name + "' in " + images_dir.string());
        return std::nullopt;
    }

    std::vector<uint8_t> raw;
    if (!read_file(*source, raw)) {
        throw CoverError(CoverError::Kind::SourceRead, "couldn't read " + source->string());
    }

    util::Logger::debug("CoverResolver: Transforming " + source->string());
    Image image = transform(raw, variant);

    std::error_code ec;
    fs::create_directories(cache_dir, ec);
    if (ec) {
        throw CoverError(CoverError::Kind::CreateCacheDir,
                         "couldn't create cache folder " + cache_dir.string() + ": " + ec.message());
    }

    fs::path cache_file = cache_dir / (name + "." + std::string(extension(image.format)));
    std::ofstream out(cache_file, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(image.data.data()),
              static_cast<std::streamsize>(image.data.size()));
    out.close();
    if (!out) {
        throw CoverError(CoverError::Kind::WriteCache, "couldn't write cached cover " + cache_file.string());
    }

    util::Logger::info("CoverResolver: Cached " + cache_file.string() + " (" +
                       std::to_string(image.data.size() / 1024) + " KB)");
    return image;
}

Image CoverResolver::transform(const std::vector<uint8_t>& source, CoverVariant variant) const {
    if (!codec_) {
        throw CoverError(CoverError::Kind::NoCodec, "no image codec available to transform covers");
    }

    Pixels decoded = codec_->decode(source);
    int box = variant == CoverVariant::Standard ? settings_.size : settings_.size_vw;
    Pixels resized = codec_->resize(decoded, box, box);

    if (variant == CoverVariant::CarSafe) {
        return Image{codec_->encode_jpeg(resized, settings_.jpeg_quality), ImageFormat::Jpeg};
    }

    std::vector<uint8_t> png = codec_->encode_png(resized);
    std::vector<uint8_t> jpeg = codec_->encode_jpeg(resized, settings_.jpeg_quality);
    if (png.size() <= jpeg.size()) {
        return Image{std::move(png), ImageFormat::Png};
    }
    return Image{std::move(jpeg), ImageFormat::Jpeg};
}

}  // namespace maestro::backend
