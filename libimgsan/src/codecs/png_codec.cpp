#include "../../include/png_codec.hpp"
#include "../../include/error.hpp"
#include "../../include/file_utils.hpp"
#include <png.h>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr char kXmpKeyword[] = "XML:com.adobe.xmp";

/**
 * @brief libpng error handler that throws a C++ exception.
 * @param msg The error message from libpng.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    throw std::runtime_error(msg);
}

// benign problems in ancillary chunks; the chunk is skipped by libpng
void png_warning_fn(png_structp, png_const_charp) {}

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngRead() = default;
    PngRead(const PngRead&) = delete;
    PngRead& operator=(const PngRead&) = delete;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

/**
 * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngWrite() = default;
    PngWrite(const PngWrite&) = delete;
    PngWrite& operator=(const PngWrite&) = delete;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

/**
 * @brief Reads the whole PNG (all chunks and all rows) into `rd`.
 *
 * Rows stay owned by `rd.info` and are retrieved with png_get_rows().
 * @throws std::runtime_error on any libpng error.
 */
void read_png(FILE *fp, PngRead &rd) {
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

    png_init_io(rd.png, fp);
    png_read_png(rd.png, rd.info, PNG_TRANSFORM_IDENTITY, nullptr);
}

std::string format_time(const png_const_timep t) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02uT%02u:%02u:%02u",
                  static_cast<unsigned>(t->year), static_cast<unsigned>(t->month),
                  static_cast<unsigned>(t->day), static_cast<unsigned>(t->hour),
                  static_cast<unsigned>(t->minute), static_cast<unsigned>(t->second));
    return buf;
}

std::size_t text_length(const png_text &t) {
    if (!t.text) return 0;
    return t.compression >= PNG_ITXT_COMPRESSION_NONE ? t.itxt_length : t.text_length;
}

/**
 * @brief Metadata blocks of a read PNG, in the order the writer walks them.
 */
std::vector<imgsan::MetadataBlock> read_blocks(png_structp png, png_infop info) {
    using imgsan::BlockKind;
    std::vector<imgsan::MetadataBlock> blocks;

    if (png_get_valid(png, info, PNG_INFO_iCCP)) {
        png_charp name = nullptr;
        int comp_type = 0;
        png_bytep profile = nullptr;
        png_uint_32 profile_len = 0;
        if (png_get_iCCP(png, info, &name, &comp_type, &profile, &profile_len)) {
            blocks.push_back({BlockKind::Icc, 0, name ? name : "", {profile, profile + profile_len}});
        }
    }

    png_uint_32 num_exif = 0;
    png_bytep exif = nullptr;
    if (png_get_eXIf_1(png, info, &num_exif, &exif) && exif && num_exif > 0) {
        blocks.push_back({BlockKind::Exif, 0, "eXIf", {exif, exif + num_exif}});
    }

    png_textp text = nullptr;
    int num_text = 0;
    png_get_text(png, info, &text, &num_text);
    for (int i = 0; i < num_text; ++i) {
        const auto &t = text[i];
        const std::string key = t.key ? t.key : "";
        const auto *data = reinterpret_cast<const unsigned char *>(t.text);
        const auto kind = key == kXmpKeyword ? BlockKind::Xmp : BlockKind::Text;
        blocks.push_back({kind, 0, key, {data, data + text_length(t)}});
    }

    if (png_get_valid(png, info, PNG_INFO_tIME)) {
        png_timep mod_time = nullptr;
        if (png_get_tIME(png, info, &mod_time) && mod_time) {
            const auto s = format_time(mod_time);
            blocks.push_back({BlockKind::Timestamp, 0, "tIME", {s.begin(), s.end()}});
        }
    }
    return blocks;
}

/**
 * @brief Copies the chunks that define how pixels are interpreted.
 * These are never metadata and are always preserved.
 */
void copy_colour_chunks(png_structp in_png, png_infop in_info,
                        png_structp out_png, png_infop out_info) {
    // plte
    if (png_get_valid(in_png, in_info, PNG_INFO_PLTE)) {
        png_colorp palette = nullptr;
        int num_palette = 0;
        if (png_get_PLTE(in_png, in_info, &palette, &num_palette)) {
            png_set_PLTE(out_png, out_info, palette, num_palette);
        }
    }
    // trns
    if (png_get_valid(in_png, in_info, PNG_INFO_tRNS)) {
        png_bytep trans = nullptr;
        int num_trans = 0;
        png_color_16p trans_color = nullptr;
        if (png_get_tRNS(in_png, in_info, &trans, &num_trans, &trans_color)) {
            png_set_tRNS(out_png, out_info, trans, num_trans, trans_color);
        }
    }
    // srgb
    if (png_get_valid(in_png, in_info, PNG_INFO_sRGB)) {
        int intent = 0;
        if (png_get_sRGB(in_png, in_info, &intent)) {
            png_set_sRGB(out_png, out_info, intent);
        }
    }
    // gama
    if (png_get_valid(in_png, in_info, PNG_INFO_gAMA)) {
        png_fixed_point gamma = 0;
        if (png_get_gAMA_fixed(in_png, in_info, &gamma)) {
            png_set_gAMA_fixed(out_png, out_info, gamma);
        }
    }
    // chrm
    if (png_get_valid(in_png, in_info, PNG_INFO_cHRM)) {
        png_fixed_point wx, wy, rx, ry, gx, gy, bx, by;
        if (png_get_cHRM_fixed(in_png, in_info, &wx, &wy, &rx, &ry, &gx, &gy, &bx, &by)) {
            png_set_cHRM_fixed(out_png, out_info, wx, wy, rx, ry, gx, gy, bx, by);
        }
    }
    // sbit
    if (png_get_valid(in_png, in_info, PNG_INFO_sBIT)) {
        png_color_8p sig_bit = nullptr;
        if (png_get_sBIT(in_png, in_info, &sig_bit)) {
            png_set_sBIT(out_png, out_info, sig_bit);
        }
    }
    // phys (pixel per unit)
    if (png_get_valid(in_png, in_info, PNG_INFO_pHYs)) {
        png_uint_32 xppu = 0, yppu = 0;
        int unit = 0;
        if (png_get_pHYs(in_png, in_info, &xppu, &yppu, &unit)) {
            png_set_pHYs(out_png, out_info, xppu, yppu, unit);
        }
    }
    // bkgd
    if (png_get_valid(in_png, in_info, PNG_INFO_bKGD)) {
        png_color_16p bkgd = nullptr;
        if (png_get_bKGD(in_png, in_info, &bkgd)) {
            png_set_bKGD(out_png, out_info, bkgd);
        }
    }
    // splt (suggested palettes)
    png_sPLT_tp splt_ptr = nullptr;
    const int n_splt = png_get_sPLT(in_png, in_info, &splt_ptr);
    if (n_splt > 0 && splt_ptr) {
        png_set_sPLT(out_png, out_info, splt_ptr, n_splt);
    }
}

} // namespace

namespace imgsan {

std::unique_ptr<ImageHandle> PngCodec::decode(const std::filesystem::path& path) const {
    unique_FILE fp(open_file(path, "rb"));
    if (!fp) {
        throw DecodeError("Cannot open PNG input: " + path.string());
    }

    std::vector<MetadataBlock> blocks;
    png_uint_32 width = 0;
    png_uint_32 height = 0;
    try {
        PngRead rd;
        read_png(fp.get(), rd);
        blocks = read_blocks(rd.png, rd.info);
        width = png_get_image_width(rd.png, rd.info);
        height = png_get_image_height(rd.png, rd.info);
    } catch (const std::exception& e) {
        throw DecodeError(std::string("libpng: ") + e.what());
    }

    // some writers keep the JPEG "Exif\0\0" prefix inside eXIf
    for (auto& block : blocks) {
        if (block.kind == BlockKind::Exif && block.data.size() >= 6 &&
            std::memcmp(block.data.data(), "Exif\0\0", 6) == 0) {
            block.data.erase(block.data.begin(), block.data.begin() + 6);
        }
    }

    return std::make_unique<ImageHandle>(path, "PNG", width, height, std::move(blocks));
}

std::vector<MetadataEntry> PngCodec::read_tags(const ImageHandle& handle) const {
    return collect_entries(handle);
}

std::vector<std::string> PngCodec::write_stripped_copy(const ImageHandle& handle,
                                                       const std::set<std::string>& keys,
                                                       const std::filesystem::path& output) const {
    const StripPlan plan = plan_strip(handle, keys);
    const auto& blocks = handle.blocks();
    const auto temp = make_temp_sibling(output);

    try {
        unique_FILE fp_in(open_file(handle.path(), "rb"));
        if (!fp_in) {
            throw WriteError("Cannot reopen PNG input: " + handle.path().string());
        }
        PngRead rd;
        read_png(fp_in.get(), rd);

        unique_FILE fp_out(open_file(temp, "wb"));
        if (!fp_out) {
            throw WriteError("Cannot open PNG output: " + temp.string());
        }

        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw std::runtime_error("png_create_info_struct failed");
        png_init_io(wr.png, fp_out.get());

        png_uint_32 width, height;
        int bit_depth, color_type, interlace, compression, filter;
        png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type,
                     &interlace, &compression, &filter);
        png_set_IHDR(wr.png, wr.info, width, height, bit_depth, color_type,
                     interlace, compression, filter);
        copy_colour_chunks(rd.png, rd.info, wr.png, wr.info);

        // walk the source chunks in the same order read_blocks() produced them
        std::size_t index = 0;
        auto keep_next = [&]() {
            if (index >= blocks.size()) {
                throw WriteError("PNG changed on disk since it was decoded: " + handle.path().string());
            }
            return plan.actions[index++];
        };

        if (png_get_valid(rd.png, rd.info, PNG_INFO_iCCP)) {
            png_charp name = nullptr;
            int comp_type = 0;
            png_bytep profile = nullptr;
            png_uint_32 profile_len = 0;
            if (png_get_iCCP(rd.png, rd.info, &name, &comp_type, &profile, &profile_len) &&
                keep_next() != BlockAction::Drop) {
                png_set_iCCP(wr.png, wr.info, name, comp_type, profile, profile_len);
            }
        }

        png_uint_32 num_exif = 0;
        png_bytep exif = nullptr;
        if (png_get_eXIf_1(rd.png, rd.info, &num_exif, &exif) && exif && num_exif > 0) {
            const std::size_t i = index;
            const auto action = keep_next();
            if (action == BlockAction::Keep) {
                auto data = blocks[i].data;
                png_set_eXIf_1(wr.png, wr.info, static_cast<png_uint_32>(data.size()), data.data());
            } else if (action == BlockAction::Rewrite) {
                auto data = plan.rewritten[i];
                png_set_eXIf_1(wr.png, wr.info, static_cast<png_uint_32>(data.size()), data.data());
            }
        }

        png_textp text = nullptr;
        int num_text = 0;
        png_get_text(rd.png, rd.info, &text, &num_text);
        std::vector<png_text> kept_text;
        for (int i = 0; i < num_text; ++i) {
            if (keep_next() != BlockAction::Drop) {
                kept_text.push_back(text[i]);
            }
        }
        if (!kept_text.empty()) {
            png_set_text(wr.png, wr.info, kept_text.data(), static_cast<int>(kept_text.size()));
        }

        if (png_get_valid(rd.png, rd.info, PNG_INFO_tIME)) {
            png_timep mod_time = nullptr;
            if (png_get_tIME(rd.png, rd.info, &mod_time) && mod_time &&
                keep_next() != BlockAction::Drop) {
                png_set_tIME(wr.png, wr.info, mod_time);
            }
        }

        png_set_rows(wr.png, wr.info, png_get_rows(rd.png, rd.info));
        png_write_png(wr.png, wr.info, PNG_TRANSFORM_IDENTITY, nullptr);

        if (std::fflush(fp_out.get()) != 0 || std::ferror(fp_out.get())) {
            throw WriteError("Write failed for " + temp.string());
        }
        if (std::fclose(fp_out.release()) != 0) {
            throw WriteError("Close failed for " + temp.string());
        }
    } catch (const WriteError&) {
        remove_quietly(temp);
        throw;
    } catch (const std::exception& e) {
        remove_quietly(temp);
        throw WriteError(std::string("libpng: ") + e.what());
    }

    commit_temp_file(temp, output);
    return plan.removed;
}

} // namespace imgsan
