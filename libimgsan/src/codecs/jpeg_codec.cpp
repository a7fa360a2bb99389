#include "../../include/jpeg_codec.hpp"
#include "../../include/error.hpp"
#include "../../include/file_utils.hpp"
#include <cstdio>
#include <cstring>
#include <jpeglib.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr char kExifHeader[] = {'E', 'x', 'i', 'f', '\0', '\0'};
constexpr char kXmpNamespace[] = "http://ns.adobe.com/xap/1.0/";
constexpr char kXmpExtension[] = "http://ns.adobe.com/xmp/extension/";
constexpr char kIccHeader[] = "ICC_PROFILE";
constexpr char kPhotoshopHeader[] = "Photoshop 3.0";

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(err->msg);
}

/**
 * @brief Keeps the first warning text instead of printing it to stderr.
 *
 * libjpeg reports corrupt entropy data and premature end of file as
 * warnings (msg_level -1); trace messages (msg_level > 0) are dropped.
 */
void jpeg_emit_message_collect(const j_common_ptr cinfo, const int msg_level) {
    if (msg_level >= 0) return;
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    if (err->pub.num_warnings == 0) {
        (*cinfo->err->format_message)(cinfo, err->msg);
    }
    ++err->pub.num_warnings;
}

/**
 * @brief RAII owner of a libjpeg decompression struct.
 */
struct Decompressor {
    jpeg_decompress_struct info{};
    JpegErrorMgr err{};

    Decompressor() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.emit_message = jpeg_emit_message_collect;
        jpeg_create_decompress(&info);
    }
    ~Decompressor() { jpeg_destroy_decompress(&info); }

    Decompressor(const Decompressor&) = delete;
    Decompressor& operator=(const Decompressor&) = delete;
};

/**
 * @brief RAII owner of a libjpeg compression struct.
 */
struct Compressor {
    jpeg_compress_struct info{};
    JpegErrorMgr err{};

    Compressor() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        jpeg_create_compress(&info);
    }
    ~Compressor() { jpeg_destroy_compress(&info); }

    Compressor(const Compressor&) = delete;
    Compressor& operator=(const Compressor&) = delete;
};

bool has_prefix(const jpeg_saved_marker_ptr m, const char *prefix, const std::size_t len) {
    return m->data_length >= len && std::memcmp(m->data, prefix, len) == 0;
}

/**
 * @brief Maps a saved marker to a metadata block.
 * @return false for structural markers (JFIF, Adobe) that are not metadata.
 */
bool to_block(const jpeg_saved_marker_ptr m, imgsan::MetadataBlock &block) {
    using imgsan::BlockKind;
    block.marker = m->marker;
    block.data.assign(m->data, m->data + m->data_length);

    if (m->marker == JPEG_COM) {
        block.kind = BlockKind::Comment;
        return true;
    }
    if (m->marker == JPEG_APP0) {
        if (has_prefix(m, "JFIF", 5)) return false;
        block.kind = BlockKind::Other;
        return true;
    }
    if (m->marker == JPEG_APP0 + 1) {
        if (has_prefix(m, kExifHeader, sizeof(kExifHeader))) {
            block.kind = BlockKind::Exif;
            block.data.erase(block.data.begin(), block.data.begin() + sizeof(kExifHeader));
            return true;
        }
        if (has_prefix(m, kXmpNamespace, sizeof(kXmpNamespace))) {
            block.kind = BlockKind::Xmp;
            return true;
        }
        if (has_prefix(m, kXmpExtension, sizeof(kXmpExtension))) {
            block.kind = BlockKind::Xmp;
            block.label = "extension";
            return true;
        }
    }
    if (m->marker == JPEG_APP0 + 2 && has_prefix(m, kIccHeader, sizeof(kIccHeader))) {
        block.kind = BlockKind::Icc;
        return true;
    }
    if (m->marker == JPEG_APP0 + 13 && has_prefix(m, kPhotoshopHeader, sizeof(kPhotoshopHeader))) {
        block.kind = BlockKind::Iptc;
        block.label = "Photoshop";
        return true;
    }
    if (m->marker == JPEG_APP0 + 14 && has_prefix(m, "Adobe", 5)) {
        return false;
    }
    block.kind = BlockKind::Other;
    return true;
}

} // namespace

namespace imgsan {

std::unique_ptr<ImageHandle> JpegCodec::decode(const std::filesystem::path& path) const {
    unique_FILE infile(open_file(path, "rb"));
    if (!infile) {
        throw DecodeError("Cannot open JPEG input: " + path.string());
    }

    std::vector<MetadataBlock> blocks;
    JDIMENSION width = 0;
    JDIMENSION height = 0;

    try {
        Decompressor src;
        jpeg_stdio_src(&src.info, infile.get());
        for (int m = 0; m < 16; ++m) {
            jpeg_save_markers(&src.info, JPEG_APP0 + m, 0xFFFF);
        }
        jpeg_save_markers(&src.info, JPEG_COM, 0xFFFF);

        if (jpeg_read_header(&src.info, TRUE) != JPEG_HEADER_OK) {
            throw DecodeError("Invalid JPEG header");
        }
        // reads every scan: corrupt entropy data shows up as warnings here
        if (!jpeg_read_coefficients(&src.info)) {
            throw DecodeError("Cannot read JPEG coefficients");
        }
        if (src.err.pub.num_warnings > 0) {
            throw DecodeError(std::string("Corrupt JPEG data: ") + src.err.msg);
        }

        for (jpeg_saved_marker_ptr m = src.info.marker_list; m; m = m->next) {
            MetadataBlock block{BlockKind::Other};
            if (to_block(m, block)) {
                blocks.push_back(std::move(block));
            }
        }
        width = src.info.image_width;
        height = src.info.image_height;
        jpeg_finish_decompress(&src.info);
    } catch (const DecodeError&) {
        throw;
    } catch (const std::exception& e) {
        throw DecodeError(std::string("libjpeg: ") + e.what());
    }

    return std::make_unique<ImageHandle>(path, "JPEG", width, height, std::move(blocks));
}

std::vector<MetadataEntry> JpegCodec::read_tags(const ImageHandle& handle) const {
    return collect_entries(handle);
}

std::vector<std::string> JpegCodec::write_stripped_copy(const ImageHandle& handle,
                                                        const std::set<std::string>& keys,
                                                        const std::filesystem::path& output) const {
    const StripPlan plan = plan_strip(handle, keys);
    const auto temp = make_temp_sibling(output);

    try {
        unique_FILE infile(open_file(handle.path(), "rb"));
        if (!infile) {
            throw WriteError("Cannot reopen JPEG input: " + handle.path().string());
        }
        unique_FILE outfile(open_file(temp, "wb"));
        if (!outfile) {
            throw WriteError("Cannot open JPEG output: " + temp.string());
        }

        Decompressor src;
        Compressor dst;
        jpeg_stdio_src(&src.info, infile.get());
        if (jpeg_read_header(&src.info, TRUE) != JPEG_HEADER_OK) {
            throw WriteError("Invalid JPEG header");
        }
        jvirt_barray_ptr *coef_arrays = jpeg_read_coefficients(&src.info);
        jpeg_copy_critical_parameters(&src.info, &dst.info);
        if (src.info.progressive_mode) {
            jpeg_simple_progression(&dst.info);
        }
        dst.info.optimize_coding = TRUE;
        jpeg_stdio_dest(&dst.info, outfile.get());
        jpeg_write_coefficients(&dst.info, coef_arrays);

        const auto& blocks = handle.blocks();
        for (std::size_t i = 0; i < blocks.size(); ++i) {
            const auto& block = blocks[i];
            if (plan.actions[i] == BlockAction::Drop) continue;

            if (block.kind == BlockKind::Exif) {
                const auto& tiff = plan.actions[i] == BlockAction::Rewrite ? plan.rewritten[i] : block.data;
                std::vector<JOCTET> payload(std::begin(kExifHeader), std::end(kExifHeader));
                payload.insert(payload.end(), tiff.begin(), tiff.end());
                jpeg_write_marker(&dst.info, block.marker, payload.data(),
                                  static_cast<unsigned int>(payload.size()));
            } else {
                jpeg_write_marker(&dst.info, block.marker, block.data.data(),
                                  static_cast<unsigned int>(block.data.size()));
            }
        }

        jpeg_finish_compress(&dst.info);
        jpeg_finish_decompress(&src.info);

        if (std::fflush(outfile.get()) != 0 || std::ferror(outfile.get())) {
            throw WriteError("Write failed for " + temp.string());
        }
        if (std::fclose(outfile.release()) != 0) {
            throw WriteError("Close failed for " + temp.string());
        }
    } catch (const WriteError&) {
        remove_quietly(temp);
        throw;
    } catch (const std::exception& e) {
        remove_quietly(temp);
        throw WriteError(std::string("libjpeg: ") + e.what());
    }

    commit_temp_file(temp, output);
    return plan.removed;
}

} // namespace imgsan
