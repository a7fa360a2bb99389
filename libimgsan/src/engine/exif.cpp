#include "../../include/exif.hpp"
#include "../../include/error.hpp"
#include <algorithm>
#include <array>
#include <cstdio>

namespace imgsan {

namespace {

constexpr std::uint16_t kExifPointer = 0x8769;
constexpr std::uint16_t kGpsPointer = 0x8825;
constexpr std::uint16_t kIopPointer = 0xa005;
constexpr std::uint16_t kThumbnailOffset = 0x0201;
constexpr std::uint16_t kThumbnailLength = 0x0202;
constexpr std::uint16_t kMakerNote = 0x927c;

constexpr std::size_t kEntrySize = 12;
constexpr std::uint16_t kMaxEntries = 1024;
constexpr std::size_t kMaxRenderedValues = 8;
constexpr std::size_t kMaxRenderedText = 128;

std::size_t type_size(const std::uint16_t type) noexcept {
    switch (type) {
        case 1: case 2: case 6: case 7: return 1;  // BYTE ASCII SBYTE UNDEFINED
        case 3: case 8:                 return 2;  // SHORT SSHORT
        case 4: case 9: case 11: case 13: return 4; // LONG SLONG FLOAT IFD
        case 5: case 10: case 12:       return 8;  // RATIONAL SRATIONAL DOUBLE
        default:                        return 0;
    }
}

/**
 * @brief Endian-aware, bounds-checked view over a TIFF block.
 */
struct TiffReader {
    std::span<const unsigned char> buf;
    bool le;

    [[nodiscard]] std::uint16_t u16(const std::size_t off) const {
        if (off > buf.size() || buf.size() - off < 2) {
            throw DecodeError("EXIF read out of range");
        }
        return le ? static_cast<std::uint16_t>(buf[off] | (buf[off + 1] << 8))
                  : static_cast<std::uint16_t>((buf[off] << 8) | buf[off + 1]);
    }

    [[nodiscard]] std::uint32_t u32(const std::size_t off) const {
        if (off > buf.size() || buf.size() - off < 4) {
            throw DecodeError("EXIF read out of range");
        }
        const std::uint32_t b0 = buf[off], b1 = buf[off + 1], b2 = buf[off + 2], b3 = buf[off + 3];
        return le ? (b0 | (b1 << 8) | (b2 << 16) | (b3 << 24))
                  : ((b0 << 24) | (b1 << 16) | (b2 << 8) | b3);
    }

    [[nodiscard]] bool fits(const std::size_t off, const std::size_t len) const noexcept {
        return off <= buf.size() && buf.size() - off >= len;
    }
};

void put16(std::vector<unsigned char>& out, const std::size_t off, const std::uint16_t v, const bool le) {
    if (le) {
        out[off] = static_cast<unsigned char>(v & 0xff);
        out[off + 1] = static_cast<unsigned char>(v >> 8);
    } else {
        out[off] = static_cast<unsigned char>(v >> 8);
        out[off + 1] = static_cast<unsigned char>(v & 0xff);
    }
}

void put32(std::vector<unsigned char>& out, const std::size_t off, const std::uint32_t v, const bool le) {
    for (int i = 0; i < 4; ++i) {
        const int shift = le ? 8 * i : 8 * (3 - i);
        out[off + static_cast<std::size_t>(i)] = static_cast<unsigned char>((v >> shift) & 0xff);
    }
}

void zero_range(std::vector<unsigned char>& out, const std::size_t off, const std::size_t len) {
    if (off >= out.size()) return;
    const auto end = std::min(out.size(), off + len);
    std::fill(out.begin() + static_cast<std::ptrdiff_t>(off), out.begin() + static_cast<std::ptrdiff_t>(end), 0);
}

std::string render_bytes(const TiffReader& r, const std::size_t off, const std::size_t size, const bool ascii) {
    std::string text;
    bool printable = true;
    for (std::size_t i = 0; i < size; ++i) {
        const unsigned char c = r.buf[off + i];
        if (c == 0) {
            if (ascii) break;
            // trailing NULs are padding
            const bool rest_zero = std::all_of(r.buf.begin() + static_cast<std::ptrdiff_t>(off + i),
                                               r.buf.begin() + static_cast<std::ptrdiff_t>(off + size),
                                               [](unsigned char b) { return b == 0; });
            if (rest_zero) break;
            printable = false;
            break;
        }
        if (c < 0x20 || c > 0x7e) {
            printable = false;
            if (!ascii) break;
            continue;
        }
        text.push_back(static_cast<char>(c));
    }
    if (!ascii && (!printable || size > 64)) {
        return "<" + std::to_string(size) + " bytes>";
    }
    while (!text.empty() && text.back() == ' ') text.pop_back();
    if (text.size() > kMaxRenderedText) {
        text.resize(kMaxRenderedText);
        text += "...";
    }
    return text;
}

std::string render_value(const TiffReader& r, const std::uint16_t type, const std::uint32_t count,
                         const std::size_t off, const std::size_t size) {
    std::string out;
    auto join = [&](auto&& element, const std::size_t step) {
        const std::size_t n = std::min<std::size_t>(count, kMaxRenderedValues);
        for (std::size_t i = 0; i < n; ++i) {
            if (i) out += ' ';
            out += element(off + i * step);
        }
        if (count > kMaxRenderedValues) out += " ...";
    };

    switch (type) {
        case 2:
            return render_bytes(r, off, size, true);
        case 1: case 6: case 7:
            return render_bytes(r, off, size, false);
        case 3:
            join([&](std::size_t o) { return std::to_string(r.u16(o)); }, 2);
            return out;
        case 8:
            join([&](std::size_t o) { return std::to_string(static_cast<std::int16_t>(r.u16(o))); }, 2);
            return out;
        case 4: case 13:
            join([&](std::size_t o) { return std::to_string(r.u32(o)); }, 4);
            return out;
        case 9:
            join([&](std::size_t o) { return std::to_string(static_cast<std::int32_t>(r.u32(o))); }, 4);
            return out;
        case 5:
            join([&](std::size_t o) { return std::to_string(r.u32(o)) + "/" + std::to_string(r.u32(o + 4)); }, 8);
            return out;
        case 10:
            join([&](std::size_t o) {
                return std::to_string(static_cast<std::int32_t>(r.u32(o))) + "/" +
                       std::to_string(static_cast<std::int32_t>(r.u32(o + 4)));
            }, 8);
            return out;
        default:
            return "<" + std::to_string(size) + " bytes>";
    }
}

std::string make_key(const ExifIfd ifd, const std::uint16_t tag) {
    std::string key(group_name(ifd));
    key += '.';
    if (const auto name = exif_tag_name(ifd, tag)) {
        key += *name;
    } else {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%04x", static_cast<unsigned>(tag));
        key += buf;
    }
    return key;
}

/**
 * @brief Walks IFD tables and collects entries in the order they are stored.
 */
class IfdWalker {
public:
    IfdWalker(const TiffReader& reader,
              std::vector<ExifEntry>& entries,
              std::vector<ExifIfdInfo>& ifds)
        : r_(reader), entries_(entries), ifds_(ifds) {}

    /**
     * @brief Parses one IFD and the sub-IFDs it points to.
     * @return The next-IFD offset stored after the table (0 if absent).
     */
    std::uint32_t walk(const std::size_t offset, const ExifIfd ifd) {
        if (std::find(visited_.begin(), visited_.end(), offset) != visited_.end()) {
            throw DecodeError("EXIF IFD loop detected");
        }
        visited_.push_back(offset);

        const std::uint16_t count = r_.u16(offset);
        if (count > kMaxEntries) {
            throw DecodeError("EXIF IFD has too many entries");
        }
        const std::size_t table = offset + 2;
        if (!r_.fits(table, kEntrySize * count)) {
            throw DecodeError("EXIF IFD table out of range");
        }
        ifds_.push_back({ifd, offset, count});

        std::vector<std::pair<std::size_t, ExifIfd>> children;
        for (std::uint16_t i = 0; i < count; ++i) {
            const std::size_t eo = table + kEntrySize * i;
            const std::uint16_t tag = r_.u16(eo);
            const std::uint16_t type = r_.u16(eo + 2);
            const std::uint32_t n = r_.u32(eo + 4);

            if (ifd == ExifIfd::Image && tag == kExifPointer) {
                children.emplace_back(r_.u32(eo + 8), ExifIfd::Photo);
                continue;
            }
            if (ifd == ExifIfd::Image && tag == kGpsPointer) {
                children.emplace_back(r_.u32(eo + 8), ExifIfd::GpsInfo);
                continue;
            }
            if (ifd == ExifIfd::Photo && tag == kIopPointer) {
                children.emplace_back(r_.u32(eo + 8), ExifIfd::Iop);
                continue;
            }

            const std::size_t unit = type_size(type);
            if (unit != 0 && n > r_.buf.size() / unit) {
                throw DecodeError("EXIF value count out of range");
            }
            const std::size_t size = unit * n;
            std::size_t value_offset = eo + 8;
            if (size > 4) {
                value_offset = r_.u32(eo + 8);
                if (!r_.fits(value_offset, size)) {
                    throw DecodeError("EXIF value offset out of range");
                }
            }

            ExifEntry entry{
                ifd, tag, type, n,
                make_key(ifd, tag),
                unit == 0 ? "<unknown type " + std::to_string(type) + ">"
                          : render_value(r_, type, n, value_offset, size),
                exif_tag_name(ifd, tag).has_value(),
                eo, value_offset, size
            };
            entries_.push_back(std::move(entry));
        }

        const std::size_t next_pos = table + kEntrySize * count;
        const std::uint32_t next = r_.fits(next_pos, 4) ? r_.u32(next_pos) : 0;

        for (const auto& [child_offset, child_ifd] : children) {
            walk(child_offset, child_ifd);
        }
        return next;
    }

private:
    const TiffReader& r_;
    std::vector<ExifEntry>& entries_;
    std::vector<ExifIfdInfo>& ifds_;
    std::vector<std::size_t> visited_;
};

} // namespace

ExifData ExifData::parse(const std::span<const unsigned char> tiff) {
    if (tiff.size() < 8) {
        throw DecodeError("EXIF block too short");
    }
    ExifData data;
    data.tiff_.assign(tiff.begin(), tiff.end());
    if (tiff[0] == 'I' && tiff[1] == 'I') {
        data.little_endian_ = true;
    } else if (tiff[0] == 'M' && tiff[1] == 'M') {
        data.little_endian_ = false;
    } else {
        throw DecodeError("EXIF block has no TIFF byte order mark");
    }

    const TiffReader r{data.tiff_, data.little_endian_};
    if (r.u16(2) != 42) {
        throw DecodeError("EXIF block has a bad TIFF magic number");
    }

    IfdWalker walker(r, data.entries_, data.ifds_);
    const std::uint32_t ifd1 = walker.walk(r.u32(4), ExifIfd::Image);
    if (ifd1 != 0) {
        walker.walk(ifd1, ExifIfd::Thumbnail);

        const ExifEntry* offset = nullptr;
        const ExifEntry* length = nullptr;
        for (const auto& e : data.entries_) {
            if (e.ifd != ExifIfd::Thumbnail) continue;
            if (e.tag == kThumbnailOffset) offset = &e;
            if (e.tag == kThumbnailLength) length = &e;
        }
        if (offset && length) {
            const std::size_t start = r.u32(offset->value_offset);
            const std::size_t size = length->type == 3 ? r.u16(length->value_offset) : r.u32(length->value_offset);
            if (size > 0 && r.fits(start, size)) {
                data.thumbnail_ = std::make_pair(start, size);
            }
        }
    }
    return data;
}

const ExifEntry* ExifData::find(const std::string_view key) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [&](const ExifEntry& e) { return e.key == key; });
    return it == entries_.end() ? nullptr : &*it;
}

std::vector<double> ExifData::rationals(const ExifEntry& entry) const {
    std::vector<double> values;
    if (entry.type != 5 && entry.type != 10) return values;
    const TiffReader r{tiff_, little_endian_};
    for (std::uint32_t i = 0; i < entry.count; ++i) {
        const std::size_t o = entry.value_offset + 8 * i;
        const std::uint32_t num = r.u32(o);
        const std::uint32_t den = r.u32(o + 4);
        if (den == 0) return {};
        if (entry.type == 5) {
            values.push_back(static_cast<double>(num) / static_cast<double>(den));
        } else {
            values.push_back(static_cast<double>(static_cast<std::int32_t>(num)) /
                             static_cast<double>(static_cast<std::int32_t>(den)));
        }
    }
    return values;
}

std::vector<std::uint32_t> ExifData::denominators(const ExifEntry& entry) const {
    std::vector<std::uint32_t> values;
    if (entry.type != 5 && entry.type != 10) return values;
    const TiffReader r{tiff_, little_endian_};
    for (std::uint32_t i = 0; i < entry.count; ++i) {
        values.push_back(r.u32(entry.value_offset + 8 * i + 4));
    }
    return values;
}

bool ExifData::selected(const ExifEntry& entry, const std::set<std::string>& keys) const {
    if (keys.contains(entry.key)) return true;
    if (entry.ifd == ExifIfd::GpsInfo && keys.contains("Exif.GPSInfo")) return true;
    if (entry.ifd == ExifIfd::Thumbnail && keys.contains("Exif.Thumbnail")) return true;
    if (keys.contains("Exif.Private") &&
        (entry.ifd == ExifIfd::Image || entry.ifd == ExifIfd::Photo) &&
        (!entry.known || entry.tag == kMakerNote)) {
        return true;
    }
    return false;
}

bool ExifData::matches_any(const std::set<std::string>& keys) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const ExifEntry& e) { return selected(e, keys); });
}

std::vector<unsigned char> ExifData::strip(const std::set<std::string>& keys,
                                           std::vector<std::string>* removed) const {
    std::vector<unsigned char> out = tiff_;
    const TiffReader r{tiff_, little_endian_};

    std::vector<std::size_t> dropped;  // entry offsets
    bool drop_ifd1 = false;
    std::size_t gps_total = 0;
    std::size_t gps_dropped = 0;

    for (const auto& e : entries_) {
        if (e.ifd == ExifIfd::GpsInfo) ++gps_total;
        if (!selected(e, keys)) continue;
        if (e.ifd == ExifIfd::Thumbnail) {
            drop_ifd1 = true;
            continue;
        }
        dropped.push_back(e.entry_offset);
        if (e.ifd == ExifIfd::GpsInfo) ++gps_dropped;
        if (e.value_size > 4) {
            zero_range(out, e.value_offset, e.value_size);
        }
        if (removed) removed->push_back(e.key);
    }
    const bool drop_gps = gps_total > 0 && gps_dropped == gps_total;

    if (drop_ifd1) {
        for (const auto& e : entries_) {
            if (e.ifd != ExifIfd::Thumbnail) continue;
            if (e.value_size > 4) zero_range(out, e.value_offset, e.value_size);
            if (removed) removed->push_back(e.key);
        }
        if (thumbnail_) {
            zero_range(out, thumbnail_->first, thumbnail_->second);
        }
    }

    auto is_dropped = [&](const std::size_t entry_offset) {
        return std::find(dropped.begin(), dropped.end(), entry_offset) != dropped.end();
    };

    for (const auto& info : ifds_) {
        const std::size_t table = info.offset + 2;
        const std::size_t next_pos = table + kEntrySize * info.count;
        const bool has_next = r.fits(next_pos, 4);

        if (info.ifd == ExifIfd::Thumbnail && drop_ifd1) {
            zero_range(out, info.offset, 2 + kEntrySize * info.count + (has_next ? 4 : 0));
            continue;
        }
        if (info.ifd == ExifIfd::GpsInfo && drop_gps) {
            zero_range(out, info.offset, 2 + kEntrySize * info.count + (has_next ? 4 : 0));
            continue;
        }

        std::vector<std::array<unsigned char, kEntrySize>> kept;
        for (std::uint16_t i = 0; i < info.count; ++i) {
            const std::size_t eo = table + kEntrySize * i;
            if (is_dropped(eo)) continue;
            if (info.ifd == ExifIfd::Image && drop_gps && r.u16(eo) == kGpsPointer) continue;
            std::array<unsigned char, kEntrySize> raw{};
            std::copy_n(tiff_.begin() + static_cast<std::ptrdiff_t>(eo), kEntrySize, raw.begin());
            kept.push_back(raw);
        }

        const bool unlink_ifd1 = info.ifd == ExifIfd::Image && drop_ifd1;
        if (kept.size() == info.count && !unlink_ifd1) continue;

        const std::uint32_t next = unlink_ifd1 ? 0 : (has_next ? r.u32(next_pos) : 0);
        zero_range(out, table, kEntrySize * info.count + (has_next ? 4 : 0));
        put16(out, info.offset, static_cast<std::uint16_t>(kept.size()), little_endian_);
        for (std::size_t i = 0; i < kept.size(); ++i) {
            std::copy(kept[i].begin(), kept[i].end(),
                      out.begin() + static_cast<std::ptrdiff_t>(table + kEntrySize * i));
        }
        if (has_next) {
            put32(out, table + kEntrySize * kept.size(), next, little_endian_);
        }
    }
    return out;
}

} // namespace imgsan
