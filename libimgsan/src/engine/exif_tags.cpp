#include "../../include/exif.hpp"

namespace imgsan {

std::string_view group_name(const ExifIfd ifd) noexcept {
    switch (ifd) {
        case ExifIfd::Image:     return "Exif.Image";
        case ExifIfd::Photo:     return "Exif.Photo";
        case ExifIfd::GpsInfo:   return "Exif.GPSInfo";
        case ExifIfd::Thumbnail: return "Exif.Thumbnail";
        case ExifIfd::Iop:       return "Exif.Iop";
    }
    return "Exif";
}

namespace {

// tags valid in IFD0 and IFD1
std::optional<std::string_view> image_tag(const std::uint16_t tag) noexcept {
    switch (tag) {
        case 0x00fe: return "NewSubfileType";
        case 0x0100: return "ImageWidth";
        case 0x0101: return "ImageLength";
        case 0x0102: return "BitsPerSample";
        case 0x0103: return "Compression";
        case 0x0106: return "PhotometricInterpretation";
        case 0x010e: return "ImageDescription";
        case 0x010f: return "Make";
        case 0x0110: return "Model";
        case 0x0111: return "StripOffsets";
        case 0x0112: return "Orientation";
        case 0x0115: return "SamplesPerPixel";
        case 0x0116: return "RowsPerStrip";
        case 0x0117: return "StripByteCounts";
        case 0x011a: return "XResolution";
        case 0x011b: return "YResolution";
        case 0x011c: return "PlanarConfiguration";
        case 0x0128: return "ResolutionUnit";
        case 0x012d: return "TransferFunction";
        case 0x0131: return "Software";
        case 0x0132: return "DateTime";
        case 0x013b: return "Artist";
        case 0x013c: return "HostComputer";
        case 0x013e: return "WhitePoint";
        case 0x013f: return "PrimaryChromaticities";
        case 0x0201: return "JPEGInterchangeFormat";
        case 0x0202: return "JPEGInterchangeFormatLength";
        case 0x0211: return "YCbCrCoefficients";
        case 0x0212: return "YCbCrSubSampling";
        case 0x0213: return "YCbCrPositioning";
        case 0x0214: return "ReferenceBlackWhite";
        case 0x02bc: return "XMLPacket";
        case 0x4746: return "Rating";
        case 0x4749: return "RatingPercent";
        case 0x8298: return "Copyright";
        case 0x83bb: return "IPTCNAA";
        case 0x8773: return "InterColorProfile";
        case 0x9c9b: return "XPTitle";
        case 0x9c9c: return "XPComment";
        case 0x9c9d: return "XPAuthor";
        case 0x9c9e: return "XPKeywords";
        case 0x9c9f: return "XPSubject";
        case 0xc4a5: return "PrintImageMatching";
        default:     return std::nullopt;
    }
}

std::optional<std::string_view> photo_tag(const std::uint16_t tag) noexcept {
    switch (tag) {
        case 0x829a: return "ExposureTime";
        case 0x829d: return "FNumber";
        case 0x8822: return "ExposureProgram";
        case 0x8824: return "SpectralSensitivity";
        case 0x8827: return "ISOSpeedRatings";
        case 0x8830: return "SensitivityType";
        case 0x8832: return "RecommendedExposureIndex";
        case 0x9000: return "ExifVersion";
        case 0x9003: return "DateTimeOriginal";
        case 0x9004: return "DateTimeDigitized";
        case 0x9010: return "OffsetTime";
        case 0x9011: return "OffsetTimeOriginal";
        case 0x9012: return "OffsetTimeDigitized";
        case 0x9101: return "ComponentsConfiguration";
        case 0x9102: return "CompressedBitsPerPixel";
        case 0x9201: return "ShutterSpeedValue";
        case 0x9202: return "ApertureValue";
        case 0x9203: return "BrightnessValue";
        case 0x9204: return "ExposureBiasValue";
        case 0x9205: return "MaxApertureValue";
        case 0x9206: return "SubjectDistance";
        case 0x9207: return "MeteringMode";
        case 0x9208: return "LightSource";
        case 0x9209: return "Flash";
        case 0x920a: return "FocalLength";
        case 0x9214: return "SubjectArea";
        case 0x927c: return "MakerNote";
        case 0x9286: return "UserComment";
        case 0x9290: return "SubSecTime";
        case 0x9291: return "SubSecTimeOriginal";
        case 0x9292: return "SubSecTimeDigitized";
        case 0xa000: return "FlashpixVersion";
        case 0xa001: return "ColorSpace";
        case 0xa002: return "PixelXDimension";
        case 0xa003: return "PixelYDimension";
        case 0xa004: return "RelatedSoundFile";
        case 0xa20e: return "FocalPlaneXResolution";
        case 0xa20f: return "FocalPlaneYResolution";
        case 0xa210: return "FocalPlaneResolutionUnit";
        case 0xa215: return "ExposureIndex";
        case 0xa217: return "SensingMethod";
        case 0xa300: return "FileSource";
        case 0xa301: return "SceneType";
        case 0xa302: return "CFAPattern";
        case 0xa401: return "CustomRendered";
        case 0xa402: return "ExposureMode";
        case 0xa403: return "WhiteBalance";
        case 0xa404: return "DigitalZoomRatio";
        case 0xa405: return "FocalLengthIn35mmFilm";
        case 0xa406: return "SceneCaptureType";
        case 0xa407: return "GainControl";
        case 0xa408: return "Contrast";
        case 0xa409: return "Saturation";
        case 0xa40a: return "Sharpness";
        case 0xa40c: return "SubjectDistanceRange";
        case 0xa420: return "ImageUniqueID";
        case 0xa430: return "CameraOwnerName";
        case 0xa431: return "BodySerialNumber";
        case 0xa432: return "LensSpecification";
        case 0xa433: return "LensMake";
        case 0xa434: return "LensModel";
        case 0xa435: return "LensSerialNumber";
        case 0xa460: return "CompositeImage";
        default:     return std::nullopt;
    }
}

std::optional<std::string_view> gps_tag(const std::uint16_t tag) noexcept {
    switch (tag) {
        case 0x0000: return "GPSVersionID";
        case 0x0001: return "GPSLatitudeRef";
        case 0x0002: return "GPSLatitude";
        case 0x0003: return "GPSLongitudeRef";
        case 0x0004: return "GPSLongitude";
        case 0x0005: return "GPSAltitudeRef";
        case 0x0006: return "GPSAltitude";
        case 0x0007: return "GPSTimeStamp";
        case 0x0008: return "GPSSatellites";
        case 0x0009: return "GPSStatus";
        case 0x000a: return "GPSMeasureMode";
        case 0x000b: return "GPSDOP";
        case 0x000c: return "GPSSpeedRef";
        case 0x000d: return "GPSSpeed";
        case 0x000e: return "GPSTrackRef";
        case 0x000f: return "GPSTrack";
        case 0x0010: return "GPSImgDirectionRef";
        case 0x0011: return "GPSImgDirection";
        case 0x0012: return "GPSMapDatum";
        case 0x0013: return "GPSDestLatitudeRef";
        case 0x0014: return "GPSDestLatitude";
        case 0x0015: return "GPSDestLongitudeRef";
        case 0x0016: return "GPSDestLongitude";
        case 0x0017: return "GPSDestBearingRef";
        case 0x0018: return "GPSDestBearing";
        case 0x0019: return "GPSDestDistanceRef";
        case 0x001a: return "GPSDestDistance";
        case 0x001b: return "GPSProcessingMethod";
        case 0x001c: return "GPSAreaInformation";
        case 0x001d: return "GPSDateStamp";
        case 0x001e: return "GPSDifferential";
        case 0x001f: return "GPSHPositioningError";
        default:     return std::nullopt;
    }
}

std::optional<std::string_view> iop_tag(const std::uint16_t tag) noexcept {
    switch (tag) {
        case 0x0001: return "InteroperabilityIndex";
        case 0x0002: return "InteroperabilityVersion";
        case 0x1000: return "RelatedImageFileFormat";
        case 0x1001: return "RelatedImageWidth";
        case 0x1002: return "RelatedImageLength";
        default:     return std::nullopt;
    }
}

} // namespace

std::optional<std::string_view> exif_tag_name(const ExifIfd ifd, const std::uint16_t tag) noexcept {
    switch (ifd) {
        case ExifIfd::Image:
        case ExifIfd::Thumbnail: return image_tag(tag);
        case ExifIfd::Photo:     return photo_tag(tag);
        case ExifIfd::GpsInfo:   return gps_tag(tag);
        case ExifIfd::Iop:       return iop_tag(tag);
    }
    return std::nullopt;
}

} // namespace imgsan
