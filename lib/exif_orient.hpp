// exif_orient.hpp - exif orientation parser
// holt den APP1 block und den orientation tag, rest ist egal
// handyfotos sind sonst immer gedreht, nervig
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

namespace imgshrink::exif {

// orientation werte laut exif standard:
// 1 = normal
// 2 = horizontal gespiegelt
// 3 = 180 grad gedreht
// 4 = vertikal gespiegelt
// 5 = transpose (gespiegelt + 270 grad)
// 6 = 90 grad rechts (handy hochkant)
// 7 = transverse (gespiegelt + 90 grad)
// 8 = 270 grad (oder 90 links)

constexpr uint16_t kOrientationTag = 0x0112;

// APP1 payload ohne marker und länge, beginnt mit "Exif\0\0"
struct Segment {
    size_t offset = 0;
    size_t length = 0;

    bool found() const noexcept { return length > 0; }
};

// exif APP1 im jpeg header suchen, gibt leeres segment wenns keins gibt
inline Segment find_app1(const uint8_t* buf, size_t len) {
    if (len < 4 || buf[0] != 0xFF || buf[1] != 0xD8) return {};

    size_t pos = 2;
    while (pos + 4 <= len) {
        if (buf[pos] != 0xFF) {
            pos++;
            continue;
        }

        uint8_t marker = buf[pos + 1];

        // fill bytes
        if (marker == 0xFF) {
            pos++;
            continue;
        }

        // SOS / EOI - ab hier kommt nur noch bilddaten
        if (marker == 0xDA || marker == 0xD9) break;

        // markers ohne länge (RSTn, TEM)
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) {
            pos += 2;
            continue;
        }

        size_t seg_len = (static_cast<size_t>(buf[pos + 2]) << 8) | buf[pos + 3];
        if (seg_len < 2 || pos + 2 + seg_len > len) break;

        if (marker == 0xE1 && seg_len >= 2 + 6 + 8 &&
            std::memcmp(buf + pos + 4, "Exif\0\0", 6) == 0) {
            return {pos + 4, seg_len - 2};
        }

        pos += 2 + seg_len;
    }

    return {};
}

namespace detail {

// offset (within the payload) of the orientation SHORT value, 0 when absent
inline size_t orientation_value_offset(const uint8_t* payload, size_t len) {
    constexpr size_t tiff = 6;  // hinter "Exif\0\0"
    if (len < tiff + 8) return 0;

    bool big_endian = payload[tiff] == 'M';

    auto read16 = [&](size_t off) -> uint32_t {
        const uint8_t* p = payload + tiff + off;
        return big_endian ? (p[0] << 8) | p[1] : p[0] | (p[1] << 8);
    };
    auto read32 = [&](size_t off) -> uint32_t {
        const uint8_t* p = payload + tiff + off;
        return big_endian
            ? (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3]
            : p[0] | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
    };

    size_t tiff_len = len - tiff;
    size_t ifd = read32(4);
    if (ifd == 0 || ifd + 2 > tiff_len) return 0;

    uint32_t count = read16(ifd);
    for (uint32_t i = 0; i < count; i++) {
        size_t entry = ifd + 2 + static_cast<size_t>(i) * 12;
        if (entry + 12 > tiff_len) break;
        if (read16(entry) == kOrientationTag) {
            return tiff + entry + 8;
        }
    }
    return 0;
}

} // namespace detail

// orientation aus dem jpeg buffer, 1 wenn nix gefunden oder kaputt
inline int read_jpeg_orientation(const uint8_t* buf, size_t len) {
    Segment seg = find_app1(buf, len);
    if (!seg.found()) return 1;

    const uint8_t* payload = buf + seg.offset;
    size_t off = detail::orientation_value_offset(payload, seg.length);
    if (off == 0) return 1;

    bool big_endian = payload[6] == 'M';
    int value = big_endian ? (payload[off] << 8) | payload[off + 1]
                           : payload[off] | (payload[off + 1] << 8);
    return (value >= 1 && value <= 8) ? value : 1;
}

// Copy of the APP1 payload with the orientation reset to 1, for writing back
// after the pixels were already rotated. Empty when the source has no EXIF.
inline std::vector<uint8_t> extract_normalized_app1(const uint8_t* buf, size_t len) {
    Segment seg = find_app1(buf, len);
    if (!seg.found()) return {};

    std::vector<uint8_t> payload(buf + seg.offset, buf + seg.offset + seg.length);
    size_t off = detail::orientation_value_offset(payload.data(), payload.size());
    if (off != 0) {
        bool big_endian = payload[6] == 'M';
        payload[off] = big_endian ? 0 : 1;
        payload[off + 1] = big_endian ? 1 : 0;
    }
    return payload;
}

// Bake the orientation into pixel order. Swaps width/height for the
// transposing cases (5-8). Works for any channel count.
inline void apply_orientation(std::vector<uint8_t>& pixels, int& width, int& height,
                              int orientation, int channels) {
    if (orientation <= 1 || orientation > 8) return;

    const size_t px = static_cast<size_t>(channels);
    const bool transposed = orientation >= 5;
    const int out_w = transposed ? height : width;
    const int out_h = transposed ? width : height;

    std::vector<uint8_t> out(pixels.size());

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            int nx = x, ny = y;
            switch (orientation) {
                case 2: nx = width - 1 - x;  ny = y;               break;
                case 3: nx = width - 1 - x;  ny = height - 1 - y;  break;
                case 4: nx = x;              ny = height - 1 - y;  break;
                case 5: nx = y;              ny = x;               break;
                case 6: nx = height - 1 - y; ny = x;               break;
                case 7: nx = height - 1 - y; ny = width - 1 - x;   break;
                case 8: nx = y;              ny = width - 1 - x;   break;
            }
            const uint8_t* src = pixels.data() + (static_cast<size_t>(y) * width + x) * px;
            uint8_t* dst = out.data() + (static_cast<size_t>(ny) * out_w + nx) * px;
            std::memcpy(dst, src, px);
        }
    }

    pixels = std::move(out);
    width = out_w;
    height = out_h;
}

} // namespace imgshrink::exif
