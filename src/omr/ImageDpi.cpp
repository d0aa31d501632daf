#include "omr/ImageDpi.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <optional>
#include <vector>

namespace omr {

namespace {

uint32_t readBE(const unsigned char* p, int n) {
    uint32_t v = 0;
    for (int i = 0; i < n; ++i) v = (v << 8) | p[i];
    return v;
}

std::optional<Dpi> jpegDpi(std::ifstream& in) {
    // SOI already consumed. Walk the marker segments up to the scan data.
    while (in) {
        unsigned char hdr[4];
        if (!in.read(reinterpret_cast<char*>(hdr), 2)) return std::nullopt;
        if (hdr[0] != 0xFF) return std::nullopt;
        unsigned char marker = hdr[1];
        if (marker == 0xD9 || marker == 0xDA) return std::nullopt;
        if (!in.read(reinterpret_cast<char*>(hdr + 2), 2)) return std::nullopt;
        uint32_t len = readBE(hdr + 2, 2);
        if (len < 2) return std::nullopt;

        std::vector<unsigned char> payload(len - 2);
        if (!payload.empty() && !in.read(reinterpret_cast<char*>(payload.data()), payload.size()))
            return std::nullopt;

        if (marker == 0xE0 && payload.size() >= 12 && std::memcmp(payload.data(), "JFIF\0", 5) == 0) {
            int units = payload[7];
            double xd = readBE(&payload[8], 2);
            double yd = readBE(&payload[10], 2);
            if (xd <= 0 || yd <= 0) return std::nullopt;
            if (units == 1) return Dpi{xd, yd};
            if (units == 2) return Dpi{xd * 2.54, yd * 2.54};
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<Dpi> pngDpi(std::ifstream& in) {
    // Signature already consumed. pHYs must come before the first IDAT.
    while (in) {
        unsigned char hdr[8];
        if (!in.read(reinterpret_cast<char*>(hdr), 8)) return std::nullopt;
        uint32_t len = readBE(hdr, 4);
        if (std::memcmp(hdr + 4, "IDAT", 4) == 0 || std::memcmp(hdr + 4, "IEND", 4) == 0)
            return std::nullopt;

        if (std::memcmp(hdr + 4, "pHYs", 4) == 0 && len == 9) {
            unsigned char data[9];
            if (!in.read(reinterpret_cast<char*>(data), 9)) return std::nullopt;
            double ppux = readBE(data, 4);
            double ppuy = readBE(data + 4, 4);
            if (data[8] != 1 || ppux <= 0 || ppuy <= 0) return std::nullopt;
            return Dpi{ppux * 0.0254, ppuy * 0.0254};
        }
        in.seekg(static_cast<std::streamoff>(len) + 4, std::ios::cur);
    }
    return std::nullopt;
}

}

Dpi readImageDpi(const std::filesystem::path& path, Dpi fallback) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return fallback;

    std::array<unsigned char, 8> sig{};
    if (!in.read(reinterpret_cast<char*>(sig.data()), 2)) return fallback;

    std::optional<Dpi> found;
    if (sig[0] == 0xFF && sig[1] == 0xD8) {
        found = jpegDpi(in);
    } else if (sig[0] == 0x89 && sig[1] == 'P') {
        static const unsigned char kPng[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
        if (in.read(reinterpret_cast<char*>(sig.data() + 2), 6) &&
            std::memcmp(sig.data(), kPng, 8) == 0) {
            found = pngDpi(in);
        }
    }
    return found ? *found : fallback;
}

}
