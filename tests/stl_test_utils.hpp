//
//  stl_test_utils.hpp
//  EbuStl
//
//  Test-only helpers to build tiny EBU STL files in memory. Kept independent of the library
//  code to avoid self-consistency bugs.
//

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace stl_test_utils {

inline constexpr size_t kGsiSize = 1024;
inline constexpr size_t kTtiSize = 128;
inline constexpr size_t kTextSize = 112;

// Space padded ASCII field, truncated when the value is too long.
inline void put_field(std::vector<uint8_t> &buf, size_t offset, size_t len,
                      const std::string &value) {
    for (size_t i = 0; i < len; ++i) {
        buf[offset + i] = i < value.size() ? static_cast<uint8_t>(value[i]) : ' ';
    }
}

// Zero padded decimal field, e.g. put_number(buf, 238, 5, 3) -> "00003".
inline void put_number(std::vector<uint8_t> &buf, size_t offset, size_t len, uint32_t value) {
    std::string digits = std::to_string(value);
    if (digits.size() < len) {
        digits.insert(0, len - digits.size(), '0');
    }
    put_field(buf, offset, len, digits);
}

struct GsiFields {
    std::string cpn = "850";
    std::string dfc = "STL25.01";
    char dsc = '1';
    std::string cct = "00";
    std::string lc = "09";
    std::string opt = "Test programme";
    std::string oet = "Episode one";
    std::string tpt;
    std::string tet;
    std::string tn = "Translator";
    std::string tcd;
    std::string slr = "REF-0001";
    std::string cd = "260116";
    std::string rd = "260117";
    std::string rn = "01";
    std::string tnb = "00000";
    std::string tns = "00000";
    std::string tng = "001";
    std::string mnc = "40";
    std::string mnr = "23";
    char tcs = '1';
    std::string tcp = "10000000";
    std::string tcf = "10000000";
    char tnd = '1';
    char dsn = '1';
    std::string co = "GBR";
    std::string pub = "Publisher";
    std::string en = "Editor";
    std::string ecd = "editor@example.com";
};

inline std::vector<uint8_t> make_gsi(const GsiFields &f = {}) {
    std::vector<uint8_t> buf(kGsiSize, ' ');
    put_field(buf, 0, 3, f.cpn);
    put_field(buf, 3, 8, f.dfc);
    buf[11] = static_cast<uint8_t>(f.dsc);
    put_field(buf, 12, 2, f.cct);
    put_field(buf, 14, 2, f.lc);
    put_field(buf, 16, 32, f.opt);
    put_field(buf, 48, 32, f.oet);
    put_field(buf, 80, 32, f.tpt);
    put_field(buf, 112, 32, f.tet);
    put_field(buf, 144, 32, f.tn);
    put_field(buf, 176, 32, f.tcd);
    put_field(buf, 208, 16, f.slr);
    put_field(buf, 224, 6, f.cd);
    put_field(buf, 230, 6, f.rd);
    put_field(buf, 236, 2, f.rn);
    put_field(buf, 238, 5, f.tnb);
    put_field(buf, 243, 5, f.tns);
    put_field(buf, 248, 3, f.tng);
    put_field(buf, 251, 2, f.mnc);
    put_field(buf, 253, 2, f.mnr);
    buf[255] = static_cast<uint8_t>(f.tcs);
    put_field(buf, 256, 8, f.tcp);
    put_field(buf, 264, 8, f.tcf);
    buf[272] = static_cast<uint8_t>(f.tnd);
    buf[273] = static_cast<uint8_t>(f.dsn);
    put_field(buf, 274, 3, f.co);
    put_field(buf, 277, 32, f.pub);
    put_field(buf, 309, 32, f.en);
    put_field(buf, 341, 32, f.ecd);
    return buf;
}

struct TtiFields {
    uint8_t sgn = 0;
    uint16_t sn = 1;
    uint8_t ebn = 0xFF;
    uint8_t cs = 0;
    uint8_t tci[4] = {10, 0, 1, 0};
    uint8_t tco[4] = {10, 0, 3, 12};
    uint8_t vp = 20;
    uint8_t jc = 2;
    uint8_t cf = 0;
    std::vector<uint8_t> text;  // padded to 112 bytes with 0x8F
};

inline std::vector<uint8_t> make_tti(const TtiFields &f) {
    std::vector<uint8_t> buf(kTtiSize, 0x8F);
    buf[0] = f.sgn;
    buf[1] = static_cast<uint8_t>(f.sn & 0xFF);
    buf[2] = static_cast<uint8_t>((f.sn >> 8) & 0xFF);
    buf[3] = f.ebn;
    buf[4] = f.cs;
    std::copy(f.tci, f.tci + 4, buf.begin() + 5);
    std::copy(f.tco, f.tco + 4, buf.begin() + 9);
    buf[13] = f.vp;
    buf[14] = f.jc;
    buf[15] = f.cf;
    const size_t n = std::min(f.text.size(), kTextSize);
    std::copy(f.text.begin(), f.text.begin() + static_cast<std::ptrdiff_t>(n),
              buf.begin() + 16);
    return buf;
}

inline std::vector<uint8_t> text_bytes(const std::string &ascii) {
    return std::vector<uint8_t>(ascii.begin(), ascii.end());
}

// Complete file: GSI with TNB set to the number of blocks, followed by the blocks.
inline std::vector<uint8_t> make_file(const std::vector<TtiFields> &blocks,
                                      GsiFields gsi = {}) {
    std::vector<uint8_t> buf = make_gsi(gsi);
    put_number(buf, 238, 5, static_cast<uint32_t>(blocks.size()));
    for (const auto &b : blocks) {
        auto rec = make_tti(b);
        buf.insert(buf.end(), rec.begin(), rec.end());
    }
    return buf;
}

inline bool write_file(const std::filesystem::path &p, const std::vector<uint8_t> &data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return out.good();
}

}  // namespace stl_test_utils
