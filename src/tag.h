#include <cstdint>
#include <string>
#include <iostream>

#pragma once

// XXX with C++20 this could be consteval with static assertion.
constexpr uint32_t tag(const char *s) {
    return (uint32_t) (uint8_t) s[0] << 24 | (uint32_t) (uint8_t) s[1] << 16 |
           (uint32_t) (uint8_t) s[2] << 8 | (uint32_t) (uint8_t) s[3];
}

#define T_CMAP tag("cmap")
#define T_HEAD tag("head")
#define T_HMTX tag("hmtx")
#define T_NAME tag("name")
#define T_OS2  tag("OS/2")
#define T_GSUB tag("GSUB")
#define T_GPOS tag("GPOS")
#define T_GDEF tag("GDEF")
#define T_COLR tag("COLR")
#define T_CPAL tag("CPAL")
#define T_CBDT tag("CBDT")
#define T_SBIX tag("sbix")
#define T_SVG  tag("SVG ")

struct otag {
 public:
    otag() = delete;
    otag(uint32_t tg) : tg(tg) {}
    std::string str() const {
        std::string s(4, ' ');
        for (int i = 3; i >= 0; i--)
            s[3 - i] = (char)(tg >> (8*i) & 0xff);
        return s;
    }
 private:
    uint32_t tg;
    friend std::ostream& operator<<(std::ostream &os, const otag &tg);
};

inline std::ostream& operator<<(std::ostream &os, const otag &p) {
    return os << p.str();
}
