#include <algorithm>
#include <cctype>
#include <cstdio>

#include <unicode/uchar.h>

#include "unicode_range.h"

fontsieve::category_bucket fontsieve::bucketFor(uint32_t cp) {
    switch (hb_unicode_general_category(hb_unicode_funcs_get_default(), cp)) {
        case HB_UNICODE_GENERAL_CATEGORY_SPACING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_ENCLOSING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_NON_SPACING_MARK:
            return category_bucket::combining;
        case HB_UNICODE_GENERAL_CATEGORY_CONTROL:
        case HB_UNICODE_GENERAL_CATEGORY_FORMAT:
        case HB_UNICODE_GENERAL_CATEGORY_UNASSIGNED:
        case HB_UNICODE_GENERAL_CATEGORY_PRIVATE_USE:
        case HB_UNICODE_GENERAL_CATEGORY_SURROGATE:
            return category_bucket::control_or_format;
        default:
            return category_bucket::visible;
    }
}

const char *fontsieve::bucketName(category_bucket b) {
    switch (b) {
        case category_bucket::combining: return "combining";
        case category_bucket::control_or_format: return "control_or_format";
        default: return "visible";
    }
}

std::string fontsieve::formatCodepoint(uint32_t cp) {
    char buf[12];
    snprintf(buf, sizeof(buf), "U+%04X", (unsigned int) cp);
    return buf;
}

std::string fontsieve::characterName(uint32_t cp) {
    char buf[128];
    UErrorCode status = U_ZERO_ERROR;
    int32_t l = u_charName((UChar32) cp, U_UNICODE_CHAR_NAME, buf,
                           sizeof(buf), &status);
    if (U_FAILURE(status) || l <= 0 || l >= (int32_t) sizeof(buf))
        return "<UNASSIGNED>";
    return std::string(buf, l);
}

std::string fontsieve::describeCodepoint(uint32_t cp) {
    return formatCodepoint(cp) + ": " + characterName(cp);
}

static bool parseHex(const std::string &s, size_t &pos, uint32_t &v) {
    size_t start = pos;
    v = 0;
    while (pos < s.size() && std::isxdigit((unsigned char) s[pos])) {
        if (pos - start == 6)
            return false;
        char c = s[pos];
        uint32_t d = std::isdigit((unsigned char) c) ? c - '0'
                                                     : (std::toupper((unsigned char) c) - 'A' + 10);
        v = v << 4 | d;
        pos++;
    }
    return pos > start;
}

bool fontsieve::range_set::parseToken(const std::string &tok,
                                      codepoint_range &r) {
    size_t b = 0, e = tok.size();
    while (b < e && std::isspace((unsigned char) tok[b]))
        b++;
    while (e > b && std::isspace((unsigned char) tok[e-1]))
        e--;
    std::string t = tok.substr(b, e - b);

    if (t.size() < 3 || std::toupper((unsigned char) t[0]) != 'U' || t[1] != '+')
        return false;
    size_t pos = 2;
    uint32_t s, l;
    if (!parseHex(t, pos, s))
        return false;
    l = s;
    if (pos < t.size()) {
        if (t[pos] != '-')
            return false;
        pos++;
        if (!parseHex(t, pos, l) || pos != t.size())
            return false;
    }
    if (l < s)
        std::swap(s, l);
    if (l > max_codepoint)
        return false;
    r = codepoint_range(s, l);
    return true;
}

void fontsieve::range_set::merge() {
    if (rs.empty())
        return;
    std::sort(rs.begin(), rs.end(),
              [](const codepoint_range &a, const codepoint_range &b) {
                  return a.start < b.start || (a.start == b.start && a.end < b.end);
              });
    std::vector<codepoint_range> merged;
    codepoint_range cur = rs[0];
    for (size_t i = 1; i < rs.size(); i++) {
        // end + 1 cannot overflow, end <= max_codepoint
        if (rs[i].start <= cur.end + 1) {
            cur.end = std::max(cur.end, rs[i].end);
        } else {
            merged.push_back(cur);
            cur = rs[i];
        }
    }
    merged.push_back(cur);
    rs.swap(merged);
}

fontsieve::range_set fontsieve::range_set::fromRanges(std::vector<codepoint_range> r) {
    range_set s;
    for (auto &cr: r) {
        if (cr.end < cr.start)
            std::swap(cr.start, cr.end);
        if (cr.end <= max_codepoint)
            s.rs.push_back(cr);
    }
    s.merge();
    return s;
}

fontsieve::range_set fontsieve::range_set::parse(const std::string &spec) {
    range_set s;
    size_t b = 0;
    while (b <= spec.size()) {
        size_t e = spec.find(',', b);
        if (e == std::string::npos)
            e = spec.size();
        codepoint_range r;
        if (parseToken(spec.substr(b, e - b), r))
            s.rs.push_back(r);
        b = e + 1;
    }
    s.merge();
    return s;
}

bool fontsieve::range_set::contains(uint32_t cp) const {
    auto i = std::upper_bound(rs.begin(), rs.end(), cp,
                              [](uint32_t v, const codepoint_range &r) {
                                  return v < r.start;
                              });
    if (i == rs.begin())
        return false;
    --i;
    return cp <= i->end;
}

uint64_t fontsieve::range_set::size() const {
    uint64_t n = 0;
    for (auto &r: rs)
        n += (uint64_t) r.end - r.start + 1;
    return n;
}

std::vector<std::string> fontsieve::range_set::normalized() const {
    std::vector<std::string> v;
    char buf[12];
    v.reserve(rs.size());
    for (auto &r: rs) {
        std::string s = formatCodepoint(r.start);
        if (r.end != r.start) {
            snprintf(buf, sizeof(buf), "-%04X", (unsigned int) r.end);
            s += buf;
        }
        v.push_back(std::move(s));
    }
    return v;
}

void fontsieve::range_set::addTo(fontsieve::wr_set &s) const {
    for (auto &r: rs)
        s.add_range(r.start, r.end);
}

fontsieve::range_set fontsieve::range_parser::parse(const std::string &spec) {
    if (capacity == 0)
        return range_set::parse(spec);

    {
        std::lock_guard<std::mutex> g(lock);
        auto i = index.find(spec);
        if (i != index.end()) {
            entries.splice(entries.begin(), entries, i->second);
            _hits++;
            return i->second->second;
        }
    }

    range_set r = range_set::parse(spec);

    std::lock_guard<std::mutex> g(lock);
    if (index.find(spec) == index.end()) {
        entries.emplace_front(spec, r);
        index.emplace(spec, entries.begin());
        while (entries.size() > capacity) {
            index.erase(entries.back().first);
            entries.pop_back();
        }
    }
    return r;
}

size_t fontsieve::range_parser::cached() const {
    std::lock_guard<std::mutex> g(lock);
    return entries.size();
}

uint64_t fontsieve::range_parser::hits() const {
    std::lock_guard<std::mutex> g(lock);
    return _hits;
}
