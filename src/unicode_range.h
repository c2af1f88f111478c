/* Codepoint range specifications of the CSS unicode-range form
   ("U+0000-00FF, U+0131, U+0152-0153"), kept as a sorted list of merged
   intervals. Used by every command.
 */

#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "wrappers.h"

#pragma once

namespace fontsieve {
    struct codepoint_range;
    class range_set;
    class range_parser;

    enum class category_bucket { visible, combining, control_or_format };
    category_bucket bucketFor(uint32_t cp);
    const char *bucketName(category_bucket b);

    // "U+XXXX", uppercase, at least four digits
    std::string formatCodepoint(uint32_t cp);
    // Unicode character name, "<UNASSIGNED>" when there is none
    std::string characterName(uint32_t cp);
    // "U+0041: LATIN CAPITAL LETTER A"
    std::string describeCodepoint(uint32_t cp);

    constexpr uint32_t max_codepoint = 0x10FFFF;
}

struct fontsieve::codepoint_range {
    codepoint_range() {}
    codepoint_range(uint32_t s, uint32_t e) : start(s), end(e) {}
    bool operator == (const codepoint_range &o) const {
        return start == o.start && end == o.end;
    }
    uint32_t start {0}, end {0};
};

class fontsieve::range_set {
 public:
    range_set() {}
    /* Malformed tokens are skipped; if none parse the set is empty */
    static range_set parse(const std::string &spec);
    static range_set fromRanges(std::vector<codepoint_range> r);
    bool contains(uint32_t cp) const;
    bool empty() const { return rs.empty(); }
    uint64_t size() const;
    const std::vector<codepoint_range> &ranges() const { return rs; }
    std::vector<std::string> normalized() const;
    void addTo(fontsieve::wr_set &s) const;
    bool operator == (const range_set &o) const { return rs == o.rs; }
    bool operator != (const range_set &o) const { return !(rs == o.rs); }
 private:
    static bool parseToken(const std::string &tok, codepoint_range &r);
    void merge();
    std::vector<codepoint_range> rs;
};

/* Parses specifications through a least-recently-used cache keyed by the
   exact input string. Lookups return copies. */
class fontsieve::range_parser {
 public:
    explicit range_parser(size_t capacity = 512) : capacity(capacity) {}
    range_parser(const range_parser &) = delete;
    range_set parse(const std::string &spec);
    size_t cached() const;
    uint64_t hits() const;
 private:
    typedef std::list<std::pair<std::string, range_set>> lru_list;
    size_t capacity;
    mutable std::mutex lock;
    lru_list entries;
    std::unordered_map<std::string, lru_list::iterator> index;
    uint64_t _hits {0};
};
