#include <string>
#include <vector>

#include <hb.h>
#include <hb-ot.h>
#include <hb-subset.h>

#pragma once

namespace fontsieve {
    struct wr_set;
    struct wr_map;
    struct wr_blob;
    struct wr_face;
    struct wr_font;
    struct wr_subset_input;
}

struct fontsieve::wr_set {
    hb_set_t *s;
    wr_set() { s = hb_set_create(); }
    wr_set(const wr_set &st) = delete;
    ~wr_set() { hb_set_destroy(s); }
    wr_set &operator = (const wr_set &st) = delete;
    bool has(hb_codepoint_t cp) const { return hb_set_has(s, cp); }
    void add_range(hb_codepoint_t f, hb_codepoint_t l) {
        hb_set_add_range(s, f, l);
    }
    unsigned int size() const { return hb_set_get_population(s); }
    bool next(hb_codepoint_t &cp) const { return hb_set_next(s, &cp); }
};

struct fontsieve::wr_map {
    hb_map_t *m;
    wr_map() { m = hb_map_create(); }
    wr_map(const wr_map &mp) = delete;
    ~wr_map() { hb_map_destroy(m); }
    hb_codepoint_t get(hb_codepoint_t k) const { return hb_map_get(m, k); }
};

struct fontsieve::wr_blob {
    hb_blob_t *b;
    wr_blob() : b(NULL) {}
    explicit wr_blob(hb_blob_t *bl) { b = bl; }
    wr_blob(const wr_blob &bl) = delete;
    ~wr_blob() { destroy(); }
    void reset(hb_blob_t *bl) {
        destroy();
        b = bl;
    }
    void from_string(std::string &s, bool read_only = false) {
        destroy();
        b = hb_blob_create_or_fail(s.data(), s.size(),
                                   read_only ? HB_MEMORY_MODE_READONLY
                                             : HB_MEMORY_MODE_WRITABLE,
                                   NULL, NULL);
    }
    const char *data(unsigned int &length) const {
        if (!b) {
            length = 0;
            return NULL;
        }
        return hb_blob_get_data(b, &length);
    }
    unsigned int length() const { return b ? hb_blob_get_length(b) : 0; }
 private:
    void destroy() {
        if (b)
            hb_blob_destroy(b);
        b = NULL;
    }
};

struct fontsieve::wr_face {
    hb_face_t *f;
    wr_face() { f = hb_face_get_empty(); }
    explicit wr_face(hb_face_t *fa) { f = fa ? fa : hb_face_get_empty(); }
    wr_face(const wr_face &fa) = delete;
    ~wr_face() { destroy(); }
    void reset(hb_face_t *fa) {
        destroy();
        f = fa ? fa : hb_face_get_empty();
    }
    void create(wr_blob &b) { destroy(); f = hb_face_create(b.b, 0); }
    bool is_empty() const { return f == hb_face_get_empty(); }
    uint32_t get_glyph_count() const { return hb_face_get_glyph_count(f); }
    unsigned int get_upem() const { return hb_face_get_upem(f); }
    void get_table_tags(std::vector<uint32_t> &t) const {
        unsigned int l = hb_face_get_table_tags(f, 0, NULL, NULL);
        t.resize(l);
        hb_face_get_table_tags(f, 0, &l, t.data());
        t.resize(l);
    }
    hb_blob_t *reference_table(uint32_t tg) const {
        return hb_face_reference_table(f, tg);
    }
    hb_blob_t *reference_blob() const { return hb_face_reference_blob(f); }
    void collect_nominal_mapping(wr_map &mapping, wr_set &unicodes) const {
        hb_face_collect_nominal_glyph_mapping(f, mapping.m, unicodes.s);
    }
 private:
    void destroy() {
        hb_face_destroy(f);
        f = hb_face_get_empty();
    }
};

struct fontsieve::wr_font {
    hb_font_t *f;
    wr_font() { f = hb_font_get_empty(); }
    wr_font(const wr_font &fo) = delete;
    ~wr_font() { destroy(); }
    void create(wr_face &fa) { destroy(); f = hb_font_create(fa.f); }
    void reset() { destroy(); }
 private:
    void destroy() {
        hb_font_destroy(f);
        f = hb_font_get_empty();
    }
};

struct fontsieve::wr_subset_input {
    hb_subset_input_t *i;
    wr_subset_input() { i = hb_subset_input_create_or_fail(); }
    wr_subset_input(const wr_subset_input &in) = delete;
    ~wr_subset_input() { if (i) hb_subset_input_destroy(i); }
    bool valid() const { return i != NULL; }
    void set_flags(unsigned v) {
        hb_subset_input_set_flags(i, (hb_subset_flags_t) v);
    }
    hb_set_t *unicode_set() { return hb_subset_input_unicode_set(i); }
    hb_set_t *gid_set() { return hb_subset_input_glyph_set(i); }
    hb_set_t *set(hb_subset_sets_t st) { return hb_subset_input_set(i, st); }
    hb_face_t *subset(wr_face &f) { return hb_subset_or_fail(f.f, i); }
};
