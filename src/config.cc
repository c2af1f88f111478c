#include <iostream>

#include "config.h"

template<class T>
static void load_scalar(const YAML::Node &n, const char *key, T &v) {
    auto s = n[key];
    if (!s)
        return;
    if (!s.IsScalar())
        throw YAML::Exception(s.Mark(), std::string("Value of '") + key +
                                        "' must be a scalar");
    v = s.as<T>();
}

void fontsieve::config::load_barcode(const YAML::Node &n) {
    load_scalar(n, "min_latin", _barcode.min_latin);
    load_scalar(n, "code39_ratio", _barcode.code39_ratio);
    load_scalar(n, "max_lowercase", _barcode.max_lowercase);
    load_scalar(n, "min_upper_digits", _barcode.min_upper_digits);
    load_scalar(n, "width_sample", _barcode.width_sample);
    load_scalar(n, "min_width_samples", _barcode.min_width_samples);
    load_scalar(n, "max_width_cv", _barcode.max_width_cv);
    load_scalar(n, "bbox_sample", _barcode.bbox_sample);
    load_scalar(n, "tall_height_ratio", _barcode.tall_height_ratio);
    load_scalar(n, "tall_fraction", _barcode.tall_fraction);
}

int fontsieve::config::load(const std::string &p) {
    auto yc = YAML::LoadFile(p.c_str());

    load_scalar(yc, "range_cache_capacity", range_cache_capacity);
    load_scalar(yc, "sample_size", sample_size);

    auto comp = yc["woff2_compressor"];
    if (comp) {
        if (comp.IsScalar()) {
            woff2_compressor = { comp.Scalar() };
        } else if (comp.IsSequence() && comp.size() > 0) {
            woff2_compressor.clear();
            for (size_t k = 0; k < comp.size(); k++)
                woff2_compressor.push_back(comp[k].as<std::string>());
        } else
            throw YAML::Exception(comp.Mark(), "woff2_compressor must be a "
                                               "command or a non-empty argument list");
    }

    auto nt = yc["non_textual"];
    if (nt) {
        if (!nt.IsMap())
            throw YAML::Exception(nt.Mark(), "non_textual must be a map");
        load_scalar(nt, "min_letters", _non_textual.min_letters);
        load_scalar(nt, "min_digits", _non_textual.min_digits);
    }

    auto bc = yc["barcode"];
    if (bc) {
        if (!bc.IsMap())
            throw YAML::Exception(bc.Mark(), "barcode must be a map");
        load_barcode(bc);
    }

    if (verbosity() > 2)
        dump(std::cerr);
    return 0;
}

void fontsieve::config::dump(std::ostream &os) {
    os << "Config:" << std::endl;
    os << "  range cache capacity: " << range_cache_capacity << std::endl;
    os << "  sample size: " << sample_size << std::endl;
    os << "  woff2 compressor:";
    for (auto &a: woff2_compressor)
        os << " " << a;
    os << std::endl;
    os << "  non-textual: letters < " << _non_textual.min_letters;
    os << " and digits < " << _non_textual.min_digits << std::endl;
    os << "  barcode: min latin " << _barcode.min_latin;
    os << ", code39 ratio " << _barcode.code39_ratio;
    os << ", width cv < " << _barcode.max_width_cv;
    os << " (" << _barcode.width_sample << " sampled)";
    os << ", tall boxes " << _barcode.tall_fraction;
    os << " of " << _barcode.bbox_sample << std::endl;
}
