/* Run-time settings. Everything has a built-in default; a YAML file given
   with -c overrides individual keys.
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "yaml-cpp/yaml.h"

#pragma once

namespace fontsieve {
    class config;
}

class fontsieve::config {
 public:
    struct barcode_thresholds {
        uint32_t min_latin = 10;
        double code39_ratio = 0.7;
        uint32_t max_lowercase = 2;
        uint32_t min_upper_digits = 10;
        uint32_t width_sample = 30;
        uint32_t min_width_samples = 5;
        double max_width_cv = 0.02;
        uint32_t bbox_sample = 20;
        double tall_height_ratio = 0.85;
        double tall_fraction = 0.6;
    };
    struct non_textual_thresholds {
        uint32_t min_letters = 10;
        uint32_t min_digits = 5;
    };

    void increaseVerbosity() { if (_verbosity < 3) _verbosity++; }
    void setVerbosity(uint8_t v) { _verbosity = v > 3 ? 3 : v; }
    uint8_t verbosity() const { return _verbosity; }

    int load(const std::string &p);

    size_t rangeCacheCapacity() const { return range_cache_capacity; }
    size_t sampleSize() const { return sample_size; }
    const std::vector<std::string> &woff2Compressor() const {
        return woff2_compressor;
    }
    void setWoff2Compressor(std::vector<std::string> v) {
        woff2_compressor = std::move(v);
    }
    const barcode_thresholds &barcode() const { return _barcode; }
    const non_textual_thresholds &nonTextual() const { return _non_textual; }
 private:
    void load_barcode(const YAML::Node &n);
    void dump(std::ostream &os);
    uint8_t _verbosity = 0;
    size_t range_cache_capacity = 512;
    size_t sample_size = 20;
    std::vector<std::string> woff2_compressor = { "woff2_compress" };
    barcode_thresholds _barcode;
    non_textual_thresholds _non_textual;
};
