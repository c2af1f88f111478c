#include <stdexcept>
#include <string>

#pragma once

namespace fontsieve {
    enum class error_kind {
        input_not_found,
        invalid_range_spec,
        empty_range,
        font_open_failure,
        output_dir_failure,
        subset_failure,
        write_failure,
        external_tool_missing,
        external_tool_failed
    };
    class error;
    const char *error_kind_name(error_kind k);
}

/* Fatal condition of a command. Recoverable failures (an optional table
   field, a container rewrite that has a fallback) never use this. */
class fontsieve::error : public std::runtime_error {
 public:
    error(error_kind k, const std::string &m) : std::runtime_error(m), k(k) {}
    error_kind kind() const { return k; }
 private:
    error_kind k;
};

inline const char *fontsieve::error_kind_name(error_kind k) {
    switch (k) {
        case error_kind::input_not_found: return "input_not_found";
        case error_kind::invalid_range_spec: return "invalid_range_spec";
        case error_kind::empty_range: return "empty_range";
        case error_kind::font_open_failure: return "font_open_failure";
        case error_kind::output_dir_failure: return "output_dir_failure";
        case error_kind::subset_failure: return "subset_failure";
        case error_kind::write_failure: return "write_failure";
        case error_kind::external_tool_missing: return "external_tool_missing";
        case error_kind::external_tool_failed: return "external_tool_failed";
    }
    return "unknown";
}
