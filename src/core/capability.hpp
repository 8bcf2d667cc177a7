#pragma once

#include <string>
#include <vector>
#include <map>

// A single specification field: number, string, or list of strings.
// Ordering (>=, >) is only meaningful between two numbers.
struct CapabilityValue {
    enum class Kind { Number, String, List };

    Kind kind = Kind::Number;
    double number = 0.0;
    std::string text;
    std::vector<std::string> items;

    static CapabilityValue of_number(double v);
    static CapabilityValue of_string(const std::string& s);
    static CapabilityValue of_list(std::vector<std::string> v);

    bool is_number() const { return kind == Kind::Number; }
    bool is_string() const { return kind == Kind::String; }
    bool is_list() const { return kind == Kind::List; }

    // "80", "nvlink", "[a, b]"
    std::string to_display() const;

    bool operator==(const CapabilityValue& other) const;
    bool operator!=(const CapabilityValue& other) const { return !(*this == other); }
};

// Ordered field name -> value association (asset specification, min-spec).
using CapabilityMap = std::map<std::string, CapabilityValue>;

// Does `have` meet the wanted value?
//   number/number: have >= want
//   string/string: case-insensitive equality
//   list/string:   list contains the string (case-insensitive)
//   list/list:     every wanted item is contained
// Any other pairing does not satisfy.
bool satisfies(const CapabilityValue& have, const CapabilityValue& want);

// Fraction of keys in `want` that `have` satisfies. 1.0 when `want` is empty.
double spec_match(const CapabilityMap& have, const CapabilityMap& want);

// True if every key in `want` is satisfied (spec_match == 1).
bool meets_spec(const CapabilityMap& have, const CapabilityMap& want);

// Strict upgrade: `upgrade` and `base` share at least one numeric field,
// `upgrade` is >= on every shared numeric field and > on at least one.
bool dominates(const CapabilityMap& upgrade, const CapabilityMap& base);

// Parse a "key=value" token. Numeric values become numbers, comma-separated
// values ("tags=a,b") become lists, anything else a string.
// Returns false if the token has no '=' or an empty key.
bool parse_capability_arg(const std::string& token, std::string& out_key,
                          CapabilityValue& out_value);

// Build a value from scalar text using the same rules as the snapshot file:
// a plain decimal number => number, otherwise string ("inf", "nan" and
// "0x1F" stay strings).
CapabilityValue capability_from_scalar(const std::string& text);

std::string format_capabilities(const CapabilityMap& caps);
