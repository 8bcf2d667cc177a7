#include "capability.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

static std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static bool list_contains(const std::vector<std::string>& items, const std::string& want) {
    std::string w = lower(want);
    for (const auto& item : items) {
        if (lower(item) == w) return true;
    }
    return false;
}

CapabilityValue CapabilityValue::of_number(double v) {
    CapabilityValue c;
    c.kind = Kind::Number;
    c.number = v;
    return c;
}

CapabilityValue CapabilityValue::of_string(const std::string& s) {
    CapabilityValue c;
    c.kind = Kind::String;
    c.text = s;
    return c;
}

CapabilityValue CapabilityValue::of_list(std::vector<std::string> v) {
    CapabilityValue c;
    c.kind = Kind::List;
    c.items = std::move(v);
    return c;
}

std::string CapabilityValue::to_display() const {
    switch (kind) {
        case Kind::Number:
            return fmt::format("{}", number);
        case Kind::String:
            return text;
        case Kind::List: {
            std::string out = "[";
            for (size_t i = 0; i < items.size(); i++) {
                if (i > 0) out += ", ";
                out += items[i];
            }
            return out + "]";
        }
    }
    return "";
}

bool CapabilityValue::operator==(const CapabilityValue& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case Kind::Number: return number == other.number;
        case Kind::String: return text == other.text;
        case Kind::List:   return items == other.items;
    }
    return false;
}

bool satisfies(const CapabilityValue& have, const CapabilityValue& want) {
    if (have.is_number() && want.is_number()) {
        return have.number >= want.number;
    }
    if (have.is_string() && want.is_string()) {
        return lower(have.text) == lower(want.text);
    }
    if (have.is_list() && want.is_string()) {
        return list_contains(have.items, want.text);
    }
    if (have.is_list() && want.is_list()) {
        for (const auto& w : want.items) {
            if (!list_contains(have.items, w)) return false;
        }
        return true;
    }
    return false;
}

double spec_match(const CapabilityMap& have, const CapabilityMap& want) {
    if (want.empty()) return 1.0;

    int matched = 0;
    for (const auto& [key, wanted] : want) {
        auto it = have.find(key);
        if (it != have.end() && satisfies(it->second, wanted)) {
            matched++;
        }
    }
    return static_cast<double>(matched) / static_cast<double>(want.size());
}

bool meets_spec(const CapabilityMap& have, const CapabilityMap& want) {
    for (const auto& [key, wanted] : want) {
        auto it = have.find(key);
        if (it == have.end() || !satisfies(it->second, wanted)) return false;
    }
    return true;
}

bool dominates(const CapabilityMap& upgrade, const CapabilityMap& base) {
    int comparable = 0;
    bool strictly_better = false;

    for (const auto& [key, base_val] : base) {
        if (!base_val.is_number()) continue;
        auto it = upgrade.find(key);
        if (it == upgrade.end() || !it->second.is_number()) continue;

        comparable++;
        if (it->second.number < base_val.number) return false;
        if (it->second.number > base_val.number) strictly_better = true;
    }
    return comparable > 0 && strictly_better;
}

// [+-]digits[.digits][e[+-]digits], at least one mantissa digit.
// Rejects what strtod also takes: inf, nan, hex floats.
static bool is_decimal(const std::string& text) {
    size_t i = 0, n = text.size();
    auto digits = [&]() {
        size_t start = i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
        return i - start;
    };

    if (i < n && (text[i] == '+' || text[i] == '-')) i++;
    size_t mantissa = digits();
    if (i < n && text[i] == '.') {
        i++;
        mantissa += digits();
    }
    if (mantissa == 0) return false;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        i++;
        if (i < n && (text[i] == '+' || text[i] == '-')) i++;
        if (digits() == 0) return false;
    }
    return i == n;
}

CapabilityValue capability_from_scalar(const std::string& text) {
    if (is_decimal(text)) {
        return CapabilityValue::of_number(std::strtod(text.c_str(), nullptr));
    }
    return CapabilityValue::of_string(text);
}

bool parse_capability_arg(const std::string& token, std::string& out_key,
                          CapabilityValue& out_value) {
    auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) return false;

    out_key = token.substr(0, eq);
    std::string raw = token.substr(eq + 1);

    if (raw.find(',') != std::string::npos) {
        std::vector<std::string> items;
        std::istringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) items.push_back(item);
        }
        out_value = CapabilityValue::of_list(std::move(items));
        return true;
    }

    out_value = capability_from_scalar(raw);
    return true;
}

std::string format_capabilities(const CapabilityMap& caps) {
    std::string out;
    for (const auto& [key, value] : caps) {
        if (!out.empty()) out += " ";
        out += fmt::format("{}={}", key, value.to_display());
    }
    return out;
}
