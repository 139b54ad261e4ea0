#include <verso/css/style/style_resolver.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_map>
#include <vector>

namespace verso::css {

namespace {

// Trim whitespace from both ends
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f");
    return s.substr(start, end - start + 1);
}

// Convert string to lowercase
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Parse a hex digit
int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Named color table
const std::unordered_map<std::string, Color>& named_colors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black",       {0, 0, 0, 255}},
        {"white",       {255, 255, 255, 255}},
        {"red",         {255, 0, 0, 255}},
        {"green",       {0, 128, 0, 255}},
        {"blue",        {0, 0, 255, 255}},
        {"yellow",      {255, 255, 0, 255}},
        {"orange",      {255, 165, 0, 255}},
        {"purple",      {128, 0, 128, 255}},
        {"gray",        {128, 128, 128, 255}},
        {"grey",        {128, 128, 128, 255}},
        {"transparent", {0, 0, 0, 0}},
        {"cyan",        {0, 255, 255, 255}},
        {"aqua",        {0, 255, 255, 255}},
        {"magenta",     {255, 0, 255, 255}},
        {"fuchsia",     {255, 0, 255, 255}},
        {"lime",        {0, 255, 0, 255}},
        {"maroon",      {128, 0, 0, 255}},
        {"navy",        {0, 0, 128, 255}},
        {"olive",       {128, 128, 0, 255}},
        {"teal",        {0, 128, 128, 255}},
        {"silver",      {192, 192, 192, 255}},
        {"pink",        {255, 192, 203, 255}},
        {"brown",       {165, 42, 42, 255}},
        {"gold",        {255, 215, 0, 255}},
        {"indigo",      {75, 0, 130, 255}},
        {"violet",      {238, 130, 238, 255}},
        {"coral",       {255, 127, 80, 255}},
        {"salmon",      {250, 128, 114, 255}},
        {"tomato",      {255, 99, 71, 255}},
        {"crimson",     {220, 20, 60, 255}},
        {"khaki",       {240, 230, 140, 255}},
        {"beige",       {245, 245, 220, 255}},
        {"ivory",       {255, 255, 240, 255}},
        {"lavender",    {230, 230, 250, 255}},
        {"darkgray",    {169, 169, 169, 255}},
        {"darkgrey",    {169, 169, 169, 255}},
        {"lightgray",   {211, 211, 211, 255}},
        {"lightgrey",   {211, 211, 211, 255}},
        {"darkblue",    {0, 0, 139, 255}},
        {"darkred",     {139, 0, 0, 255}},
        {"darkgreen",   {0, 100, 0, 255}},
        {"lightblue",   {173, 216, 230, 255}},
        {"lightgreen",  {144, 238, 144, 255}},
        {"steelblue",   {70, 130, 180, 255}},
        {"skyblue",     {135, 206, 235, 255}},
        {"whitesmoke",  {245, 245, 245, 255}},
        {"gainsboro",   {220, 220, 220, 255}},
        {"rebeccapurple", {102, 51, 153, 255}},
    };
    return colors;
}

// Parses a number prefix of `s`; `rest` receives the unparsed suffix.
std::optional<float> parse_number_prefix(const std::string& s, std::string& rest) {
    if (s.empty()) return std::nullopt;
    const char* begin = s.c_str();
    char* end = nullptr;
    float num = std::strtof(begin, &end);
    if (end == begin || !std::isfinite(num)) return std::nullopt;
    rest = s.substr(static_cast<size_t>(end - begin));
    return num;
}

// rgb()/rgba() channel: 0-255 or percentage
std::optional<uint8_t> parse_channel(const std::string& token) {
    std::string rest;
    auto num = parse_number_prefix(token, rest);
    if (!num) return std::nullopt;
    float v = *num;
    if (rest == "%") {
        v = v * 255.0f / 100.0f;
    } else if (!rest.empty()) {
        return std::nullopt;
    }
    v = std::clamp(v, 0.0f, 255.0f);
    return static_cast<uint8_t>(std::lround(v));
}

std::optional<uint8_t> parse_alpha(const std::string& token) {
    std::string rest;
    auto num = parse_number_prefix(token, rest);
    if (!num) return std::nullopt;
    float v = *num;
    if (rest == "%") {
        v /= 100.0f;
    } else if (!rest.empty()) {
        return std::nullopt;
    }
    v = std::clamp(v, 0.0f, 1.0f);
    return static_cast<uint8_t>(std::lround(v * 255.0f));
}

std::optional<Color> parse_rgb_function(const std::string& value) {
    auto open = value.find('(');
    if (open == std::string::npos || value.back() != ')') return std::nullopt;
    std::string inner = value.substr(open + 1, value.size() - open - 2);
    for (auto& c : inner) {
        if (c == ',' || c == '/') c = ' ';
    }
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < inner.size()) {
        while (i < inner.size() && std::isspace(static_cast<unsigned char>(inner[i]))) ++i;
        size_t start = i;
        while (i < inner.size() && !std::isspace(static_cast<unsigned char>(inner[i]))) ++i;
        if (i > start) parts.push_back(inner.substr(start, i - start));
    }
    if (parts.size() != 3 && parts.size() != 4) return std::nullopt;

    auto r = parse_channel(parts[0]);
    auto g = parse_channel(parts[1]);
    auto b = parse_channel(parts[2]);
    if (!r || !g || !b) return std::nullopt;
    uint8_t a = 255;
    if (parts.size() == 4) {
        auto alpha = parse_alpha(parts[3]);
        if (!alpha) return std::nullopt;
        a = *alpha;
    }
    return Color{*r, *g, *b, a};
}

} // namespace

std::optional<Color> parse_color(const std::string& input) {
    std::string value = trim(to_lower(input));

    if (value.empty()) return std::nullopt;

    // Named colors
    auto& colors = named_colors();
    auto it = colors.find(value);
    if (it != colors.end()) {
        return it->second;
    }

    // Hex colors
    if (value[0] == '#') {
        std::string hex = value.substr(1);
        std::vector<int> digits;
        for (char c : hex) {
            int d = hex_digit(c);
            if (d < 0) return std::nullopt;
            digits.push_back(d);
        }

        if (digits.size() == 3 || digits.size() == 4) {
            // #RGB / #RGBA -> #RRGGBB / #RRGGBBAA
            return Color{
                static_cast<uint8_t>(digits[0] * 17),
                static_cast<uint8_t>(digits[1] * 17),
                static_cast<uint8_t>(digits[2] * 17),
                static_cast<uint8_t>(digits.size() == 4 ? digits[3] * 17 : 255)
            };
        }

        if (digits.size() == 6 || digits.size() == 8) {
            return Color{
                static_cast<uint8_t>(digits[0] * 16 + digits[1]),
                static_cast<uint8_t>(digits[2] * 16 + digits[3]),
                static_cast<uint8_t>(digits[4] * 16 + digits[5]),
                static_cast<uint8_t>(digits.size() == 8 ? digits[6] * 16 + digits[7] : 255)
            };
        }
        return std::nullopt;
    }

    if (value.rfind("rgb(", 0) == 0 || value.rfind("rgba(", 0) == 0) {
        return parse_rgb_function(value);
    }

    return std::nullopt;
}

std::optional<Length> parse_length(const std::string& input) {
    std::string value = trim(to_lower(input));

    if (value.empty()) return std::nullopt;

    if (value == "auto") {
        return Length::auto_val();
    }

    std::string unit;
    auto num = parse_number_prefix(value, unit);
    if (!num) return std::nullopt;

    if (unit.empty()) {
        // Only a unitless zero is a valid length
        if (*num == 0) return Length::zero();
        return std::nullopt;
    }
    if (unit == "px") return Length::px(*num);
    if (unit == "em") return Length::em(*num);
    if (unit == "rem") return Length::rem(*num);
    if (unit == "%") return Length::percent(*num);
    if (unit == "vw") return Length::vw(*num);
    if (unit == "vh") return Length::vh(*num);
    if (unit == "pt") return Length::px(*num * 96.0f / 72.0f);
    return std::nullopt;
}

} // namespace verso::css
