#include "docmap/inflector.hpp"
#include "docmap/introspection.hpp"

#include <cctype>
#include <regex>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docmap {
namespace inflector {

namespace {

const std::set<std::string>& uncountables() {
    static const std::set<std::string> words = {
        "audio", "data", "equipment", "feedback", "fish", "information", "metadata",
        "money", "news", "police", "rice", "series", "sheep", "species", "staff",
        "traffic", "deer", "moose", "software", "hardware", "advice", "media"
    };
    return words;
}

const std::unordered_map<std::string, std::string>& irregulars() {
    static const std::unordered_map<std::string, std::string> words = {
        {"person", "people"},
        {"man", "men"},
        {"woman", "women"},
        {"child", "children"},
        {"tooth", "teeth"},
        {"foot", "feet"},
        {"mouse", "mice"},
        {"goose", "geese"},
        {"ox", "oxen"},
        {"leaf", "leaves"},
        {"cookie", "cookies"},
        {"movie", "movies"},
        {"criterion", "criteria"},
        {"genus", "genera"},
        {"octopus", "octopuses"},
        {"cactus", "cacti"},
        {"radius", "radii"},
    };
    return words;
}

struct rule {
    std::regex pattern;
    std::string replacement;
};

const std::vector<rule>& rules() {
    // Evaluated in order, first match wins
    static const std::vector<rule> table = [] {
        auto icase = std::regex::ECMAScript | std::regex::icase;
        return std::vector<rule>{
            {std::regex("(quiz)$", icase), "$1zes"},
            {std::regex("(matr|vert|ind)(ix|ex)$", icase), "$1ices"},
            {std::regex("(x|ch|ss|sh)$", icase), "$1es"},
            {std::regex("([^aeiouy]|qu)y$", icase), "$1ies"},
            {std::regex("(hive)$", icase), "$1s"},
            {std::regex("(?:([^f])fe|([lr])f)$", icase), "$1$2ves"},
            {std::regex("sis$", icase), "ses"},
            {std::regex("([ti])um$", icase), "$1a"},
            {std::regex("(buffal|tomat|potat|her)o$", icase), "$1oes"},
            {std::regex("(bu|mis|gas)s$", icase), "$1ses"},
            {std::regex("(alias|status|campus)$", icase), "$1es"},
            {std::regex("(ax|test)is$", icase), "$1es"},
            {std::regex("s$", icase), "s"},
            {std::regex("$"), "s"},
        };
    }();
    return table;
}

std::string match_case(const std::string& source, std::string plural) {
    if (!source.empty() && !plural.empty() &&
        std::isupper(static_cast<unsigned char>(source[0]))) {
        plural[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(plural[0])));
    }
    return plural;
}

} // namespace

std::string pluralize(std::string_view word) {
    std::string source(word);
    if (source.empty()) return source;

    auto lower = detail::to_lower(source);
    if (uncountables().count(lower)) {
        return source;
    }

    auto irregular = irregulars().find(lower);
    if (irregular != irregulars().end()) {
        return match_case(source, irregular->second);
    }

    // Irregular endings of compound words ("Salesperson" -> "Salespeople")
    for (const auto& [singular, plural] : irregulars()) {
        if (lower.size() > singular.size() &&
            lower.compare(lower.size() - singular.size(), singular.size(), singular) == 0 &&
            singular.size() > 3) {
            return source.substr(0, source.size() - singular.size()) + plural;
        }
    }

    for (const auto& r : rules()) {
        if (std::regex_search(source, r.pattern)) {
            return std::regex_replace(source, r.pattern, r.replacement,
                                      std::regex_constants::format_first_only);
        }
    }
    return source + "s";
}

} // namespace inflector
} // namespace docmap
