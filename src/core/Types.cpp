#include "core/Types.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace shapemirror::core {

namespace {
    std::string toLower(std::string_view text) {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }
}

std::optional<Axis> parseAxis(std::string_view text) {
    const auto value = toLower(text);
    if (value == "x") return Axis::X;
    if (value == "y") return Axis::Y;
    if (value == "z") return Axis::Z;
    return std::nullopt;
}

std::optional<Half> parseHalf(std::string_view text) {
    const auto value = toLower(text);
    if (value == "negative" || value == "neg" || value == "-") return Half::Negative;
    if (value == "positive" || value == "pos" || value == "+") return Half::Positive;
    return std::nullopt;
}

std::optional<SeamPolicy> parseSeamPolicy(std::string_view text) {
    const auto value = toLower(text);
    if (value == "authoritative") return SeamPolicy::Authoritative;
    if (value == "symmetrize") return SeamPolicy::Symmetrize;
    return std::nullopt;
}

std::optional<TieBreak> parseTieBreak(std::string_view text) {
    const auto value = toLower(text);
    if (value == "lowest") return TieBreak::LowestIndex;
    if (value == "highest") return TieBreak::HighestIndex;
    return std::nullopt;
}

std::optional<SearchMethod> parseSearchMethod(std::string_view text) {
    const auto value = toLower(text);
    if (value == "grid") return SearchMethod::Grid;
    if (value == "brute-force" || value == "bruteforce") return SearchMethod::BruteForce;
    return std::nullopt;
}

} // namespace shapemirror::core
