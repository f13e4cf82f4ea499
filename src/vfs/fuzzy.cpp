//! # Fuzzy Suggestions Implementation

#include "vfs/fuzzy.hpp"

#include "util/strings.hpp"
#include "vfs/paths.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>

namespace jig::vfs {

namespace {

constexpr char SEGMENT_SEPARATOR = '\0';
constexpr double TOKEN_WEIGHT = 0.95;

/// Splits on the segment separator and on whitespace.
std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (c == SEGMENT_SEPARATOR || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::string join(const std::vector<std::string>& tokens) {
    return join_segments(tokens, " ");
}

int token_sort_ratio(std::string_view s1, std::string_view s2) {
    auto t1 = tokenize(s1);
    auto t2 = tokenize(s2);
    std::sort(t1.begin(), t1.end());
    std::sort(t2.begin(), t2.end());
    return similarity_ratio(join(t1), join(t2));
}

int token_set_ratio(std::string_view s1, std::string_view s2) {
    auto tokens1 = tokenize(s1);
    auto tokens2 = tokenize(s2);
    std::set<std::string> set1(tokens1.begin(), tokens1.end());
    std::set<std::string> set2(tokens2.begin(), tokens2.end());

    std::vector<std::string> common;
    std::vector<std::string> only1;
    std::vector<std::string> only2;
    std::set_intersection(set1.begin(), set1.end(), set2.begin(), set2.end(),
                          std::back_inserter(common));
    std::set_difference(set1.begin(), set1.end(), set2.begin(), set2.end(),
                        std::back_inserter(only1));
    std::set_difference(set2.begin(), set2.end(), set1.begin(), set1.end(),
                        std::back_inserter(only2));

    auto base = join(common);
    auto combined1 = base.empty() ? join(only1) : (only1.empty() ? base : base + " " + join(only1));
    auto combined2 = base.empty() ? join(only2) : (only2.empty() ? base : base + " " + join(only2));

    int best = similarity_ratio(combined1, combined2);
    if (!base.empty()) {
        best = std::max({best, similarity_ratio(base, combined1), similarity_ratio(base, combined2)});
    }
    return best;
}

} // namespace

size_t levenshtein_distance(std::string_view s1, std::string_view s2, size_t substitution_cost) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));

            size_t cost = (c1 == c2) ? 0 : substitution_cost;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

int similarity_ratio(std::string_view s1, std::string_view s2) {
    size_t total = s1.size() + s2.size();
    if (total == 0) {
        return 100;
    }
    size_t distance = levenshtein_distance(s1, s2, 2);
    double ratio = static_cast<double>(total - distance) / static_cast<double>(total);
    return static_cast<int>(std::lround(ratio * 100.0));
}

FuzzyMatcher::FuzzyMatcher(FuzzyOptions options) : options_(options) {}

std::string FuzzyMatcher::normalize(std::string_view path) {
    std::string result;
    result.reserve(path.size());
    size_t pos = 0;
    bool first = true;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        auto segment = path.substr(pos, slash - pos);
        if (!segment.empty()) {
            if (!first) {
                result += SEGMENT_SEPARATOR;
            }
            result += segment;
            first = false;
        }
        pos = slash + 1;
    }
    return result;
}

int FuzzyMatcher::score(std::string_view query, std::string_view candidate) const {
    auto q = util::to_lower(query);
    auto c = util::to_lower(candidate);

    int plain = similarity_ratio(q, c);
    int sorted = static_cast<int>(std::lround(token_sort_ratio(q, c) * TOKEN_WEIGHT));
    int set = static_cast<int>(std::lround(token_set_ratio(q, c) * TOKEN_WEIGHT));
    return std::max({plain, sorted, set});
}

std::vector<Suggestion> FuzzyMatcher::rank(std::string_view query,
                                           const std::vector<std::string>& candidates) const {
    if (options_.max_results == 0 || candidates.empty()) {
        return {};
    }

    auto normalized_query = normalize(query);

    std::vector<Suggestion> scored;
    scored.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        int s = score(normalized_query, normalize(candidate));
        if (s >= options_.min_score) {
            scored.push_back({candidate, s});
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const Suggestion& a, const Suggestion& b) { return a.score > b.score; });

    if (scored.size() > options_.max_results) {
        scored.resize(options_.max_results);
    }
    return scored;
}

std::string not_found_message(std::string_view entity, std::string_view query,
                              const std::vector<Suggestion>& suggestions) {
    std::ostringstream oss;
    oss << "No " << entity << " matching " << util::quoted(query) << " was found.";
    if (suggestions.empty()) {
        oss << " No similar results found.";
        return oss.str();
    }

    oss << " Maybe you meant:";
    for (const auto& suggestion : suggestions) {
        oss << "\n  - " << suggestion.candidate;
    }
    return oss.str();
}

} // namespace jig::vfs
