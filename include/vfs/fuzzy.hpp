//! # Fuzzy Suggestions
//!
//! Ranks candidate paths or module names against a query that failed to
//! resolve, producing "did you mean" suggestions.
//!
//! ## Algorithm
//!
//! 1. Query and candidates are normalized by splitting on '/' and joining
//!    the segments with a NUL byte, which cannot occur in a real segment.
//! 2. Each candidate is scored in `[0, 100]` case-insensitively: the best of
//!    the plain edit-distance ratio, the token-sort ratio and the token-set
//!    ratio (token variants weighted by 0.95).
//! 3. Candidates scoring below `min_score` are dropped; the rest are stable
//!    sorted by descending score (ties keep discovery order) and capped at
//!    `max_results`.
//! 4. Suggestions carry the original, non-normalized candidate text.
//!
//! Ranking is deterministic for a fixed candidate order.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jig::vfs {

/// Tuning for suggestion ranking. Passed explicitly, never global.
struct FuzzyOptions {
    size_t max_results = 5; ///< Maximum number of suggestions returned
    int min_score = 75;     ///< Minimum score (0-100) a candidate needs
};

/// One ranked candidate.
struct Suggestion {
    std::string candidate; ///< Original candidate text
    int score;             ///< Similarity in [0, 100]

    bool operator==(const Suggestion& other) const {
        return candidate == other.candidate && score == other.score;
    }
};

/// Case-insensitive edit distance with a configurable substitution cost.
size_t levenshtein_distance(std::string_view s1, std::string_view s2,
                            size_t substitution_cost = 1);

/// Similarity ratio in [0, 100]: `(len1 + len2 - distance) / (len1 + len2)`
/// with substitutions costing 2. Two empty strings are identical.
int similarity_ratio(std::string_view s1, std::string_view s2);

class FuzzyMatcher {
public:
    explicit FuzzyMatcher(FuzzyOptions options = {});

    const FuzzyOptions& options() const {
        return options_;
    }

    /// Joins the '/' separated segments of `path` with a NUL byte.
    static std::string normalize(std::string_view path);

    /// Scores an already normalized pair.
    int score(std::string_view query, std::string_view candidate) const;

    /// Ranks `candidates` against `query`.
    std::vector<Suggestion> rank(std::string_view query,
                                 const std::vector<std::string>& candidates) const;

private:
    FuzzyOptions options_;
};

/// Builds the user-facing message for a failed lookup:
///
/// ```text
/// No file matching "com/example/Fo.java" was found. Maybe you meant:
///   - com/example/Foo.java
/// ```
///
/// or, with no suggestions, `... was found. No similar results found.`
std::string not_found_message(std::string_view entity, std::string_view query,
                              const std::vector<Suggestion>& suggestions);

} // namespace jig::vfs
