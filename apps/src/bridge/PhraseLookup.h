#pragma once

#include "EngineHost.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace StenoBridge {
namespace Bridge {

/**
 * @brief Finds the stroke sequences that would write a piece of text.
 *
 * The text is split into tokens (numbers, words, single punctuation marks).
 * Each prefix of up to longestKey() tokens is looked up as a phrase, longest
 * first, and combined with every solution of the remaining tokens. A phrase
 * also matches through its lowercase form behind the capitalize-next stroke,
 * through the {c} command form for single punctuation, and digit by digit
 * for numbers.
 *
 * Uses only the host's reverseLookup() and longestKey(), so it must run on the
 * host context.
 */
class PhraseLookup {
public:
    using Strokes = std::vector<std::string>;

    struct Segment {
        std::string text;
        Strokes steno;

        bool operator==(const Segment&) const = default;
    };

    using Sequence = std::vector<Segment>;

    static constexpr const char* kCapitalizeNextStroke = "KPA";

    // Bounds the work one request can cause on the host thread.
    static constexpr size_t kMaxSolutionsPerSuffix = 256;

    explicit PhraseLookup(const EngineHost& host);

    /**
     * @brief All solutions, best first (fewest strokes, then fewest keys).
     * Empty when any part of the text has no strokes.
     */
    std::vector<Sequence> lookup(const std::string& text);

    /**
     * @brief Candidate strokes for one phrase, best first, empty when none.
     */
    std::vector<Strokes> stenoForPhrase(const std::string& phrase) const;

    static std::vector<std::string> tokenize(const std::string& text);

    static nlohmann::json toJson(const std::vector<Sequence>& sequences);

private:
    const std::vector<Sequence>& solve(size_t start);

    const EngineHost& host_;
    std::vector<std::string> tokens_;
    std::map<size_t, std::vector<Sequence>> memo_;
};

} // namespace Bridge
} // namespace StenoBridge
