#include "PhraseLookup.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <string_view>
#include <tuple>
#include <utility>

namespace StenoBridge {
namespace Bridge {

namespace {

constexpr size_t kMaxTokens = 200;

// UTF-8 sequences that are punctuation or symbols rather than word characters.
constexpr std::string_view kNonWordSequences[] = {
    "\xC2\xA0",     // no-break space
    "\xC2\xA3",     // pound sign
    "\xC2\xAB",     // left guillemet
    "\xC2\xBB",     // right guillemet
    "\xC2\xA1",     // inverted exclamation mark
    "\xC2\xBF",     // inverted question mark
    "\xE2\x80\x93", // en dash
    "\xE2\x80\x94", // em dash
    "\xE2\x80\x98", // left single quote
    "\xE2\x80\x99", // right single quote
    "\xE2\x80\x9C", // left double quote
    "\xE2\x80\x9D", // right double quote
    "\xE2\x80\xA6", // ellipsis
    "\xE2\x82\xAC", // euro sign
};

constexpr std::string_view kCurrencySymbols[] = { "$", "\xE2\x82\xAC", "\xC2\xA3" };

constexpr std::string_view kApostrophes[] = { "'", "\xE2\x80\x99" };

bool isAsciiDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool isAsciiAlnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

size_t codePointLength(const std::string& text, size_t i)
{
    const auto lead = static_cast<unsigned char>(text[i]);
    size_t length = 1;
    if ((lead >> 5) == 0x6) {
        length = 2;
    }
    else if ((lead >> 4) == 0xE) {
        length = 3;
    }
    else if ((lead >> 3) == 0x1E) {
        length = 4;
    }
    return std::min(length, text.size() - i);
}

template <size_t N>
size_t matchAny(const std::string& text, size_t i, const std::string_view (&candidates)[N])
{
    for (const auto& candidate : candidates) {
        if (std::string_view(text).substr(i, candidate.size()) == candidate) {
            return candidate.size();
        }
    }
    return 0;
}

// Length of the word character at i, or 0 if there is none.
size_t wordCharLength(const std::string& text, size_t i)
{
    if (i >= text.size()) {
        return 0;
    }
    const char c = text[i];
    if (static_cast<unsigned char>(c) < 0x80) {
        return (isAsciiAlnum(c) || c == '_') ? 1 : 0;
    }
    if (matchAny(text, i, kNonWordSequences) > 0) {
        return 0;
    }
    return codePointLength(text, i);
}

size_t keyCount(const PhraseLookup::Strokes& strokes)
{
    size_t keys = 0;
    for (const auto& stroke : strokes) {
        keys += stroke.size();
    }
    return keys;
}

// Total strokes, then total keys.
std::pair<size_t, size_t> sequenceCost(const PhraseLookup::Sequence& sequence)
{
    size_t strokes = 0;
    size_t keys = 0;
    for (const auto& segment : sequence) {
        strokes += segment.steno.size();
        keys += keyCount(segment.steno);
    }
    return { strokes, keys };
}

std::string asciiLower(const std::string& text)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string withoutNumberPunctuation(const std::string& phrase)
{
    std::string result;
    for (size_t i = 0; i < phrase.size();) {
        if (phrase[i] == ',') {
            ++i;
            continue;
        }
        if (size_t skip = matchAny(phrase, i, kCurrencySymbols)) {
            i += skip;
            continue;
        }
        result += phrase[i++];
    }
    return result;
}

} // namespace

PhraseLookup::PhraseLookup(const EngineHost& host) : host_(host)
{}

std::vector<std::string> PhraseLookup::tokenize(const std::string& text)
{
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        // Number, optionally with a currency symbol and thousands separators.
        const size_t currency = matchAny(text, i, kCurrencySymbols);
        if (i + currency < text.size() && isAsciiDigit(text[i + currency])) {
            size_t j = i + currency;
            while (j < text.size() && isAsciiDigit(text[j])) {
                ++j;
            }
            while (j + 1 < text.size() && text[j] == ',' && isAsciiDigit(text[j + 1])) {
                ++j;
                while (j < text.size() && isAsciiDigit(text[j])) {
                    ++j;
                }
            }
            tokens.push_back(text.substr(i, j - i));
            i = j;
            continue;
        }

        // Word, with internal apostrophes.
        if (wordCharLength(text, i) > 0) {
            size_t j = i;
            while (size_t w = wordCharLength(text, j)) {
                j += w;
            }
            while (size_t a = matchAny(text, j, kApostrophes)) {
                if (wordCharLength(text, j + a) == 0) {
                    break;
                }
                j += a;
                while (size_t w = wordCharLength(text, j)) {
                    j += w;
                }
            }
            tokens.push_back(text.substr(i, j - i));
            i = j;
            continue;
        }

        const size_t length = codePointLength(text, i);
        tokens.push_back(text.substr(i, length));
        i += length;
    }
    return tokens;
}

std::vector<PhraseLookup::Strokes> PhraseLookup::stenoForPhrase(const std::string& phrase) const
{
    std::set<Strokes> direct;
    for (auto& strokes : host_.reverseLookup(phrase)) {
        direct.insert(std::move(strokes));
    }

    const bool singleSymbol = !phrase.empty() && codePointLength(phrase, 0) == phrase.size()
        && wordCharLength(phrase, 0) == 0;
    if (singleSymbol) {
        for (auto& strokes : host_.reverseLookup("{" + phrase + "}")) {
            direct.insert(std::move(strokes));
        }
    }

    std::set<Strokes> combined = direct;

    const std::string lower = asciiLower(phrase);
    if (lower != phrase) {
        for (const auto& strokes : host_.reverseLookup(lower)) {
            Strokes capitalized{ kCapitalizeNextStroke };
            capitalized.insert(capitalized.end(), strokes.begin(), strokes.end());
            combined.insert(std::move(capitalized));
        }
    }

    const std::string digits = withoutNumberPunctuation(phrase);
    if (!digits.empty() && std::all_of(digits.begin(), digits.end(), isAsciiDigit)) {
        Strokes numberStrokes;
        bool allDigitsFound = true;
        for (char digit : digits) {
            auto candidates = host_.reverseLookup(std::string(1, digit));
            if (candidates.empty()) {
                allDigitsFound = false;
                break;
            }
            const auto shortest = std::min_element(
                candidates.begin(), candidates.end(), [](const Strokes& a, const Strokes& b) {
                    return std::make_tuple(a.size(), keyCount(a), std::cref(a))
                        < std::make_tuple(b.size(), keyCount(b), std::cref(b));
                });
            numberStrokes.insert(numberStrokes.end(), shortest->begin(), shortest->end());
        }
        if (allDigitsFound) {
            combined.insert(std::move(numberStrokes));
        }
    }

    if (combined.empty()) {
        if (phrase.find(' ') == std::string::npos) {
            LOG_DEBUG(Host, "No strokes for word '{}'", phrase);
        }
        return {};
    }

    std::vector<Strokes> sorted(combined.begin(), combined.end());
    std::stable_sort(sorted.begin(), sorted.end(), [&direct](const Strokes& a, const Strokes& b) {
        return std::make_tuple(direct.count(a) == 0, a.size(), keyCount(a))
            < std::make_tuple(direct.count(b) == 0, b.size(), keyCount(b));
    });
    return sorted;
}

std::vector<PhraseLookup::Sequence> PhraseLookup::lookup(const std::string& text)
{
    tokens_ = tokenize(text);
    memo_.clear();

    if (tokens_.empty()) {
        return {};
    }
    if (tokens_.size() > kMaxTokens) {
        LOG_WARN(Host, "Lookup refused: {} tokens exceeds limit of {}", tokens_.size(), kMaxTokens);
        return {};
    }

    std::vector<Sequence> sequences = solve(0);

    LOG_DEBUG(Host, "Lookup '{}' found {} sequence(s)", text, sequences.size());
    return sequences;
}

const std::vector<PhraseLookup::Sequence>& PhraseLookup::solve(size_t start)
{
    if (auto it = memo_.find(start); it != memo_.end()) {
        return it->second;
    }

    std::vector<Sequence> solutions;
    if (start == tokens_.size()) {
        solutions.push_back(Sequence{});
        return memo_[start] = std::move(solutions);
    }

    const size_t maxLength = std::min(tokens_.size() - start, host_.longestKey());
    for (size_t length = maxLength; length > 0; --length) {
        std::string phrase = tokens_[start];
        for (size_t k = start + 1; k < start + length; ++k) {
            phrase += " " + tokens_[k];
        }

        const auto options = stenoForPhrase(phrase);
        if (options.empty()) {
            continue;
        }

        // std::map references stay valid while the memo grows.
        const auto& suffixSolutions = solve(start + length);
        for (const auto& suffix : suffixSolutions) {
            Sequence sequence{ Segment{ .text = phrase, .steno = options.front() } };
            sequence.insert(sequence.end(), suffix.begin(), suffix.end());
            solutions.push_back(std::move(sequence));
        }
    }

    // Each suffix keeps its cheapest solutions, so ranking here before the cut
    // keeps the cheapest ones for this start too.
    std::stable_sort(solutions.begin(), solutions.end(), [](const Sequence& a, const Sequence& b) {
        return sequenceCost(a) < sequenceCost(b);
    });
    if (solutions.size() > kMaxSolutionsPerSuffix) {
        solutions.resize(kMaxSolutionsPerSuffix);
    }

    return memo_[start] = std::move(solutions);
}

nlohmann::json PhraseLookup::toJson(const std::vector<Sequence>& sequences)
{
    nlohmann::json result = nlohmann::json::array();
    for (const auto& sequence : sequences) {
        nlohmann::json segments = nlohmann::json::array();
        for (const auto& segment : sequence) {
            segments.push_back({ { "text", segment.text }, { "steno", segment.steno } });
        }
        result.push_back(std::move(segments));
    }
    return result;
}

} // namespace Bridge
} // namespace StenoBridge
