#include <kbase/search/query_expander.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace kbase::search {

namespace {

bool isTermByte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

void pushUnique(std::vector<std::string>& out, std::string value) {
    auto trimmedStart = value.find_first_not_of(" \t\r\n");
    if (trimmedStart == std::string::npos)
        return;
    auto trimmedEnd = value.find_last_not_of(" \t\r\n");
    value = value.substr(trimmedStart, trimmedEnd - trimmedStart + 1);
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(std::move(value));
    }
}

bool isAscii(std::string_view word) {
    return std::all_of(word.begin(), word.end(), [](unsigned char c) { return c < 0x80; });
}

// Replace the first occurrence of word in text (case-insensitive). With wholeTerm set, a match
// must not sit inside a longer term.
std::string replaceTerm(const std::string& text, const std::string& word,
                        const std::string& replacement, bool wholeTerm) {
    if (word.empty())
        return text;
    auto lower = toLower(text);
    auto needle = toLower(word);
    for (size_t pos = lower.find(needle); pos != std::string::npos;
         pos = lower.find(needle, pos + 1)) {
        const size_t end = pos + needle.size();
        const bool bounded =
            (pos == 0 || !isTermByte(static_cast<unsigned char>(lower[pos - 1]))) &&
            (end == lower.size() || !isTermByte(static_cast<unsigned char>(lower[end])));
        if (!wholeTerm || bounded)
            return text.substr(0, pos) + replacement + text.substr(end);
    }
    return text;
}

} // namespace

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> terms;
    std::string current;
    for (unsigned char c : text) {
        if (isTermByte(c)) {
            current.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
        } else if (!current.empty()) {
            terms.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        terms.push_back(std::move(current));
    }
    return terms;
}

SynonymTable defaultSynonymTable() {
    return {
        {"problem", {"issue", "difficulty", "question"}},
        {"method", {"approach", "technique", "way"}},
        {"solve", {"resolve", "fix", "handle"}},
        {"error", {"failure", "fault", "bug"}},
        {"fast", {"quick", "rapid"}},
        {"问题", {"疑问", "困惑", "难题"}},
        {"方法", {"方式", "途径", "手段"}},
        {"解决", {"处理", "解答", "应对"}},
        {"如何", {"怎样", "怎么", "如何才能"}},
        {"什么", {"啥", "什么是", "何为"}},
    };
}

HeuristicQueryExpander::HeuristicQueryExpander(SynonymTable synonyms, size_t cacheCapacity)
    : synonyms_(std::move(synonyms)), cache_(cacheCapacity) {}

std::vector<std::string> HeuristicQueryExpander::decompose(const std::string& query) const {
    std::vector<std::string> parts;
    auto lower = toLower(query);

    // English "and" and the Chinese conjunction U+548C, each between whitespace
    constexpr std::string_view kConjunctions[] = {" and ", " \xE5\x92\x8C "};
    for (auto conjunction : kConjunctions) {
        if (lower.find(conjunction) == std::string::npos)
            continue;
        size_t start = 0;
        size_t pos = 0;
        while ((pos = lower.find(conjunction, start)) != std::string::npos) {
            pushUnique(parts, query.substr(start, pos - start));
            start = pos + conjunction.size();
        }
        pushUnique(parts, query.substr(start));
    }

    // ASCII comma and the full-width comma (U+FF0C)
    constexpr std::string_view kWideComma = "\xEF\xBC\x8C";
    if (query.find(',') != std::string::npos || query.find(kWideComma) != std::string::npos) {
        std::string normalized = query;
        for (size_t pos = 0; (pos = normalized.find(kWideComma, pos)) != std::string::npos;) {
            normalized.replace(pos, kWideComma.size(), ",");
        }
        size_t start = 0;
        size_t pos = 0;
        while ((pos = normalized.find(',', start)) != std::string::npos) {
            pushUnique(parts, normalized.substr(start, pos - start));
            start = pos + 1;
        }
        pushUnique(parts, normalized.substr(start));
    }
    return parts;
}

std::vector<std::string> HeuristicQueryExpander::findSynonyms(const std::string& query,
                                                              std::string& matched) const {
    std::vector<std::string> out;
    auto lower = toLower(query);
    auto terms = tokenize(query);
    for (const auto& [word, syns] : synonyms_) {
        const bool ascii = isAscii(word);
        // ASCII words must match a whole term; CJK words have no separators
        bool hit = ascii ? std::find(terms.begin(), terms.end(), word) != terms.end()
                         : lower.find(word) != std::string::npos;
        if (!hit)
            continue;
        if (matched.empty())
            matched = word;
        out.insert(out.end(), syns.begin(), syns.end());
    }
    return out;
}

std::vector<std::string>
HeuristicQueryExpander::relatedTerms(const std::string& query,
                                     const std::vector<knowledge::ChunkRecord>& sample) const {
    std::vector<std::string> related;
    auto queryWords = tokenize(query);
    if (queryWords.empty())
        return related;

    size_t scanned = 0;
    for (const auto& chunk : sample) {
        if (scanned++ >= kSampleChunks || related.size() >= kMaxRelatedTerms)
            break;
        for (const auto& word : tokenize(chunk.content)) {
            if (word.size() <= 3)
                continue;
            if (std::find(queryWords.begin(), queryWords.end(), word) != queryWords.end())
                continue;
            if (std::find(related.begin(), related.end(), word) != related.end())
                continue;
            bool overlaps = std::any_of(queryWords.begin(), queryWords.end(),
                                        [&](const std::string& qw) {
                                            return qw.size() > 1 &&
                                                   (word.find(qw) != std::string::npos ||
                                                    qw.find(word) != std::string::npos);
                                        });
            if (overlaps) {
                related.push_back(word);
                if (related.size() >= kMaxRelatedTerms)
                    break;
            }
        }
    }
    return related;
}

std::string HeuristicQueryExpander::inflect(const std::string& query) const {
    std::string out = query;
    bool changed = false;
    for (const auto& term : tokenize(query)) {
        if (term.size() <= 3 || !std::isalpha(static_cast<unsigned char>(term.back())))
            continue;
        std::string swapped = term.back() == 's' ? term.substr(0, term.size() - 1) : term + "s";
        auto next = replaceTerm(out, term, swapped, true);
        if (next != out) {
            out = std::move(next);
            changed = true;
        }
    }
    return changed ? out : std::string{};
}

Result<QueryExpansion> HeuristicQueryExpander::expand(
    const std::string& query, const std::string& scope,
    const std::vector<knowledge::ChunkRecord>& sample, size_t maxVariants) {
    const std::string cacheKey = scope + '\x1f' + query;
    if (auto hit = cache_.get(cacheKey)) {
        if (hit->variants.size() > maxVariants)
            hit->variants.resize(std::max<size_t>(maxVariants, 1));
        return std::move(*hit);
    }

    QueryExpansion expansion;
    expansion.originalQuery = query;
    expansion.variants.push_back(query);

    for (auto& part : decompose(query)) {
        pushUnique(expansion.variants, std::move(part));
    }

    std::string matched;
    expansion.synonyms = findSynonyms(query, matched);
    if (!expansion.synonyms.empty()) {
        pushUnique(expansion.variants, replaceTerm(query, matched, expansion.synonyms.front(),
                                                   isAscii(matched)));
    }

    expansion.relatedTerms = relatedTerms(query, sample);
    if (!expansion.relatedTerms.empty()) {
        pushUnique(expansion.variants, query + " " + expansion.relatedTerms.front());
    }

    if (auto inflected = inflect(query); !inflected.empty()) {
        pushUnique(expansion.variants, std::move(inflected));
    }

    cache_.put(cacheKey, expansion);
    spdlog::debug("Expanded query into {} variants ({} synonyms, {} related terms)",
                  expansion.variants.size(), expansion.synonyms.size(),
                  expansion.relatedTerms.size());

    if (expansion.variants.size() > maxVariants)
        expansion.variants.resize(std::max<size_t>(maxVariants, 1));
    return expansion;
}

} // namespace kbase::search
