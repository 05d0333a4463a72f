#ifndef TOKENVAULT_SUBSTITUTION_SUBSTITUTION_ENGINE_HPP
#define TOKENVAULT_SUBSTITUTION_SUBSTITUTION_ENGINE_HPP

#include <algorithm>
#include <cctype>
#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/entity.hpp"
#include "core/errors.hpp"
#include "core/mapping.hpp"
#include "core/results.hpp"
#include "core/token.hpp"

/**
 * @file substitution_engine.hpp
 * @brief Rewrites text: spans -> tokens (forward), tokens -> values (reverse),
 *        and known values -> tokens by search (registry applied to fresh text).
 *
 * DESIGN GOALS:
 *   - Forward substitution is anchored on detector offsets. It never searches
 *     for the value, so a first name inside a full name, or a value that
 *     happens to occur elsewhere, cannot be replaced by mistake.
 *   - Every rewrite is one left-to-right pass that copies untouched text into
 *     a new buffer. Inserted text is never scanned again, so a token can not
 *     be substituted twice.
 *   - Restoration only touches well-formed tokens present in the mapping.
 *     Unknown tokens stay verbatim and are reported.
 *
 * USAGE EXAMPLE:
 *   @code
 *   SubstitutionEngine engine;
 *   std::string out = engine.apply(text, winners,
 *       [&](const core::Entity &e) { return assigner.assign(e); });
 *   core::DetokenizeResult back = engine.restore(out, mapping);
 *   @endcode
 */

namespace tokenvault {
namespace substitution {

class SubstitutionEngine
{
public:
    using TokenFor = std::function<std::string(const core::Entity &)>;

    /**
     * @param wordBoundary When true, value search only matches values whose
     *        alphanumeric edges are not glued to other word characters.
     */
    explicit SubstitutionEngine(bool wordBoundary = true)
        : wordBoundary_(wordBoundary)
    {
    }

    /**
     * @brief Replace each span with the string returned by @p tokenFor.
     * @param spans Non-overlapping, sorted by start, all inside @p text.
     * @throw core::EntityError if the spans overlap, are unsorted or out of range.
     */
    inline std::string apply(const std::string &text,
                             const std::vector<core::Entity> &spans,
                             const TokenFor &tokenFor) const
    {
        std::string out;
        out.reserve(text.size());

        size_t cursor = 0;
        for (const auto &span : spans) {
            if (span.start < cursor || span.end <= span.start || span.end > text.size()) {
                throw core::EntityError("SubstitutionEngine: span [" + std::to_string(span.start) + ", " +
                                        std::to_string(span.end) + ") overlaps, is unsorted or out of range");
            }
            out.append(text, cursor, span.start - cursor);
            out.append(tokenFor(span));
            cursor = span.end;
        }
        out.append(text, cursor, std::string::npos);
        return out;
    }

    /**
     * @brief Replace every known token in @p text with its value.
     */
    inline core::DetokenizeResult restore(const std::string &text, const core::Mapping &mapping) const
    {
        core::DetokenizeResult result;
        result.text.reserve(text.size());

        size_t i = 0;
        while (i < text.size()) {
            size_t open = text.find('<', i);
            if (open == std::string::npos) {
                result.text.append(text, i, std::string::npos);
                break;
            }
            result.text.append(text, i, open - i);

            size_t len = core::matchTokenAt(text, open);
            if (len == 0) {
                result.text.push_back('<');
                i = open + 1;
                continue;
            }

            std::string token = text.substr(open, len);
            auto value = mapping.findValue(token);
            if (value) {
                result.text.append(*value);
                ++result.replaced;
            } else {
                result.text.append(token);
                result.unresolved.push_back(token);
            }
            i = open + len;
        }
        return result;
    }

    /**
     * @brief Replace known values found by search, leftmost-longest.
     *
     * At each position the longest matching value wins, so "Marie Dupont" is
     * replaced before "Marie". Well-formed tokens already in the text are
     * copied unchanged.
     *
     * @param known Pairs (value, token); empty values are ignored.
     * @param used If set, receives the (token, value) pairs that were applied.
     */
    inline std::string replaceKnownValues(const std::string &text,
                                          const std::vector<std::pair<std::string, std::string>> &known,
                                          core::Mapping *used = nullptr) const
    {
        // candidates bucketed by first byte, longest first
        std::unordered_map<char, std::vector<const std::pair<std::string, std::string> *>> byFirst;
        for (const auto &kv : known) {
            if (!kv.first.empty()) {
                byFirst[kv.first[0]].push_back(&kv);
            }
        }
        for (auto &bucket : byFirst) {
            std::stable_sort(bucket.second.begin(), bucket.second.end(),
                             [](const std::pair<std::string, std::string> *a,
                                const std::pair<std::string, std::string> *b) {
                                 return a->first.size() > b->first.size();
                             });
        }

        std::string out;
        out.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            size_t tokenLen = core::matchTokenAt(text, i);
            if (tokenLen > 0) {
                out.append(text, i, tokenLen);
                i += tokenLen;
                continue;
            }

            const std::pair<std::string, std::string> *match = nullptr;
            auto bucket = byFirst.find(text[i]);
            if (bucket != byFirst.end()) {
                for (const auto *kv : bucket->second) {
                    if (text.compare(i, kv->first.size(), kv->first) == 0 &&
                        boundaryOk(text, i, kv->first.size()))
                    {
                        match = kv;
                        break;
                    }
                }
            }

            if (match) {
                out.append(match->second);
                if (used) {
                    used->insert(match->second, match->first);
                }
                i += match->first.size();
            } else {
                out.push_back(text[i]);
                ++i;
            }
        }
        return out;
    }

    /**
     * @brief Well-formed tokens occurring literally in @p text.
     *
     * Token allocation skips these so that restoring a tokenized text can
     * not turn a literal "<Person_1>" typed by a user into a real value.
     */
    inline static std::set<std::string> findTokenLiterals(const std::string &text)
    {
        std::set<std::string> found;
        size_t i = text.find('<');
        while (i != std::string::npos) {
            size_t len = core::matchTokenAt(text, i);
            if (len > 0) {
                found.insert(text.substr(i, len));
                i = text.find('<', i + len);
            } else {
                i = text.find('<', i + 1);
            }
        }
        return found;
    }

    /**
     * @brief The one-way replacement used by redaction: "[REDACTED-Type]".
     */
    inline static std::string redactionMarker(const std::string &type)
    {
        return "[REDACTED-" + type + "]";
    }

private:
    // Bytes >= 0x80 count as word characters so UTF-8 letters are not split.
    inline static bool isWordByte(char c)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        return uc >= 0x80 || std::isalnum(uc) || c == '_';
    }

    inline bool boundaryOk(const std::string &text, size_t pos, size_t len) const
    {
        if (!wordBoundary_) {
            return true;
        }
        if (pos > 0 && isWordByte(text[pos]) && isWordByte(text[pos - 1])) {
            return false;
        }
        size_t end = pos + len;
        if (end < text.size() && isWordByte(text[end - 1]) && isWordByte(text[end])) {
            return false;
        }
        return true;
    }

    bool wordBoundary_;
};

} // namespace substitution
} // namespace tokenvault

#endif // TOKENVAULT_SUBSTITUTION_SUBSTITUTION_ENGINE_HPP
