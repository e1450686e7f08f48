#include "PropertyTokenizer.hpp"

#include <algorithm>
#include <cctype>

using namespace Config::Directive;

void CPropertyMap::set(const std::string& key, SPropertyToken token) {
    auto it = std::ranges::find_if(m_entries, [&key](const auto& e) { return e.first == key; });
    if (it != m_entries.end()) {
        it->second = std::move(token);
        return;
    }

    m_entries.emplace_back(key, std::move(token));
}

const SPropertyToken* CPropertyMap::get(std::string_view key) const {
    auto it = std::ranges::find_if(m_entries, [key](const auto& e) { return e.first == key; });
    return it == m_entries.end() ? nullptr : &it->second;
}

bool CPropertyMap::contains(std::string_view key) const {
    return get(key) != nullptr;
}

bool CPropertyMap::empty() const {
    return m_entries.empty();
}

size_t CPropertyMap::size() const {
    return m_entries.size();
}

const std::vector<std::pair<std::string, SPropertyToken>>& CPropertyMap::entries() const {
    return m_entries;
}

static bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c));
}

// returns the position past the closing quote, or npos when unterminated
static size_t scanDoubleQuoted(std::string_view s, size_t start, std::string& out) {
    for (size_t i = start + 1; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && (s[i + 1] == '"' || s[i + 1] == '\\')) {
            out += s[i + 1];
            ++i;
            continue;
        }

        if (s[i] == '"')
            return i + 1;

        out += s[i];
    }

    return std::string_view::npos;
}

static size_t scanSingleQuoted(std::string_view s, size_t start, std::string& out) {
    const auto CLOSE = s.find('\'', start + 1);
    if (CLOSE == std::string_view::npos)
        return std::string_view::npos;

    out = s.substr(start + 1, CLOSE - start - 1);
    return CLOSE + 1;
}

CPropertyMap Config::Directive::tokenizeProperties(std::string_view fragment) {
    CPropertyMap result;

    size_t       i = 0;
    while (i < fragment.size()) {
        if (!isWordChar(fragment[i])) {
            ++i;
            continue;
        }

        size_t keyEnd = i;
        while (keyEnd < fragment.size() && isWordChar(fragment[keyEnd])) {
            ++keyEnd;
        }

        if (keyEnd >= fragment.size() || fragment[keyEnd] != '=') {
            i = keyEnd;
            continue;
        }

        const std::string KEY{fragment.substr(i, keyEnd - i)};
        const size_t      VALUE_START = keyEnd + 1;

        if (VALUE_START >= fragment.size() || isSpace(fragment[VALUE_START])) {
            i = VALUE_START;
            continue;
        }

        SPropertyToken token;
        size_t         end = std::string_view::npos;

        if (fragment[VALUE_START] == '"')
            end = scanDoubleQuoted(fragment, VALUE_START, token.value);
        else if (fragment[VALUE_START] == '\'')
            end = scanSingleQuoted(fragment, VALUE_START, token.value);

        if (end != std::string_view::npos)
            token.quoted = true;
        else {
            // bare run, also the fallback for an unterminated quote
            end = VALUE_START;
            while (end < fragment.size() && !isSpace(fragment[end])) {
                ++end;
            }
            token.value = std::string{fragment.substr(VALUE_START, end - VALUE_START)};
        }

        result.set(KEY, std::move(token));
        i = end;
    }

    return result;
}

std::string Config::Directive::quoteValue(std::string_view value) {
    std::string result = "\"";
    for (const char c : value) {
        if (c == '"' || c == '\\')
            result += '\\';
        result += c;
    }
    result += '"';
    return result;
}
