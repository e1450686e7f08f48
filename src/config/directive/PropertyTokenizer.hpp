#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Config::Directive {

    struct SPropertyToken {
        std::string value;
        bool        quoted = false;

        bool        operator==(const SPropertyToken&) const = default;
    };

    // insertion ordered, a repeated key overwrites the value but keeps its first position
    class CPropertyMap {
      public:
        void                                                       set(const std::string& key, SPropertyToken token);
        const SPropertyToken*                                      get(std::string_view key) const;
        bool                                                       contains(std::string_view key) const;

        bool                                                       empty() const;
        size_t                                                     size() const;
        const std::vector<std::pair<std::string, SPropertyToken>>& entries() const;

      private:
        std::vector<std::pair<std::string, SPropertyToken>> m_entries;
    };

    /*
        Scans `key=value key2="quoted value" key3='single'` left to right.
        Keys are runs of [A-Za-z0-9_]. A value is a double quoted string (\" and \\ are escapes),
        a single quoted string or a run of non-whitespace. Fragments without any pair give an empty map.
    */
    CPropertyMap tokenizeProperties(std::string_view fragment);

    // inverse of the double quoted form, used by the generators
    std::string  quoteValue(std::string_view value);
}
