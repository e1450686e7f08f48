#pragma once

#include "../../helpers/memory/Memory.hpp"

#include <string>

//NOLINTNEXTLINE
namespace re2 {
    class RE2;
};

namespace Config::Directive {

    // a rule selector as the window manager evaluates it: an unanchored regex search
    class CSelectorMatcher {
      public:
        CSelectorMatcher(const std::string& pattern);
        ~CSelectorMatcher();

        bool        valid() const;
        std::string error() const;
        bool        match(const std::string& other) const;

      private:
        UP<re2::RE2> m_regex;
    };
}
