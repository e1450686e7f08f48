#include "SelectorMatcher.hpp"
#include <re2/re2.h>

using namespace Config::Directive;

CSelectorMatcher::CSelectorMatcher(const std::string& pattern) {
    re2::RE2::Options opts;
    opts.set_log_errors(false);
    m_regex = makeUnique<re2::RE2>(pattern, opts);
}

CSelectorMatcher::~CSelectorMatcher() = default;

bool CSelectorMatcher::valid() const {
    return m_regex->ok();
}

std::string CSelectorMatcher::error() const {
    return m_regex->error();
}

bool CSelectorMatcher::match(const std::string& other) const {
    if (!m_regex->ok())
        return false;

    return re2::RE2::PartialMatch(other, *m_regex);
}
