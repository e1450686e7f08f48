#include "HotkeyBinding.hpp"
#include "../../helpers/StringUtils.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

using namespace Config;
using namespace Config::Binding;

// letters, digits, f1-f20, named keys, keypad, raw keycodes and layout punctuation
static const RE2 KEY_RE(R"((?i)[a-z0-9]|f([1-9]|1[0-9]|20)|space|tab|return|backspace|escape|delete|forwarddelete|home|end|pageup|pagedown|left|right|up|down|)"
                        R"(caps_lock|help|insert|sound_up|sound_down|mute|brightness_up|brightness_down|illumination_up|illumination_down|play|previous|next|)"
                        R"(rewind|fast|kp_\S+|kp[0-9]|0x[0-9a-f]{1,2}|[-=\[\];',./\\`])");

bool SHotkeyBinding::hasValidModifiers() const {
    return std::ranges::all_of(modifiers, [](const auto& m) { return HOTKEY_MODIFIERS.contains(m); });
}

bool SHotkeyBinding::hasValidKey() const {
    return RE2::FullMatch(key, KEY_RE);
}

std::string SHotkeyBinding::displayString() const {
    std::string result;

    for (const auto& m : modifiers) {
        const auto MOD = HOTKEY_MODIFIERS.fromString(m);
        result += MOD ? std::string{HOTKEY_MODIFIERS.symbol(*MOD)} : m;
    }

    std::string upper = key;
    std::ranges::transform(upper, upper.begin(), [](unsigned char c) { return std::toupper(c); });

    return result + upper;
}

std::optional<std::string> Config::Binding::normalizeCategory(const std::optional<std::string>& category) {
    if (!category.has_value())
        return std::nullopt;

    auto result = NStringUtils::toLower(trim(*category));
    std::ranges::replace(result, '\n', ' ');

    if (result.empty() || result == "uncategorized")
        return std::nullopt;

    return result;
}

static SHotkeyBinding normalized(SHotkeyBinding binding) {
    binding.category = normalizeCategory(binding.category);
    return binding;
}

CBindingSet::CBindingSet(std::vector<SHotkeyBinding> bindings) : m_bindings(std::move(bindings)) {
    for (auto& b : m_bindings) {
        b.category = normalizeCategory(b.category);
    }
}

const std::vector<SHotkeyBinding>& CBindingSet::bindings() const {
    return m_bindings;
}

std::expected<CBindingSet, std::string> CBindingSet::addBinding(const SHotkeyBinding& binding) const {
    if (binding.id.empty())
        return std::unexpected("binding has no id");

    if (findBinding(binding.id).has_value())
        return std::unexpected(std::format("a binding with id {} already exists", binding.id));

    CBindingSet copy = *this;
    copy.m_bindings.emplace_back(normalized(binding));
    return copy;
}

CBindingSet CBindingSet::removeBinding(const std::string& id) const {
    CBindingSet copy = *this;
    std::erase_if(copy.m_bindings, [&id](const auto& b) { return b.id == id; });
    return copy;
}

std::expected<CBindingSet, std::string> CBindingSet::updateBinding(const SHotkeyBinding& binding) const {
    CBindingSet copy = *this;

    auto        it = std::ranges::find_if(copy.m_bindings, [&binding](const auto& b) { return b.id == binding.id; });
    if (it == copy.m_bindings.end())
        return std::unexpected(std::format("no binding with id {}", binding.id));

    *it = normalized(binding);
    return copy;
}

std::optional<SHotkeyBinding> CBindingSet::findBinding(const std::string& id) const {
    const auto IT = std::ranges::find_if(m_bindings, [&id](const auto& b) { return b.id == id; });
    if (IT == m_bindings.end())
        return std::nullopt;
    return *IT;
}

std::vector<SHotkeyBinding> CBindingSet::byCategory(const std::optional<std::string>& category) const {
    std::vector<SHotkeyBinding> result;
    std::ranges::copy_if(m_bindings, std::back_inserter(result), [&category](const auto& b) { return b.category == category; });
    return result;
}

std::vector<std::optional<std::string>> CBindingSet::categories() const {
    std::vector<std::optional<std::string>> result;
    for (const auto& b : m_bindings) {
        if (std::ranges::find(result, b.category) == result.end())
            result.emplace_back(b.category);
    }
    return result;
}

size_t CBindingSet::enabledCount() const {
    return std::ranges::count_if(m_bindings, [](const auto& b) { return b.enabled; });
}

size_t CBindingSet::disabledCount() const {
    return m_bindings.size() - enabledCount();
}

std::string CBindingSet::nextId() const {
    for (size_t i = 0;; ++i) {
        auto id = std::format("binding_{}", i);
        if (!findBinding(id).has_value())
            return id;
    }
}
