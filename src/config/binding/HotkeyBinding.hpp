#pragma once

#include "../ConfigEnums.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace Config::Binding {

    struct SHotkeyBinding {
        std::string                id;
        std::vector<std::string>   modifiers; // display order, compared as a set
        std::string                key;
        std::string                action;
        std::optional<std::string> category; // lowercase
        std::optional<std::string> description;
        bool                       enabled = true;

        bool                            hasValidModifiers() const;
        // a key skhd can bind, case-insensitive
        bool                            hasValidKey() const;

        // modifier symbols followed by the upper-cased key, e.g. ⌥⇧J
        std::string                     displayString() const;

        bool                            operator==(const SHotkeyBinding&) const = default;
    };

    // lowercased and trimmed, empty and "uncategorized" give nullopt
    std::optional<std::string> normalizeCategory(const std::optional<std::string>& category);

    // immutable, ids are unique within a set, categories are normalized on the way in
    class CBindingSet {
      public:
        CBindingSet() = default;
        explicit CBindingSet(std::vector<SHotkeyBinding> bindings);

        const std::vector<SHotkeyBinding>&       bindings() const;

        std::expected<CBindingSet, std::string>  addBinding(const SHotkeyBinding& binding) const;
        CBindingSet                              removeBinding(const std::string& id) const;
        std::expected<CBindingSet, std::string>  updateBinding(const SHotkeyBinding& binding) const;
        std::optional<SHotkeyBinding>            findBinding(const std::string& id) const;

        std::vector<SHotkeyBinding>              byCategory(const std::optional<std::string>& category) const;
        // distinct categories in first-seen order
        std::vector<std::optional<std::string>>  categories() const;

        size_t                                   enabledCount() const;
        size_t                                   disabledCount() const;

        // first binding_N not taken yet
        std::string                              nextId() const;

        bool                                     operator==(const CBindingSet&) const = default;

      private:
        std::vector<SHotkeyBinding> m_bindings;
    };
}
