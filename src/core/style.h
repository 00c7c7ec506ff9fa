#pragma once

#include "core/token_types.h"

#include <optional>
#include <string>
#include <vector>

namespace rubric::style
{
// Resolved visual attributes of a category.
// Colors are 6 hex digits without '#'; empty means unset.
struct StyleRecord
{
    std::string color;
    std::string bgcolor;
    std::string border;
    bool bold = false;
    bool italic = false;
    bool underline = false;

    bool operator==(const StyleRecord& o) const
    {
        return color == o.color && bgcolor == o.bgcolor && border == o.border &&
               bold == o.bold && italic == o.italic && underline == o.underline;
    }
    bool operator!=(const StyleRecord& o) const { return !(*this == o); }
};

// Explicit (partial) style of one category, as written in a theme.
struct StyleSpec
{
    std::optional<std::string> fg;
    std::optional<std::string> bg;
    std::optional<std::string> border;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<bool> underline;

    // false: start from an empty record instead of the nearest styled ancestor's.
    bool inherit = true;
};

class Style
{
public:
    struct Entry
    {
        tokens::TokenType type = tokens::kRoot;
        StyleRecord record;
    };

    explicit Style(const tokens::TokenTypeTree& tree);

    // Adds or replaces the explicit style of `t` (re-resolves dependents).
    void Define(tokens::TokenType t, const StyleSpec& spec);

    bool StylesToken(tokens::TokenType t) const;

    // Nearest category at or above `t` that has an explicit style (root always has one).
    tokens::TokenType EffectiveType(tokens::TokenType t) const;

    // Resolved record of EffectiveType(t).
    const StyleRecord& StyleForToken(tokens::TokenType t) const;

    // Explicitly styled categories with their resolved records, in category id order.
    // The root is always the first entry.
    const std::vector<Entry>& Entries() const { return m_entries; }

    const tokens::TokenTypeTree& Tree() const { return *m_tree; }

    std::string name;
    std::string author;
    // Color hint for line-number gutters (may be empty).
    std::string line_number_color;

private:
    void Resolve();

    const tokens::TokenTypeTree* m_tree = nullptr;
    // Indexed by TokenType; disengaged when the category has no explicit style.
    std::vector<std::optional<StyleSpec>> m_specs;
    // Indexed by TokenType; valid only where m_specs is engaged.
    std::vector<StyleRecord> m_resolved;
    std::vector<Entry> m_entries;
};

StyleRecord ApplySpec(const StyleRecord& base, const StyleSpec& spec);
} // namespace rubric::style
