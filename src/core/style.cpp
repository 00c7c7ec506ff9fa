#include "core/style.h"

namespace rubric::style
{
StyleRecord ApplySpec(const StyleRecord& base, const StyleSpec& spec)
{
    StyleRecord out = spec.inherit ? base : StyleRecord{};
    if (spec.fg) out.color = *spec.fg;
    if (spec.bg) out.bgcolor = *spec.bg;
    if (spec.border) out.border = *spec.border;
    if (spec.bold) out.bold = *spec.bold;
    if (spec.italic) out.italic = *spec.italic;
    if (spec.underline) out.underline = *spec.underline;
    return out;
}

Style::Style(const tokens::TokenTypeTree& tree)
    : m_tree(&tree)
{
    m_specs.resize(tree.Size());
    m_specs[tokens::kRoot] = StyleSpec{};
    Resolve();
}

void Style::Define(tokens::TokenType t, const StyleSpec& spec)
{
    if (t == tokens::kInvalid)
        return;
    if (t >= m_specs.size())
        m_specs.resize((std::size_t)t + 1);
    m_specs[t] = spec;
    Resolve();
}

bool Style::StylesToken(tokens::TokenType t) const
{
    return t < m_specs.size() && m_specs[t].has_value();
}

tokens::TokenType Style::EffectiveType(tokens::TokenType t) const
{
    if (t == tokens::kInvalid || t >= m_tree->Size())
        return tokens::kRoot;
    // Bounded by tree depth: every step moves to a strictly smaller id.
    while (!StylesToken(t) && m_tree->HasParent(t))
        t = m_tree->Parent(t);
    return StylesToken(t) ? t : tokens::kRoot;
}

const StyleRecord& Style::StyleForToken(tokens::TokenType t) const
{
    return m_resolved[EffectiveType(t)];
}

void Style::Resolve()
{
    // Parents are registered before children, so a single pass in id order sees every
    // ancestor's resolved record before it is needed.
    m_resolved.assign(m_specs.size(), StyleRecord{});
    m_entries.clear();
    for (std::size_t i = 0; i < m_specs.size(); ++i)
    {
        if (!m_specs[i])
            continue;
        const tokens::TokenType t = (tokens::TokenType)i;
        StyleRecord base;
        if (m_tree->HasParent(t))
            base = m_resolved[EffectiveType(m_tree->Parent(t))];
        m_resolved[i] = ApplySpec(base, *m_specs[i]);
        m_entries.push_back(Entry{t, m_resolved[i]});
    }
}
} // namespace rubric::style
