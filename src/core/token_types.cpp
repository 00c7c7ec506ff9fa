#include "core/token_types.h"

#include <utility>

namespace rubric::tokens
{
namespace
{
// Registration order defines category enumeration order (and with it the order in which
// styles contribute colors to an exported color table).
static const char* const kStandardTypes[] = {
    "Text",
    "Whitespace",
    "Escape",
    "Error",
    "Other",
    "Keyword",
    "Keyword.Constant",
    "Keyword.Declaration",
    "Keyword.Namespace",
    "Keyword.Pseudo",
    "Keyword.Reserved",
    "Keyword.Type",
    "Name",
    "Name.Attribute",
    "Name.Builtin",
    "Name.Builtin.Pseudo",
    "Name.Class",
    "Name.Constant",
    "Name.Decorator",
    "Name.Entity",
    "Name.Exception",
    "Name.Function",
    "Name.Function.Magic",
    "Name.Property",
    "Name.Label",
    "Name.Namespace",
    "Name.Other",
    "Name.Tag",
    "Name.Variable",
    "Name.Variable.Class",
    "Name.Variable.Global",
    "Name.Variable.Instance",
    "Name.Variable.Magic",
    "Literal",
    "Literal.Date",
    "Literal.String",
    "Literal.String.Affix",
    "Literal.String.Backtick",
    "Literal.String.Char",
    "Literal.String.Delimiter",
    "Literal.String.Doc",
    "Literal.String.Double",
    "Literal.String.Escape",
    "Literal.String.Heredoc",
    "Literal.String.Interpol",
    "Literal.String.Other",
    "Literal.String.Regex",
    "Literal.String.Single",
    "Literal.String.Symbol",
    "Literal.Number",
    "Literal.Number.Bin",
    "Literal.Number.Float",
    "Literal.Number.Hex",
    "Literal.Number.Integer",
    "Literal.Number.Integer.Long",
    "Literal.Number.Oct",
    "Operator",
    "Operator.Word",
    "Punctuation",
    "Punctuation.Marker",
    "Comment",
    "Comment.Hashbang",
    "Comment.Multiline",
    "Comment.Preproc",
    "Comment.PreprocFile",
    "Comment.Single",
    "Comment.Special",
    "Generic",
    "Generic.Deleted",
    "Generic.Emph",
    "Generic.Error",
    "Generic.Heading",
    "Generic.Inserted",
    "Generic.Output",
    "Generic.Prompt",
    "Generic.Strong",
    "Generic.Subheading",
    "Generic.EmphStrong",
    "Generic.Traceback",
};

// "String.Doc" and "Number.Hex" are shorthands for their Literal.* categories.
static std::string CanonicalName(std::string_view dotted)
{
    if (dotted == "Token")
        return std::string();
    if (dotted.substr(0, 6) == "Token.")
        dotted.remove_prefix(6);

    auto starts_component = [&](std::string_view head) {
        return dotted.substr(0, head.size()) == head &&
               (dotted.size() == head.size() || dotted[head.size()] == '.');
    };
    if (starts_component("String") || starts_component("Number"))
        return "Literal." + std::string(dotted);
    return std::string(dotted);
}
} // namespace

TokenTypeTree::TokenTypeTree()
{
    m_nodes.push_back(Node{"Token", kInvalid});
    m_by_name.emplace(std::string(), kRoot);

    for (const char* name : kStandardTypes)
        Intern(name);

    m_text = Find("Text");
    m_whitespace = Find("Whitespace");
    m_keyword = Find("Keyword");
    m_name = Find("Name");
    m_string_doc = Find("Literal.String.Doc");
    m_comment = Find("Comment");
    m_error = Find("Error");
}

TokenType TokenTypeTree::AddChild(TokenType parent, std::string name)
{
    if (m_nodes.size() >= (std::size_t)kInvalid)
        return kInvalid;
    const TokenType id = (TokenType)m_nodes.size();
    m_by_name.emplace(name, id);
    m_nodes.push_back(Node{std::move(name), parent});
    return id;
}

TokenType TokenTypeTree::Intern(std::string_view dotted)
{
    const std::string canon = CanonicalName(dotted);
    if (canon.empty())
        return kRoot;

    if (auto it = m_by_name.find(canon); it != m_by_name.end())
        return it->second;

    TokenType cur = kRoot;
    std::size_t start = 0;
    while (start <= canon.size())
    {
        std::size_t dot = canon.find('.', start);
        if (dot == std::string::npos)
            dot = canon.size();
        if (dot == start)
            return kInvalid;

        const std::string prefix = canon.substr(0, dot);
        auto it = m_by_name.find(prefix);
        if (it != m_by_name.end())
        {
            cur = it->second;
        }
        else
        {
            cur = AddChild(cur, prefix);
            if (cur == kInvalid)
                return kInvalid;
        }
        start = dot + 1;
    }
    return cur;
}

TokenType TokenTypeTree::Find(std::string_view dotted) const
{
    auto it = m_by_name.find(CanonicalName(dotted));
    return (it == m_by_name.end()) ? kInvalid : it->second;
}

TokenType TokenTypeTree::Parent(TokenType t) const
{
    if (t >= m_nodes.size())
        return kInvalid;
    return m_nodes[t].parent;
}

bool TokenTypeTree::IsSubtype(TokenType t, TokenType ancestor) const
{
    // Parents always have smaller ids than their children, so the walk is bounded.
    while (t != kInvalid && t < m_nodes.size())
    {
        if (t == ancestor)
            return true;
        t = m_nodes[t].parent;
    }
    return false;
}

std::string TokenTypeTree::FullName(TokenType t) const
{
    if (t == kRoot || t >= m_nodes.size())
        return "Token";
    return "Token." + m_nodes[t].name;
}

const std::string& TokenTypeTree::DottedName(TokenType t) const
{
    if (t >= m_nodes.size())
        return m_nodes[kRoot].name;
    return m_nodes[t].name;
}

int TokenTypeTree::Depth(TokenType t) const
{
    int depth = 0;
    while (HasParent(t))
    {
        t = m_nodes[t].parent;
        ++depth;
    }
    return depth;
}
} // namespace rubric::tokens
