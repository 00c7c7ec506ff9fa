#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rubric::tokens
{
// Lexical categories form a fixed tree rooted at "Token".
//
// - Ids are stable for the lifetime of a tree and follow registration order.
// - The standard categories (Keyword, Name.Function, Literal.String.Doc, ...) are
//   registered by the constructor, so enumeration order is deterministic.
// - Unknown dotted names are interned on demand; missing ancestors are created first.
using TokenType = std::uint16_t;

static constexpr TokenType kRoot = 0;
static constexpr TokenType kInvalid = 0xFFFF;

class TokenTypeTree
{
public:
    TokenTypeTree();

    // Accepts "Keyword.Constant", "Token.Keyword.Constant" and "Token".
    // Returns kInvalid only when the tree is full or the name has an empty component.
    TokenType Intern(std::string_view dotted);

    // Lookup only. Returns kInvalid when unknown.
    TokenType Find(std::string_view dotted) const;

    TokenType Parent(TokenType t) const;
    bool HasParent(TokenType t) const { return t != kRoot && t < m_nodes.size(); }

    // True if `t` equals `ancestor` or descends from it.
    bool IsSubtype(TokenType t, TokenType ancestor) const;

    // "Token.Literal.String.Doc"
    std::string FullName(TokenType t) const;
    // "Literal.String.Doc" ("Token" for the root)
    const std::string& DottedName(TokenType t) const;

    std::size_t Size() const { return m_nodes.size(); }
    int Depth(TokenType t) const;

    // Frequently used standard ids.
    TokenType Text() const { return m_text; }
    TokenType Whitespace() const { return m_whitespace; }
    TokenType Keyword() const { return m_keyword; }
    TokenType Name() const { return m_name; }
    TokenType StringDoc() const { return m_string_doc; }
    TokenType Comment() const { return m_comment; }
    TokenType Error() const { return m_error; }

private:
    struct Node
    {
        std::string name; // dotted, without "Token." prefix
        TokenType   parent = kInvalid;
    };

    TokenType AddChild(TokenType parent, std::string name);

    std::vector<Node> m_nodes;
    std::unordered_map<std::string, TokenType> m_by_name;

    TokenType m_text = kInvalid;
    TokenType m_whitespace = kInvalid;
    TokenType m_keyword = kInvalid;
    TokenType m_name = kInvalid;
    TokenType m_string_doc = kInvalid;
    TokenType m_comment = kInvalid;
    TokenType m_error = kInvalid;
};

struct Token
{
    TokenType   type = kRoot;
    std::string text; // UTF-8
};

// Forward-only, single-pass token sequence.
class TokenSource
{
public:
    virtual ~TokenSource() = default;

    // Returns false when exhausted (or when the source failed; see the concrete source).
    virtual bool Next(Token& out) = 0;
};

// Materialized sequence exposed through the forward-only interface.
class VectorTokenSource : public TokenSource
{
public:
    explicit VectorTokenSource(const std::vector<Token>& tokens) : m_tokens(tokens) {}

    bool Next(Token& out) override
    {
        if (m_pos >= m_tokens.size())
            return false;
        out = m_tokens[m_pos++];
        return true;
    }

private:
    const std::vector<Token>& m_tokens;
    std::size_t m_pos = 0;
};
} // namespace rubric::tokens
