//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: dsl/Lexer.hpp
// Purpose: Declares the rule-file lexer that turns S-expression source into
//          tokens.
// Key invariants: Line/column tracking is 1-based; lexical errors are reported
//                 to the DiagnosticEngine and the offending input is skipped.
// Ownership/Lifetime: Lexer owns a copy of the source; DiagnosticEngine borrowed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace isle::dsl
{

/// @brief All token kinds recognized by the rule-file lexer.
enum class TokenKind
{
    Eof,    ///< End of file
    LParen, ///< (
    RParen, ///< )
    At,     ///< @ (bind pattern)
    Symbol, ///< Identifier, keyword or term name
    Int,    ///< Integer literal
};

/// @brief Convert TokenKind to human-readable string.
const char *tokenKindToString(TokenKind kind);

/// @brief Signed integer literal with a full 64-bit magnitude.
/// @details Rule files routinely spell all-ones masks such as
///          0xFFFF_FFFF_FFFF_FFFF, so the magnitude is kept unsigned and the
///          sign separately.
struct IntLiteral
{
    bool negative{false};
    uint64_t magnitude{0};

    /// @brief Render the literal in decimal, with a leading '-' when negative.
    std::string toString() const;

    bool operator==(const IntLiteral &other) const
    {
        return negative == other.negative && magnitude == other.magnitude;
    }
};

/// @brief A lexical token produced by the lexer.
struct Token
{
    TokenKind kind{TokenKind::Eof};

    /// @brief Original spelling for symbols; empty for punctuation.
    std::string text;

    /// @brief Parsed value for Int tokens.
    IntLiteral intValue;

    /// @brief Source location where the token begins.
    isle::support::SourceLoc loc;
};

/// @brief Tokenizes rule-file text into a stream of tokens.
/// @details Call next() repeatedly until an Eof token is returned.
class Lexer
{
  public:
    /// @param source Source text to tokenize.
    /// @param fileId Identifier of the source file for diagnostics.
    /// @param diag Diagnostic engine for reporting errors.
    Lexer(std::string source, uint32_t fileId, isle::support::DiagnosticEngine &diag);

    /// @brief Produce the next token in the source.
    Token next();

    /// @brief Peek at the next token without consuming it.
    const Token &peek();

  private:
    char peekChar() const;
    char peekChar(size_t offset) const;
    char getChar();
    bool eof() const;

    isle::support::SourceLoc currentLoc() const;
    void reportError(isle::support::SourceLoc loc, std::string message);

    /// @brief Skip whitespace, `;` line comments and nested `(; ;)` blocks.
    void skipWhitespaceAndComments();

    Token lexSymbol();
    Token lexInt();

    static bool isSymFirstChar(char c);
    static bool isSymOtherChar(char c);

    std::string src_;
    size_t pos_{0};
    uint32_t fileId_;
    uint32_t line_{1};
    uint32_t column_{1};
    isle::support::DiagnosticEngine &diag_;
    std::optional<Token> peeked_;
};

} // namespace isle::dsl
