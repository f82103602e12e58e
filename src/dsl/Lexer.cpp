//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: dsl/Lexer.cpp
// Purpose: Implements the rule-file lexer.
// Key invariants: Every character is consumed exactly once; the lexer never
//                 stops early on an error, so later errors are still found.
// Ownership/Lifetime: Lexer owns copy of source; DiagnosticEngine borrowed.
//
//===----------------------------------------------------------------------===//

#include "dsl/Lexer.hpp"
#include "support/diag_expected.hpp"

#include <limits>
#include <utility>

namespace isle::dsl
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of file";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::At:
            return "'@'";
        case TokenKind::Symbol:
            return "symbol";
        case TokenKind::Int:
            return "integer";
    }
    return "token";
}

std::string IntLiteral::toString() const
{
    std::string digits = std::to_string(magnitude);
    return negative && magnitude != 0 ? "-" + digits : digits;
}

Lexer::Lexer(std::string source, uint32_t fileId, isle::support::DiagnosticEngine &diag)
    : src_(std::move(source)), fileId_(fileId), diag_(diag)
{
}

//===----------------------------------------------------------------------===//
// Character cursor
//===----------------------------------------------------------------------===//

char Lexer::peekChar() const
{
    return pos_ < src_.size() ? src_[pos_] : '\0';
}

char Lexer::peekChar(size_t offset) const
{
    const size_t idx = pos_ + offset;
    return idx < src_.size() ? src_[idx] : '\0';
}

char Lexer::getChar()
{
    if (pos_ >= src_.size())
        return '\0';
    const char c = src_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= src_.size();
}

isle::support::SourceLoc Lexer::currentLoc() const
{
    return {fileId_, line_, column_};
}

void Lexer::reportError(isle::support::SourceLoc loc, std::string message)
{
    diag_.report(isle::support::makeError(loc, std::move(message)));
}

//===----------------------------------------------------------------------===//
// Trivia
//===----------------------------------------------------------------------===//

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        const char c = peekChar();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
        {
            getChar();
            continue;
        }
        if (c == ';')
        {
            while (!eof() && peekChar() != '\n' && peekChar() != '\r')
                getChar();
            continue;
        }
        if (c == '(' && peekChar(1) == ';')
        {
            const auto start = currentLoc();
            getChar();
            getChar();
            unsigned depth = 1;
            while (depth > 0)
            {
                if (eof())
                {
                    reportError(start, "unterminated block comment");
                    return;
                }
                if (peekChar() == '(' && peekChar(1) == ';')
                {
                    getChar();
                    getChar();
                    ++depth;
                }
                else if (peekChar() == ';' && peekChar(1) == ')')
                {
                    getChar();
                    getChar();
                    --depth;
                }
                else
                {
                    getChar();
                }
            }
            continue;
        }
        return;
    }
}

//===----------------------------------------------------------------------===//
// Tokens
//===----------------------------------------------------------------------===//

bool Lexer::isSymFirstChar(char c)
{
    switch (c)
    {
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
        case '(':
        case ')':
        case ';':
        case ' ':
        case '\t':
        case '\n':
        case '\r':
        case '\0':
            return false;
        default:
            return true;
    }
}

bool Lexer::isSymOtherChar(char c)
{
    switch (c)
    {
        case '(':
        case ')':
        case ';':
        case '@':
        case ' ':
        case '\t':
        case '\n':
        case '\r':
        case '\0':
            return false;
        default:
            return true;
    }
}

Token Lexer::lexSymbol()
{
    Token tok;
    tok.kind = TokenKind::Symbol;
    tok.loc = currentLoc();
    const size_t start = pos_;
    getChar();
    while (!eof() && isSymOtherChar(peekChar()))
        getChar();
    tok.text = src_.substr(start, pos_ - start);
    return tok;
}

namespace
{
int digitValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

/// @brief Lex an integer literal with optional sign, radix prefix and `_`
///        digit separators.
/// @details Malformed literals are reported and yield a zero-valued token so
///          the parser can keep going.
Token Lexer::lexInt()
{
    Token tok;
    tok.kind = TokenKind::Int;
    tok.loc = currentLoc();
    const size_t start = pos_;

    if (peekChar() == '-')
    {
        getChar();
        tok.intValue.negative = true;
    }

    unsigned radix = 10;
    if (peekChar() == '0')
    {
        const char p = peekChar(1);
        if (p == 'x' || p == 'X')
            radix = 16;
        else if (p == 'o' || p == 'O')
            radix = 8;
        else if (p == 'b' || p == 'B')
            radix = 2;
        if (radix != 10)
        {
            getChar();
            getChar();
        }
    }

    bool sawDigit = false;
    bool bad = false;
    bool overflow = false;
    uint64_t value = 0;
    while (!eof())
    {
        const char c = peekChar();
        if (c == '_')
        {
            getChar();
            continue;
        }
        const int d = digitValue(c);
        if (d < 0)
            break;
        getChar();
        if (static_cast<unsigned>(d) >= radix)
        {
            bad = true;
            continue;
        }
        sawDigit = true;
        if (value > (std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(d)) / radix)
            overflow = true;
        else
            value = value * radix + static_cast<uint64_t>(d);
    }

    // A literal runs into a symbol character, e.g. `12abc` with radix 10 or `1x`.
    while (!eof() && isSymOtherChar(peekChar()) && peekChar() != '@')
    {
        getChar();
        bad = true;
    }

    const std::string spelling = src_.substr(start, pos_ - start);
    if (!sawDigit || bad)
    {
        reportError(tok.loc, "invalid integer literal '" + spelling + "'");
        return tok;
    }
    if (overflow)
    {
        reportError(tok.loc, "integer literal out of range '" + spelling + "'");
        return tok;
    }
    tok.intValue.magnitude = value;
    return tok;
}

Token Lexer::next()
{
    if (peeked_)
    {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }

    for (;;)
    {
        skipWhitespaceAndComments();

        Token tok;
        tok.loc = currentLoc();
        if (eof())
        {
            tok.kind = TokenKind::Eof;
            return tok;
        }

        const char c = peekChar();
        switch (c)
        {
            case '(':
                getChar();
                tok.kind = TokenKind::LParen;
                return tok;
            case ')':
                getChar();
                tok.kind = TokenKind::RParen;
                return tok;
            case '@':
                getChar();
                tok.kind = TokenKind::At;
                return tok;
            default:
                break;
        }

        const bool startsNumber =
            (c >= '0' && c <= '9') || (c == '-' && peekChar(1) >= '0' && peekChar(1) <= '9');
        if (startsNumber)
            return lexInt();
        if (isSymFirstChar(c))
            return lexSymbol();

        reportError(tok.loc, std::string("unexpected character '") + c + "'");
        getChar();
    }
}

const Token &Lexer::peek()
{
    if (!peeked_)
        peeked_ = next();
    return *peeked_;
}

} // namespace isle::dsl
