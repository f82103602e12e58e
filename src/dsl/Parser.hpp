//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: dsl/Parser.hpp
// Purpose: Declares the recursive-descent parser for rule files.
// Key invariants: A malformed definition is reported once and skipped up to its
//                 closing parenthesis; parsing resumes at the next definition.
// Ownership/Lifetime: Parser borrows the Lexer and DiagnosticEngine.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dsl/AST.hpp"
#include "dsl/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <vector>

namespace isle::dsl
{

/// @brief Parses a token stream into top-level definitions.
class Parser
{
  public:
    /// @param lexer Lexer to read tokens from.
    /// @param diag Diagnostic engine for reporting errors.
    Parser(Lexer &lexer, isle::support::DiagnosticEngine &diag);

    /// @brief Parse every definition up to end of file.
    /// @return Successfully parsed definitions; malformed ones are omitted.
    std::vector<Def> parseDefs();

    /// @brief Parse a single pattern (for testing).
    std::optional<Pattern> parsePattern();

    /// @brief Parse a single expression (for testing).
    std::optional<Expr> parseExpr();

    /// @brief Check if any errors occurred during parsing.
    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    // Token Handling
    //=========================================================================

    const Token &peek() const;
    Token advance();
    bool check(TokenKind kind) const;
    bool checkSymbol(const char *text) const;
    bool expect(TokenKind kind, const char *what);
    std::optional<Ident> expectSymbol(const char *what);

    /// @brief True when the current token is '(' followed by symbol @p text.
    bool checkForm(const char *text);

    /// @brief Skip to the end of the definition being parsed.
    void resyncToTopLevel();

    void error(const std::string &message);
    void errorAt(isle::support::SourceLoc loc, const std::string &message);

    //=========================================================================
    // Definitions
    //=========================================================================

    std::optional<Def> parseDef();
    std::optional<TypeDef> parseTypeDef(isle::support::SourceLoc loc);
    std::optional<Variant> parseVariant();
    std::optional<Decl> parseDecl(isle::support::SourceLoc loc);
    std::optional<ExternDef> parseExtern(isle::support::SourceLoc loc);
    std::optional<ExtractorDef> parseExtractor(isle::support::SourceLoc loc);
    std::optional<Rule> parseRule(isle::support::SourceLoc loc);
    std::optional<Guard> parseGuard();
    std::optional<LetBinding> parseLetBinding();

    Lexer &lexer_;
    isle::support::DiagnosticEngine &diag_;
    Token current_;
    int depth_{0};
    bool hasError_{false};
};

} // namespace isle::dsl
