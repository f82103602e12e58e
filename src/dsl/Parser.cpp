//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: dsl/Parser.cpp
// Purpose: Implements the recursive-descent parser for rule files.
// Key invariants: depth_ counts unclosed '(' consumed so far, which is what
//                 error recovery uses to find the end of a definition.
// Ownership/Lifetime: Parser borrows the Lexer and DiagnosticEngine.
//
//===----------------------------------------------------------------------===//

#include "dsl/Parser.hpp"
#include "support/diag_expected.hpp"

#include <limits>
#include <utility>

namespace isle::dsl
{

Parser::Parser(Lexer &lexer, isle::support::DiagnosticEngine &diag)
    : lexer_(lexer), diag_(diag), current_(lexer.next())
{
}

//=============================================================================
// Token Handling
//=============================================================================

const Token &Parser::peek() const
{
    return current_;
}

Token Parser::advance()
{
    if (current_.kind == TokenKind::LParen)
        ++depth_;
    else if (current_.kind == TokenKind::RParen)
        --depth_;
    Token result = std::move(current_);
    current_ = lexer_.next();
    return result;
}

bool Parser::check(TokenKind kind) const
{
    return current_.kind == kind;
}

bool Parser::checkSymbol(const char *text) const
{
    return current_.kind == TokenKind::Symbol && current_.text == text;
}

bool Parser::checkForm(const char *text)
{
    if (!check(TokenKind::LParen))
        return false;
    const Token &next = lexer_.peek();
    return next.kind == TokenKind::Symbol && next.text == text;
}

bool Parser::expect(TokenKind kind, const char *what)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    error(std::string("expected ") + what + ", got " + tokenKindToString(current_.kind));
    return false;
}

std::optional<Ident> Parser::expectSymbol(const char *what)
{
    if (!check(TokenKind::Symbol))
    {
        error(std::string("expected ") + what + ", got " + tokenKindToString(current_.kind));
        return std::nullopt;
    }
    Token tok = advance();
    return Ident{std::move(tok.text), tok.loc};
}

void Parser::resyncToTopLevel()
{
    while (!check(TokenKind::Eof) && depth_ > 0)
        advance();
}

void Parser::error(const std::string &message)
{
    errorAt(current_.loc, message);
}

void Parser::errorAt(isle::support::SourceLoc loc, const std::string &message)
{
    hasError_ = true;
    diag_.report(isle::support::makeError(loc, message));
}

//=============================================================================
// Definitions
//=============================================================================

std::vector<Def> Parser::parseDefs()
{
    std::vector<Def> defs;
    while (!check(TokenKind::Eof))
    {
        if (!check(TokenKind::LParen))
        {
            error(std::string("expected '(' to start a definition, got ") +
                  tokenKindToString(current_.kind));
            advance();
            depth_ = 0;
            continue;
        }
        auto def = parseDef();
        if (def)
        {
            defs.push_back(std::move(*def));
        }
        else
        {
            resyncToTopLevel();
        }
    }
    return defs;
}

std::optional<Def> Parser::parseDef()
{
    const auto loc = peek().loc;
    if (!expect(TokenKind::LParen, "'('"))
        return std::nullopt;
    auto kw = expectSymbol("definition keyword");
    if (!kw)
        return std::nullopt;

    if (kw->name == "type")
    {
        if (auto d = parseTypeDef(loc))
            return Def{std::move(*d)};
        return std::nullopt;
    }
    if (kw->name == "decl")
    {
        if (auto d = parseDecl(loc))
            return Def{std::move(*d)};
        return std::nullopt;
    }
    if (kw->name == "extern")
    {
        if (auto d = parseExtern(loc))
            return Def{std::move(*d)};
        return std::nullopt;
    }
    if (kw->name == "extractor")
    {
        if (auto d = parseExtractor(loc))
            return Def{std::move(*d)};
        return std::nullopt;
    }
    if (kw->name == "rule")
    {
        if (auto d = parseRule(loc))
            return Def{std::move(*d)};
        return std::nullopt;
    }
    errorAt(kw->loc, "unknown definition '" + kw->name + "'");
    return std::nullopt;
}

std::optional<TypeDef> Parser::parseTypeDef(isle::support::SourceLoc loc)
{
    TypeDef def;
    def.loc = loc;
    auto name = expectSymbol("type name");
    if (!name)
        return std::nullopt;
    def.name = std::move(*name);

    for (;;)
    {
        if (checkSymbol("extern"))
        {
            advance();
            def.isExtern = true;
        }
        else if (checkSymbol("nodebug"))
        {
            advance();
            def.nodebug = true;
        }
        else
        {
            break;
        }
    }

    if (check(TokenKind::Symbol))
    {
        // Shorthand: (type Name prim)
        def.kind = TypeDef::Kind::Primitive;
        def.primitive = *expectSymbol("primitive type");
        if (!expect(TokenKind::RParen, "')'"))
            return std::nullopt;
        return def;
    }

    if (!expect(TokenKind::LParen, "'(' or primitive type name"))
        return std::nullopt;
    auto form = expectSymbol("'primitive' or 'enum'");
    if (!form)
        return std::nullopt;

    if (form->name == "primitive")
    {
        def.kind = TypeDef::Kind::Primitive;
        auto prim = expectSymbol("primitive type name");
        if (!prim)
            return std::nullopt;
        def.primitive = std::move(*prim);
    }
    else if (form->name == "enum")
    {
        def.kind = TypeDef::Kind::Enum;
        while (!check(TokenKind::RParen) && !check(TokenKind::Eof))
        {
            auto variant = parseVariant();
            if (!variant)
                return std::nullopt;
            def.variants.push_back(std::move(*variant));
        }
    }
    else
    {
        errorAt(form->loc, "expected 'primitive' or 'enum', got '" + form->name + "'");
        return std::nullopt;
    }

    if (!expect(TokenKind::RParen, "')'"))
        return std::nullopt;
    if (!expect(TokenKind::RParen, "')'"))
        return std::nullopt;
    return def;
}

std::optional<Variant> Parser::parseVariant()
{
    Variant variant;
    if (check(TokenKind::Symbol))
    {
        variant.name = *expectSymbol("variant name");
        return variant;
    }
    if (!expect(TokenKind::LParen, "variant"))
        return std::nullopt;
    auto name = expectSymbol("variant name");
    if (!name)
        return std::nullopt;
    variant.name = std::move(*name);
    while (check(TokenKind::LParen))
    {
        advance();
        auto fieldName = expectSymbol("field name");
        if (!fieldName)
            return std::nullopt;
        auto fieldType = expectSymbol("field type");
        if (!fieldType)
            return std::nullopt;
        if (!expect(TokenKind::RParen, "')'"))
            return std::nullopt;
        variant.fields.push_back(Field{std::move(*fieldName), std::move(*fieldType)});
    }
    if (!expect(TokenKind::RParen, "')' or field"))
        return std::nullopt;
    return variant;
}

std::optional<Decl> Parser::parseDecl(isle::support::SourceLoc loc)
{
    Decl decl;
    decl.loc = loc;
    for (;;)
    {
        if (checkSymbol("pure"))
        {
            advance();
            decl.pure = true;
        }
        else if (checkSymbol("partial"))
        {
            advance();
            decl.partial = true;
        }
        else if (checkSymbol("multi"))
        {
            error("multi terms are not supported");
            return std::nullopt;
        }
        else
        {
            break;
        }
    }

    auto term = expectSymbol("term name");
    if (!term)
        return std::nullopt;
    decl.term = std::move(*term);

    if (!expect(TokenKind::LParen, "'(' before argument types"))
        return std::nullopt;
    while (check(TokenKind::Symbol))
        decl.argTypes.push_back(*expectSymbol("argument type"));
    if (!expect(TokenKind::RParen, "')' after argument types"))
        return std::nullopt;

    auto ret = expectSymbol("return type");
    if (!ret)
        return std::nullopt;
    decl.retType = std::move(*ret);

    if (!expect(TokenKind::RParen, "')'"))
        return std::nullopt;
    return decl;
}

std::optional<ExternDef> Parser::parseExtern(isle::support::SourceLoc loc)
{
    ExternDef def;
    def.loc = loc;
    auto kind = expectSymbol("'constructor' or 'extractor'");
    if (!kind)
        return std::nullopt;
    if (kind->name == "constructor")
    {
        def.kind = ExternDef::Kind::Constructor;
    }
    else if (kind->name == "extractor")
    {
        def.kind = ExternDef::Kind::Extractor;
        if (checkSymbol("infallible"))
        {
            advance();
            def.infallible = true;
        }
    }
    else
    {
        errorAt(kind->loc, "expected 'constructor' or 'extractor', got '" + kind->name + "'");
        return std::nullopt;
    }

    auto term = expectSymbol("term name");
    if (!term)
        return std::nullopt;
    def.term = std::move(*term);
    auto func = expectSymbol("function name");
    if (!func)
        return std::nullopt;
    def.func = std::move(*func);
    if (!expect(TokenKind::RParen, "')'"))
        return std::nullopt;
    return def;
}

std::optional<ExtractorDef> Parser::parseExtractor(isle::support::SourceLoc loc)
{
    ExtractorDef def;
    def.loc = loc;
    if (!expect(TokenKind::LParen, "'(' before extractor signature"))
        return std::nullopt;
    auto term = expectSymbol("extractor term name");
    if (!term)
        return std::nullopt;
    def.term = std::move(*term);
    while (check(TokenKind::Symbol))
        def.params.push_back(*expectSymbol("extractor parameter"));
    if (!expect(TokenKind::RParen, "')' after extractor parameters"))
        return std::nullopt;

    auto body = parsePattern();
    if (!body)
        return std::nullopt;
    def.body = std::move(*body);

    if (!expect(TokenKind::RParen, "')'"))
        return std::nullopt;
    return def;
}

std::optional<Rule> Parser::parseRule(isle::support::SourceLoc loc)
{
    Rule rule;
    rule.loc = loc;

    if (check(TokenKind::Symbol))
        rule.name = *expectSymbol("rule name");

    if (check(TokenKind::Int))
    {
        Token prio = advance();
        const uint64_t limit = prio.intValue.negative
                                   ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                                   : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        if (prio.intValue.magnitude > limit)
        {
            errorAt(prio.loc, "rule priority out of range");
            return std::nullopt;
        }
        rule.prio = prio.intValue.negative
                        ? static_cast<int64_t>(0 - prio.intValue.magnitude)
                        : static_cast<int64_t>(prio.intValue.magnitude);
    }

    auto pattern = parsePattern();
    if (!pattern)
        return std::nullopt;
    rule.pattern = std::move(*pattern);

    while (checkForm("if-let") || checkForm("if"))
    {
        auto guard = parseGuard();
        if (!guard)
            return std::nullopt;
        rule.guards.push_back(std::move(*guard));
    }

    auto expr = parseExpr();
    if (!expr)
        return std::nullopt;
    rule.expr = std::move(*expr);

    if (!expect(TokenKind::RParen, "')' after rule body"))
        return std::nullopt;
    return rule;
}

std::optional<Guard> Parser::parseGuard()
{
    Guard guard;
    guard.loc = peek().loc;
    advance(); // (
    Token kw = advance();

    if (kw.text == "if-let")
    {
        auto pattern = parsePattern();
        if (!pattern)
            return std::nullopt;
        guard.pattern = std::move(*pattern);
    }
    else
    {
        guard.pattern.kind = Pattern::Kind::Wildcard;
        guard.pattern.loc = kw.loc;
    }

    auto expr = parseExpr();
    if (!expr)
        return std::nullopt;
    guard.expr = std::move(*expr);

    if (!expect(TokenKind::RParen, "')' after guard"))
        return std::nullopt;
    return guard;
}

//=============================================================================
// Patterns and expressions
//=============================================================================

std::optional<Pattern> Parser::parsePattern()
{
    Pattern pat;
    pat.loc = peek().loc;

    if (check(TokenKind::Int))
    {
        pat.kind = Pattern::Kind::ConstInt;
        pat.intValue = advance().intValue;
        return pat;
    }

    if (check(TokenKind::Symbol))
    {
        Token sym = advance();
        if (sym.text == "_")
        {
            pat.kind = Pattern::Kind::Wildcard;
            return pat;
        }
        if (sym.text == "true" || sym.text == "false")
        {
            pat.kind = Pattern::Kind::ConstBool;
            pat.boolValue = sym.text == "true";
            return pat;
        }
        pat.name = std::move(sym.text);
        if (check(TokenKind::At))
        {
            advance();
            auto sub = parsePattern();
            if (!sub)
                return std::nullopt;
            pat.kind = Pattern::Kind::Bind;
            pat.args.push_back(std::move(*sub));
            return pat;
        }
        pat.kind = Pattern::Kind::Var;
        return pat;
    }

    if (check(TokenKind::LParen))
    {
        advance();
        auto head = expectSymbol("term name in pattern");
        if (!head)
            return std::nullopt;
        pat.kind = head->name == "and" ? Pattern::Kind::And : Pattern::Kind::Term;
        if (pat.kind == Pattern::Kind::Term)
            pat.name = std::move(head->name);
        while (!check(TokenKind::RParen) && !check(TokenKind::Eof))
        {
            auto arg = parsePattern();
            if (!arg)
                return std::nullopt;
            pat.args.push_back(std::move(*arg));
        }
        if (!expect(TokenKind::RParen, "')' after pattern"))
            return std::nullopt;
        return pat;
    }

    error(std::string("expected pattern, got ") + tokenKindToString(current_.kind));
    return std::nullopt;
}

std::optional<Expr> Parser::parseExpr()
{
    Expr expr;
    expr.loc = peek().loc;

    if (check(TokenKind::Int))
    {
        expr.kind = Expr::Kind::ConstInt;
        expr.intValue = advance().intValue;
        return expr;
    }

    if (check(TokenKind::Symbol))
    {
        Token sym = advance();
        if (sym.text == "true" || sym.text == "false")
        {
            expr.kind = Expr::Kind::ConstBool;
            expr.boolValue = sym.text == "true";
            return expr;
        }
        expr.kind = Expr::Kind::Var;
        expr.name = std::move(sym.text);
        return expr;
    }

    if (check(TokenKind::LParen))
    {
        advance();
        auto head = expectSymbol("term name in expression");
        if (!head)
            return std::nullopt;

        if (head->name == "let")
        {
            expr.kind = Expr::Kind::Let;
            if (!expect(TokenKind::LParen, "'(' before let bindings"))
                return std::nullopt;
            while (check(TokenKind::LParen))
            {
                auto binding = parseLetBinding();
                if (!binding)
                    return std::nullopt;
                expr.lets.push_back(std::move(*binding));
            }
            if (!expect(TokenKind::RParen, "')' after let bindings"))
                return std::nullopt;
            auto body = parseExpr();
            if (!body)
                return std::nullopt;
            expr.args.push_back(std::move(*body));
            if (!expect(TokenKind::RParen, "')' after let body"))
                return std::nullopt;
            return expr;
        }

        expr.kind = Expr::Kind::Term;
        expr.name = std::move(head->name);
        while (!check(TokenKind::RParen) && !check(TokenKind::Eof))
        {
            auto arg = parseExpr();
            if (!arg)
                return std::nullopt;
            expr.args.push_back(std::move(*arg));
        }
        if (!expect(TokenKind::RParen, "')' after expression"))
            return std::nullopt;
        return expr;
    }

    error(std::string("expected expression, got ") + tokenKindToString(current_.kind));
    return std::nullopt;
}

std::optional<LetBinding> Parser::parseLetBinding()
{
    advance(); // (
    auto var = expectSymbol("let variable");
    if (!var)
        return std::nullopt;
    auto type = expectSymbol("let variable type");
    if (!type)
        return std::nullopt;
    auto value = parseExpr();
    if (!value)
        return std::nullopt;
    if (!expect(TokenKind::RParen, "')' after let binding"))
        return std::nullopt;
    return LetBinding{std::move(*var), std::move(*type), std::move(*value)};
}

} // namespace isle::dsl
