//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sema/Sema.cpp
// Purpose: Implements name resolution, type checking and extractor macro
//          expansion for rule files.
// Key invariants: A definition that fails a check contributes nothing to the
//                 environments or the checked rule list.
// Ownership/Lifetime: See Sema.hpp.
//
//===----------------------------------------------------------------------===//

#include "sema/Sema.hpp"
#include "support/diag_expected.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace isle::sema
{

namespace
{

/// @brief Replace macro parameters in @p body by the argument patterns.
/// @details A parameter used as `p @ sub` becomes `(and arg sub)` so both the
///          caller's pattern and the template's subpattern must match.
dsl::Pattern substitute(const dsl::Pattern &body,
                        const std::vector<dsl::Ident> &params,
                        const std::vector<dsl::Pattern> &args)
{
    auto paramIndex = [&](const std::string &name) -> std::optional<size_t> {
        for (size_t i = 0; i < params.size(); ++i)
        {
            if (params[i].name == name)
                return i;
        }
        return std::nullopt;
    };

    if (body.kind == dsl::Pattern::Kind::Var)
    {
        if (auto idx = paramIndex(body.name))
            return args[*idx];
        return body;
    }

    dsl::Pattern out = body;
    out.args.clear();
    for (const auto &child : body.args)
        out.args.push_back(substitute(child, params, args));

    if (body.kind == dsl::Pattern::Kind::Bind)
    {
        if (auto idx = paramIndex(body.name))
        {
            dsl::Pattern conj;
            conj.kind = dsl::Pattern::Kind::And;
            conj.loc = body.loc;
            conj.args.push_back(args[*idx]);
            conj.args.push_back(std::move(out.args.front()));
            return conj;
        }
    }
    return out;
}

} // namespace

Sema::Sema(isle::support::DiagnosticEngine &diag) : diag_(diag) {}

void Sema::error(isle::support::SourceLoc loc, std::string message)
{
    diag_.report(isle::support::makeError(loc, std::move(message)));
}

const std::string &Sema::typeName(TypeId type) const
{
    return types_.get(type).name;
}

void Sema::analyze(const std::vector<dsl::Def> &defs)
{
    registerTypes(defs);
    registerDecls(defs);
    registerExterns(defs);
    registerExtractors(defs);
    markInternalConstructors(defs);
    checkRules(defs);

    if (isle::support::traceEnabled())
    {
        isle::support::trace("sema: " + std::to_string(types_.size()) + " types, " +
                             std::to_string(terms_.size()) + " terms, " +
                             std::to_string(rules_.size()) + " rules");
    }
}

std::vector<const CheckedRule *> Sema::rulesFor(TermId term) const
{
    std::vector<const CheckedRule *> out;
    for (const auto &rule : rules_)
    {
        if (rule.root == term)
            out.push_back(&rule);
    }
    std::stable_sort(out.begin(), out.end(), [](const CheckedRule *a, const CheckedRule *b) {
        if (a->prio != b->prio)
            return a->prio > b->prio;
        return a->order < b->order;
    });
    return out;
}

std::optional<TypeId> Sema::resolveType(const dsl::Ident &name)
{
    if (auto id = types_.lookup(name.name))
        return id;
    error(name.loc, "undefined type '" + name.name + "'");
    return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

void Sema::registerTypes(const std::vector<dsl::Def> &defs)
{
    // Pass 1: names, so field types may refer to any type in the rule set.
    std::vector<std::pair<const dsl::TypeDef *, TypeId>> added;
    for (const auto &def : defs)
    {
        const auto *td = std::get_if<dsl::TypeDef>(&def);
        if (!td)
            continue;
        TypeInfo info;
        info.name = td->name.name;
        info.isExtern = td->isExtern;
        info.loc = td->loc;
        if (td->kind == dsl::TypeDef::Kind::Primitive)
        {
            info.kind = TypeInfo::Kind::Primitive;
            info.primitive = td->primitive.name;
        }
        else
        {
            info.kind = TypeInfo::Kind::Enum;
        }
        auto id = types_.add(std::move(info));
        if (!id)
        {
            error(td->name.loc, "duplicate type '" + td->name.name + "'");
            continue;
        }
        added.emplace_back(td, *id);
    }

    // Pass 2: enum variants and their terms.
    for (const auto &[td, typeId] : added)
    {
        if (td->kind != dsl::TypeDef::Kind::Enum)
            continue;
        std::unordered_set<std::string> seen;
        for (const auto &variant : td->variants)
        {
            if (!seen.insert(variant.name.name).second)
            {
                error(variant.name.loc,
                      "duplicate variant '" + variant.name.name + "' in type '" + td->name.name +
                          "'");
                continue;
            }

            VariantInfo vinfo;
            vinfo.name = variant.name.name;
            bool ok = true;
            for (const auto &field : variant.fields)
            {
                auto fieldType = resolveType(field.type);
                if (!fieldType)
                {
                    ok = false;
                    continue;
                }
                vinfo.fields.push_back(FieldInfo{field.name.name, *fieldType});
            }
            if (!ok)
                continue;

            TermInfo term;
            term.name = td->name.name + "." + variant.name.name;
            for (const auto &field : vinfo.fields)
                term.argTypes.push_back(field.type);
            term.retType = typeId;
            term.pure = true;
            term.loc = variant.name.loc;
            term.constructor = ConstructorKind::Variant;
            term.extractor = ExtractorKind::Variant;
            term.enumType = typeId;
            term.variantIndex = static_cast<uint32_t>(types_.get(typeId).variants.size());
            auto termId = terms_.add(std::move(term));
            if (!termId)
            {
                error(variant.name.loc, "duplicate term '" + td->name.name + "." +
                                            variant.name.name + "'");
                continue;
            }
            vinfo.term = *termId;
            types_.get(typeId).variants.push_back(std::move(vinfo));
        }
    }
}

void Sema::registerDecls(const std::vector<dsl::Def> &defs)
{
    for (const auto &def : defs)
    {
        const auto *decl = std::get_if<dsl::Decl>(&def);
        if (!decl)
            continue;

        TermInfo term;
        term.name = decl->term.name;
        term.pure = decl->pure;
        term.partial = decl->partial;
        term.loc = decl->loc;
        bool ok = true;
        for (const auto &arg : decl->argTypes)
        {
            auto ty = resolveType(arg);
            if (!ty)
            {
                ok = false;
                continue;
            }
            term.argTypes.push_back(*ty);
        }
        auto ret = resolveType(decl->retType);
        if (!ret || !ok)
            continue;
        term.retType = *ret;

        if (!terms_.add(std::move(term)))
            error(decl->term.loc, "duplicate term '" + decl->term.name + "'");
    }
}

void Sema::registerExterns(const std::vector<dsl::Def> &defs)
{
    for (const auto &def : defs)
    {
        const auto *ext = std::get_if<dsl::ExternDef>(&def);
        if (!ext)
            continue;

        auto termId = terms_.lookup(ext->term.name);
        if (!termId)
        {
            error(ext->term.loc, "extern declared for undeclared term '" + ext->term.name + "'");
            continue;
        }
        TermInfo &term = terms_.get(*termId);

        if (ext->kind == dsl::ExternDef::Kind::Constructor)
        {
            if (term.constructor != ConstructorKind::None)
            {
                error(ext->loc, "term '" + term.name + "' already has a constructor");
                continue;
            }
            term.constructor = ConstructorKind::Extern;
            term.externConstructor = ext->func.name;
            term.constructorLoc = ext->loc;
        }
        else
        {
            if (term.extractor != ExtractorKind::None)
            {
                error(ext->loc, "term '" + term.name + "' already has an extractor");
                continue;
            }
            term.extractor = ExtractorKind::Extern;
            term.externExtractor = ext->func.name;
            term.infallible = ext->infallible;
            term.extractorLoc = ext->loc;
        }
    }
}

void Sema::registerExtractors(const std::vector<dsl::Def> &defs)
{
    for (const auto &def : defs)
    {
        const auto *macro = std::get_if<dsl::ExtractorDef>(&def);
        if (!macro)
            continue;

        auto termId = terms_.lookup(macro->term.name);
        if (!termId)
        {
            error(macro->term.loc,
                  "extractor declared for undeclared term '" + macro->term.name + "'");
            continue;
        }
        TermInfo &term = terms_.get(*termId);
        if (term.extractor != ExtractorKind::None)
        {
            error(macro->loc, "term '" + term.name + "' already has an extractor");
            continue;
        }
        if (macro->params.size() != term.argTypes.size())
        {
            error(macro->loc, "extractor '" + term.name + "' takes " +
                                  std::to_string(macro->params.size()) +
                                  " parameters but the term has " +
                                  std::to_string(term.argTypes.size()) + " arguments");
            continue;
        }
        term.extractor = ExtractorKind::Macro;
        term.macro = macros_.size();
        term.extractorLoc = macro->loc;
        macros_.push_back(*macro);
    }
}

void Sema::markInternalConstructors(const std::vector<dsl::Def> &defs)
{
    for (const auto &def : defs)
    {
        const auto *rule = std::get_if<dsl::Rule>(&def);
        if (!rule || rule->pattern.kind != dsl::Pattern::Kind::Term)
            continue;
        auto termId = terms_.lookup(rule->pattern.name);
        if (!termId)
            continue;
        TermInfo &term = terms_.get(*termId);
        if (term.constructor == ConstructorKind::None)
        {
            term.constructor = ConstructorKind::Internal;
            term.constructorLoc = rule->loc;
        }
    }
}

//===----------------------------------------------------------------------===//
// Rules
//===----------------------------------------------------------------------===//

std::optional<VarId> Sema::RuleScope::lookup(const std::string &name) const
{
    for (auto it = scopes.rbegin(); it != scopes.rend(); ++it)
    {
        auto found = it->find(name);
        if (found != it->end())
            return found->second;
    }
    return std::nullopt;
}

VarId Sema::RuleScope::bind(const std::string &name, TypeId type)
{
    const auto id = static_cast<VarId>(vars.size());
    vars.push_back(VarInfo{name, type});
    scopes.back()[name] = id;
    return id;
}

void Sema::checkRules(const std::vector<dsl::Def> &defs)
{
    std::unordered_map<std::string, isle::support::SourceLoc> names;
    size_t order = 0;
    for (const auto &def : defs)
    {
        const auto *rule = std::get_if<dsl::Rule>(&def);
        if (!rule)
            continue;
        if (rule->name)
        {
            if (!names.emplace(rule->name->name, rule->name->loc).second)
            {
                error(rule->name->loc, "duplicate rule name '" + rule->name->name + "'");
                continue;
            }
        }
        if (auto checked = checkRule(*rule, order++))
            rules_.push_back(std::move(*checked));
    }
}

std::optional<CheckedRule> Sema::checkRule(const dsl::Rule &rule, size_t order)
{
    if (rule.pattern.kind != dsl::Pattern::Kind::Term)
    {
        error(rule.pattern.loc, "rule pattern must be a term application");
        return std::nullopt;
    }
    auto termId = terms_.lookup(rule.pattern.name);
    if (!termId)
    {
        error(rule.pattern.loc, "undefined term '" + rule.pattern.name + "'");
        return std::nullopt;
    }
    const TermInfo &term = terms_.get(*termId);
    if (term.constructor == ConstructorKind::Variant)
    {
        error(rule.pattern.loc, "cannot define rules for enum variant '" + term.name + "'");
        return std::nullopt;
    }
    if (term.constructor == ConstructorKind::Extern)
    {
        error(rule.pattern.loc,
              "term '" + term.name + "' has an extern constructor and cannot have rules");
        return std::nullopt;
    }
    if (rule.pattern.args.size() != term.argTypes.size())
    {
        error(rule.pattern.loc, "term '" + term.name + "' expects " +
                                    std::to_string(term.argTypes.size()) + " arguments, got " +
                                    std::to_string(rule.pattern.args.size()));
        return std::nullopt;
    }

    CheckedRule out;
    out.root = *termId;
    if (rule.name)
        out.name = rule.name->name;
    out.prio = rule.prio;
    out.order = order;
    out.loc = rule.loc;

    RuleScope scope;
    scope.scopes.emplace_back();
    bool ok = true;
    for (size_t i = 0; i < rule.pattern.args.size(); ++i)
    {
        auto arg = checkPattern(rule.pattern.args[i], term.argTypes[i], scope);
        if (!arg)
        {
            ok = false;
            continue;
        }
        out.args.push_back(std::move(*arg));
    }
    if (!ok)
        return std::nullopt;

    for (const auto &guard : rule.guards)
    {
        auto expr = checkExpr(guard.expr, std::nullopt, scope);
        if (!expr)
            return std::nullopt;
        auto pattern = checkPattern(guard.pattern, expr->type, scope);
        if (!pattern)
            return std::nullopt;
        out.guards.push_back(CheckedGuard{std::move(*pattern), std::move(*expr)});
    }

    auto result = checkExpr(rule.expr, term.retType, scope);
    if (!result)
        return std::nullopt;
    out.result = std::move(*result);
    out.vars = std::move(scope.vars);
    return out;
}

bool Sema::checkType(isle::support::SourceLoc loc,
                     const std::string &what,
                     TypeId actual,
                     std::optional<TypeId> expected)
{
    if (!expected || *expected == actual)
        return true;
    error(loc, what + " has type '" + typeName(actual) + "' but type '" + typeName(*expected) +
                   "' is expected");
    return false;
}

std::optional<CheckedPattern> Sema::checkPattern(const dsl::Pattern &pat,
                                                 TypeId expected,
                                                 RuleScope &scope)
{
    CheckedPattern out;
    out.type = expected;
    out.loc = pat.loc;

    switch (pat.kind)
    {
        case dsl::Pattern::Kind::Wildcard:
            out.kind = CheckedPattern::Kind::Wildcard;
            return out;

        case dsl::Pattern::Kind::ConstBool:
            if (!checkType(pat.loc, "boolean constant", kBoolType, expected))
                return std::nullopt;
            out.kind = CheckedPattern::Kind::ConstBool;
            out.boolValue = pat.boolValue;
            return out;

        case dsl::Pattern::Kind::ConstInt:
            if (types_.get(expected).kind != TypeInfo::Kind::Primitive)
            {
                error(pat.loc,
                      "integer constant used where type '" + typeName(expected) + "' is expected");
                return std::nullopt;
            }
            out.kind = CheckedPattern::Kind::ConstInt;
            out.intValue = pat.intValue;
            return out;

        case dsl::Pattern::Kind::Var:
            if (auto existing = scope.lookup(pat.name))
            {
                if (!checkType(pat.loc, "variable '" + pat.name + "'",
                               scope.vars[*existing].type, expected))
                    return std::nullopt;
                out.kind = CheckedPattern::Kind::EqVar;
                out.var = *existing;
                return out;
            }
            out.kind = CheckedPattern::Kind::BindVar;
            out.var = scope.bind(pat.name, expected);
            return out;

        case dsl::Pattern::Kind::Bind:
        {
            if (scope.lookup(pat.name))
            {
                error(pat.loc, "variable '" + pat.name + "' is already bound");
                return std::nullopt;
            }
            out.kind = CheckedPattern::Kind::BindVar;
            out.var = scope.bind(pat.name, expected);
            auto sub = checkPattern(pat.args.front(), expected, scope);
            if (!sub)
                return std::nullopt;
            out.args.push_back(std::move(*sub));
            return out;
        }

        case dsl::Pattern::Kind::And:
            out.kind = CheckedPattern::Kind::And;
            for (const auto &sub : pat.args)
            {
                auto checked = checkPattern(sub, expected, scope);
                if (!checked)
                    return std::nullopt;
                out.args.push_back(std::move(*checked));
            }
            return out;

        case dsl::Pattern::Kind::Term:
            return checkTermPattern(pat, expected, scope);
    }
    return std::nullopt;
}

std::optional<CheckedPattern> Sema::checkTermPattern(const dsl::Pattern &pat,
                                                     TypeId expected,
                                                     RuleScope &scope)
{
    auto termId = terms_.lookup(pat.name);
    if (!termId)
    {
        error(pat.loc, "undefined term '" + pat.name + "'");
        return std::nullopt;
    }
    const TermInfo &term = terms_.get(*termId);
    if (!checkType(pat.loc, "term '" + term.name + "'", term.retType, expected))
        return std::nullopt;
    if (pat.args.size() != term.argTypes.size())
    {
        error(pat.loc, "term '" + term.name + "' expects " + std::to_string(term.argTypes.size()) +
                           " arguments, got " + std::to_string(pat.args.size()));
        return std::nullopt;
    }

    CheckedPattern out;
    out.type = expected;
    out.loc = pat.loc;
    out.term = *termId;

    switch (term.extractor)
    {
        case ExtractorKind::None:
            error(pat.loc,
                  "term '" + term.name + "' has no extractor and cannot be used in a pattern");
            return std::nullopt;

        case ExtractorKind::Macro:
        {
            if (std::find(expanding_.begin(), expanding_.end(), *termId) != expanding_.end())
            {
                error(pat.loc, "recursive expansion of extractor '" + term.name + "'");
                return std::nullopt;
            }
            const dsl::ExtractorDef &macro = macros_[term.macro];
            dsl::Pattern expanded = substitute(macro.body, macro.params, pat.args);
            expanding_.push_back(*termId);
            auto result = checkPattern(expanded, expected, scope);
            expanding_.pop_back();
            return result;
        }

        case ExtractorKind::Variant:
            out.kind = CheckedPattern::Kind::Variant;
            break;

        case ExtractorKind::Extern:
            out.kind = CheckedPattern::Kind::Extractor;
            break;
    }

    for (size_t i = 0; i < pat.args.size(); ++i)
    {
        auto arg = checkPattern(pat.args[i], term.argTypes[i], scope);
        if (!arg)
            return std::nullopt;
        out.args.push_back(std::move(*arg));
    }
    return out;
}

std::optional<CheckedExpr> Sema::checkExpr(const dsl::Expr &expr,
                                           std::optional<TypeId> expected,
                                           RuleScope &scope)
{
    CheckedExpr out;
    out.loc = expr.loc;

    switch (expr.kind)
    {
        case dsl::Expr::Kind::Var:
        {
            auto var = scope.lookup(expr.name);
            if (!var)
            {
                error(expr.loc, "unbound variable '" + expr.name + "'");
                return std::nullopt;
            }
            const TypeId type = scope.vars[*var].type;
            if (!checkType(expr.loc, "variable '" + expr.name + "'", type, expected))
                return std::nullopt;
            out.kind = CheckedExpr::Kind::Var;
            out.var = *var;
            out.type = type;
            return out;
        }

        case dsl::Expr::Kind::ConstBool:
            if (!checkType(expr.loc, "boolean constant", kBoolType, expected))
                return std::nullopt;
            out.kind = CheckedExpr::Kind::ConstBool;
            out.boolValue = expr.boolValue;
            out.type = kBoolType;
            return out;

        case dsl::Expr::Kind::ConstInt:
            if (!expected)
            {
                error(expr.loc, "cannot infer the type of integer constant " +
                                    expr.intValue.toString());
                return std::nullopt;
            }
            if (types_.get(*expected).kind != TypeInfo::Kind::Primitive)
            {
                error(expr.loc,
                      "integer constant used where type '" + typeName(*expected) + "' is expected");
                return std::nullopt;
            }
            out.kind = CheckedExpr::Kind::ConstInt;
            out.intValue = expr.intValue;
            out.type = *expected;
            return out;

        case dsl::Expr::Kind::Term:
        {
            auto termId = terms_.lookup(expr.name);
            if (!termId)
            {
                error(expr.loc, "undefined term '" + expr.name + "'");
                return std::nullopt;
            }
            const TermInfo &term = terms_.get(*termId);
            if (term.constructor == ConstructorKind::None)
            {
                error(expr.loc, "term '" + term.name +
                                    "' has no constructor and cannot be used in an expression");
                return std::nullopt;
            }
            if (!checkType(expr.loc, "term '" + term.name + "'", term.retType, expected))
                return std::nullopt;
            if (expr.args.size() != term.argTypes.size())
            {
                error(expr.loc, "term '" + term.name + "' expects " +
                                    std::to_string(term.argTypes.size()) + " arguments, got " +
                                    std::to_string(expr.args.size()));
                return std::nullopt;
            }
            out.kind = CheckedExpr::Kind::Call;
            out.term = *termId;
            out.type = term.retType;
            for (size_t i = 0; i < expr.args.size(); ++i)
            {
                auto arg = checkExpr(expr.args[i], term.argTypes[i], scope);
                if (!arg)
                    return std::nullopt;
                out.args.push_back(std::move(*arg));
            }
            return out;
        }

        case dsl::Expr::Kind::Let:
        {
            out.kind = CheckedExpr::Kind::Let;
            scope.scopes.emplace_back();
            for (const auto &binding : expr.lets)
            {
                auto type = resolveType(binding.type);
                if (!type)
                {
                    scope.scopes.pop_back();
                    return std::nullopt;
                }
                auto value = checkExpr(binding.value, *type, scope);
                if (!value)
                {
                    scope.scopes.pop_back();
                    return std::nullopt;
                }
                const VarId var = scope.bind(binding.var.name, *type);
                out.lets.push_back(CheckedLet{var, std::move(*value)});
            }
            auto body = checkExpr(expr.args.front(), expected, scope);
            scope.scopes.pop_back();
            if (!body)
                return std::nullopt;
            out.type = body->type;
            out.args.push_back(std::move(*body));
            return out;
        }
    }
    return std::nullopt;
}

} // namespace isle::sema
