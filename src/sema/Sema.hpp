//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sema/Sema.hpp
// Purpose: Declares the semantic analyzer that resolves names, checks types
//          and arities, expands extractor macros and produces checked rules.
// Key invariants: Definitions are registered in phases (types, decls, externs,
//                 extractor macros, rules), so a definition may refer to names
//                 defined later in the same file or in a later file.
// Ownership/Lifetime: Sema owns the environments and checked rules; the
//                     DiagnosticEngine is borrowed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dsl/AST.hpp"
#include "sema/Env.hpp"
#include "sema/Rules.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace isle::sema
{

/// @brief Checks a parsed rule set and builds the environments for codegen.
class Sema
{
  public:
    explicit Sema(isle::support::DiagnosticEngine &diag);

    /// @brief Analyze all definitions of the logical rule set.
    /// @details Errors are reported to the engine; analysis continues past an
    ///          erroneous definition so every problem is reported in one run.
    void analyze(const std::vector<dsl::Def> &defs);

    const TypeEnv &types() const
    {
        return types_;
    }

    const TermEnv &terms() const
    {
        return terms_;
    }

    const std::vector<CheckedRule> &rules() const
    {
        return rules_;
    }

    /// @brief Rules defining @p term, highest priority first, then source order.
    std::vector<const CheckedRule *> rulesFor(TermId term) const;

    /// @brief Spell @p type the way diagnostics name it.
    const std::string &typeName(TypeId type) const;

  private:
    /// Variables of one rule plus the stack of let scopes.
    struct RuleScope
    {
        std::vector<VarInfo> vars;
        std::vector<std::unordered_map<std::string, VarId>> scopes;

        std::optional<VarId> lookup(const std::string &name) const;
        VarId bind(const std::string &name, TypeId type);
    };

    void registerTypes(const std::vector<dsl::Def> &defs);
    void registerDecls(const std::vector<dsl::Def> &defs);
    void registerExterns(const std::vector<dsl::Def> &defs);
    void registerExtractors(const std::vector<dsl::Def> &defs);
    void markInternalConstructors(const std::vector<dsl::Def> &defs);
    void checkRules(const std::vector<dsl::Def> &defs);

    std::optional<TypeId> resolveType(const dsl::Ident &name);
    std::optional<CheckedRule> checkRule(const dsl::Rule &rule, size_t order);
    std::optional<CheckedPattern> checkPattern(const dsl::Pattern &pat,
                                               TypeId expected,
                                               RuleScope &scope);
    std::optional<CheckedPattern> checkTermPattern(const dsl::Pattern &pat,
                                                   TypeId expected,
                                                   RuleScope &scope);
    std::optional<CheckedExpr> checkExpr(const dsl::Expr &expr,
                                         std::optional<TypeId> expected,
                                         RuleScope &scope);
    bool checkType(isle::support::SourceLoc loc,
                   const std::string &what,
                   TypeId actual,
                   std::optional<TypeId> expected);

    void error(isle::support::SourceLoc loc, std::string message);

    isle::support::DiagnosticEngine &diag_;
    TypeEnv types_;
    TermEnv terms_;
    std::vector<dsl::ExtractorDef> macros_;
    std::vector<TermId> expanding_;
    std::vector<CheckedRule> rules_;
};

} // namespace isle::sema
