// File: tests/sema/SemaTests.cpp
// Purpose: Verify name resolution, type checking, extractor macro expansion
//          and rule ordering performed by the semantic analyzer.
// Key invariants: Every failed check is reported with the location of the
//                 offending form; analysis continues past errors.
// Ownership/Lifetime: The fixture owns the engine and analyzer per test.
// Links: src/sema/Sema.cpp

#include "dsl/Lexer.hpp"
#include "dsl/Parser.hpp"
#include "sema/Sema.hpp"
#include "support/diagnostics.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace isle::sema;
using isle::support::DiagnosticEngine;

namespace
{

const char *const kPrelude = "(type Reg (primitive u32))\n"
                             "(type Imm u64)\n"
                             "(type Inst (enum Nop (Add (a Reg) (b Reg)) (Ld (off Imm))))\n"
                             "(decl lower (Inst) Reg)\n"
                             "(decl add (Reg Reg) Reg)\n"
                             "(extern constructor add emit_add)\n";

class SemaTest : public ::testing::Test
{
  protected:
    void analyze(const std::string &src)
    {
        isle::dsl::Lexer lexer(src, 1, de);
        isle::dsl::Parser parser(lexer, de);
        auto defs = parser.parseDefs();
        ASSERT_EQ(de.errorCount(), 0u) << "parse errors in test input";
        sema.analyze(defs);
    }

    bool hasError(const std::string &message) const
    {
        for (const auto &d : de.diagnostics())
        {
            if (d.message == message)
                return true;
        }
        return false;
    }

    std::string allErrors() const
    {
        std::string out;
        for (const auto &d : de.diagnostics())
            out += d.message + "\n";
        return out;
    }

    DiagnosticEngine de;
    Sema sema{de};
};

} // namespace

TEST_F(SemaTest, RegistersTypesVariantsAndTerms)
{
    analyze(kPrelude);
    ASSERT_EQ(de.errorCount(), 0u) << allErrors();

    auto inst = sema.types().lookup("Inst");
    ASSERT_TRUE(inst.has_value());
    const auto &info = sema.types().get(*inst);
    EXPECT_EQ(info.kind, TypeInfo::Kind::Enum);
    ASSERT_EQ(info.variants.size(), 3u);
    EXPECT_EQ(info.variants[1].fields[1].name, "b");

    auto addVariant = sema.terms().lookup("Inst.Add");
    ASSERT_TRUE(addVariant.has_value());
    const auto &term = sema.terms().get(*addVariant);
    EXPECT_EQ(term.constructor, ConstructorKind::Variant);
    EXPECT_EQ(term.extractor, ExtractorKind::Variant);
    EXPECT_EQ(term.argTypes.size(), 2u);
    EXPECT_EQ(term.retType, *inst);
    EXPECT_EQ(term.variantIndex, 1u);

    auto add = sema.terms().lookup("add");
    ASSERT_TRUE(add.has_value());
    EXPECT_EQ(sema.terms().get(*add).constructor, ConstructorKind::Extern);
    EXPECT_EQ(sema.terms().get(*add).externConstructor, "emit_add");
    EXPECT_EQ(sema.typeName(kBoolType), "bool");
}

TEST_F(SemaTest, ChecksRuleAndMarksInternalConstructor)
{
    analyze(std::string(kPrelude) + "(rule (lower (Inst.Add x y)) (add x y))");
    ASSERT_EQ(de.errorCount(), 0u) << allErrors();
    ASSERT_EQ(sema.rules().size(), 1u);

    auto lower = *sema.terms().lookup("lower");
    EXPECT_EQ(sema.terms().get(lower).constructor, ConstructorKind::Internal);

    const auto &rule = sema.rules()[0];
    EXPECT_EQ(rule.root, lower);
    ASSERT_EQ(rule.args.size(), 1u);
    EXPECT_EQ(rule.args[0].kind, CheckedPattern::Kind::Variant);
    ASSERT_EQ(rule.args[0].args.size(), 2u);
    EXPECT_EQ(rule.args[0].args[0].kind, CheckedPattern::Kind::BindVar);
    ASSERT_EQ(rule.vars.size(), 2u);
    EXPECT_EQ(rule.vars[0].name, "x");
    EXPECT_EQ(rule.result.kind, CheckedExpr::Kind::Call);
    EXPECT_EQ(rule.result.args.size(), 2u);
}

TEST_F(SemaTest, RepeatedVariableBecomesEqualityTest)
{
    analyze(std::string(kPrelude) + "(rule (lower (Inst.Add x x)) x)");
    ASSERT_EQ(de.errorCount(), 0u) << allErrors();
    const auto &add = sema.rules().at(0).args[0];
    EXPECT_EQ(add.args[0].kind, CheckedPattern::Kind::BindVar);
    EXPECT_EQ(add.args[1].kind, CheckedPattern::Kind::EqVar);
    EXPECT_EQ(add.args[1].var, add.args[0].var);
}

TEST_F(SemaTest, OrdersRulesByPriorityThenSourceOrder)
{
    analyze(std::string(kPrelude) + "(rule first (lower _) 1)\n"
                                    "(rule second 10 (lower _) 2)\n"
                                    "(rule third (lower _) 3)\n"
                                    "(rule fourth 10 (lower _) 4)");
    ASSERT_EQ(de.errorCount(), 0u) << allErrors();
    auto ordered = sema.rulesFor(*sema.terms().lookup("lower"));
    ASSERT_EQ(ordered.size(), 4u);
    EXPECT_EQ(*ordered[0]->name, "second");
    EXPECT_EQ(*ordered[1]->name, "fourth");
    EXPECT_EQ(*ordered[2]->name, "first");
    EXPECT_EQ(*ordered[3]->name, "third");
}

TEST_F(SemaTest, ExpandsExtractorMacros)
{
    analyze(std::string(kPrelude) + "(decl iadd (Reg Reg) Inst)\n"
                                    "(extractor (iadd a b) (Inst.Add a b))\n"
                                    "(rule (lower (iadd x y @ 7)) y)");
    ASSERT_EQ(de.errorCount(), 0u) << allErrors();
    const auto &pat = sema.rules().at(0).args[0];
    ASSERT_EQ(pat.kind, CheckedPattern::Kind::Variant);
    ASSERT_EQ(pat.args.size(), 2u);
    EXPECT_EQ(pat.args[0].kind, CheckedPattern::Kind::BindVar);
    ASSERT_EQ(pat.args[1].kind, CheckedPattern::Kind::BindVar);
    ASSERT_EQ(pat.args[1].args.size(), 1u);
    EXPECT_EQ(pat.args[1].args[0].kind, CheckedPattern::Kind::ConstInt);
}

TEST_F(SemaTest, DetectsRecursiveExtractorMacro)
{
    analyze(std::string(kPrelude) + "(decl loop (Reg) Inst)\n"
                                    "(extractor (loop a) (loop a))\n"
                                    "(rule (lower (loop x)) x)");
    EXPECT_TRUE(hasError("recursive expansion of extractor 'loop'")) << allErrors();
}

TEST_F(SemaTest, TypesLetBindingsAndGuards)
{
    analyze(std::string(kPrelude) + "(decl partial small (Imm) bool)\n"
                                    "(extern constructor small is_small)\n"
                                    "(decl imm_reg (Imm) Reg)\n"
                                    "(extern constructor imm_reg imm_reg)\n"
                                    "(rule (lower (Inst.Ld off)) (if-let true (small off))\n"
                                    "  (let ((r Reg (imm_reg off)) (s Reg (add r r))) s))");
    ASSERT_EQ(de.errorCount(), 0u) << allErrors();
    const auto &rule = sema.rules().at(0);
    ASSERT_EQ(rule.guards.size(), 1u);
    EXPECT_EQ(rule.guards[0].pattern.kind, CheckedPattern::Kind::ConstBool);
    EXPECT_EQ(rule.guards[0].expr.type, kBoolType);
    ASSERT_EQ(rule.result.kind, CheckedExpr::Kind::Let);
    EXPECT_EQ(rule.result.lets.size(), 2u);
    EXPECT_EQ(rule.vars.size(), 3u);
}

TEST_F(SemaTest, ReportsDuplicatesAndUndefinedNames)
{
    analyze("(type Reg u32)\n"
            "(type Reg u64)\n"
            "(type E (enum A A))\n"
            "(decl f (Missing) Reg)\n"
            "(decl g () Reg)\n"
            "(decl g () Reg)\n"
            "(extern constructor nope nope)\n");
    EXPECT_TRUE(hasError("duplicate type 'Reg'")) << allErrors();
    EXPECT_TRUE(hasError("duplicate variant 'A' in type 'E'")) << allErrors();
    EXPECT_TRUE(hasError("undefined type 'Missing'")) << allErrors();
    EXPECT_TRUE(hasError("duplicate term 'g'")) << allErrors();
    EXPECT_TRUE(hasError("extern declared for undeclared term 'nope'")) << allErrors();
    EXPECT_EQ(de.errorCount(), 5u) << allErrors();
}

TEST_F(SemaTest, ReportsDuplicateConstructorsAndRuleRoots)
{
    analyze(std::string(kPrelude) + "(extern constructor add emit_add2)\n"
                                    "(rule (add x y) x)\n"
                                    "(rule (Inst.Nop) 1)\n"
                                    "(rule (nothing) 1)");
    EXPECT_TRUE(hasError("term 'add' already has a constructor")) << allErrors();
    EXPECT_TRUE(hasError("term 'add' has an extern constructor and cannot have rules"))
        << allErrors();
    EXPECT_TRUE(hasError("cannot define rules for enum variant 'Inst.Nop'")) << allErrors();
    EXPECT_TRUE(hasError("undefined term 'nothing'")) << allErrors();
    EXPECT_TRUE(sema.rules().empty());
}

TEST_F(SemaTest, ReportsTypeAndArityErrors)
{
    analyze(std::string(kPrelude) + "(rule (lower (Inst.Add x)) x)\n"
                                    "(rule (lower (Inst.Ld off)) off)\n"
                                    "(rule (lower _) true)\n"
                                    "(rule (lower true) 1)\n"
                                    "(rule (lower 3) 1)\n"
                                    "(rule (lower _) y)\n");
    EXPECT_TRUE(hasError("term 'Inst.Add' expects 2 arguments, got 1")) << allErrors();
    EXPECT_TRUE(hasError("variable 'off' has type 'Imm' but type 'Reg' is expected"))
        << allErrors();
    EXPECT_TRUE(hasError("boolean constant has type 'bool' but type 'Reg' is expected"))
        << allErrors();
    EXPECT_TRUE(hasError("boolean constant has type 'bool' but type 'Inst' is expected"))
        << allErrors();
    EXPECT_TRUE(hasError("integer constant used where type 'Inst' is expected")) << allErrors();
    EXPECT_TRUE(hasError("unbound variable 'y'")) << allErrors();
    EXPECT_EQ(de.errorCount(), 6u) << allErrors();
}

TEST_F(SemaTest, ReportsMissingExtractorAndConstructor)
{
    analyze(std::string(kPrelude) + "(decl opaque (Reg) Inst)\n"
                                    "(decl make () Reg)\n"
                                    "(rule (lower (opaque x)) x)\n"
                                    "(rule (lower _) (make))");
    EXPECT_TRUE(
        hasError("term 'opaque' has no extractor and cannot be used in a pattern"))
        << allErrors();
    EXPECT_TRUE(
        hasError("term 'make' has no constructor and cannot be used in an expression"))
        << allErrors();
}

TEST_F(SemaTest, ReportsUninferableIntegerGuard)
{
    analyze(std::string(kPrelude) + "(rule (lower _) (if-let _ 5) 1)");
    EXPECT_TRUE(hasError("cannot infer the type of integer constant 5")) << allErrors();
}

TEST_F(SemaTest, ReportsDuplicateRuleNames)
{
    analyze(std::string(kPrelude) + "(rule same (lower _) 1)\n(rule same (lower _) 2)");
    EXPECT_TRUE(hasError("duplicate rule name 'same'")) << allErrors();
    EXPECT_EQ(sema.rules().size(), 1u);
}

TEST_F(SemaTest, ErrorLocationsPointAtTheOffendingForm)
{
    analyze(std::string(kPrelude) + "(rule (lower _) y)");
    ASSERT_EQ(de.errorCount(), 1u);
    const auto &d = de.diagnostics()[0];
    EXPECT_EQ(d.loc.line, 7u);
    EXPECT_EQ(d.loc.column, 17u);
}
