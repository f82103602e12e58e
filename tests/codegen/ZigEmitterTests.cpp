// File: tests/codegen/ZigEmitterTests.cpp
// Purpose: Verify the Zig text produced for representative rule sets: type
//          declarations, rule blocks, extern calls, partial terms and the
//          options that change the generated header and names.
// Key invariants: Unused parameters are discarded explicitly; rules after an
//                 infallible rule are not emitted.
// Ownership/Lifetime: Tests compile in-memory sources and own the result.
// Links: src/codegen/zig/ZigEmitter.cpp

#include "codegen/CodegenOptions.hpp"
#include "compile/IsleCompiler.hpp"

#include <gtest/gtest.h>

#include <string>

using isle::codegen::CodegenOptions;
using isle::compile::compileSource;

namespace
{

std::string generate(const std::string &src, const CodegenOptions &options = {})
{
    auto result = compileSource(src, "test.isle", options);
    if (!result.isOk())
    {
        ADD_FAILURE() << result.error().str();
        return {};
    }
    return result.value();
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

const char *const kLowerRules = "(type Reg (primitive u32))\n"
                                "(type Inst (enum Nop (Add (a Reg) (b Reg))))\n"
                                "(decl lower (Inst) Reg)\n"
                                "(decl add (Reg Reg) Reg)\n"
                                "(extern constructor add emit_add)\n"
                                "(rule (lower (Inst.Add x y)) (add x y))\n"
                                "(rule (lower (Inst.Nop)) 0)\n";

} // namespace

TEST(ZigEmitterTest, EmitsHeaderTypesAndContextInterface)
{
    const std::string code = generate(kLowerRules);
    EXPECT_EQ(code.rfind("// GENERATED BY ISLE. DO NOT EDIT!\n", 0), 0u) << code;
    EXPECT_TRUE(contains(code, "// - test.isle\n")) << code;
    EXPECT_TRUE(contains(code, "// zig fmt: off\n")) << code;
    EXPECT_TRUE(contains(code, "const std = @import(\"std\");\n")) << code;
    EXPECT_TRUE(contains(code, "//   ctx.emit_add(Reg, Reg) Reg\n")) << code;
    EXPECT_TRUE(contains(code, "pub const Reg = u32;\n")) << code;
    EXPECT_TRUE(contains(code,
                         "pub const Inst = union(enum) {\n"
                         "    Nop: void,\n"
                         "    Add: struct { a: Reg, b: Reg },\n"
                         "};\n"))
        << code;
}

TEST(ZigEmitterTest, EmitsRulesInOrderWithPanicFallthrough)
{
    const std::string code = generate(kLowerRules);
    EXPECT_TRUE(contains(code,
                         "pub fn constructor_lower(ctx: anytype, arg0: Inst) Reg {\n"
                         "    rule_0: {\n"
                         "        if (arg0 != .Add) break :rule_0;\n"
                         "        return ctx.emit_add(arg0.Add.a, arg0.Add.b);\n"
                         "    }\n"
                         "    rule_1: {\n"
                         "        if (arg0 != .Nop) break :rule_1;\n"
                         "        return 0;\n"
                         "    }\n"
                         "    @panic(\"no rule matched for term lower\");\n"
                         "}\n"))
        << code;
    // Extern constructors are provided by the context, not generated.
    EXPECT_FALSE(contains(code, "constructor_add")) << code;
}

TEST(ZigEmitterTest, PartialTermsUseOptionalsAndExternExtractors)
{
    const std::string code = generate("(type Value extern (primitive Value))\n"
                                      "(type Reg u32)\n"
                                      "(decl def_const (Reg) Value)\n"
                                      "(extern extractor def_const def_const)\n"
                                      "(decl partial fold (Value) Reg)\n"
                                      "(rule (fold (def_const c)) c)\n");
    EXPECT_TRUE(contains(code, "//   ctx.def_const(Value) ?Reg\n")) << code;
    EXPECT_FALSE(contains(code, "pub const Value")) << code;
    EXPECT_TRUE(contains(code,
                         "pub fn constructor_fold(ctx: anytype, arg0: Value) ?Reg {\n"
                         "    rule_0: {\n"
                         "        const v0 = ctx.def_const(arg0) orelse break :rule_0;\n"
                         "        return v0;\n"
                         "    }\n"
                         "    return null;\n"
                         "}\n"))
        << code;
}

TEST(ZigEmitterTest, StopsAfterInfallibleRuleAndDiscardsUnusedArgs)
{
    const std::string code = generate("(type Reg u32)\n"
                                      "(decl pick (Reg Reg) Reg)\n"
                                      "(rule (pick x _) x)\n"
                                      "(rule (pick _ y) y)\n");
    EXPECT_TRUE(contains(code,
                         "pub fn constructor_pick(ctx: anytype, arg0: Reg, arg1: Reg) Reg {\n"
                         "    _ = ctx;\n"
                         "    _ = arg1;\n"
                         "    {\n"
                         "        return arg0;\n"
                         "    }\n"
                         "}\n"))
        << code;
    EXPECT_FALSE(contains(code, "@panic")) << code;
}

TEST(ZigEmitterTest, ComparesRepeatedVariablesAndConstants)
{
    const std::string code = generate("(type Reg u32)\n"
                                      "(decl same (Reg Reg bool) Reg)\n"
                                      "(rule (same x x true) x)\n"
                                      "(rule (same _ 3 false) 7)\n");
    EXPECT_TRUE(contains(code, "        if (arg1 != arg0) break :rule_0;\n")) << code;
    EXPECT_TRUE(contains(code, "        if (!arg2) break :rule_0;\n")) << code;
    EXPECT_TRUE(contains(code, "        if (arg1 != 3) break :rule_1;\n")) << code;
    EXPECT_TRUE(contains(code, "        if (arg2) break :rule_1;\n")) << code;
    EXPECT_TRUE(contains(code, "    @panic(\"no rule matched for term same\");\n")) << code;
}

TEST(ZigEmitterTest, BuildsVariantsAndUnwrapsPartialCalls)
{
    const std::string code = generate("(type Reg u32)\n"
                                      "(type Op (enum (Mov (dst Reg)) Halt))\n"
                                      "(decl partial try_reg (Reg) Reg)\n"
                                      "(rule (try_reg 0) 1)\n"
                                      "(decl wrap (Reg) Op)\n"
                                      "(rule keep_mov (wrap r)\n"
                                      "  (let ((t Reg (try_reg r))) (Op.Mov t)))\n"
                                      "(rule (wrap _) (Op.Halt))\n");
    EXPECT_TRUE(contains(code,
                         "pub fn constructor_try_reg(ctx: anytype, arg0: Reg) ?Reg {\n"
                         "    _ = ctx;\n"
                         "    rule_0: {\n"
                         "        if (arg0 != 0) break :rule_0;\n"
                         "        return 1;\n"
                         "    }\n"
                         "    return null;\n"
                         "}\n"))
        << code;
    EXPECT_TRUE(contains(code,
                         "pub fn constructor_wrap(ctx: anytype, arg0: Reg) Op {\n"
                         "    // keep_mov\n"
                         "    rule_0: {\n"
                         "        const v0 = constructor_try_reg(ctx, arg0) orelse break :rule_0;\n"
                         "        const v1: Reg = v0;\n"
                         "        return Op{ .Mov = .{ .dst = v1 } };\n"
                         "    }\n"
                         "    {\n"
                         "        return Op{ .Halt = {} };\n"
                         "    }\n"
                         "}\n"))
        << code;
}

TEST(ZigEmitterTest, DiscardsUnusedExtractorResults)
{
    const std::string code = generate("(type Value extern (primitive Value))\n"
                                      "(type Reg u32)\n"
                                      "(decl pair (Reg Reg) Value)\n"
                                      "(extern extractor infallible pair split_pair)\n"
                                      "(decl first (Value) Reg)\n"
                                      "(rule (first (pair a _)) a)\n"
                                      "(decl ignore (Value) Reg)\n"
                                      "(rule (ignore (pair _ _)) 0)\n");
    EXPECT_TRUE(contains(code, "//   ctx.split_pair(Value) struct { Reg, Reg }\n")) << code;
    EXPECT_TRUE(contains(code,
                         "    {\n"
                         "        const v0 = ctx.split_pair(arg0);\n"
                         "        return v0[0];\n"
                         "    }\n"))
        << code;
    EXPECT_TRUE(contains(code,
                         "    {\n"
                         "        const v0 = ctx.split_pair(arg0);\n"
                         "        _ = v0;\n"
                         "        return 0;\n"
                         "    }\n"))
        << code;
}

TEST(ZigEmitterTest, EscapesKeywordsAndSanitizesNames)
{
    const std::string code = generate("(type Reg u32)\n"
                                      "(type Kind (enum (Const (type Reg))))\n"
                                      "(decl kind->reg (Kind) Reg)\n"
                                      "(rule (kind->reg (Kind.Const t)) t)\n");
    EXPECT_TRUE(contains(code, "    Const: struct { @\"type\": Reg },\n")) << code;
    EXPECT_TRUE(contains(code, "pub fn constructor_kind__reg(ctx: anytype, arg0: Kind) Reg {\n"))
        << code;
    EXPECT_TRUE(contains(code, "        return arg0.Const.@\"type\";\n")) << code;
}

TEST(ZigEmitterTest, HonorsPrefixesAndPragmaExclusion)
{
    CodegenOptions options;
    options.excludeGlobalAllowPragmas = true;
    options.prefixes = {"aarch64", "isel"};
    const std::string code = generate(kLowerRules, options);
    EXPECT_FALSE(contains(code, "zig fmt: off")) << code;
    EXPECT_TRUE(contains(code, "pub fn constructor_aarch64_isel_lower(ctx: anytype")) << code;
}

TEST(ZigEmitterTest, ChainsInternalConstructors)
{
    const std::string code = generate("(type Reg u32)\n"
                                      "(decl inner (Reg) Reg)\n"
                                      "(rule (inner x) x)\n"
                                      "(decl outer (Reg) Reg)\n"
                                      "(rule (outer x) (inner (inner x)))\n");
    EXPECT_TRUE(contains(code, "        return constructor_inner(ctx, constructor_inner(ctx, arg0));\n"))
        << code;
}
