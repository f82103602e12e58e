//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/zig/ZigEmitter.cpp
// Purpose: Renders checked rules as Zig constructor functions.
// Key invariants: A rule block only carries a label when a match step can
//                 break out of it; emission of a term stops after the first
//                 rule that cannot fail, since anything after it would be
//                 unreachable.
// Ownership/Lifetime: FunctionBuilder lives for the emission of one term.
//
//===----------------------------------------------------------------------===//

#include "codegen/zig/ZigEmitter.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <utility>

namespace isle::codegen::zig
{

using sema::CheckedExpr;
using sema::CheckedPattern;
using sema::CheckedRule;
using sema::ConstructorKind;
using sema::ExtractorKind;
using sema::TermInfo;
using sema::TypeInfo;

namespace
{

constexpr std::array<std::string_view, 49> kZigKeywords = {
    "addrspace", "align",     "allowzero",   "and",         "anyframe", "anytype",
    "asm",       "async",     "await",       "break",       "callconv", "catch",
    "comptime",  "const",     "continue",    "defer",       "else",     "enum",
    "errdefer",  "error",     "export",      "extern",      "fn",       "for",
    "if",        "inline",    "noalias",     "nosuspend",   "noinline", "opaque",
    "or",        "orelse",    "packed",      "pub",         "resume",   "return",
    "linksection", "struct",  "suspend",     "switch",      "test",     "threadlocal",
    "try",       "type",      "union",       "unreachable", "usingnamespace", "var",
    "while",
};

/// @brief Sanitized identifier, quoted with @"..." when it collides with a keyword.
std::string ident(std::string_view name)
{
    std::string clean = ZigEmitter::sanitize(name);
    for (std::string_view kw : kZigKeywords)
    {
        if (kw == clean)
            return "@\"" + clean + "\"";
    }
    return clean;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i)
            out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

//===----------------------------------------------------------------------===//
// FunctionBuilder
//===----------------------------------------------------------------------===//

/// @brief Emits one constructor function, tracking which values are used.
class ZigEmitter::FunctionBuilder
{
  public:
    FunctionBuilder(const ZigEmitter &emitter, sema::TermId term)
        : emitter_(emitter), sema_(emitter.sema_), term_(sema_.terms().get(term)), termId_(term),
          argUsed_(term_.argTypes.size(), false)
    {
    }

    void build(std::ostream &os);

  private:
    /// A Zig expression plus the parameter or local it reads, if any.
    struct Value
    {
        std::string text;
        int arg{-1};
        int local{-1};
    };

    struct Local
    {
        std::string name;
        bool used{false};
    };

    /// @brief Emit @p rule as a block; returns true when the rule can fail.
    bool emitRule(const CheckedRule &rule, size_t index, std::string &out);

    void matchPattern(const CheckedPattern &pat, const Value &value);
    Value emitExpr(const CheckedExpr &expr);
    Value emitCall(const CheckedExpr &expr);

    std::string use(const Value &value);
    Value newLocal(const std::string &init, const std::string &type = {});
    std::string breakExpr();
    std::string breakOut();
    void line(std::string text);

    const ZigEmitter &emitter_;
    const sema::Sema &sema_;
    const TermInfo &term_;
    sema::TermId termId_;

    std::vector<bool> argUsed_;
    bool ctxUsed_{false};
    size_t nextTemp_{0};

    // Per-rule state.
    std::string label_;
    bool breaks_{false};
    std::vector<std::string> lines_;
    std::vector<Local> locals_;
    std::vector<std::optional<Value>> vars_;
};

std::string ZigEmitter::FunctionBuilder::use(const Value &value)
{
    if (value.arg >= 0)
        argUsed_[static_cast<size_t>(value.arg)] = true;
    if (value.local >= 0)
        locals_[static_cast<size_t>(value.local)].used = true;
    return value.text;
}

ZigEmitter::FunctionBuilder::Value ZigEmitter::FunctionBuilder::newLocal(const std::string &init,
                                                                         const std::string &type)
{
    std::string name = "v" + std::to_string(nextTemp_++);
    line("const " + name + (type.empty() ? "" : ": " + type) + " = " + init + ";");
    locals_.push_back(Local{name, false});
    return Value{name, -1, static_cast<int>(locals_.size() - 1)};
}

std::string ZigEmitter::FunctionBuilder::breakExpr()
{
    breaks_ = true;
    return "break :" + label_;
}

std::string ZigEmitter::FunctionBuilder::breakOut()
{
    return breakExpr() + ";";
}

void ZigEmitter::FunctionBuilder::line(std::string text)
{
    lines_.push_back(std::move(text));
}

void ZigEmitter::FunctionBuilder::matchPattern(const CheckedPattern &pat, const Value &value)
{
    switch (pat.kind)
    {
        case CheckedPattern::Kind::Wildcard:
            return;

        case CheckedPattern::Kind::BindVar:
            vars_[pat.var] = value;
            for (const auto &sub : pat.args)
                matchPattern(sub, value);
            return;

        case CheckedPattern::Kind::EqVar:
        {
            const Value &bound = *vars_[pat.var];
            const std::string lhs = use(value);
            const std::string rhs = use(bound);
            if (sema_.types().get(pat.type).kind == TypeInfo::Kind::Enum)
                line("if (!std.meta.eql(" + lhs + ", " + rhs + ")) " + breakOut());
            else
                line("if (" + lhs + " != " + rhs + ") " + breakOut());
            return;
        }

        case CheckedPattern::Kind::ConstInt:
            line("if (" + use(value) + " != " + pat.intValue.toString() + ") " + breakOut());
            return;

        case CheckedPattern::Kind::ConstBool:
            line(std::string("if (") + (pat.boolValue ? "!" : "") + use(value) + ") " + breakOut());
            return;

        case CheckedPattern::Kind::Variant:
        {
            const TermInfo &term = sema_.terms().get(pat.term);
            const auto &variant = sema_.types().get(term.enumType).variants[term.variantIndex];
            const std::string tag = ident(variant.name);
            line("if (" + use(value) + " != ." + tag + ") " + breakOut());
            for (size_t i = 0; i < pat.args.size(); ++i)
            {
                Value field{value.text + "." + tag + "." + ident(variant.fields[i].name),
                            value.arg,
                            value.local};
                matchPattern(pat.args[i], field);
            }
            return;
        }

        case CheckedPattern::Kind::Extractor:
        {
            const TermInfo &term = sema_.terms().get(pat.term);
            ctxUsed_ = true;
            const std::string call = "ctx." + ident(term.externExtractor) + "(" + use(value) + ")";
            if (pat.args.empty())
            {
                if (term.infallible)
                    line("_ = " + call + ";");
                else
                    line("if (!" + call + ") " + breakOut());
                return;
            }
            const Value results = newLocal(term.infallible ? call : call + " orelse " + breakExpr());
            if (pat.args.size() == 1)
            {
                matchPattern(pat.args.front(), results);
                return;
            }
            for (size_t i = 0; i < pat.args.size(); ++i)
            {
                matchPattern(pat.args[i],
                             Value{results.text + "[" + std::to_string(i) + "]", -1, results.local});
            }
            return;
        }

        case CheckedPattern::Kind::And:
            for (const auto &sub : pat.args)
                matchPattern(sub, value);
            return;
    }
}

ZigEmitter::FunctionBuilder::Value ZigEmitter::FunctionBuilder::emitCall(const CheckedExpr &expr)
{
    const TermInfo &term = sema_.terms().get(expr.term);

    std::vector<std::string> args;
    for (const auto &arg : expr.args)
    {
        Value v = emitExpr(arg);
        args.push_back(use(v));
    }

    if (term.constructor == ConstructorKind::Variant)
    {
        const auto &variant = sema_.types().get(term.enumType).variants[term.variantIndex];
        std::string text = emitter_.typeRef(term.enumType) + "{ ." + ident(variant.name) + " = ";
        if (variant.fields.empty())
        {
            text += "{}";
        }
        else
        {
            text += ".{ ";
            for (size_t i = 0; i < args.size(); ++i)
            {
                if (i)
                    text += ", ";
                text += "." + ident(variant.fields[i].name) + " = " + args[i];
            }
            text += " }";
        }
        return Value{text + " }", -1, -1};
    }

    ctxUsed_ = true;
    std::string call;
    if (term.constructor == ConstructorKind::Extern)
    {
        call = "ctx." + ident(term.externConstructor) + "(" + join(args, ", ") + ")";
    }
    else
    {
        args.insert(args.begin(), "ctx");
        call = emitter_.constructorName(expr.term) + "(" + join(args, ", ") + ")";
    }

    if (!term.partial)
        return Value{call, -1, -1};
    return newLocal(call + " orelse " + breakExpr());
}

ZigEmitter::FunctionBuilder::Value ZigEmitter::FunctionBuilder::emitExpr(const CheckedExpr &expr)
{
    switch (expr.kind)
    {
        case CheckedExpr::Kind::Var:
            return *vars_[expr.var];
        case CheckedExpr::Kind::ConstInt:
            return Value{expr.intValue.toString(), -1, -1};
        case CheckedExpr::Kind::ConstBool:
            return Value{expr.boolValue ? "true" : "false", -1, -1};
        case CheckedExpr::Kind::Call:
            return emitCall(expr);
        case CheckedExpr::Kind::Let:
            for (const auto &let : expr.lets)
            {
                Value value = emitExpr(let.value);
                vars_[let.var] = newLocal(use(value), emitter_.typeRef(let.value.type));
            }
            return emitExpr(expr.args.front());
    }
    return Value{};
}

bool ZigEmitter::FunctionBuilder::emitRule(const CheckedRule &rule, size_t index, std::string &out)
{
    label_ = "rule_" + std::to_string(index);
    breaks_ = false;
    lines_.clear();
    locals_.clear();
    vars_.assign(rule.vars.size(), std::nullopt);

    for (size_t i = 0; i < rule.args.size(); ++i)
        matchPattern(rule.args[i], Value{"arg" + std::to_string(i), static_cast<int>(i), -1});

    for (const auto &guard : rule.guards)
    {
        Value value = emitExpr(guard.expr);
        if (guard.pattern.kind == CheckedPattern::Kind::Wildcard && guard.expr.kind ==
                                                                         CheckedExpr::Kind::Call &&
            value.local < 0)
        {
            line("_ = " + use(value) + ";");
            continue;
        }
        matchPattern(guard.pattern, value);
    }

    Value result = emitExpr(rule.result);
    const std::string ret = "return " + use(result) + ";";
    for (const auto &local : locals_)
    {
        if (!local.used)
            line("_ = " + local.name + ";");
    }
    line(ret);

    if (rule.name)
        out += "    // " + *rule.name + "\n";
    out += breaks_ ? "    " + label_ + ": {\n" : "    {\n";
    for (const auto &text : lines_)
        out += "        " + text + "\n";
    out += "    }\n";
    return breaks_;
}

void ZigEmitter::FunctionBuilder::build(std::ostream &os)
{
    std::string body;
    bool reachable = true;
    size_t index = 0;
    for (const CheckedRule *rule : sema_.rulesFor(termId_))
    {
        reachable = emitRule(*rule, index++, body);
        if (!reachable)
            break;
    }
    if (reachable)
    {
        if (term_.partial)
            body += "    return null;\n";
        else
            body += "    @panic(\"no rule matched for term " + term_.name + "\");\n";
    }

    os << "pub fn " << emitter_.constructorName(termId_) << "(ctx: anytype";
    for (size_t i = 0; i < term_.argTypes.size(); ++i)
        os << ", arg" << i << ": " << emitter_.typeRef(term_.argTypes[i]);
    os << ") " << (term_.partial ? "?" : "") << emitter_.typeRef(term_.retType) << " {\n";
    if (!ctxUsed_)
        os << "    _ = ctx;\n";
    for (size_t i = 0; i < argUsed_.size(); ++i)
    {
        if (!argUsed_[i])
            os << "    _ = arg" << i << ";\n";
    }
    os << body << "}\n";
}

//===----------------------------------------------------------------------===//
// ZigEmitter
//===----------------------------------------------------------------------===//

ZigEmitter::ZigEmitter(const sema::Sema &sema, const CodegenOptions &options)
    : sema_(sema), options_(options)
{
}

std::string ZigEmitter::sanitize(std::string_view name)
{
    std::string out;
    out.reserve(name.size() + 1);
    for (char c : name)
    {
        const auto uc = static_cast<unsigned char>(c);
        out += (std::isalnum(uc) || c == '_') ? c : '_';
    }
    if (out.empty() || std::isdigit(static_cast<unsigned char>(out.front())))
        out.insert(out.begin(), '_');
    return out;
}

std::string ZigEmitter::constructorName(sema::TermId term) const
{
    std::string name = "constructor_";
    for (const auto &prefix : options_.prefixes)
        name += sanitize(prefix) + "_";
    return name + sanitize(sema_.terms().get(term).name);
}

std::string ZigEmitter::typeRef(sema::TypeId type) const
{
    const TypeInfo &info = sema_.types().get(type);
    switch (info.kind)
    {
        case TypeInfo::Kind::Builtin:
            return info.primitive;
        case TypeInfo::Kind::Primitive:
            if (info.isExtern || info.name == info.primitive)
                return info.primitive;
            return ident(info.name);
        case TypeInfo::Kind::Enum:
            return ident(info.name);
    }
    return info.name;
}

void ZigEmitter::emitHeader(std::ostream &os, const std::vector<std::string> &inputs) const
{
    os << "// GENERATED BY ISLE. DO NOT EDIT!\n";
    os << "//\n";
    os << "// Generated automatically from the rule files:\n";
    for (const auto &input : inputs)
        os << "// - " << input << "\n";
    os << "\n";
    if (!options_.excludeGlobalAllowPragmas)
        os << "// zig fmt: off\n\n";
    os << "const std = @import(\"std\");\n";
}

void ZigEmitter::emitTypes(std::ostream &os) const
{
    const auto &types = sema_.types();
    for (sema::TypeId id = 0; id < types.size(); ++id)
    {
        const TypeInfo &info = types.get(id);
        if (info.isExtern || info.kind == TypeInfo::Kind::Builtin)
            continue;

        if (info.kind == TypeInfo::Kind::Primitive)
        {
            if (info.name != info.primitive)
                os << "\npub const " << ident(info.name) << " = " << info.primitive << ";\n";
            continue;
        }

        os << "\npub const " << ident(info.name) << " = union(enum) {\n";
        for (const auto &variant : info.variants)
        {
            os << "    " << ident(variant.name) << ": ";
            if (variant.fields.empty())
            {
                os << "void,\n";
                continue;
            }
            os << "struct { ";
            for (size_t i = 0; i < variant.fields.size(); ++i)
            {
                if (i)
                    os << ", ";
                os << ident(variant.fields[i].name) << ": " << typeRef(variant.fields[i].type);
            }
            os << " },\n";
        }
        os << "};\n";
    }
}

void ZigEmitter::emitContextInterface(std::ostream &os) const
{
    std::vector<std::string> entries;
    const auto &terms = sema_.terms();
    for (sema::TermId id = 0; id < terms.size(); ++id)
    {
        const TermInfo &term = terms.get(id);
        if (term.constructor == ConstructorKind::Extern)
        {
            std::vector<std::string> args;
            for (auto ty : term.argTypes)
                args.push_back(typeRef(ty));
            entries.push_back("ctx." + ident(term.externConstructor) + "(" + join(args, ", ") +
                              ") " + (term.partial ? "?" : "") + typeRef(term.retType));
        }
        if (term.extractor == ExtractorKind::Extern)
        {
            std::string results;
            if (term.argTypes.empty())
            {
                results = "bool";
            }
            else if (term.argTypes.size() == 1)
            {
                results = typeRef(term.argTypes.front());
            }
            else
            {
                std::vector<std::string> parts;
                for (auto ty : term.argTypes)
                    parts.push_back(typeRef(ty));
                results = "struct { " + join(parts, ", ") + " }";
            }
            if (!term.infallible && !term.argTypes.empty())
                results = "?" + results;
            entries.push_back("ctx." + ident(term.externExtractor) + "(" + typeRef(term.retType) +
                              ") " + results);
        }
    }
    if (entries.empty())
        return;
    os << "\n// Context interface: `ctx` must provide\n";
    for (const auto &entry : entries)
        os << "//   " << entry << "\n";
}

void ZigEmitter::emitConstructor(std::ostream &os, sema::TermId term) const
{
    FunctionBuilder builder(*this, term);
    os << "\n";
    builder.build(os);
}

void ZigEmitter::emit(std::ostream &os, const std::vector<std::string> &inputs) const
{
    emitHeader(os, inputs);
    emitContextInterface(os);
    emitTypes(os);
    const auto &terms = sema_.terms();
    for (sema::TermId id = 0; id < terms.size(); ++id)
    {
        if (terms.get(id).constructor == ConstructorKind::Internal)
            emitConstructor(os, id);
    }
}

} // namespace isle::codegen::zig
