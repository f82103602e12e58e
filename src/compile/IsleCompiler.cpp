//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the load/parse/check/emit pipeline behind IsleCompiler.
//
//===----------------------------------------------------------------------===//

#include "compile/IsleCompiler.hpp"
#include "codegen/zig/ZigEmitter.hpp"
#include "dsl/Lexer.hpp"
#include "dsl/Parser.hpp"
#include "sema/Sema.hpp"
#include "support/diag_expected.hpp"
#include "support/trace.hpp"
#include "tools/common/source_loader.hpp"

#include <cstdint>
#include <sstream>
#include <utility>

namespace isle::compile
{

using isle::support::DiagnosticEngine;
using isle::support::SourceManager;

namespace
{

/// @brief A rule file registered with the source manager and ready to lex.
struct Unit
{
    std::string path;
    std::string text;
    uint32_t fileId{0};
};

CompileResult fail(DiagnosticEngine &de, SourceManager &sm)
{
    return CompileResult::failure(CompileErrors(de.take(), std::move(sm)));
}

/// @brief Parse, check and emit @p units, which are already loaded.
CompileResult compileUnits(const std::vector<Unit> &units,
                           const isle::codegen::CodegenOptions &options,
                           DiagnosticEngine &de,
                           SourceManager &sm)
{
    std::vector<isle::dsl::Def> defs;
    for (const auto &unit : units)
    {
        isle::dsl::Lexer lexer(unit.text, unit.fileId, de);
        isle::dsl::Parser parser(lexer, de);
        auto fileDefs = parser.parseDefs();
        if (isle::support::traceEnabled())
        {
            isle::support::trace("parsed " + unit.path + ": " + std::to_string(fileDefs.size()) +
                                 " definitions");
        }
        for (auto &def : fileDefs)
            defs.push_back(std::move(def));
    }
    if (de.errorCount() != 0)
        return fail(de, sm);

    isle::sema::Sema sema(de);
    sema.analyze(defs);
    if (de.errorCount() != 0)
        return fail(de, sm);

    if (options.target != isle::codegen::CodegenTarget::Zig)
    {
        de.error({}, "unsupported code generation target");
        return fail(de, sm);
    }

    std::vector<std::string> paths;
    for (const auto &unit : units)
        paths.push_back(unit.path);

    std::ostringstream out;
    isle::codegen::zig::ZigEmitter emitter(sema, options);
    emitter.emit(out, paths);
    std::string code = out.str();
    if (isle::support::traceEnabled())
        isle::support::trace("emitted " + std::to_string(code.size()) + " bytes of zig");
    return CompileResult::success(std::move(code));
}

} // namespace

CompileResult IsleCompiler::compile(const std::vector<std::string> &files,
                                    const isle::codegen::CodegenOptions &options)
{
    DiagnosticEngine de;
    SourceManager sm;
    if (files.empty())
    {
        de.error({}, "no input files");
        return fail(de, sm);
    }

    std::vector<Unit> units;
    for (const auto &path : files)
    {
        auto loaded = isle::tools::common::loadSourceBuffer(path, sm);
        if (!loaded)
        {
            de.report(loaded.error());
            continue;
        }
        units.push_back(Unit{path, std::move(loaded.value().buffer), loaded.value().fileId});
    }
    if (de.errorCount() != 0)
        return fail(de, sm);

    return compileUnits(units, options, de, sm);
}

CompileResult compileSource(std::string_view source,
                            std::string_view path,
                            const isle::codegen::CodegenOptions &options)
{
    DiagnosticEngine de;
    SourceManager sm;
    const uint32_t fileId = sm.addFile(std::string(path));
    if (fileId == 0)
    {
        de.error({}, std::string(isle::support::kSourceManagerFileIdOverflowMessage));
        return fail(de, sm);
    }
    std::vector<Unit> units;
    units.push_back(Unit{std::string(path), std::string(source), fileId});
    return compileUnits(units, options, de, sm);
}

} // namespace isle::compile
