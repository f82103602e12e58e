//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/zig/ZigEmitter.hpp
// Purpose: Declares the emitter that renders a checked rule set as Zig source.
// Key invariants: Output is deterministic for a given rule set and options;
//                 every generated local is either used or explicitly discarded
//                 so the result compiles under Zig's unused-value rules.
// Ownership/Lifetime: The emitter borrows the analyzer; the analyzer must
//                     outlive every emit() call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/CodegenOptions.hpp"
#include "sema/Sema.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace isle::codegen::zig
{

/// @brief Renders checked rules as Zig constructor functions.
/// @details Each term with an internal constructor becomes one
///          `pub fn constructor_<name>(ctx: anytype, ...)`. Rules are tried in
///          priority order, each inside its own labeled block that is exited
///          with `break` when a match step fails.
class ZigEmitter
{
  public:
    ZigEmitter(const sema::Sema &sema, const CodegenOptions &options);

    /// @brief Emit the whole module; @p inputs are listed in the header.
    void emit(std::ostream &os, const std::vector<std::string> &inputs) const;

    /// @brief Zig spelling of the generated constructor for @p term.
    [[nodiscard]] std::string constructorName(sema::TermId term) const;

    /// @brief Zig spelling of @p type in signatures and let bindings.
    [[nodiscard]] std::string typeRef(sema::TypeId type) const;

    /// @brief Replace every character that is not valid in a Zig identifier.
    [[nodiscard]] static std::string sanitize(std::string_view name);

  private:
    class FunctionBuilder;

    void emitHeader(std::ostream &os, const std::vector<std::string> &inputs) const;
    void emitTypes(std::ostream &os) const;
    void emitContextInterface(std::ostream &os) const;
    void emitConstructor(std::ostream &os, sema::TermId term) const;

    const sema::Sema &sema_;
    CodegenOptions options_;
};

} // namespace isle::codegen::zig
