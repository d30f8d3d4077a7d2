#pragma once

#include "model/Diagnostic.h"
#include "model/MachineSpec.h"
#include <memory>
#include <string>

namespace TSM {

/**
 * @brief Front end of the compiler: DSL text to validated MachineSpec
 *
 * Runs the parser, the pattern expander and the table builder in sequence.
 * Each stage reports every error it finds; a later stage only runs when the
 * earlier ones succeeded.
 *
 * @code
 * MachineCompiler compiler;
 * auto spec = compiler.compileFile("robot.tsm");
 * if (!spec) {
 *     for (const auto &diagnostic : compiler.getDiagnostics()) {
 *         std::cerr << diagnostic.format("robot.tsm") << std::endl;
 *     }
 * }
 * @endcode
 */
class MachineCompiler {
public:
    MachineCompiler() = default;
    ~MachineCompiler() = default;

    /**
     * @brief Compile a DSL file
     * @param filename Path of the file to compile
     * @return Validated machine, nullptr on failure
     */
    std::shared_ptr<const MachineSpec> compileFile(const std::string &filename);

    /**
     * @brief Compile DSL text
     * @param content Source text
     * @param sourceName Label used in diagnostics
     * @return Validated machine, nullptr on failure
     */
    std::shared_ptr<const MachineSpec> compileSource(const std::string &content,
                                                     const std::string &sourceName = "<input>");

    bool hasErrors() const {
        return !diagnostics_.empty();
    }

    const DiagnosticList &getDiagnostics() const {
        return diagnostics_;
    }

private:
    template <typename ParseFn> std::shared_ptr<const MachineSpec> compile(const std::string &sourceName, ParseFn parse);

    DiagnosticList diagnostics_;
};

}  // namespace TSM
