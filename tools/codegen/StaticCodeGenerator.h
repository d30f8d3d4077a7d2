// Transition table to C++ static code generator
#pragma once

#include "model/Capability.h"
#include "model/Diagnostic.h"
#include "model/MachineSpec.h"
#include <string>
#include <string_view>
#include <vector>

namespace TSM::Codegen {

/**
 * @brief Generates a self-contained C++ header from a validated machine
 *
 * The header declares, inside TSM::Generated::<name> (TSM::Generated for
 * an unnamed machine):
 * - State and Event scoped enums, the initial state first so that State{}
 *   is the initial state
 * - kInitialState, kStateCount and kEventCount
 * - constexpr processEvent(State, Event) returning std::optional<State>,
 *   an exhaustive switch over the validated table
 * - the code required by the derived capabilities of each enum
 *
 * The generated code depends on the standard library only.
 */
class StaticCodeGenerator {
public:
    StaticCodeGenerator() = default;
    ~StaticCodeGenerator() = default;

    /**
     * @brief Generate <outputDir>/<stem>_sm.h
     * @param spec Validated machine
     * @param outputDir Output directory, created when missing
     * @return Success status; failures are available from getDiagnostics()
     */
    bool generate(const MachineSpec &spec, const std::string &outputDir);

    /**
     * @brief Check that every state, event and the machine name can be used as a C++ identifier
     * @return false if a ReservedIdentifierError was reported
     */
    bool validateIdentifiers(const MachineSpec &spec, DiagnosticList &diagnostics) const;

    // Individual generation methods (public for testability)
    std::string generateHeader(const MachineSpec &spec);
    std::string generateStateEnum(const MachineSpec &spec);
    std::string generateEventEnum(const MachineSpec &spec);
    std::string generateProcessEvent(const MachineSpec &spec);
    std::string generateCapabilities(const std::string &enumName, const std::vector<std::string> &values,
                                     const CapabilitySet &capabilities);

    static std::string outputPathFor(const MachineSpec &spec, const std::string &outputDir);

    static bool isReservedIdentifier(std::string_view identifier);

    bool hasErrors() const {
        return !diagnostics_.empty();
    }

    const DiagnosticList &getDiagnostics() const {
        return diagnostics_;
    }

private:
    std::string generateEnum(const std::string &enumName, const std::vector<std::string> &values);
    std::string generateIncludes(const MachineSpec &spec);
    std::string namespaceOf(const MachineSpec &spec) const;

    static const char *underlyingType(size_t count);

    // Comment-safe rendering of a source name for the banner
    std::string escapeComment(const std::string &str);

    bool writeToFile(const std::string &path, const std::string &content);

    DiagnosticList diagnostics_;
};

}  // namespace TSM::Codegen
