// Static code generator for validated transition tables
#include "StaticCodeGenerator.h"
#include "common/FileLoadingHelper.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace TSM::Codegen {

namespace {

// C++20 keywords, alternative operator tokens, contextual keywords and standard macros
constexpr std::string_view CPP_KEYWORDS[] = {
    "alignas",      "alignof",     "and",          "and_eq",       "asm",         "auto",        "bitand",
    "bitor",        "bool",        "break",        "case",         "catch",       "char",        "char8_t",
    "char16_t",     "char32_t",    "class",        "compl",        "concept",     "const",       "consteval",
    "constexpr",    "constinit",   "const_cast",   "continue",     "co_await",    "co_return",   "co_yield",
    "decltype",     "default",     "delete",       "do",           "double",      "dynamic_cast", "else",
    "enum",         "explicit",    "export",       "extern",       "false",       "float",       "for",
    "friend",       "goto",        "if",           "inline",       "int",         "long",        "mutable",
    "namespace",    "new",         "noexcept",     "not",          "not_eq",      "nullptr",     "operator",
    "or",           "or_eq",       "private",      "protected",    "public",      "register",    "reinterpret_cast",
    "requires",     "return",      "short",        "signed",       "sizeof",      "static",      "static_assert",
    "static_cast",  "struct",      "switch",       "template",     "this",        "thread_local", "throw",
    "true",         "try",         "typedef",      "typeid",       "typename",    "union",       "unsigned",
    "using",        "virtual",     "void",         "volatile",     "wchar_t",     "while",       "xor",
    "xor_eq",       "final",       "override",     "import",       "module",      "NULL",        "EOF"};

constexpr size_t UINT8_LIMIT = 256;
constexpr size_t UINT16_LIMIT = 65536;

}  // namespace

bool StaticCodeGenerator::generate(const MachineSpec &spec, const std::string &outputDir) {
    diagnostics_.clear();

    // Step 1: Validate input
    if (outputDir.empty()) {
        diagnostics_.emplace_back(ErrorKind::ConfigurationError, "output directory is empty");
        LOG_ERROR("StaticCodeGenerator: Output directory is empty");
        return false;
    }

    if (spec.states.empty()) {
        diagnostics_.emplace_back(ErrorKind::ConfigurationError, "machine has no states");
        LOG_ERROR("StaticCodeGenerator: No states in machine '{}'", spec.artifactStem());
        return false;
    }

    if (spec.states.size() > UINT16_LIMIT || spec.events.size() > UINT16_LIMIT) {
        diagnostics_.emplace_back(ErrorKind::ConfigurationError,
                                  "too many states or events for a 16-bit enumeration (" +
                                      std::to_string(spec.states.size()) + " states, " +
                                      std::to_string(spec.events.size()) + " events)");
        LOG_ERROR("StaticCodeGenerator: Machine '{}' exceeds the enumeration limit", spec.artifactStem());
        return false;
    }

    if (!validateIdentifiers(spec, diagnostics_)) {
        LOG_ERROR("StaticCodeGenerator: Machine '{}' uses reserved identifiers", spec.artifactStem());
        return false;
    }

    // Step 2: Generate code
    LOG_DEBUG("StaticCodeGenerator: Generating code for '{}' with {} states, {} events, {} transitions",
              spec.artifactStem(), spec.states.size(), spec.events.size(), spec.table.size());
    std::string content = generateHeader(spec);

    // Step 3: Write to file
    std::string outputPath = outputPathFor(spec, outputDir);
    LOG_INFO("StaticCodeGenerator: Writing generated code to: {}", outputPath);
    if (!writeToFile(outputPath, content)) {
        diagnostics_.emplace_back(ErrorKind::ConfigurationError, "cannot write " + outputPath);
        return false;
    }
    return true;
}

bool StaticCodeGenerator::validateIdentifiers(const MachineSpec &spec, DiagnosticList &diagnostics) const {
    bool valid = true;
    auto check = [&](const std::string &identifier, const char *role) {
        if (!isReservedIdentifier(identifier)) {
            return;
        }
        diagnostics.emplace_back(ErrorKind::ReservedIdentifierError,
                                 std::string(role) + " '" + identifier + "' is reserved in C++ and cannot be emitted",
                                 SourcePosition{}, "", "rename it, for example '" + identifier + "_'");
        valid = false;
    };

    if (spec.hasNamespace()) {
        check(spec.name, "machine name");
    }
    for (const auto &state : spec.states) {
        check(state, "state");
    }
    for (const auto &event : spec.events) {
        check(event, "event");
    }
    return valid;
}

std::string StaticCodeGenerator::generateHeader(const MachineSpec &spec) {
    std::stringstream ss;
    std::string ns = namespaceOf(spec);

    ss << "// Generated by tsmc from " << escapeComment(spec.sourceName) << ". Do not edit.\n";
    ss << "#pragma once\n";
    ss << generateIncludes(spec);
    ss << "\n";

    ss << "namespace " << ns << " {\n\n";

    ss << generateStateEnum(spec);
    ss << "\n";
    ss << generateEventEnum(spec);
    ss << "\n";

    std::string stateCapabilities = generateCapabilities("State", spec.states, spec.deriveStates);
    if (!stateCapabilities.empty()) {
        ss << stateCapabilities << "\n";
    }
    std::string eventCapabilities = generateCapabilities("Event", spec.events, spec.deriveEvents);
    if (!eventCapabilities.empty()) {
        ss << eventCapabilities << "\n";
    }

    ss << generateProcessEvent(spec);

    ss << "\n}  // namespace " << ns << "\n";
    return ss.str();
}

std::string StaticCodeGenerator::generateEnum(const std::string &enumName, const std::vector<std::string> &values) {
    std::stringstream ss;
    ss << "enum class " << enumName << " : " << underlyingType(values.size()) << " {\n";

    size_t idx = 0;
    for (const auto &value : values) {
        ss << "    " << value;
        if (idx < values.size() - 1) {
            ss << ",";
        }
        ss << "\n";
        idx++;
    }

    ss << "};\n";
    return ss.str();
}

std::string StaticCodeGenerator::generateStateEnum(const MachineSpec &spec) {
    // states[0] is the initial state, so State{} and kInitialState agree
    std::stringstream ss;
    ss << generateEnum("State", spec.states);
    ss << "\n";
    ss << "inline constexpr State kInitialState = State::" << spec.initialState << ";\n";
    ss << "inline constexpr ::std::size_t kStateCount = " << spec.states.size() << ";\n";
    return ss.str();
}

std::string StaticCodeGenerator::generateEventEnum(const MachineSpec &spec) {
    std::stringstream ss;
    ss << generateEnum("Event", spec.events);
    ss << "\n";
    ss << "inline constexpr ::std::size_t kEventCount = " << spec.events.size() << ";\n";
    return ss.str();
}

std::string StaticCodeGenerator::generateCapabilities(const std::string &enumName,
                                                      const std::vector<std::string> &values,
                                                      const CapabilitySet &capabilities) {
    std::stringstream ss;

    if (capabilities.has(Capability::Equality)) {
        ss << "static_assert(::std::equality_comparable<" << enumName << ">);\n";
    }
    if (capabilities.has(Capability::Duplication)) {
        ss << "static_assert(::std::is_trivially_copyable_v<" << enumName << ">);\n";
    }

    if (capabilities.has(Capability::Formatting)) {
        ss << "\n";
        ss << "constexpr ::std::string_view toString(" << enumName << " value) noexcept {\n";
        ss << "    switch (value) {\n";
        for (const auto &value : values) {
            ss << "    case " << enumName << "::" << value << ":\n";
            ss << "        return \"" << value << "\";\n";
        }
        ss << "    }\n";
        ss << "    return {};\n";
        ss << "}\n";
        ss << "\n";
        ss << "inline ::std::ostream &operator<<(::std::ostream &os, " << enumName << " value) {\n";
        ss << "    return os << toString(value);\n";
        ss << "}\n";
    }

    if (capabilities.has(Capability::Hashing)) {
        ss << "\n";
        ss << "struct " << enumName << "Hash {\n";
        ss << "    ::std::size_t operator()(" << enumName << " value) const noexcept {\n";
        ss << "        using Underlying = ::std::underlying_type_t<" << enumName << ">;\n";
        ss << "        return ::std::hash<Underlying>{}(static_cast<Underlying>(value));\n";
        ss << "    }\n";
        ss << "};\n";
    }

    // Ordering and Default need no code: scoped enums compare with <, and T{} is the first enumerator
    return ss.str();
}

std::string StaticCodeGenerator::generateProcessEvent(const MachineSpec &spec) {
    std::stringstream ss;

    ss << "constexpr ::std::optional<State> processEvent(State state, Event event) noexcept {\n";
    ss << "    switch (state) {\n";

    for (const auto &state : spec.states) {
        ss << "    case State::" << state << ":\n";

        std::vector<std::pair<std::string, std::string>> rows;
        for (const auto &event : spec.events) {
            if (const TableEntry *entry = spec.table.find(state, event)) {
                rows.emplace_back(event, entry->target);
            }
        }

        if (rows.empty()) {
            ss << "        return ::std::nullopt;\n";
            continue;
        }

        ss << "        switch (event) {\n";
        for (const auto &[event, target] : rows) {
            ss << "        case Event::" << event << ":\n";
            ss << "            return State::" << target << ";\n";
        }
        ss << "        default:\n";
        ss << "            return ::std::nullopt;\n";
        ss << "        }\n";
    }

    ss << "    }\n";
    ss << "    return ::std::nullopt;\n";
    ss << "}\n";
    return ss.str();
}

std::string StaticCodeGenerator::generateIncludes(const MachineSpec &spec) {
    auto either = [&spec](Capability capability) {
        return spec.deriveStates.has(capability) || spec.deriveEvents.has(capability);
    };

    std::vector<std::string> headers = {"cstddef", "cstdint", "optional"};
    if (either(Capability::Equality)) {
        headers.push_back("concepts");
    }
    if (either(Capability::Duplication) || either(Capability::Hashing)) {
        headers.push_back("type_traits");
    }
    if (either(Capability::Formatting)) {
        headers.push_back("ostream");
        headers.push_back("string_view");
    }
    if (either(Capability::Hashing)) {
        headers.push_back("functional");
    }
    std::sort(headers.begin(), headers.end());

    std::stringstream ss;
    for (const auto &header : headers) {
        ss << "#include <" << header << ">\n";
    }
    return ss.str();
}

std::string StaticCodeGenerator::namespaceOf(const MachineSpec &spec) const {
    // Each named machine gets its own nested namespace to avoid conflicts. The emitted
    // code names the standard library as ::std, so any machine name (even "std") is usable.
    return spec.hasNamespace() ? "TSM::Generated::" + spec.name : "TSM::Generated";
}

const char *StaticCodeGenerator::underlyingType(size_t count) {
    return count <= UINT8_LIMIT ? "::std::uint8_t" : "::std::uint16_t";
}

std::string StaticCodeGenerator::outputPathFor(const MachineSpec &spec, const std::string &outputDir) {
    return (fs::path(outputDir) / (spec.artifactStem() + "_sm.h")).string();
}

bool StaticCodeGenerator::isReservedIdentifier(std::string_view identifier) {
    if (std::find(std::begin(CPP_KEYWORDS), std::end(CPP_KEYWORDS), identifier) != std::end(CPP_KEYWORDS)) {
        return true;
    }

    // Reserved for the implementation: "__" anywhere, or '_' followed by an uppercase letter
    if (identifier.find("__") != std::string_view::npos) {
        return true;
    }
    return identifier.size() > 1 && identifier[0] == '_' && std::isupper(static_cast<unsigned char>(identifier[1]));
}

std::string StaticCodeGenerator::escapeComment(const std::string &str) {
    std::string result;
    result.reserve(str.size());

    for (char c : str) {
        switch (c) {
        case '\n':
        case '\r':
            result += ' ';
            break;
        default:
            result += c;
            break;
        }
    }

    return result;
}

bool StaticCodeGenerator::writeToFile(const std::string &path, const std::string &content) {
    if (!FileLoadingHelper::writeFileContent(path, content)) {
        LOG_ERROR("StaticCodeGenerator: Failed to write generated code to: {}", path);
        return false;
    }

    LOG_DEBUG("StaticCodeGenerator: Successfully wrote {} bytes to {}", content.size(), path);
    return true;
}

}  // namespace TSM::Codegen
