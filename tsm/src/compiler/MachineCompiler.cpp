#include "compiler/MachineCompiler.h"
#include "common/Logger.h"
#include "compiler/PatternExpander.h"
#include "compiler/TableBuilder.h"
#include "parsing/MachineParser.h"

namespace TSM {

template <typename ParseFn>
std::shared_ptr<const MachineSpec> MachineCompiler::compile(const std::string &sourceName, ParseFn parse) {
    diagnostics_.clear();

    MachineParser parser;
    auto source = parse(parser);
    if (!source) {
        diagnostics_ = parser.getDiagnostics();
        LOG_DEBUG("MachineCompiler: '{}' failed to parse", sourceName);
        return nullptr;
    }

    PatternExpander expander;
    auto expansions = expander.expandAll(source->clauses, diagnostics_);
    if (!expansions) {
        LOG_DEBUG("MachineCompiler: '{}' failed to expand", sourceName);
        return nullptr;
    }

    TableBuilder builder;
    auto spec = builder.build(*source, *expansions, diagnostics_);
    if (!spec) {
        LOG_DEBUG("MachineCompiler: '{}' failed validation", sourceName);
        return nullptr;
    }

    LOG_INFO("MachineCompiler: Compiled '{}' ({} states, {} events, {} transitions)", sourceName,
             spec->states.size(), spec->events.size(), spec->table.size());
    return spec;
}

std::shared_ptr<const MachineSpec> MachineCompiler::compileFile(const std::string &filename) {
    return compile(filename, [&filename](MachineParser &parser) { return parser.parseFile(filename); });
}

std::shared_ptr<const MachineSpec> MachineCompiler::compileSource(const std::string &content,
                                                                  const std::string &sourceName) {
    return compile(sourceName,
                   [&content, &sourceName](MachineParser &parser) { return parser.parseContent(content, sourceName); });
}

}  // namespace TSM
