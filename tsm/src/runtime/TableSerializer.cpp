#include "runtime/TableSerializer.h"
#include "common/FileLoadingHelper.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <filesystem>

namespace TSM {

namespace {

const char *originName(TransitionOrigin origin) {
    return origin == TransitionOrigin::Wildcard ? "wildcard" : "explicit";
}

}  // namespace

Json::Value TableSerializer::toJson(const MachineSpec &spec) {
    Json::Value root(Json::objectValue);
    root["format"] = FORMAT_TAG;
    root["version"] = FORMAT_VERSION;
    root["name"] = spec.name;
    root["initial"] = spec.initialState;
    root["states"] = JsonUtils::toStringArray(spec.states);
    root["events"] = JsonUtils::toStringArray(spec.events);
    root["deriveStates"] = JsonUtils::toStringArray(spec.deriveStates.names());
    root["deriveEvents"] = JsonUtils::toStringArray(spec.deriveEvents.names());

    // Declaration order rather than the table's lexicographic key order
    Json::Value transitions(Json::arrayValue);
    for (const auto &state : spec.states) {
        for (const auto &event : spec.events) {
            const TableEntry *entry = spec.table.find(state, event);
            if (!entry) {
                continue;
            }
            Json::Value transition(Json::objectValue);
            transition["state"] = state;
            transition["event"] = event;
            transition["target"] = entry->target;
            transition["origin"] = originName(entry->origin);
            transitions.append(transition);
        }
    }
    root["transitions"] = transitions;

    Json::Value wildcards(Json::arrayValue);
    for (const auto &rule : spec.table.wildcardRules()) {
        Json::Value wildcard(Json::objectValue);
        wildcard["event"] = rule.event;
        wildcard["target"] = rule.target;
        wildcards.append(wildcard);
    }
    root["wildcards"] = wildcards;

    return root;
}

std::string TableSerializer::serialize(const MachineSpec &spec) {
    return JsonUtils::toPrettyString(toJson(spec)) + "\n";
}

std::string TableSerializer::writeFile(const MachineSpec &spec, const std::string &outputDir) {
    std::filesystem::path outputPath = std::filesystem::path(outputDir) / (spec.artifactStem() + "_table.json");
    if (!FileLoadingHelper::writeFileContent(outputPath.string(), serialize(spec))) {
        LOG_ERROR("TableSerializer: Failed to write table for '{}'", spec.sourceName);
        return "";
    }

    LOG_DEBUG("TableSerializer: Wrote {} entries to {}", spec.table.size(), outputPath.string());
    return outputPath.string();
}

}  // namespace TSM
