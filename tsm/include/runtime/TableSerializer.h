#pragma once

#include "model/MachineSpec.h"
#include <json/json.h>
#include <string>

namespace TSM {

/**
 * @brief Writes a validated machine as a JSON transition table
 *
 * The document is the input of TableMachine:
 * @code
 * {
 *   "format": "tsm-table", "version": 1, "name": "Robot", "initial": "Idle",
 *   "states": ["Idle", "Moving"], "events": ["Move", "Stop"],
 *   "deriveStates": ["Debug"], "deriveEvents": ["Debug"],
 *   "transitions": [{"state": "Idle", "event": "Move", "target": "Moving", "origin": "explicit"}],
 *   "wildcards": [{"event": "Stop", "target": "Idle"}]
 * }
 * @endcode
 * Transitions are listed in state order, then event order.
 */
class TableSerializer {
public:
    static constexpr const char *FORMAT_TAG = "tsm-table";
    static constexpr int FORMAT_VERSION = 1;

    static Json::Value toJson(const MachineSpec &spec);

    static std::string serialize(const MachineSpec &spec);

    /**
     * @brief Write <outputDir>/<stem>_table.json
     * @return Path of the written file, empty on failure
     */
    static std::string writeFile(const MachineSpec &spec, const std::string &outputDir);
};

}  // namespace TSM
