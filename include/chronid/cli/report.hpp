/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file report.hpp
 * @brief JSON field reports for identifiers, used by the `chronid` tool.
 *
 * @details
 * A report exposes what an identifier encodes. Every report carries
 * `id`, `version` and `variant`. Version 1 identifiers additionally carry
 * the decoded wall-clock milliseconds, the sub-millisecond tick, the clock
 * sequence and the node.
 *
 * @code
 * {"id":"f12e9a86-6568-103c-b039-aa1122334455","version":1,"variant":"rfc4122",
 *  "timestamp_ms":1700000000000,"tick":6790,"clock_sequence":12345,
 *  "node":"aa:11:22:33:44:55"}
 * @endcode
 */

#pragma once

#include "chronid/core/identifier.hpp"

#include <cJSON.h>
#include <string>
#include <vector>

namespace chronid::cli {

/**
 * @class Report
 * @brief Static builders for identifier JSON reports.
 */
class Report {
  public:
    /**
     * @brief Builds the report object for one identifier.
     *
     * @return A new cJSON object owned by the caller (release with `cJSON_Delete`).
     */
    static cJSON* describe(const core::Identifier& id);

    /// @brief Compact JSON text of `describe(id)`.
    static std::string to_json(const core::Identifier& id);

    /// @brief Compact JSON array of reports, in input order.
    static std::string to_json(const std::vector<core::Identifier>& ids);

  private:
    static std::string print(cJSON* item);
};

} // namespace chronid::cli
