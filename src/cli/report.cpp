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
 * @file report.cpp
 * @brief cJSON-backed implementation of identifier reports.
 */

#include "chronid/cli/report.hpp"

#include "chronid/core/encoder.hpp"

#include <cstdio>
#include <cstdlib>
#include <new>
#include <stdexcept>

namespace chronid::cli {

namespace {

std::string format_node(const core::NodeIdentifier& node)
{
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", node[0], node[1], node[2],
                  node[3], node[4], node[5]);
    return std::string(buf);
}

} // namespace

cJSON* Report::describe(const core::Identifier& id)
{
    cJSON* obj = cJSON_CreateObject();
    if (!obj) {
        throw std::bad_alloc();
    }

    try {
        cJSON_AddStringToObject(obj, "id", id.to_string().c_str());
        cJSON_AddNumberToObject(obj, "version", id.version());
        cJSON_AddStringToObject(obj, "variant", core::variant_name(id.variant()));

        // Time fields only mean something for the time-based layout.
        if (id.version() == 1 && id.variant() == core::Variant::RFC4122) {
            core::Fields fields = core::Encoder::unpack(id);
            std::uint64_t simulated = core::Encoder::simulated_time(fields);
            auto ticks = static_cast<std::uint64_t>(core::Encoder::kTicksPerMillisecond);

            cJSON_AddNumberToObject(obj, "timestamp_ms", static_cast<double>(simulated / ticks));
            cJSON_AddNumberToObject(obj, "tick", static_cast<double>(simulated % ticks));
            cJSON_AddNumberToObject(obj, "clock_sequence", core::Encoder::clock_sequence(fields));
            cJSON_AddStringToObject(obj, "node", format_node(fields.node).c_str());
        }
    } catch (...) {
        cJSON_Delete(obj);
        throw;
    }

    return obj;
}

std::string Report::to_json(const core::Identifier& id)
{
    return print(describe(id));
}

std::string Report::to_json(const std::vector<core::Identifier>& ids)
{
    cJSON* array = cJSON_CreateArray();
    if (!array) {
        throw std::bad_alloc();
    }

    try {
        for (const core::Identifier& id : ids) {
            // Ownership transfer: the report becomes a child of 'array'.
            cJSON_AddItemToArray(array, describe(id));
        }
    } catch (...) {
        cJSON_Delete(array);
        throw;
    }

    return print(array);
}

/// Serializes and releases `item`.
std::string Report::print(cJSON* item)
{
    char* raw = cJSON_PrintUnformatted(item);
    cJSON_Delete(item);
    if (!raw) {
        throw std::runtime_error("Report: JSON serialization failed");
    }

    std::string out(raw);
    std::free(raw);
    return out;
}

} // namespace chronid::cli
