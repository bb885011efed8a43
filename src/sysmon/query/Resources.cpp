//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sysmon/query/Resources.cpp
// Purpose: Fixed read-only resources backed by the service and log queries
//==========================================================================================================

#include "sysmon/query/Queries.h"
#include "sysmon/errors/Errors.h"
#include "logging/Logger.h"

namespace sysmon {
namespace query {

namespace {
    JSONValue contentsOf(const std::string& uri, const JSONValue& payload) {
        JSONValue::Object item;
        SetMember(item, "uri", JSONValue(uri));
        SetMember(item, "mimeType", JSONValue("application/json"));
        SetMember(item, "text", JSONValue(SerializeJSON(payload)));
        JSONValue::Array contents;
        contents.push_back(std::make_shared<JSONValue>(std::move(item)));
        JSONValue::Object result;
        SetMember(result, "contents", JSONValue(std::move(contents)));
        return JSONValue(std::move(result));
    }
}

const std::vector<ResourceDefinition>& ResourceCatalog::Definitions() {
    static const std::vector<ResourceDefinition> kDefinitions = [] {
        std::vector<ResourceDefinition> defs(3);
        defs[0].uri = ResourceUris::ServicesSnapshot;
        defs[0].name = "Service Snapshot";
        defs[0].description = "Current status of all systemd service units";
        defs[1].uri = ResourceUris::ServicesFailed;
        defs[1].name = "Failed Service Snapshot";
        defs[1].description = "Service units currently in the failed state";
        defs[2].uri = ResourceUris::LogsRecent;
        defs[2].name = "Recent Logs Snapshot";
        defs[2].description = "Journal entries from the last hour, newest first";
        return defs;
    }();
    return kDefinitions;
}

JSONValue ResourceCatalog::Read(const std::string& uri) const {
    LOG_DEBUG("reading resource {}", SerializeJSON(JSONValue(uri)));
    if (uri == ResourceUris::ServicesSnapshot) {
        ServiceQueryParams params;
        params.limit = kMaxLimit;
        return contentsOf(uri, services_.Run(params).structured);
    }
    if (uri == ResourceUris::ServicesFailed) {
        ServiceQueryParams params;
        params.state = "failed";
        params.limit = kMaxLimit;
        return contentsOf(uri, services_.Run(params).structured);
    }
    if (uri == ResourceUris::LogsRecent) {
        LogQueryParams params;
        params.end = NowMicros();
        params.start = params.end - kMicrosPerHour;
        params.order = LogOrder::Desc;
        params.limit = kDefaultLimit;
        return contentsOf(uri, logs_.Run(params).structured);
    }
    throw errors::resourceNotFound(uri);
}

} // namespace query
} // namespace sysmon
