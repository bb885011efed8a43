//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Queries.h
// Purpose: list_services / list_logs execution and the read-only resource catalog built on them
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "sysmon/JSONRPCTypes.h"
#include "sysmon/Protocol.h"
#include "sysmon/adapters/AdapterTypes.h"
#include "sysmon/query/Validation.h"

namespace sysmon {
namespace query {

//==========================================================================================================
// QueryOutput
// Purpose: Result of one query.
// Fields:
//   structured: Machine-readable result object (becomes structuredContent / resource text).
//   summary: One-line human-readable description.
//==========================================================================================================
struct QueryOutput {
    JSONValue structured;
    std::string summary;
};

// JSON form of a service record; optional members are omitted when absent.
JSONValue ServiceRecordToJSON(const adapters::ServiceRecord& record);

// JSON form of a journal entry; optional members are omitted when absent.
JSONValue LogEntryToJSON(const adapters::LogEntry& entry);

//==========================================================================================================
// SortServices
// Purpose: Ascending by unit name. With failedFirst, records whose active_state is "failed" come first,
//          each group ascending by unit.
//==========================================================================================================
void SortServices(std::vector<adapters::ServiceRecord>& services, bool failedFirst);

//==========================================================================================================
// SanitizeMessage
// Purpose: Trims the message and replaces control characters other than \n, \r, \t with spaces.
// Returns:
//   std::nullopt when nothing but whitespace remains.
//==========================================================================================================
std::optional<std::string> SanitizeMessage(const std::string& message);

//==========================================================================================================
// ServiceQuery
// Purpose: Executes list_services against a unit lister.
// Output:
//   { services:[...], total, returned, truncated, generated_at_utc }, truncated = total > returned.
// Throws:
//   adapters::AdapterError from the lister.
//==========================================================================================================
class ServiceQuery {
public:
    explicit ServiceQuery(adapters::IUnitLister& lister) : lister_(lister) {}

    QueryOutput Run(const ServiceQueryParams& params) const;

private:
    adapters::IUnitLister& lister_;
};

//==========================================================================================================
// LogQuery
// Purpose: Executes list_logs against a log reader. Window, priority and unit are pushed down to the
//          reader and enforced again here; exclude_units, message sanitizing, grep, ordering and the limit
//          are applied here.
// Output:
//   { entries:[...], total_scanned?, returned, truncated, generated_at_utc, window:{start_utc,end_utc} }.
// Throws:
//   adapters::AdapterError from the reader.
//==========================================================================================================
class LogQuery {
public:
    LogQuery(adapters::ILogReader& reader, std::size_t scanLimit) : reader_(reader), scanLimit_(scanLimit) {}

    QueryOutput Run(const LogQueryParams& params) const;

private:
    adapters::ILogReader& reader_;
    std::size_t scanLimit_;
};

//==========================================================================================================
// ResourceCatalog
// Purpose: Fixed read-only resources.
//   resource://services/snapshot  all services, limit 1000
//   resource://services/failed    services in the failed state, limit 1000
//   resource://logs/recent        last hour of logs, newest first, limit 200
//==========================================================================================================
class ResourceCatalog {
public:
    ResourceCatalog(const ServiceQuery& services, const LogQuery& logs) : services_(services), logs_(logs) {}

    static const std::vector<ResourceDefinition>& Definitions();

    //==========================================================================================================
    // Read
    // Returns:
    //   { contents:[{ uri, mimeType, text }] } where text is the serialized query result.
    // Throws:
    //   errors::RpcException (-32601, resource_not_found) for an unknown URI; adapters::AdapterError.
    //==========================================================================================================
    JSONValue Read(const std::string& uri) const;

private:
    const ServiceQuery& services_;
    const LogQuery& logs_;
};

} // namespace query
} // namespace sysmon
