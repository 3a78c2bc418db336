#ifndef DATAJAIL_COLLECTOR_H_
#define DATAJAIL_COLLECTOR_H_

#include <string>

#include <nlohmann/json.hpp>
#include <datajail/backend.h>
#include <datajail/workspace.h>

// Converts one mapping entry of the envelope; false if it is not a well-formed capture
bool ParseCapturedValue(const nlohmann::json&, CapturedValue&);

// The workspace is only read; it is released by its owner afterwards.
ExecutionOutcome Collect(const RawExecutionResult&, const Workspace&, const ResourceLimits&);

#endif  // DATAJAIL_COLLECTOR_H_
