#ifndef INCLUDE_DATAJAIL_UTILS_H_
#define INCLUDE_DATAJAIL_UTILS_H_

#include <string>

#include "execution.h"

long GetUniqueExecutionId();

const char* FailureKindToDesc(FailureKind);
const char* FailureKindToAbr(FailureKind);

const char* CapturedTypeName(CapturedType);
// return false if not a known type name
bool GetCapturedType(const std::string&, CapturedType&);

const char* BackendTypeName(BackendType);

#endif  // INCLUDE_DATAJAIL_UTILS_H_
