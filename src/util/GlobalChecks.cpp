// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <stdexcept>
#include <string>

namespace hotbft
{

void
printAssertFailureAndThrow(const char* s1, const char* file, int line)
{
    LOG_ERROR(DEFAULT_LOG, "{} at {}:{}", s1, file, line);
    throw std::runtime_error(std::string("invariant violated: ") + s1);
}
}
