// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#pragma once

namespace hotbft
{
[[noreturn]] void printAssertFailureAndThrow(const char* s1, const char* file,
                                             int line);

// Like `assert()` but not sensitive to NDEBUG, and throwing rather than
// aborting. Protocol invariants (append-only evidence) are checked with it
// so that a release build still reports a breach as a failed round.
#define releaseAssertOrThrow(e) \
    (static_cast<bool>(e) \
         ? void(0) \
         : hotbft::printAssertFailureAndThrow(#e, __FILE__, __LINE__))
}
