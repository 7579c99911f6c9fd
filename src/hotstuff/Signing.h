#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include <string>
#include <vector>

namespace hotbft
{

// Returns the opaque signature token of `signer` over `proposalIdentity`:
// "SIG(<signer>:<6 hex chars of sha256(signer|identity)>)". The token is a
// pure function of its inputs and is never verified.
std::string sign(NodeID const& signer, std::string const& proposalIdentity);

// Validator naming: "A".."Z" for the first 26 indices, "Node<i>" after.
NodeID makeValidatorID(size_t index);
std::vector<NodeID> makeValidatorIDs(size_t count);
}
