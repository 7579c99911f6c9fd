#pragma once

// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include <json/forwards.h>
#include <optional>
#include <utility>
#include <vector>

namespace hotbft
{

// undirected edge, first < second by position in the validator list
typedef std::pair<NodeID, NodeID> Edge;

class Topologies
{
  public:
    // each validator linked to its successor (wrapping), plus a chord from
    // each validator of the first half to its opposite
    static std::vector<Edge> ringWithChords(std::vector<NodeID> const& ids);

    // { "validators": [...], "faulty_leader": id|null, "edges": [[a,b],...] }
    static Json::Value toJson(std::vector<NodeID> const& ids,
                              std::optional<NodeID> const& faultyLeader);
};
}
