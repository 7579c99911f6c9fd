// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/Topologies.h"
#include <json/json.h>
#include <algorithm>
#include <set>

namespace hotbft
{

std::vector<Edge>
Topologies::ringWithChords(std::vector<NodeID> const& ids)
{
    std::vector<Edge> edges;
    std::set<std::pair<size_t, size_t>> seen;
    auto const n = ids.size();
    if (n < 2)
    {
        return edges;
    }

    auto addEdge = [&](size_t a, size_t b) {
        if (a == b)
        {
            return;
        }
        auto key = std::make_pair(std::min(a, b), std::max(a, b));
        if (seen.insert(key).second)
        {
            edges.emplace_back(ids[key.first], ids[key.second]);
        }
    };

    for (size_t i = 0; i < n; i++)
    {
        addEdge(i, (i + 1) % n);
    }
    for (size_t i = 0; i < n / 2; i++)
    {
        addEdge(i, (i + n / 2) % n);
    }
    return edges;
}

Json::Value
Topologies::toJson(std::vector<NodeID> const& ids,
                   std::optional<NodeID> const& faultyLeader)
{
    Json::Value ret;
    auto& validators = ret["validators"];
    validators = Json::arrayValue;
    for (auto const& id : ids)
    {
        validators.append(id);
    }
    ret["faulty_leader"] = faultyLeader ? Json::Value(*faultyLeader)
                                        : Json::Value(Json::nullValue);
    auto& edges = ret["edges"];
    edges = Json::arrayValue;
    for (auto const& e : ringWithChords(ids))
    {
        Json::Value edge(Json::arrayValue);
        edge.append(e.first);
        edge.append(e.second);
        edges.append(edge);
    }
    return ret;
}
}
