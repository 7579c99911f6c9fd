#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include <functional>
#include <json/forwards.h>
#include <string>

namespace hotbft
{

/**
 * Proof that `accused` signed two distinct proposals authored by the same
 * proposer in the same view. The two proposal identities are kept in
 * lexicographic order, so the same conflict discovered in either order
 * yields the same value.
 */
class EquivocationEvidence
{
    NodeID mAccused;
    std::string mFirst;
    std::string mSecond;

  public:
    EquivocationEvidence(NodeID const& accused, std::string const& proposalA,
                         std::string const& proposalB);

    NodeID const&
    getAccused() const
    {
        return mAccused;
    }
    std::string const&
    getFirst() const
    {
        return mFirst;
    }
    std::string const&
    getSecond() const
    {
        return mSecond;
    }

    std::string toString() const;
    Json::Value toJson() const;
};

bool operator==(EquivocationEvidence const& l, EquivocationEvidence const& r);
bool operator!=(EquivocationEvidence const& l, EquivocationEvidence const& r);
bool operator<(EquivocationEvidence const& l, EquivocationEvidence const& r);
}

namespace std
{
template <> struct hash<hotbft::EquivocationEvidence>
{
    size_t operator()(hotbft::EquivocationEvidence const& e) const noexcept;
};
}
