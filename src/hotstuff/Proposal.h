#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include <json/forwards.h>
#include <string>

namespace hotbft
{

/**
 * A candidate block put forward by `proposer` in `view`. Proposals are
 * identified by (blockID, view); a leader that issues two proposals with
 * different block IDs in the same view is equivocating.
 */
class Proposal
{
    BlockID mBlockID;
    BlockID mParentID;
    ViewNumber mView;
    NodeID mProposer;

  public:
    Proposal(BlockID const& blockID, BlockID const& parentID, ViewNumber view,
             NodeID const& proposer);

    BlockID const&
    getBlockID() const
    {
        return mBlockID;
    }
    BlockID const&
    getParentID() const
    {
        return mParentID;
    }
    ViewNumber
    getView() const
    {
        return mView;
    }
    NodeID const&
    getProposer() const
    {
        return mProposer;
    }

    // "<blockID>@v<view>", the key votes are filed under
    std::string getIdentity() const;

    Json::Value toJson() const;
};

// same identity: same block in the same view
bool operator==(Proposal const& l, Proposal const& r);
bool operator!=(Proposal const& l, Proposal const& r);
}
