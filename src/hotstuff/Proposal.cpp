// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/Proposal.h"
#include <fmt/format.h>
#include <json/json.h>
#include <stdexcept>

namespace hotbft
{

Proposal::Proposal(BlockID const& blockID, BlockID const& parentID,
                   ViewNumber view, NodeID const& proposer)
    : mBlockID(blockID), mParentID(parentID), mView(view), mProposer(proposer)
{
    if (mBlockID.empty())
    {
        throw std::invalid_argument("proposal needs a block id");
    }
    if (mProposer.empty())
    {
        throw std::invalid_argument("proposal needs a proposer");
    }
}

std::string
Proposal::getIdentity() const
{
    return fmt::format(FMT_STRING("{}@v{}"), mBlockID, mView);
}

Json::Value
Proposal::toJson() const
{
    Json::Value ret;
    ret["id"] = getIdentity();
    ret["block"] = mBlockID;
    ret["parent"] = mParentID;
    ret["view"] = static_cast<Json::UInt>(mView);
    ret["proposer"] = mProposer;
    return ret;
}

bool
operator==(Proposal const& l, Proposal const& r)
{
    return l.getBlockID() == r.getBlockID() && l.getView() == r.getView();
}

bool
operator!=(Proposal const& l, Proposal const& r)
{
    return !(l == r);
}
}
