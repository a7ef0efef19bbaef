#include "cu_node.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace urysohn
{

    CUNode::CUNode(ClosedSet c, OpenSet u, std::shared_ptr<const NormalityOracle> oracle)
        : c_(std::move(c)), u_(std::move(u)), oracle_(std::move(oracle))
    {
    }

    CUNode::Ptr CUNode::make(
        ClosedSet c,
        OpenSet u,
        std::shared_ptr<const NormalityOracle> oracle,
        const std::vector<Point> *probes)
    {
        if (!oracle)
        {
            throw std::invalid_argument("CUNode::make requires a normality oracle");
        }

        if (probes != nullptr && !subset_on(c, u, *probes))
        {
            throw PreconditionViolated("CUNode::make: closed set is not contained in open set");
        }

        return Ptr(new CUNode(std::move(c), std::move(u), std::move(oracle)));
    }

    void CUNode::split() const
    {
        std::call_once(split_once_, [this]
                       {
            OpenSet v = oracle_->separate(c_, u_);
            ClosedSet v_closure = v.closure();
            left_ = Ptr(new CUNode(c_, v, oracle_));
            right_ = Ptr(new CUNode(std::move(v_closure), u_, oracle_));
            separator_ = std::move(v); });
    }

    const OpenSet &CUNode::separator() const
    {
        split();
        return *separator_;
    }

    CUNode::Ptr CUNode::left() const
    {
        split();
        return left_;
    }

    CUNode::Ptr CUNode::right() const
    {
        split();
        return right_;
    }

    CUNode::Ptr CUNode::detached() const
    {
        return Ptr(new CUNode(c_, u_, oracle_));
    }

} // namespace urysohn
