#pragma once
#include "normality.hpp"
#include "topology.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace urysohn
{

    /**
     * Node (C, U) of the Urysohn approximation tree
     *
     * Invariant: C closed, U open, C ⊆ U.
     *
     * Children come from one oracle split V = separate(C, U):
     *   left()  = (C, V)
     *   right() = (closure(V), U)
     *
     * so left().U ⊆ right().C at every node; this nesting is what makes
     * the approximations converge and the limit continuous.
     *
     * The tree is infinite and generated on demand. A node is immutable;
     * its split and children are computed at most once (thread-safe) and
     * cached in the node. Children never refer back to their parent.
     */
    class CUNode
    {
    public:
        using Ptr = std::shared_ptr<const CUNode>;

        /**
         * Build a root node
         *
         * @param c      Closed set (function value 0)
         * @param u      Open set containing c (function value 1 outside)
         * @param oracle Normality oracle used for every split below this node
         * @param probes Optional probe cloud on which C ⊆ U is checked
         * @return Shared root node
         *
         * @throws PreconditionViolated if a probe lies in C but not in U
         * @throws std::invalid_argument if oracle is null
         */
        static Ptr make(
            ClosedSet c,
            OpenSet u,
            std::shared_ptr<const NormalityOracle> oracle,
            const std::vector<Point> *probes = nullptr);

        const ClosedSet &c() const { return c_; }
        const OpenSet &u() const { return u_; }
        const std::shared_ptr<const NormalityOracle> &oracle() const { return oracle_; }

        // Cached oracle output V for this node
        const OpenSet &separator() const;

        Ptr left() const;
        Ptr right() const;

        // Same sets and oracle, empty child cache
        Ptr detached() const;

        CUNode(const CUNode &) = delete;
        CUNode &operator=(const CUNode &) = delete;

    private:
        CUNode(ClosedSet c, OpenSet u, std::shared_ptr<const NormalityOracle> oracle);

        void split() const;

        ClosedSet c_;
        OpenSet u_;
        std::shared_ptr<const NormalityOracle> oracle_;

        mutable std::once_flag split_once_;
        mutable std::optional<OpenSet> separator_;
        mutable Ptr left_;
        mutable Ptr right_;
    };

} // namespace urysohn
