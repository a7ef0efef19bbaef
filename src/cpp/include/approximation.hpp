#pragma once
#include "cu_node.hpp"

namespace urysohn
{

    /**
     * Depth-n approximations of the Urysohn function and their limit
     *
     * approx(node, 0, x)   = 1 if x ∉ U, else 0
     * approx(node, n+1, x) = (approx(left, n, x) + approx(right, n, x)) / 2
     * lim(node, x)         = sup_n approx(node, n, x)
     *
     * Properties relied on throughout:
     *   - 0 <= approx <= 1; approx = 0 on C; approx = 1 outside U
     *   - approx is non-decreasing in n
     *   - node1.U ⊆ node2.C  =>  approx(node2, n, x) <= approx(node1, n, x)
     *
     * Every approximation value is a dyadic rational k / 2^n, so for
     * n <= kMaxDepth all arithmetic here is exact in double precision.
     *
     * Convergence rate:
     * Unfolding the midpoint relation n times, lim - approx_n is 2^-n times
     * the sum of lim over the depth-n descendants whose U contains x. Those
     * descendants are nested (each U inside the next one's C), so at most
     * one term is nonzero and 0 <= lim - approx_n <= 2^-n.
     */
    class Approximation
    {
    public:
        static constexpr int kMaxDepth = 52;

        /**
         * Certified bracket of lim(node, x)
         */
        struct Enclosure
        {
            double lower; // approx(node, depth, x)
            double upper; // lower + 2^-depth, or lower when exact
            int depth;    // Depth of the descent
        };

        /**
         * Depth-n approximation by the defining midpoint recursion
         *
         * @param node  Tree node
         * @param depth Recursion depth (>= 0)
         * @param x     Evaluation point
         * @return Value in [0, 1]
         *
         * @note Visits 2^depth leaves; child splits are cached per node so
         *       the oracle runs once per node. Intended for inspection and
         *       testing at shallow depth.
         * @throws std::invalid_argument for negative depth
         */
        static double approx(const CUNode &node, int depth, const Point &x);

        /**
         * Same value as approx(), computed along a single path
         *
         * If x ∈ left.U then x ∈ right.C, so the right half contributes 0
         * and the walk continues left. Otherwise x ∉ left.U, the left half
         * contributes 1 and the walk continues right. O(depth) splits.
         */
        static double approx_descend(const CUNode &node, int depth, const Point &x);

        /**
         * Bracket lim(node, x) from a depth-n descent
         *
         * The leaf reached by the descent decides the last term: 0 if x is
         * in its C, 1 if x is outside its U, unknown in [0, 1] otherwise.
         */
        static Enclosure enclose(const CUNode &node, const Point &x, int depth);

        /**
         * Smallest depth whose truncation bound is within tolerance
         *
         * @return ceil(log2(1 / tolerance)), clamped to [0, kMaxDepth]
         * @throws std::invalid_argument if tolerance <= 0 or NaN
         */
        static int required_depth(double tolerance);

        // 2^-depth
        static double truncation_bound(int depth);

        /**
         * Limit function value within tolerance
         *
         * @return approx(node, required_depth(tolerance), x), which lies in
         *         [lim - tolerance, lim]
         * @throws std::invalid_argument if tolerance <= 0 or NaN
         */
        static double lim_approx(const CUNode &node, const Point &x, double tolerance);

    private:
        static void check_depth(int depth);
    };

} // namespace urysohn
