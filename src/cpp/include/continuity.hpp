#pragma once
#include "cu_node.hpp"

namespace urysohn
{

    /**
     * Explicit continuity certificates for the limit function
     *
     * For a point x and level n, certify() returns a radius r > 0 with
     *
     *   |y - x| < r   =>   |lim(node, y) - lim(node, x)| <= (3/4)^n
     *
     * Recursion on n:
     *
     *   n = 0:  r = +inf (both values lie in [0, 1])
     *
     *   Case A, x ∈ left.U:
     *     Inside left.U every point also lies in right.C, so lim(right) = 0
     *     at x and y. Midpoint relation gives (3/4)^(n-1) / 2.
     *     r = min(inner radius of left.U at x, certify(left, n-1))
     *
     *   Case B, x ∉ left.U:
     *     left.right.C ⊆ left.U, so x lies in the open complement of
     *     left.right.C; there y ∉ left.left.U and lim(left.left) = 1.
     *     Two midpoint steps give (r'/2 + r')/2 = (3/4) r' for r' = (3/4)^(n-1).
     *     r = min(inner radius of the complement of left.right.C at x,
     *             certify(left.right, n-1), certify(right, n-1))
     */
    class ContinuityEstimate
    {
    public:
        static constexpr double kContraction = 0.75;

        struct Certificate
        {
            double radius; // Certified open-ball radius around x (+inf at level 0)
            double bound;  // (3/4)^level
            int level;
            int case_a;    // Case A branches taken
            int case_b;    // Case B branches taken
        };

        // (3/4)^level
        static double contraction_bound(int level);

        /**
         * @param node  Tree node whose limit function is certified
         * @param x     Centre point
         * @param level Precision level n (>= 0)
         * @return Certificate with radius > 0
         *
         * @note Case B branches twice, so the cost grows like 2^level
         * @throws std::invalid_argument for negative level
         */
        static Certificate certify(const CUNode &node, const Point &x, int level);

    private:
        static double radius(const CUNode &node, const Point &x, int level, Certificate &stats);
    };

} // namespace urysohn
