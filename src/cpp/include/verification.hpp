#pragma once
#include "continuity.hpp"
#include "cu_node.hpp"

namespace urysohn
{

    /**
     * Adversarial check of continuity certificates via NLopt
     *
     * Maximises |lim_approx(y) - lim_approx(x)| over the cube inscribed in
     * the ball B(x, radius), i.e. half-side radius / sqrt(n), so every
     * candidate y is inside the certified ball.
     *
     * Two passes, as for any non-smooth objective:
     * 1. GN_DIRECT_L: global, derivative-free, needs only the box bounds
     * 2. LN_NELDERMEAD: local refinement started from the best point so far
     *
     * The objective is piecewise constant at any finite depth, so the
     * search is a sampling strategy, not a proof; the certificate is the proof.
     */
    class ContinuityVerifier
    {
    public:
        struct SearchConfig
        {
            double tolerance = 1e-4;    // lim_approx tolerance per evaluation
            int max_evaluations = 400;  // Per optimiser pass
            double max_time = 5.0;      // Seconds per optimiser pass
            double max_radius = 1.0;    // Clamp for infinite / huge radii
        };

        struct SearchResult
        {
            double worst_deviation; // max |f(y) - f(x)| observed
            Point worst_point;      // Witness y (x itself if nothing worse)
            double radius;          // Radius actually searched
            int evaluations;        // Objective evaluations over both passes
            bool completed;         // Both passes ended without an NLopt error
        };

        static SearchConfig default_config();

        /**
         * Search the ball of a certificate for the largest deviation
         *
         * @param node   Tree node (a detached copy is searched)
         * @param x      Centre point
         * @param radius Certified radius
         * @param config Search configuration (defaults if nullptr)
         * @return SearchResult; NLopt failures are logged and reported
         *         through completed = false
         */
        static SearchResult worst_deviation(
            const CUNode &node,
            const Point &x,
            double radius,
            const SearchConfig *config = nullptr);

        /**
         * Convenience: certify at level n, then search the certified ball
         *
         * @return true if no deviation above bound + 2 * tolerance was found
         */
        static bool confirm(
            const CUNode &node,
            const Point &x,
            int level,
            const SearchConfig *config = nullptr);
    };

} // namespace urysohn
