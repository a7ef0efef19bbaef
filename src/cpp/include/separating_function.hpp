#pragma once
#include "approximation.hpp"
#include "continuity.hpp"
#include "cu_node.hpp"
#include "normality.hpp"
#include "topology.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

namespace urysohn
{

    /**
     * Continuous [0, 1]-valued function separating two sets
     *
     * Three ways to build one:
     *
     * 1. SeparatingFunction(C, U):  0 on C, 1 outside U
     * 2. between(A, B):             0 on A, 1 on B (disjoint closed sets)
     * 3. bump(C, U):                1 on C, 0 outside an intermediate V with
     *                               closure(V) ⊆ U, so support ⊆ closure(V)
     *
     * Values come from the limit of the Urysohn approximation tree,
     * evaluated to config.tolerance.
     */
    class SeparatingFunction
    {
    public:
        struct EvaluationConfig
        {
            double tolerance = 1e-6;        // |evaluate(x) - f(x)| <= tolerance
            bool validate_contracts = true; // Check root precondition and oracle on probes
            std::vector<Point> probes;      // Probe cloud; empty disables the checks
        };

        // Get default configuration
        static EvaluationConfig default_config();

        /**
         * @param c      Closed set where the function is 0
         * @param u      Open set containing c; the function is 1 outside u
         * @param oracle Normality oracle
         * @param config Evaluation configuration (defaults if nullptr)
         *
         * @throws PreconditionViolated if validation is on and a probe lies in
         *         c but not in u
         * @throws std::invalid_argument for a non-positive tolerance or null oracle
         */
        SeparatingFunction(
            ClosedSet c,
            OpenSet u,
            std::shared_ptr<const NormalityOracle> oracle,
            const EvaluationConfig *config = nullptr);

        /**
         * Function that is 0 on zero_set and 1 on one_set
         *
         * @note Root node is (zero_set, complement(one_set)); disjointness
         *       is exactly the root precondition
         */
        static SeparatingFunction between(
            const ClosedSet &zero_set,
            const ClosedSet &one_set,
            std::shared_ptr<const NormalityOracle> oracle,
            const EvaluationConfig *config = nullptr);

        /**
         * Function that is 1 on c and vanishes off a closed set inside u
         *
         * One oracle call picks V with c ⊆ V, closure(V) ⊆ u; the result is
         * 1 - lim of the tree rooted at (c, V).
         */
        static SeparatingFunction bump(
            const ClosedSet &c,
            const OpenSet &u,
            std::shared_ptr<const NormalityOracle> oracle,
            const EvaluationConfig *config = nullptr);

        /**
         * Function value within config.tolerance
         *
         * @note Each call descends a private copy of the root, so concurrent
         *       calls share no node caches
         */
        double evaluate(const Point &x) const;

        double operator()(const Point &x) const { return evaluate(x); }

        /**
         * Certified bracket of the exact value at the configured depth
         */
        Approximation::Enclosure enclose(const Point &x) const;

        /**
         * Batch evaluation with parallel execution
         *
         * @param points Evaluation points
         * @param cancel Optional flag; once set, remaining points are skipped
         * @return One entry per point; nullopt for skipped or failed points
         *
         * @note OpenMP parallelization: each point on its own detached root
         * @note Cancellation is checked between points, never mid-descent
         * @note Failures are logged to stderr, not thrown
         */
        std::vector<std::optional<double>> evaluate_batch(
            const std::vector<Point> &points,
            const std::atomic<bool> *cancel = nullptr) const;

        /**
         * Continuity certificate at x: radius r with
         * |f(y) - f(x)| <= (3/4)^level whenever |y - x| < r
         */
        ContinuityEstimate::Certificate certify(const Point &x, int level) const;

        const CUNode::Ptr &root() const { return root_; }
        const EvaluationConfig &config() const { return config_; }

        // True for bump(): value is 1 - lim
        bool inverted() const { return inverted_; }

        // Closed set outside which the function is 0 (bump only)
        const std::optional<ClosedSet> &support_hull() const { return support_hull_; }

    private:
        SeparatingFunction(CUNode::Ptr root, EvaluationConfig config, bool inverted, std::optional<ClosedSet> support_hull);

        static EvaluationConfig resolve(const EvaluationConfig *config);
        static std::shared_ptr<const NormalityOracle> wrap(
            std::shared_ptr<const NormalityOracle> oracle,
            const EvaluationConfig &config);
        static CUNode::Ptr make_root(
            ClosedSet c,
            OpenSet u,
            const std::shared_ptr<const NormalityOracle> &oracle,
            const EvaluationConfig &config);

        CUNode::Ptr root_;
        EvaluationConfig config_;
        bool inverted_;
        std::optional<ClosedSet> support_hull_;
    };

} // namespace urysohn
