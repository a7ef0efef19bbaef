#pragma once
#include "topology.hpp"

#include <memory>
#include <vector>

namespace urysohn
{

    /**
     * Normality oracle: shrink an open neighbourhood of a closed set
     *
     * Contract, whenever C ⊆ U:
     *   C ⊆ separate(C, U)   and   closure(separate(C, U)) ⊆ U
     *
     * The construction only consumes this capability. Implementations must
     * be deterministic and either stateless or internally thread-safe.
     */
    class NormalityOracle
    {
    public:
        virtual ~NormalityOracle() = default;

        virtual OpenSet separate(const ClosedSet &c, const OpenSet &u) const = 0;
    };

    /**
     * Oracle for level-function sets in R^n
     *
     * With C = { a == 0 } and U = { b > 0 }:
     *
     *   V    = { max(b - a, 0) > 0 }     (points closer to C than to U^c)
     *   hull = { max(a - b, 0) == 0 }    (closed, contains closure(V))
     *
     * C ⊆ V because b > 0 = a on C; hull ⊆ U because a <= b = 0 forces
     * a = 0, i.e. a point of C. Both inclusions hold exactly in floating
     * point since fl(b - a) > 0 iff b > a. Lipschitz bounds add.
     */
    class LevelSetOracle : public NormalityOracle
    {
    public:
        OpenSet separate(const ClosedSet &c, const OpenSet &u) const override;
    };

    /**
     * Decorator that checks the oracle contract on a probe cloud
     *
     * @throws OracleContractViolated naming the failed inclusion
     */
    class ValidatingOracle : public NormalityOracle
    {
    public:
        ValidatingOracle(std::shared_ptr<const NormalityOracle> inner, std::vector<Point> probes);

        OpenSet separate(const ClosedSet &c, const OpenSet &u) const override;

        const std::vector<Point> &probes() const { return probes_; }

    private:
        std::shared_ptr<const NormalityOracle> inner_;
        std::vector<Point> probes_;
    };

} // namespace urysohn
