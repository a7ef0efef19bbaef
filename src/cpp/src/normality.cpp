#include "normality.hpp"
#include "errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace urysohn
{

    OpenSet LevelSetOracle::separate(const ClosedSet &c, const OpenSet &u) const
    {
        const double lip = c.lipschitz() + u.lipschitz();

        Field margin = [c, u](const Point &x)
        { return std::max(u.margin(x) - c.gap(x), 0.0); };

        ClosedSet hull([c, u](const Point &x)
                       { return std::max(c.gap(x) - u.margin(x), 0.0); },
                       lip);

        return OpenSet(std::move(margin), lip, std::move(hull));
    }

    ValidatingOracle::ValidatingOracle(std::shared_ptr<const NormalityOracle> inner, std::vector<Point> probes)
        : inner_(std::move(inner)), probes_(std::move(probes))
    {
        if (!inner_)
        {
            throw std::invalid_argument("ValidatingOracle requires an inner oracle");
        }
    }

    OpenSet ValidatingOracle::separate(const ClosedSet &c, const OpenSet &u) const
    {
        OpenSet v = inner_->separate(c, u);

        if (!subset_on(c, v, probes_))
        {
            throw OracleContractViolated("oracle result does not contain C");
        }
        if (!subset_on(v.closure(), u, probes_))
        {
            throw OracleContractViolated("closure of oracle result escapes U");
        }

        return v;
    }

} // namespace urysohn
