#include "topology.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace urysohn
{

    namespace
    {
        std::shared_ptr<const Field> share(Field f)
        {
            if (!f)
            {
                throw std::invalid_argument("level function must be callable");
            }
            return std::make_shared<const Field>(std::move(f));
        }

        double checked_lipschitz(double lipschitz)
        {
            if (!(lipschitz >= 0.0) || !std::isfinite(lipschitz))
            {
                throw std::invalid_argument("Lipschitz bound must be finite and nonnegative");
            }
            return lipschitz;
        }

        Point checked_normal(const Point &normal)
        {
            if (normal.size() == 0 || !(normal.norm() > 0.0))
            {
                throw std::invalid_argument("half-space normal must be nonzero");
            }
            return normal;
        }
    } // namespace

    // ---------------------------------------------------------------------
    // ClosedSet
    // ---------------------------------------------------------------------

    ClosedSet::ClosedSet(Field gap, double lipschitz)
        : gap_(share(std::move(gap))), lipschitz_(checked_lipschitz(lipschitz))
    {
    }

    bool ClosedSet::contains(const Point &x) const
    {
        return gap(x) <= 0.0;
    }

    double ClosedSet::gap(const Point &x) const
    {
        return (*gap_)(x);
    }

    OpenSet ClosedSet::complement() const
    {
        auto g = gap_;
        return OpenSet([g](const Point &x)
                       { return (*g)(x); },
                       lipschitz_);
    }

    ClosedSet ClosedSet::unite(const ClosedSet &other) const
    {
        auto g1 = gap_;
        auto g2 = other.gap_;
        return ClosedSet([g1, g2](const Point &x)
                         { return std::min((*g1)(x), (*g2)(x)); },
                         std::max(lipschitz_, other.lipschitz_));
    }

    ClosedSet ClosedSet::intersect(const ClosedSet &other) const
    {
        auto g1 = gap_;
        auto g2 = other.gap_;
        return ClosedSet([g1, g2](const Point &x)
                         { return std::max((*g1)(x), (*g2)(x)); },
                         std::max(lipschitz_, other.lipschitz_));
    }

    ClosedSet ClosedSet::empty()
    {
        return ClosedSet([](const Point &)
                         { return 1.0; },
                         0.0);
    }

    ClosedSet ClosedSet::whole()
    {
        return ClosedSet([](const Point &)
                         { return 0.0; },
                         0.0);
    }

    ClosedSet ClosedSet::singleton(const Point &p)
    {
        return closed_ball(p, 0.0);
    }

    ClosedSet ClosedSet::closed_ball(const Point &center, double radius)
    {
        if (!(radius >= 0.0))
        {
            throw std::invalid_argument("closed ball radius must be nonnegative");
        }
        return ClosedSet([center, radius](const Point &x)
                         { return std::max((x - center).norm() - radius, 0.0); },
                         1.0);
    }

    ClosedSet ClosedSet::half_space(const Point &normal, double offset)
    {
        const Point n = checked_normal(normal);
        return ClosedSet([n, offset](const Point &x)
                         { return std::max(n.dot(x) - offset, 0.0); },
                         n.norm());
    }

    // ---------------------------------------------------------------------
    // OpenSet
    // ---------------------------------------------------------------------

    OpenSet::OpenSet(Field margin, double lipschitz)
        : margin_(share(std::move(margin))), lipschitz_(checked_lipschitz(lipschitz))
    {
    }

    OpenSet::OpenSet(Field margin, double lipschitz, ClosedSet hull)
        : margin_(share(std::move(margin))), lipschitz_(checked_lipschitz(lipschitz)), hull_(std::move(hull))
    {
    }

    bool OpenSet::contains(const Point &x) const
    {
        return margin(x) > 0.0;
    }

    double OpenSet::margin(const Point &x) const
    {
        return (*margin_)(x);
    }

    double OpenSet::inner_radius(const Point &x) const
    {
        const double m = margin(x);
        if (!(m > 0.0))
        {
            return 0.0;
        }
        if (lipschitz_ <= 0.0)
        {
            return std::numeric_limits<double>::infinity();
        }
        return m / lipschitz_;
    }

    ClosedSet OpenSet::complement() const
    {
        auto m = margin_;
        return ClosedSet([m](const Point &x)
                         { return (*m)(x); },
                         lipschitz_);
    }

    ClosedSet OpenSet::closure() const
    {
        if (hull_)
        {
            return *hull_;
        }
        return ClosedSet::whole();
    }

    OpenSet OpenSet::unite(const OpenSet &other) const
    {
        auto m1 = margin_;
        auto m2 = other.margin_;
        Field f = [m1, m2](const Point &x)
        { return std::max((*m1)(x), (*m2)(x)); };
        const double lip = std::max(lipschitz_, other.lipschitz_);

        // closure(A ∪ B) = closure(A) ∪ closure(B)
        if (hull_ && other.hull_)
        {
            return OpenSet(std::move(f), lip, hull_->unite(*other.hull_));
        }
        return OpenSet(std::move(f), lip);
    }

    OpenSet OpenSet::intersect(const OpenSet &other) const
    {
        auto m1 = margin_;
        auto m2 = other.margin_;
        Field f = [m1, m2](const Point &x)
        { return std::min((*m1)(x), (*m2)(x)); };
        const double lip = std::max(lipschitz_, other.lipschitz_);

        // closure(A ∩ B) ⊆ closure(A) ∩ closure(B), and either hull alone bounds it
        if (hull_ && other.hull_)
        {
            return OpenSet(std::move(f), lip, hull_->intersect(*other.hull_));
        }
        if (hull_)
        {
            return OpenSet(std::move(f), lip, *hull_);
        }
        if (other.hull_)
        {
            return OpenSet(std::move(f), lip, *other.hull_);
        }
        return OpenSet(std::move(f), lip);
    }

    OpenSet OpenSet::empty()
    {
        return OpenSet([](const Point &)
                       { return 0.0; },
                       0.0, ClosedSet::empty());
    }

    OpenSet OpenSet::whole()
    {
        return OpenSet([](const Point &)
                       { return 1.0; },
                       0.0, ClosedSet::whole());
    }

    OpenSet OpenSet::open_ball(const Point &center, double radius)
    {
        if (!(radius >= 0.0))
        {
            throw std::invalid_argument("open ball radius must be nonnegative");
        }
        return OpenSet([center, radius](const Point &x)
                       { return std::max(radius - (x - center).norm(), 0.0); },
                       1.0, ClosedSet::closed_ball(center, radius));
    }

    OpenSet OpenSet::half_space(const Point &normal, double offset)
    {
        const Point n = checked_normal(normal);
        return OpenSet([n, offset](const Point &x)
                       { return std::max(offset - n.dot(x), 0.0); },
                       n.norm(), ClosedSet::half_space(n, offset));
    }

    // ---------------------------------------------------------------------
    // Probe-based inclusion
    // ---------------------------------------------------------------------

    bool subset_on(const ClosedSet &c, const OpenSet &u, const std::vector<Point> &probes)
    {
        return std::all_of(probes.begin(), probes.end(), [&](const Point &x)
                           { return !c.contains(x) || u.contains(x); });
    }

    bool subset_on(const OpenSet &v, const ClosedSet &c, const std::vector<Point> &probes)
    {
        return std::all_of(probes.begin(), probes.end(), [&](const Point &x)
                           { return !v.contains(x) || c.contains(x); });
    }

    bool subset_on(const ClosedSet &c, const ClosedSet &d, const std::vector<Point> &probes)
    {
        return std::all_of(probes.begin(), probes.end(), [&](const Point &x)
                           { return !c.contains(x) || d.contains(x); });
    }

    bool disjoint_on(const ClosedSet &c, const ClosedSet &d, const std::vector<Point> &probes)
    {
        return std::none_of(probes.begin(), probes.end(), [&](const Point &x)
                            { return c.contains(x) && d.contains(x); });
    }

    std::vector<Point> sample_box(const Point &lower, const Point &upper, int per_axis)
    {
        if (lower.size() != upper.size() || lower.size() == 0)
        {
            throw std::invalid_argument("sample_box: corner dimension mismatch");
        }
        if (per_axis < 2)
        {
            throw std::invalid_argument("sample_box: per_axis must be >= 2");
        }

        const Eigen::Index dim = lower.size();
        const Point step = (upper - lower) / static_cast<double>(per_axis - 1);

        std::size_t total = 1;
        for (Eigen::Index d = 0; d < dim; ++d)
        {
            total *= static_cast<std::size_t>(per_axis);
        }

        std::vector<Point> points;
        points.reserve(total);

        std::vector<int> index(static_cast<std::size_t>(dim), 0);
        for (std::size_t i = 0; i < total; ++i)
        {
            Point p(dim);
            for (Eigen::Index d = 0; d < dim; ++d)
            {
                p[d] = lower[d] + step[d] * static_cast<double>(index[static_cast<std::size_t>(d)]);
            }
            points.push_back(std::move(p));

            // Odometer increment, first axis fastest
            for (std::size_t d = 0; d < index.size(); ++d)
            {
                if (++index[d] < per_axis)
                {
                    break;
                }
                index[d] = 0;
            }
        }

        return points;
    }

} // namespace urysohn
