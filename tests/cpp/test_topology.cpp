#include "errors.hpp"
#include "normality.hpp"
#include "topology.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace
{
    using urysohn::ClosedSet;
    using urysohn::OpenSet;
    using urysohn::Point;

    bool approx_equal(double a, double b, double tol)
    {
        return std::abs(a - b) <= tol;
    }

    Point pt(double x)
    {
        Point p(1);
        p << x;
        return p;
    }

    Point pt(double x, double y)
    {
        Point p(2);
        p << x, y;
        return p;
    }

    // Returns U itself: contains C, but its closure is unknown (whole space)
    class LazyOracle : public urysohn::NormalityOracle
    {
    public:
        OpenSet separate(const ClosedSet &, const OpenSet &u) const override
        {
            return OpenSet([u](const Point &x)
                           { return u.margin(x); },
                           u.lipschitz());
        }
    };

    // Returns the empty set: closure fine, misses C
    class EmptyOracle : public urysohn::NormalityOracle
    {
    public:
        OpenSet separate(const ClosedSet &, const OpenSet &) const override
        {
            return OpenSet::empty();
        }
    };
}

int main()
{
    const auto line = urysohn::sample_box(pt(-2.0), pt(2.0), 81);

    // 1. Balls and singletons on the line
    {
        const auto open = OpenSet::open_ball(pt(0.0), 1.0);
        const auto closed = ClosedSet::closed_ball(pt(0.0), 1.0);
        const auto origin = ClosedSet::singleton(pt(0.0));

        assert(open.contains(pt(0.5)));
        assert(!open.contains(pt(1.0)));
        assert(!open.contains(pt(-1.5)));
        assert(closed.contains(pt(1.0)));
        assert(closed.contains(pt(-1.0)));
        assert(!closed.contains(pt(1.01)));
        assert(origin.contains(pt(0.0)));
        assert(!origin.contains(pt(1e-9)));
        assert(approx_equal(closed.gap(pt(3.0)), 2.0, 1e-12));
    }

    // 2. Complements read the same level function the other way round
    {
        const auto closed = ClosedSet::closed_ball(pt(0.0), 1.0);
        const auto outside = closed.complement();
        assert(outside.contains(pt(2.0)));
        assert(!outside.contains(pt(0.5)));
        assert(!outside.contains(pt(1.0)));

        const auto open = OpenSet::open_ball(pt(0.0), 1.0);
        const auto rest = open.complement();
        assert(rest.contains(pt(1.0)));
        assert(rest.contains(pt(-3.0)));
        assert(!rest.contains(pt(0.0)));

        for (const auto &x : line)
        {
            assert(closed.contains(x) != outside.contains(x));
            assert(open.contains(x) != rest.contains(x));
        }
    }

    // 3. Closure: exact hull for balls, whole space when unknown
    {
        const auto open = OpenSet::open_ball(pt(0.0), 1.0);
        assert(open.has_hull());
        assert(open.closure().contains(pt(1.0)));
        assert(!open.closure().contains(pt(1.1)));
        assert(urysohn::subset_on(open, open.closure(), line));

        const auto punctured = ClosedSet::singleton(pt(0.0)).complement();
        assert(!punctured.has_hull());
        for (const auto &x : line)
        {
            assert(punctured.closure().contains(x));
        }
    }

    // 4. Inner radius
    {
        const auto open = OpenSet::open_ball(pt(0.0), 1.0);
        assert(approx_equal(open.inner_radius(pt(0.25)), 0.75, 1e-12));
        assert(open.inner_radius(pt(1.0)) == 0.0);
        assert(open.inner_radius(pt(4.0)) == 0.0);
        assert(OpenSet::whole().inner_radius(pt(7.0)) == std::numeric_limits<double>::infinity());
        assert(OpenSet::empty().inner_radius(pt(0.0)) == 0.0);

        // Steeper normal, same set, proportionally scaled margin
        const auto half = OpenSet::half_space(pt(2.0), 2.0); // x < 1
        assert(half.contains(pt(0.0)));
        assert(!half.contains(pt(1.0)));
        assert(approx_equal(half.inner_radius(pt(0.0)), 1.0, 1e-12));
    }

    // 5. Set algebra
    {
        const auto left = ClosedSet::closed_ball(pt(-1.0), 0.5);
        const auto right = ClosedSet::closed_ball(pt(1.0), 0.5);
        const auto both = left.unite(right);
        const auto none = left.intersect(right);
        assert(both.contains(pt(-1.2)) && both.contains(pt(1.4)));
        assert(!both.contains(pt(0.0)));
        for (const auto &x : line)
        {
            assert(!none.contains(x));
        }

        const auto a = OpenSet::open_ball(pt(0.0), 1.0);
        const auto b = OpenSet::open_ball(pt(1.0), 1.0);
        const auto a_or_b = a.unite(b);
        const auto a_and_b = a.intersect(b);
        assert(a_or_b.contains(pt(1.5)) && a_or_b.contains(pt(-0.5)));
        assert(a_and_b.contains(pt(0.5)));
        assert(!a_and_b.contains(pt(-0.5)));
        assert(urysohn::subset_on(a_and_b, a_and_b.closure(), line));
        assert(urysohn::subset_on(a_or_b, a_or_b.closure(), line));

        assert(ClosedSet::whole().contains(pt(123.0)));
        assert(!ClosedSet::empty().contains(pt(0.0)));
        assert(urysohn::disjoint_on(left, right, line));
        assert(!urysohn::disjoint_on(left, both, line));
    }

    // 6. Level-set oracle: C = {0}, U = (-1, 1) gives V = (-1/2, 1/2), hull [-1/2, 1/2]
    {
        const auto c = ClosedSet::singleton(pt(0.0));
        const auto u = OpenSet::open_ball(pt(0.0), 1.0);
        const urysohn::LevelSetOracle oracle;
        const auto v = oracle.separate(c, u);

        assert(v.contains(pt(0.0)));
        assert(v.contains(pt(0.49)));
        assert(!v.contains(pt(0.5)));
        assert(v.closure().contains(pt(0.5)));
        assert(!v.closure().contains(pt(0.51)));
        assert(approx_equal(v.lipschitz(), 2.0, 1e-12));

        assert(urysohn::subset_on(c, v, line));
        assert(urysohn::subset_on(v.closure(), u, line));
        assert(urysohn::subset_on(v, v.closure(), line));
    }

    // 7. Oracle in two dimensions
    {
        const auto plane = urysohn::sample_box(pt(-2.0, -2.0), pt(2.0, 2.0), 41);
        const auto c = ClosedSet::closed_ball(pt(0.0, 0.0), 0.5);
        const auto u = OpenSet::open_ball(pt(0.0, 0.0), 1.5).intersect(OpenSet::half_space(pt(1.0, 0.0), 1.0));
        assert(urysohn::subset_on(c, u, plane));

        const urysohn::LevelSetOracle oracle;
        const auto v = oracle.separate(c, u);
        assert(urysohn::subset_on(c, v, plane));
        assert(urysohn::subset_on(v.closure(), u, plane));
    }

    // 8. Validating oracle
    {
        const auto c = ClosedSet::singleton(pt(0.0));
        const auto u = OpenSet::open_ball(pt(0.0), 1.0);

        const urysohn::ValidatingOracle good(std::make_shared<urysohn::LevelSetOracle>(), line);
        const auto v = good.separate(c, u);
        assert(v.contains(pt(0.0)));

        bool threw = false;
        try
        {
            const urysohn::ValidatingOracle lazy(std::make_shared<LazyOracle>(), line);
            (void)lazy.separate(c, u);
        }
        catch (const urysohn::OracleContractViolated &e)
        {
            threw = true;
            std::cout << "  rejected lazy oracle: " << e.what() << "\n";
        }
        assert(threw);

        threw = false;
        try
        {
            const urysohn::ValidatingOracle empty(std::make_shared<EmptyOracle>(), line);
            (void)empty.separate(c, u);
        }
        catch (const urysohn::OracleContractViolated &e)
        {
            threw = true;
            std::cout << "  rejected empty oracle: " << e.what() << "\n";
        }
        assert(threw);

        threw = false;
        try
        {
            const urysohn::ValidatingOracle missing(nullptr, line);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    // 9. Probe grids
    {
        const auto grid = urysohn::sample_box(pt(0.0, 0.0), pt(1.0, 2.0), 5);
        assert(grid.size() == 25);
        assert(approx_equal(grid.front()[0], 0.0, 1e-12) && approx_equal(grid.front()[1], 0.0, 1e-12));
        assert(approx_equal(grid.back()[0], 1.0, 1e-12) && approx_equal(grid.back()[1], 2.0, 1e-12));
        assert(approx_equal(grid[1][0], 0.25, 1e-12));

        bool threw = false;
        try
        {
            (void)urysohn::sample_box(pt(0.0), pt(1.0, 1.0), 5);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)urysohn::sample_box(pt(0.0), pt(1.0), 1);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    // 10. Invalid constructions
    {
        bool threw = false;
        try
        {
            (void)ClosedSet::closed_ball(pt(0.0), -1.0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)OpenSet([](const Point &)
                          { return 1.0; },
                          -2.0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)ClosedSet::half_space(pt(0.0), 1.0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "topology: all checks passed\n";
    return 0;
}
