#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <Eigen/Dense>

namespace urysohn
{

    using Point = Eigen::VectorXd;
    using Field = std::function<double(const Point &)>;

    class OpenSet;

    /**
     * Closed subset of R^n given as the zero set of a level function
     *
     *   C = { x : gap(x) == 0 },  gap >= 0,  |gap(x) - gap(y)| <= L |x - y|
     *
     * Every closed set has such a description (its distance function),
     * so nothing is lost by working with level functions. The function is
     * shared, never copied, between a set and the sets derived from it.
     */
    class ClosedSet
    {
    public:
        /**
         * @param gap       Nonnegative function vanishing exactly on the set
         * @param lipschitz Lipschitz bound of gap (0 for constant functions)
         */
        ClosedSet(Field gap, double lipschitz);

        bool contains(const Point &x) const;
        double gap(const Point &x) const;
        double lipschitz() const { return lipschitz_; }

        // { gap > 0 }: same function read as a margin
        OpenSet complement() const;

        ClosedSet unite(const ClosedSet &other) const;
        ClosedSet intersect(const ClosedSet &other) const;

        static ClosedSet empty();
        static ClosedSet whole();
        static ClosedSet singleton(const Point &p);
        static ClosedSet closed_ball(const Point &center, double radius);

        // { x : normal·x <= offset }
        static ClosedSet half_space(const Point &normal, double offset);

    private:
        std::shared_ptr<const Field> gap_;
        double lipschitz_;
    };

    /**
     * Open subset of R^n given as the positive set of a level function
     *
     *   U = { x : margin(x) > 0 },  margin >= 0, Lipschitz
     *
     * The closure of a positive set cannot be read off the function in
     * general, so an open set may carry a closed hull known to contain its
     * closure. Balls and oracle outputs always have one.
     */
    class OpenSet
    {
    public:
        OpenSet(Field margin, double lipschitz);
        OpenSet(Field margin, double lipschitz, ClosedSet hull);

        bool contains(const Point &x) const;
        double margin(const Point &x) const;
        double lipschitz() const { return lipschitz_; }

        /**
         * Radius of an open ball around x that lies inside the set
         *
         * @return margin(x) / L; +inf for a constant positive margin;
         *         0 when x is not in the set
         */
        double inner_radius(const Point &x) const;

        ClosedSet complement() const;

        /**
         * Closed superset of the topological closure
         *
         * @return The hull when known, the whole space otherwise
         */
        ClosedSet closure() const;

        bool has_hull() const { return hull_.has_value(); }

        OpenSet unite(const OpenSet &other) const;
        OpenSet intersect(const OpenSet &other) const;

        static OpenSet empty();
        static OpenSet whole();
        static OpenSet open_ball(const Point &center, double radius);

        // { x : normal·x < offset }
        static OpenSet half_space(const Point &normal, double offset);

    private:
        std::shared_ptr<const Field> margin_;
        double lipschitz_;
        std::optional<ClosedSet> hull_;
    };

    /**
     * Inclusion tests decided on a finite probe cloud
     *
     * A false result is a proof of non-inclusion (the witness is a probe);
     * a true result only says no probe disagrees.
     */
    bool subset_on(const ClosedSet &c, const OpenSet &u, const std::vector<Point> &probes);
    bool subset_on(const OpenSet &v, const ClosedSet &c, const std::vector<Point> &probes);
    bool subset_on(const ClosedSet &c, const ClosedSet &d, const std::vector<Point> &probes);
    bool disjoint_on(const ClosedSet &c, const ClosedSet &d, const std::vector<Point> &probes);

    /**
     * Regular probe grid over the box [lower, upper]
     *
     * @param lower    Lower corner
     * @param upper    Upper corner (same dimension as lower)
     * @param per_axis Points per axis, endpoints included (>= 2)
     * @return per_axis^n points
     */
    std::vector<Point> sample_box(const Point &lower, const Point &upper, int per_axis);

} // namespace urysohn
