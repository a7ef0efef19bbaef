#include "continuity.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace urysohn
{

    double ContinuityEstimate::contraction_bound(int level)
    {
        if (level < 0)
        {
            throw std::invalid_argument("continuity level must be nonnegative");
        }
        return std::pow(kContraction, level);
    }

    ContinuityEstimate::Certificate ContinuityEstimate::certify(const CUNode &node, const Point &x, int level)
    {
        Certificate cert{};
        cert.level = level;
        cert.bound = contraction_bound(level);
        cert.case_a = 0;
        cert.case_b = 0;
        cert.radius = radius(node, x, level, cert);
        return cert;
    }

    double ContinuityEstimate::radius(const CUNode &node, const Point &x, int level, Certificate &stats)
    {
        if (level == 0)
        {
            return std::numeric_limits<double>::infinity();
        }

        const CUNode::Ptr left = node.left();

        if (left->u().contains(x))
        {
            ++stats.case_a;
            const double r_open = left->u().inner_radius(x);
            const double r_left = radius(*left, x, level - 1, stats);
            return std::min(r_open, r_left);
        }

        ++stats.case_b;
        const CUNode::Ptr left_right = left->right();
        const double r_open = left_right->c().complement().inner_radius(x);
        const double r_mid = radius(*left_right, x, level - 1, stats);
        const double r_right = radius(*node.right(), x, level - 1, stats);
        return std::min({r_open, r_mid, r_right});
    }

} // namespace urysohn
