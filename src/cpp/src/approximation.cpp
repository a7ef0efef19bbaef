#include "approximation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace urysohn
{

    void Approximation::check_depth(int depth)
    {
        if (depth < 0)
        {
            throw std::invalid_argument("approximation depth must be nonnegative, got " + std::to_string(depth));
        }
    }

    double Approximation::approx(const CUNode &node, int depth, const Point &x)
    {
        check_depth(depth);

        if (depth == 0)
        {
            return node.u().contains(x) ? 0.0 : 1.0;
        }

        const double lhs = approx(*node.left(), depth - 1, x);
        const double rhs = approx(*node.right(), depth - 1, x);
        return 0.5 * (lhs + rhs);
    }

    double Approximation::approx_descend(const CUNode &node, int depth, const Point &x)
    {
        return enclose(node, x, depth).lower;
    }

    Approximation::Enclosure Approximation::enclose(const CUNode &node, const Point &x, int depth)
    {
        check_depth(depth);

        double value = 0.0;
        double weight = 1.0;

        // Keeps the current node alive; the caller owns only the start node
        CUNode::Ptr hold;
        const CUNode *cur = &node;

        for (int level = depth; level > 0; --level)
        {
            weight *= 0.5;
            CUNode::Ptr left = cur->left();
            if (left->u().contains(x))
            {
                hold = std::move(left);
            }
            else
            {
                value += weight;
                hold = cur->right();
            }
            cur = hold.get();
        }

        Enclosure result{};
        result.depth = depth;

        if (!cur->u().contains(x))
        {
            result.lower = value + weight;
            result.upper = result.lower;
        }
        else if (cur->c().contains(x))
        {
            result.lower = value;
            result.upper = value;
        }
        else
        {
            result.lower = value;
            result.upper = value + weight;
        }

        return result;
    }

    int Approximation::required_depth(double tolerance)
    {
        if (!(tolerance > 0.0))
        {
            throw std::invalid_argument("tolerance must be positive");
        }
        if (tolerance >= 1.0)
        {
            return 0;
        }

        const double depth = std::ceil(std::log2(1.0 / tolerance));
        if (!std::isfinite(depth) || depth >= static_cast<double>(kMaxDepth))
        {
            return kMaxDepth;
        }
        return std::max(0, static_cast<int>(depth));
    }

    double Approximation::truncation_bound(int depth)
    {
        check_depth(depth);
        return std::ldexp(1.0, -depth);
    }

    double Approximation::lim_approx(const CUNode &node, const Point &x, double tolerance)
    {
        return approx_descend(node, required_depth(tolerance), x);
    }

} // namespace urysohn
