#include "verification.hpp"
#include "approximation.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <vector>

#include <nlopt.hpp>

namespace urysohn
{

    namespace
    {
        std::mutex g_log_mutex;

        void log_failure(const char *stage, const char *reason)
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << "ContinuityVerifier failure (" << stage << "): " << reason << '\n';
        }

        struct SearchData
        {
            const CUNode *node;
            double centre_value;
            double tolerance;
            double best;
            Point best_point;
            int eval_count = 0;
        };

        double deviation(const std::vector<double> &y, std::vector<double> &, void *user_data)
        {
            auto *data = static_cast<SearchData *>(user_data);
            ++(data->eval_count);

            const Point p = Eigen::Map<const Eigen::VectorXd>(y.data(), static_cast<Eigen::Index>(y.size()));
            const double value = Approximation::lim_approx(*data->node, p, data->tolerance);
            const double dev = std::abs(value - data->centre_value);

            if (dev > data->best)
            {
                data->best = dev;
                data->best_point = p;
            }
            return dev;
        }
    } // namespace

    ContinuityVerifier::SearchConfig ContinuityVerifier::default_config()
    {
        return SearchConfig{
            .tolerance = 1e-4,
            .max_evaluations = 400,
            .max_time = 5.0,
            .max_radius = 1.0};
    }

    ContinuityVerifier::SearchResult ContinuityVerifier::worst_deviation(
        const CUNode &node,
        const Point &x,
        double radius,
        const SearchConfig *config)
    {
        SearchConfig default_cfg = default_config();
        const SearchConfig &cfg = (config != nullptr) ? *config : default_cfg;

        SearchResult result{};
        result.worst_deviation = 0.0;
        result.worst_point = x;
        result.radius = std::min(radius, cfg.max_radius);
        result.evaluations = 0;
        result.completed = true;

        const std::size_t dim = static_cast<std::size_t>(x.size());
        if (dim == 0 || !(result.radius > 0.0))
        {
            return result;
        }

        // Strictly inside the open ball
        const double half_side = result.radius / std::sqrt(static_cast<double>(dim)) * (1.0 - 1e-9);

        // Task-private tree: the search touches many paths
        const CUNode::Ptr local = node.detached();

        SearchData data{local.get(), 0.0, cfg.tolerance, 0.0, x};
        data.centre_value = Approximation::lim_approx(*local, x, cfg.tolerance);

        std::vector<double> lb(dim);
        std::vector<double> ub(dim);
        for (std::size_t i = 0; i < dim; ++i)
        {
            lb[i] = x[static_cast<Eigen::Index>(i)] - half_side;
            ub[i] = x[static_cast<Eigen::Index>(i)] + half_side;
        }

        auto run_optimizer = [&](nlopt::algorithm algo, const Point &start) -> bool
        {
            std::vector<double> params(start.data(), start.data() + start.size());
            for (std::size_t i = 0; i < dim; ++i)
            {
                params[i] = std::clamp(params[i], lb[i], ub[i]);
            }

            nlopt::opt opt(algo, static_cast<unsigned>(dim));
            opt.set_max_objective(deviation, &data);
            opt.set_lower_bounds(lb);
            opt.set_upper_bounds(ub);
            opt.set_xtol_abs(half_side * 1e-6);
            opt.set_maxeval(cfg.max_evaluations);
            opt.set_maxtime(cfg.max_time);
            if (algo == nlopt::LN_NELDERMEAD)
            {
                opt.set_initial_step(std::vector<double>(dim, 0.25 * half_side));
            }

            double maxf = 0.0;
            nlopt::result opt_result = nlopt::FAILURE;

            try
            {
                opt_result = opt.optimize(params, maxf);
            }
            catch (const std::exception &e)
            {
                // Best point seen so far is kept in data
                log_failure(algo == nlopt::GN_DIRECT_L ? "global" : "local", e.what());
                return false;
            }

            return opt_result > 0;
        };

        const bool global_ok = run_optimizer(nlopt::GN_DIRECT_L, x);
        const Point refine_from = data.best_point;
        const bool local_ok = run_optimizer(nlopt::LN_NELDERMEAD, refine_from);

        result.worst_deviation = data.best;
        result.worst_point = data.best_point;
        result.evaluations = data.eval_count;
        result.completed = global_ok && local_ok;
        return result;
    }

    bool ContinuityVerifier::confirm(
        const CUNode &node,
        const Point &x,
        int level,
        const SearchConfig *config)
    {
        SearchConfig default_cfg = default_config();
        const SearchConfig &cfg = (config != nullptr) ? *config : default_cfg;

        const auto cert = ContinuityEstimate::certify(node, x, level);
        const auto search = worst_deviation(node, x, cert.radius, &cfg);
        return search.worst_deviation <= cert.bound + 2.0 * cfg.tolerance;
    }

} // namespace urysohn
