#include "separating_function.hpp"
#include "errors.hpp"

#include <cstddef>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace urysohn
{

    namespace
    {
        std::mutex g_log_mutex;

        void log_failure(const char *reason, const Point &x)
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << "SeparatingFunction failure (" << reason << ") x=[" << x.transpose() << "]\n";
        }

        void log_batch_failure(const char *reason, std::size_t count)
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << "SeparatingFunction batch failure (" << reason << ") points=" << count << '\n';
        }
    } // namespace

    SeparatingFunction::EvaluationConfig SeparatingFunction::default_config()
    {
        return EvaluationConfig{
            .tolerance = 1e-6,
            .validate_contracts = true,
            .probes = {}};
    }

    SeparatingFunction::EvaluationConfig SeparatingFunction::resolve(const EvaluationConfig *config)
    {
        EvaluationConfig cfg = (config != nullptr) ? *config : default_config();
        if (!(cfg.tolerance > 0.0))
        {
            throw std::invalid_argument("SeparatingFunction: tolerance must be positive");
        }
        return cfg;
    }

    std::shared_ptr<const NormalityOracle> SeparatingFunction::wrap(
        std::shared_ptr<const NormalityOracle> oracle,
        const EvaluationConfig &config)
    {
        if (!oracle)
        {
            throw std::invalid_argument("SeparatingFunction requires a normality oracle");
        }
        if (config.validate_contracts && !config.probes.empty())
        {
            return std::make_shared<const ValidatingOracle>(std::move(oracle), config.probes);
        }
        return oracle;
    }

    CUNode::Ptr SeparatingFunction::make_root(
        ClosedSet c,
        OpenSet u,
        const std::shared_ptr<const NormalityOracle> &oracle,
        const EvaluationConfig &config)
    {
        const bool check = config.validate_contracts && !config.probes.empty();
        return CUNode::make(std::move(c), std::move(u), oracle, check ? &config.probes : nullptr);
    }

    SeparatingFunction::SeparatingFunction(
        CUNode::Ptr root,
        EvaluationConfig config,
        bool inverted,
        std::optional<ClosedSet> support_hull)
        : root_(std::move(root)), config_(std::move(config)), inverted_(inverted), support_hull_(std::move(support_hull))
    {
    }

    SeparatingFunction::SeparatingFunction(
        ClosedSet c,
        OpenSet u,
        std::shared_ptr<const NormalityOracle> oracle,
        const EvaluationConfig *config)
        : config_(resolve(config)), inverted_(false)
    {
        root_ = make_root(std::move(c), std::move(u), wrap(std::move(oracle), config_), config_);
    }

    SeparatingFunction SeparatingFunction::between(
        const ClosedSet &zero_set,
        const ClosedSet &one_set,
        std::shared_ptr<const NormalityOracle> oracle,
        const EvaluationConfig *config)
    {
        EvaluationConfig cfg = resolve(config);
        if (cfg.validate_contracts && !disjoint_on(zero_set, one_set, cfg.probes))
        {
            throw PreconditionViolated("SeparatingFunction::between: closed sets intersect");
        }

        auto checked = wrap(std::move(oracle), cfg);
        CUNode::Ptr root = make_root(zero_set, one_set.complement(), checked, cfg);
        return SeparatingFunction(std::move(root), std::move(cfg), false, std::nullopt);
    }

    SeparatingFunction SeparatingFunction::bump(
        const ClosedSet &c,
        const OpenSet &u,
        std::shared_ptr<const NormalityOracle> oracle,
        const EvaluationConfig *config)
    {
        EvaluationConfig cfg = resolve(config);
        if (cfg.validate_contracts && !subset_on(c, u, cfg.probes))
        {
            throw PreconditionViolated("SeparatingFunction::bump: closed set is not contained in open set");
        }

        auto checked = wrap(std::move(oracle), cfg);
        OpenSet v = checked->separate(c, u);
        ClosedSet hull = v.closure();

        CUNode::Ptr root = make_root(c, std::move(v), checked, cfg);
        return SeparatingFunction(std::move(root), std::move(cfg), true, std::move(hull));
    }

    double SeparatingFunction::evaluate(const Point &x) const
    {
        const CUNode::Ptr local = root_->detached();
        const double value = Approximation::lim_approx(*local, x, config_.tolerance);
        return inverted_ ? 1.0 - value : value;
    }

    Approximation::Enclosure SeparatingFunction::enclose(const Point &x) const
    {
        const CUNode::Ptr local = root_->detached();
        const int depth = Approximation::required_depth(config_.tolerance);
        Approximation::Enclosure e = Approximation::enclose(*local, x, depth);
        if (inverted_)
        {
            const double lower = 1.0 - e.upper;
            const double upper = 1.0 - e.lower;
            e.lower = lower;
            e.upper = upper;
        }
        return e;
    }

    std::vector<std::optional<double>> SeparatingFunction::evaluate_batch(
        const std::vector<Point> &points,
        const std::atomic<bool> *cancel) const
    {
        const std::size_t n = points.size();
        std::vector<std::optional<double>> results(n, std::nullopt);
        std::atomic<std::size_t> skipped{0};
        std::atomic<std::size_t> failed{0};

#pragma omp parallel for schedule(dynamic, 64)
        for (int i = 0; i < static_cast<int>(n); ++i)
        {
            const std::size_t idx = static_cast<std::size_t>(i);
            if (cancel != nullptr && cancel->load(std::memory_order_relaxed))
            {
                skipped.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            try
            {
                results[idx] = evaluate(points[idx]);
            }
            catch (const std::exception &e)
            {
                failed.fetch_add(1, std::memory_order_relaxed);
                log_failure(e.what(), points[idx]);
            }
        }

        if (skipped.load() > 0)
        {
            log_batch_failure("cancelled", skipped.load());
        }
        if (failed.load() > 0)
        {
            log_batch_failure("evaluation_error", failed.load());
        }

        return results;
    }

    ContinuityEstimate::Certificate SeparatingFunction::certify(const Point &x, int level) const
    {
        const CUNode::Ptr local = root_->detached();
        return ContinuityEstimate::certify(*local, x, level);
    }

} // namespace urysohn
