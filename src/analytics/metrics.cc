#include "metrics.hh"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace slp {

namespace {

double to_sol(double lamports) {
    return lamports / static_cast<double>(LAMPORTS_PER_SOL);
}

std::string bucket_label(double start, double end) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.4f-%.4f", start, end);
    return buf;
}

std::vector<HistogramBucket> histogram(const std::vector<double>& values) {
    if (values.empty()) {
        return {};
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double min_v = *min_it;
    double max_v = *max_it;
    double width = (max_v - min_v) / static_cast<double>(HISTOGRAM_BUCKETS);

    if (width == 0.0) {
        HistogramBucket single;
        single.range_start = min_v;
        single.range_end = max_v;
        single.count = static_cast<std::uint32_t>(values.size());
        single.label = bucket_label(min_v, max_v);
        return {single};
    }

    std::vector<HistogramBucket> buckets(HISTOGRAM_BUCKETS);
    for (std::size_t i = 0; i < HISTOGRAM_BUCKETS; ++i) {
        buckets[i].range_start = min_v + static_cast<double>(i) * width;
        buckets[i].range_end = buckets[i].range_start + width;
        buckets[i].label = bucket_label(buckets[i].range_start, buckets[i].range_end);
    }

    for (double v : values) {
        auto idx = static_cast<std::size_t>(std::floor((v - min_v) / width));
        idx = std::min(idx, HISTOGRAM_BUCKETS - 1);
        ++buckets[idx].count;
    }
    return buckets;
}

}  // namespace

std::vector<CumulativePoint> cumulative_mev(const std::vector<ScenarioResult>& scenarios) {
    std::vector<CumulativePoint> points;
    std::int64_t total = 0;
    for (const auto& s : scenarios) {
        if (s.attack_succeeded && s.sandwich) {
            total += s.sandwich->profit_lamports;
        }
        points.push_back({s.id, total});
    }
    return points;
}

std::vector<CumulativePoint> cumulative_losses(const std::vector<ScenarioResult>& scenarios) {
    std::vector<CumulativePoint> points;
    std::int64_t total = 0;
    for (const auto& s : scenarios) {
        if (s.attack_succeeded && s.sandwich) {
            total += static_cast<std::int64_t>(s.sandwich->victim_loss);
        }
        points.push_back({s.id, total});
    }
    return points;
}

std::vector<HistogramBucket> loss_distribution(const std::vector<ScenarioResult>& scenarios) {
    std::vector<double> losses;
    for (const auto& s : scenarios) {
        if (s.sandwich && s.sandwich->victim_loss > 0) {
            losses.push_back(to_sol(static_cast<double>(s.sandwich->victim_loss)));
        }
    }
    return histogram(losses);
}

std::vector<HistogramBucket> profit_distribution(const std::vector<ScenarioResult>& scenarios) {
    std::vector<double> profits;
    for (const auto& s : scenarios) {
        if (s.sandwich && s.sandwich->frontrun_amount > 0) {
            profits.push_back(to_sol(static_cast<double>(s.sandwich->profit_lamports)));
        }
    }
    return histogram(profits);
}

std::vector<PricePoint> price_history(const std::vector<ScenarioResult>& scenarios) {
    std::vector<PricePoint> points;
    for (const auto& s : scenarios) {
        if (!s.failed) {
            points.push_back({s.id, s.normal_pool.price_a_in_b});
        }
    }
    return points;
}

ComparisonMetrics comparison_metrics(const std::vector<ScenarioResult>& scenarios) {
    ComparisonMetrics m;
    for (const auto& s : scenarios) {
        if (s.failed) continue;
        m.normal_total_loss += s.normal_trade.slippage_loss;
        m.protected_total_loss += s.protected_trade.slippage_loss;
        if (s.normal_trade.was_attacked) {
            ++m.attacked_transactions;
        }
        ++m.protected_transactions;
    }

    m.savings = m.normal_total_loss > m.protected_total_loss ? m.normal_total_loss - m.protected_total_loss : 0;
    if (m.normal_total_loss > 0) {
        m.savings_percentage = static_cast<double>(m.savings) * 100.0 / static_cast<double>(m.normal_total_loss);
    }
    return m;
}

}  // namespace slp
