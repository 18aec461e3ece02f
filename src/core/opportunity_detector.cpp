#include "opportunity_detector.hpp"
#include <algorithm>
#include <cmath>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace sentinel {

namespace {

bool is_valid_snapshot(const PoolSnapshot& snapshot) {
    return snapshot.price_a > 0.0 && std::isfinite(snapshot.price_a) && !snapshot.pool_id.empty();
}

bool same_asset_pair(const PoolSnapshot& first, const PoolSnapshot& second) {
    return (first.asset_a == second.asset_a && first.asset_b == second.asset_b) ||
           (first.asset_a == second.asset_b && first.asset_b == second.asset_a);
}

} // namespace

void to_json(nlohmann::json& j, const DetectionStats& s) {
    j = nlohmann::json{
        {"detection_runs", s.detection_runs},
        {"pairs_compared", s.pairs_compared},
        {"skipped_below_floor", s.skipped_below_floor},
        {"skipped_unprofitable", s.skipped_unprofitable},
        {"skipped_duplicate", s.skipped_duplicate},
        {"skipped_unquoted", s.skipped_unquoted},
        {"invalid_snapshots", s.invalid_snapshots},
        {"emitted", s.emitted},
        {"expired", s.expired}
    };
}

OpportunityDetector::OpportunityDetector(const ArbitrageConfig& config, std::shared_ptr<Clock> clock)
    : config_(config),
      clock_(std::move(clock)),
      ttl_(config.opportunity_ttl_ms) {
    if (!clock_) {
        throw ConfigurationError("opportunity detector requires a clock");
    }
}

std::string OpportunityDetector::make_opportunity_id(const std::string& first_pool,
                                                     const std::string& second_pool,
                                                     Timestamp created_at) {
    return "arb_" + first_pool + "_" + second_pool + "_" + std::to_string(to_epoch_ms(created_at));
}

std::vector<Opportunity> OpportunityDetector::detect(const std::vector<PoolSnapshot>& snapshots,
                                                     const DynamicParameters& params) {
    SENTINEL_SCOPED_TIMER("OpportunityDetector::detect");
    const Timestamp now = clock_->now();

    std::vector<const PoolSnapshot*> valid;
    valid.reserve(snapshots.size());
    uint64_t invalid = 0;
    for (const auto& snapshot : snapshots) {
        if (is_valid_snapshot(snapshot)) {
            valid.push_back(&snapshot);
        } else {
            ++invalid;
            SENTINEL_LOG_DEBUG("Ignoring snapshot for pool '{}' with non-positive price {}",
                               snapshot.pool_id, snapshot.price_a);
        }
    }

    std::vector<Opportunity> candidates;
    uint64_t compared = 0;
    for (size_t i = 0; i < valid.size(); ++i) {
        for (size_t j = i + 1; j < valid.size(); ++j) {
            if (!same_asset_pair(*valid[i], *valid[j])) {
                continue;
            }
            ++compared;
            auto opportunity = analyze_pair(*valid[i], *valid[j], params, now);
            if (opportunity) {
                candidates.push_back(std::move(*opportunity));
            }
        }
    }

    std::vector<Opportunity> emitted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.detection_runs;
        stats_.pairs_compared += compared;
        stats_.invalid_snapshots += invalid;

        purge_expired_locked(now);

        for (auto& candidate : candidates) {
            if (active_.count(candidate.id) > 0) {
                ++stats_.skipped_duplicate;
                continue;
            }
            active_.emplace(candidate.id, candidate);
            ++stats_.emitted;
            emitted.push_back(std::move(candidate));
        }
    }

    for (const auto& opportunity : emitted) {
        TradingLogger::log_opportunity_detected(opportunity.id, opportunity.asset_pair(),
                                                opportunity.spread_percentage,
                                                opportunity.estimated_profit);
    }
    return emitted;
}

std::optional<Opportunity> OpportunityDetector::analyze_pair(const PoolSnapshot& first,
                                                             const PoolSnapshot& second,
                                                             const DynamicParameters& params,
                                                             Timestamp now) {
    // Both quotes in the first pool's orientation
    const double first_price = first.price_a;
    const double second_price = second.price_of(first.asset_a);
    if (!(second_price > 0.0) || !std::isfinite(second_price)) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.skipped_unquoted;
        return std::nullopt;
    }

    const double spread = std::fabs(first_price - second_price);
    const double spread_percentage = spread / std::min(first_price, second_price);

    // Coarse floor only; the decision gate makes the real call later
    if (spread_percentage < params.min_spread_threshold * 0.5) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.skipped_below_floor;
        return std::nullopt;
    }

    const double trade_amount = config_.default_trade_amount;
    const double buy_price = std::min(first_price, second_price);
    const double sell_price = std::max(first_price, second_price);
    const double gross_profit = trade_amount * (sell_price - buy_price);
    const double fees = config_.gas_estimate + trade_amount * config_.flash_loan_fee;
    const double estimated_profit = gross_profit - fees;

    if (estimated_profit < 0.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.skipped_unprofitable;
        return std::nullopt;
    }

    Opportunity opportunity;
    opportunity.id = make_opportunity_id(first.pool_id, second.pool_id, now);
    opportunity.pool_a = first;
    opportunity.pool_b = second;
    opportunity.buy_price = buy_price;
    opportunity.sell_price = sell_price;
    opportunity.spread = spread;
    opportunity.spread_percentage = spread_percentage;
    opportunity.estimated_profit = estimated_profit;
    opportunity.gas_estimate = config_.gas_estimate;
    opportunity.trade_amount = trade_amount;
    opportunity.approved = false;
    opportunity.created_at = now;
    opportunity.expires_at = now + ttl_;
    return opportunity;
}

size_t OpportunityDetector::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return purge_expired_locked(clock_->now());
}

size_t OpportunityDetector::purge_expired_locked(Timestamp now) {
    size_t removed = 0;
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->second.is_expired(now)) {
            it = active_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.expired += removed;
    return removed;
}

std::vector<Opportunity> OpportunityDetector::active_opportunities() const {
    const Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Opportunity> result;
    result.reserve(active_.size());
    for (const auto& [id, opportunity] : active_) {
        if (!opportunity.is_expired(now)) {
            result.push_back(opportunity);
        }
    }
    std::sort(result.begin(), result.end(), [](const Opportunity& a, const Opportunity& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
    });
    return result;
}

size_t OpportunityDetector::active_count() const {
    const Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(active_.begin(), active_.end(), [now](const auto& entry) {
        return !entry.second.is_expired(now);
    }));
}

std::optional<Opportunity> OpportunityDetector::find(const std::string& id) const {
    const Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end() || it->second.is_expired(now)) {
        return std::nullopt;
    }
    return it->second;
}

bool OpportunityDetector::mark_approved(const std::string& id, double trade_amount) {
    const Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end() || it->second.is_expired(now)) {
        return false;
    }
    it->second.approved = true;
    it->second.trade_amount = trade_amount;
    return true;
}

DetectionStats OpportunityDetector::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace sentinel
