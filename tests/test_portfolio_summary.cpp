/**
 * @file test_portfolio_summary.cpp
 * @brief Unit tests for PortfolioSummary and milestone tracking
 */

#include <catch2/catch.hpp>
#include "analytics/portfolio_summary.hpp"
#include "common/errors.hpp"
#include <nlohmann/json.hpp>

using namespace wealth;
using namespace wealth::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::HoldingSnapshot sample_snapshot() {
    data::Holding fund;
    fund.id = "1";
    fund.name = "Fund";
    fund.category = data::AssetCategory::POOLED_FUNDS;
    fund.cost_basis = 60000.0;
    fund.current_value = 90000.0;
    fund.acquisition_date = "2021-01-01";

    data::Holding deposit = fund;
    deposit.id = "2";
    deposit.name = "Deposit";
    deposit.category = data::AssetCategory::FIXED_INCOME;
    deposit.cost_basis = 40000.0;
    deposit.current_value = 30000.0;

    data::HoldingSnapshot snapshot;
    snapshot.valuation_date = "2024-06-30";
    snapshot.holdings = {fund, deposit};
    return snapshot;
}

std::vector<projection::ProjectionPoint> linear_projection(double start, double step, int years) {
    std::vector<projection::ProjectionPoint> points;
    for (int y = 1; y <= years; ++y) {
        projection::ProjectionPoint point;
        point.year = y;
        point.total_value = start + step * y;
        point.lumpsum_value = point.total_value;
        points.push_back(point);
    }
    return points;
}

} // namespace

TEST_CASE("Portfolio summary", "[PortfolioSummary]") {
    auto summary = PortfolioSummary::from_snapshot(sample_snapshot());

    REQUIRE_THAT(summary.total_net_worth, WithinAbs(120000.0, 1e-9));
    REQUIRE_THAT(summary.total_investment, WithinAbs(100000.0, 1e-9));
    REQUIRE_THAT(summary.total_gain_loss, WithinAbs(20000.0, 1e-9));
    REQUIRE_THAT(summary.gain_loss_percentage, WithinAbs(20.0, 1e-9));
    REQUIRE(summary.asset_allocation.size() == 2);
    REQUIRE_THAT(summary.asset_allocation.at(data::AssetCategory::FIXED_INCOME), WithinAbs(30000.0, 1e-9));

    SECTION("JSON output") {
        auto j = summary.to_json();
        REQUIRE(j["asset_allocation"].contains("pooled_funds"));
        REQUIRE(j["asset_allocation"].contains("fixed_income"));
    }

    SECTION("Nothing invested") {
        auto empty = PortfolioSummary::from_snapshot(data::HoldingSnapshot{});
        REQUIRE(empty.total_net_worth == 0.0);
        REQUIRE(empty.gain_loss_percentage == 0.0);
        REQUIRE(empty.asset_allocation.empty());
    }
}

TEST_CASE("Milestone tracking", "[PortfolioSummary]") {
    auto summary = PortfolioSummary::from_snapshot(sample_snapshot());
    auto projection = linear_projection(120000.0, 40000.0, 10);

    std::vector<Milestone> milestones = {
        {"Emergency corpus", 100000.0, "2025-01-01"},
        {"Down payment", 240000.0, "2028-06-30"},
        {"Early target", 400000.0, "2026-01-01"},
        {"Out of reach", 10000000.0, "2040-01-01"}};

    auto progress = track_milestones(summary, milestones, projection, "2024-06-30");
    REQUIRE(progress.size() == 4);

    SECTION("Already achieved milestone is capped at 100%") {
        REQUIRE(progress[0].achieved);
        REQUIRE(progress[0].progress_pct == 100.0);
        REQUIRE(progress[0].projected_year == 0);
        REQUIRE(progress[0].on_track);
    }

    SECTION("Milestone reached within the target date") {
        REQUIRE_FALSE(progress[1].achieved);
        REQUIRE_THAT(progress[1].progress_pct, WithinAbs(50.0, 1e-9));
        REQUIRE(progress[1].projected_year == 3);
        REQUIRE(progress[1].on_track);
    }

    SECTION("Milestone reached after the target date") {
        REQUIRE(progress[2].projected_year == 7);
        REQUIRE_FALSE(progress[2].on_track);
    }

    SECTION("Milestone beyond the projection horizon") {
        REQUIRE_FALSE(progress[3].projected_year.has_value());
        REQUIRE_FALSE(progress[3].on_track);
        auto j = progress[3].to_json();
        REQUIRE(j["projected_year"].is_null());
    }
}

TEST_CASE("Milestone validation", "[PortfolioSummary]") {
    auto summary = PortfolioSummary::from_snapshot(sample_snapshot());

    SECTION("Non-positive target") {
        std::vector<Milestone> milestones = {{"Zero", 0.0, "2030-01-01"}};
        REQUIRE_THROWS_AS(track_milestones(summary, milestones, {}, "2024-06-30"), ValidationError);
    }

    SECTION("Malformed target date") {
        REQUIRE_THROWS_AS(Milestone::from_json(nlohmann::json::parse(
                              R"({"name": "Bad", "target_amount": 1000, "target_date": "2030-13-01"})")),
                          ValidationError);
    }

    SECTION("No milestones needs no valuation date") {
        REQUIRE(track_milestones(summary, {}, {}, "").empty());
    }
}
