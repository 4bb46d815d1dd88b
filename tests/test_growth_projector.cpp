/**
 * @file test_growth_projector.cpp
 * @brief Unit tests for GrowthProjector and ProjectionSettings
 */

#include <catch2/catch.hpp>
#include "common/errors.hpp"
#include "projection/growth_projector.hpp"
#include <nlohmann/json.hpp>

using namespace wealth;
using namespace wealth::projection;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

data::Holding make_holding(const std::string& name, data::AssetCategory category,
                           double cost, double value) {
    data::Holding h;
    h.id = name;
    h.name = name;
    h.category = category;
    h.cost_basis = cost;
    h.current_value = value;
    h.acquisition_date = "2022-01-10";
    return h;
}

} // namespace

TEST_CASE("Projection shape", "[GrowthProjector]") {
    auto points = GrowthProjector::project(50000.0, 12.0, 1000.0, 500.0, 5.0, 15);

    REQUIRE(points.size() == 15);
    for (size_t i = 0; i < points.size(); ++i) {
        REQUIRE(points[i].year == static_cast<int>(i) + 1);
        REQUIRE_THAT(points[i].total_value,
                     WithinRel(points[i].contribution_value + points[i].lumpsum_value, 1e-12));
    }
}

TEST_CASE("Projection values", "[GrowthProjector]") {
    SECTION("Zero growth and no flows stays flat") {
        auto points = GrowthProjector::project(250000.0, 0.0, 0.0, 0.0, 0.0, 10);
        for (const auto& point : points) {
            REQUIRE_THAT(point.total_value, WithinAbs(250000.0, 1e-9));
            REQUIRE(point.contribution_value == 0.0);
        }
    }

    SECTION("Ten percent for one year") {
        auto points = GrowthProjector::project(100000.0, 10.0, 0.0, 0.0, 0.0, 1);
        REQUIRE(points.size() == 1);
        REQUIRE_THAT(points[0].total_value, WithinAbs(110000.0, 1e-6));
    }

    SECTION("Contributions at zero growth accumulate linearly") {
        auto points = GrowthProjector::project(0.0, 0.0, 0.0, 1000.0, 0.0, 3);
        REQUIRE_THAT(points[0].contribution_value, WithinAbs(12000.0, 1e-9));
        REQUIRE_THAT(points[2].contribution_value, WithinAbs(36000.0, 1e-9));
    }

    SECTION("Step-up raises the monthly deposit each year") {
        auto points = GrowthProjector::project(0.0, 0.0, 0.0, 1000.0, 10.0, 2);
        // 12 * 1000 + 12 * 1100
        REQUIRE_THAT(points[1].contribution_value, WithinAbs(25200.0, 1e-9));
    }

    SECTION("Lump-sum is added before the year's growth") {
        auto points = GrowthProjector::project(0.0, 10.0, 1000.0, 0.0, 0.0, 1);
        REQUIRE_THAT(points[0].lumpsum_value, WithinAbs(1100.0, 1e-6));
    }

    SECTION("Positive growth is monotonic") {
        auto points = GrowthProjector::project(10000.0, 8.0, 0.0, 200.0, 0.0, 20);
        for (size_t i = 1; i < points.size(); ++i) {
            REQUIRE(points[i].total_value > points[i - 1].total_value);
        }
    }
}

TEST_CASE("Projection validation", "[GrowthProjector]") {
    REQUIRE_THROWS_AS(GrowthProjector::project(1000.0, 10.0, 0.0, 0.0, 0.0, 0), ValidationError);
    REQUIRE_THROWS_AS(GrowthProjector::project(1000.0, 10.0, 0.0, 0.0, 0.0, 51), ValidationError);
    REQUIRE_THROWS_AS(GrowthProjector::project(-1.0, 10.0, 0.0, 0.0, 0.0, 5), ValidationError);
    REQUIRE_THROWS_AS(GrowthProjector::project(1000.0, -100.0, 0.0, 0.0, 0.0, 5), ValidationError);
    REQUIRE_THROWS_AS(GrowthProjector::project(1000.0, 10.0, -5.0, 0.0, 0.0, 5), ValidationError);
    REQUIRE_THROWS_AS(GrowthProjector::project(1000.0, 10.0, 0.0, -5.0, 0.0, 5), ValidationError);

    SECTION("Request errors name the category") {
        ProjectionRequest request;
        request.category = data::AssetCategory::CRYPTO_ASSETS;
        request.current_value = -10.0;
        request.horizon_years = 5;
        try {
            GrowthProjector::project(request);
            FAIL("Expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.field() == "crypto_assets.current_value");
        }
    }
}

TEST_CASE("Projection settings", "[GrowthProjector]") {
    SECTION("Default growth rates") {
        ProjectionSettings settings;
        REQUIRE(settings.growth_rate_for(data::AssetCategory::EQUITIES) == 12.0);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::POOLED_FUNDS) == 10.0);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::CRYPTO_ASSETS) == 15.0);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::REAL_ESTATE) == 8.0);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::FIXED_INCOME) == 6.0);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::PRECIOUS_METALS) == 8.0);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::OTHER) == 7.0);
    }

    SECTION("JSON overrides") {
        auto j = nlohmann::json::parse(R"({
            "horizon_years": 25,
            "lumpsum_fraction": 0.0,
            "growth_rates_pct": {"stocks": 9.5}
        })");
        auto settings = ProjectionSettings::from_json(j);
        REQUIRE(settings.horizon_years == 25);
        REQUIRE(settings.lumpsum_fraction == 0.0);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::EQUITIES) == 9.5);
        REQUIRE(settings.growth_rate_for(data::AssetCategory::FIXED_INCOME) == 6.0);
    }

    SECTION("Invalid horizon") {
        auto j = nlohmann::json::parse(R"({"horizon_years": 80})");
        REQUIRE_THROWS_AS(ProjectionSettings::from_json(j), ValidationError);
    }
}

TEST_CASE("Requests from a snapshot", "[GrowthProjector]") {
    data::HoldingSnapshot snapshot;
    snapshot.valuation_date = "2024-06-30";

    auto fund_a = make_holding("Fund A", data::AssetCategory::POOLED_FUNDS, 10000.0, 12000.0);
    fund_a.contribution = data::ContributionSchedule{2000.0, "2022-02-01", 10.0, true};
    auto fund_b = make_holding("Fund B", data::AssetCategory::POOLED_FUNDS, 5000.0, 8000.0);
    fund_b.contribution = data::ContributionSchedule{1000.0, "2022-02-01", 0.0, true};
    auto fund_c = make_holding("Fund C", data::AssetCategory::POOLED_FUNDS, 5000.0, 5000.0);
    fund_c.contribution = data::ContributionSchedule{4000.0, "2022-02-01", 50.0, false};
    auto stock = make_holding("Stock", data::AssetCategory::EQUITIES, 3000.0, 4000.0);

    snapshot.holdings = {fund_a, fund_b, fund_c, stock};

    ProjectionSettings settings;
    settings.horizon_years = 7;
    auto requests = GrowthProjector::build_requests(snapshot, settings);

    REQUIRE(requests.size() == 2);
    for (const auto& request : requests) {
        REQUIRE(request.horizon_years == 7);
        if (request.category == data::AssetCategory::POOLED_FUNDS) {
            REQUIRE_THAT(request.current_value, WithinAbs(25000.0, 1e-9));
            REQUIRE_THAT(request.periodic_contribution, WithinAbs(3000.0, 1e-9));
            REQUIRE_THAT(request.step_up_pct, WithinAbs(5.0, 1e-9));
            REQUIRE_THAT(request.annual_lumpsum, WithinAbs(1250.0, 1e-9));
            REQUIRE(request.annual_growth_rate_pct == 10.0);
        } else {
            REQUIRE(request.category == data::AssetCategory::EQUITIES);
            REQUIRE(request.periodic_contribution == 0.0);
            REQUIRE(request.step_up_pct == 0.0);
        }
    }
}
