/**
 * @file test_attribution.cpp
 * @brief Unit tests for AttributionAnalyzer
 */

#include <catch2/catch.hpp>
#include "analytics/attribution.hpp"
#include "common/errors.hpp"

using namespace wealth;
using namespace wealth::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::Holding make_holding(const std::string& name, data::AssetCategory category,
                           double cost, double value) {
    data::Holding h;
    h.id = name;
    h.name = name;
    h.category = category;
    h.cost_basis = cost;
    h.current_value = value;
    h.acquisition_date = "2022-08-01";
    return h;
}

data::HoldingSnapshot make_snapshot(std::vector<data::Holding> holdings) {
    data::HoldingSnapshot snapshot;
    snapshot.valuation_date = "2024-06-30";
    snapshot.holdings = std::move(holdings);
    return snapshot;
}

} // namespace

TEST_CASE("Two holding attribution", "[Attribution]") {
    auto snapshot = make_snapshot({
        make_holding("Winner", data::AssetCategory::EQUITIES, 100.0, 150.0),
        make_holding("Loser", data::AssetCategory::EQUITIES, 200.0, 150.0)});

    AttributionAnalyzer analyzer;
    auto result = analyzer.attribute(snapshot);

    REQUIRE(result.best_performers.size() == 2);
    REQUIRE(result.best_performers[0].name == "Winner");
    REQUIRE_THAT(result.best_performers[0].return_percentage, WithinAbs(50.0, 1e-12));
    REQUIRE_THAT(result.best_performers[1].return_percentage, WithinAbs(-25.0, 1e-12));

    const auto& equities = result.sector_analysis.at(data::AssetCategory::EQUITIES);
    REQUIRE_THAT(equities.allocation_percentage, WithinAbs(100.0, 1e-12));
    // Count-weighted: (50 - 25) / 2
    REQUIRE_THAT(equities.average_return, WithinAbs(12.5, 1e-12));
    REQUIRE(equities.holding_count == 2);

    // Value-weighted: 0 gain on 300 invested
    REQUIRE_THAT(result.portfolio_return_pct, WithinAbs(0.0, 1e-12));
}

TEST_CASE("Sector breakdown", "[Attribution]") {
    auto snapshot = make_snapshot({
        make_holding("Fund", data::AssetCategory::POOLED_FUNDS, 1000.0, 1200.0),
        make_holding("Gold", data::AssetCategory::PRECIOUS_METALS, 500.0, 600.0),
        make_holding("Bond", data::AssetCategory::FIXED_INCOME, 200.0, 200.0)});

    auto result = AttributionAnalyzer().attribute(snapshot);

    REQUIRE(result.sector_analysis.size() == 3);
    double allocation_total = 0.0;
    for (const auto& [category, sector] : result.sector_analysis) {
        allocation_total += sector.allocation_percentage;
    }
    REQUIRE_THAT(allocation_total, WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(result.sector_analysis.at(data::AssetCategory::POOLED_FUNDS).allocation_percentage,
                 WithinAbs(60.0, 1e-9));
    REQUIRE_THAT(result.sector_analysis.at(data::AssetCategory::PRECIOUS_METALS).average_return,
                 WithinAbs(20.0, 1e-9));
    REQUIRE_THAT(result.portfolio_return_pct, WithinAbs(300.0 / 1700.0 * 100.0, 1e-9));
}

TEST_CASE("Ranking order", "[Attribution]") {
    auto snapshot = make_snapshot({
        make_holding("A", data::AssetCategory::EQUITIES, 100.0, 110.0),
        make_holding("B", data::AssetCategory::CRYPTO_ASSETS, 100.0, 300.0),
        make_holding("C", data::AssetCategory::EQUITIES, 100.0, 90.0),
        make_holding("D", data::AssetCategory::REAL_ESTATE, 100.0, 110.0),
        make_holding("E", data::AssetCategory::OTHER, 100.0, 150.0)});

    auto ranked = AttributionAnalyzer::rank_by_return(snapshot);
    REQUIRE(ranked.size() == 5);
    for (size_t i = 1; i < ranked.size(); ++i) {
        REQUIRE(ranked[i - 1].return_percentage >= ranked[i].return_percentage);
    }

    SECTION("Ties keep snapshot order") {
        REQUIRE(ranked[2].name == "A");
        REQUIRE(ranked[3].name == "D");
    }

    SECTION("Top-k limits best performers") {
        AttributionConfig config;
        config.top_k = 2;
        auto result = AttributionAnalyzer(config).attribute(snapshot);
        REQUIRE(result.best_performers.size() == 2);
        REQUIRE(result.best_performers[0].name == "B");
        REQUIRE(result.best_performers[1].name == "E");
    }

    SECTION("Invalid top-k") {
        AttributionConfig config;
        config.top_k = 0;
        REQUIRE_THROWS_AS(AttributionAnalyzer(config), ConfigurationError);
    }
}

TEST_CASE("Invalid holdings are rejected before attribution", "[Attribution]") {
    AttributionAnalyzer analyzer;

    SECTION("Negative cost basis is rejected") {
        auto snapshot = make_snapshot({
            make_holding("Odd", data::AssetCategory::EQUITIES, -100.0, 150.0),
            make_holding("Fine", data::AssetCategory::EQUITIES, 200.0, 250.0)});
        REQUIRE_THROWS_AS(analyzer.attribute(snapshot), ValidationError);
    }

    SECTION("Negative current value is rejected") {
        auto snapshot = make_snapshot({
            make_holding("Fine", data::AssetCategory::EQUITIES, 100.0, 150.0),
            make_holding("Odd", data::AssetCategory::CRYPTO_ASSETS, 200.0, -50.0)});
        REQUIRE_THROWS_AS(analyzer.attribute(snapshot), ValidationError);
    }

    SECTION("Missing valuation date is rejected") {
        REQUIRE_THROWS_AS(analyzer.attribute(data::HoldingSnapshot{}), ValidationError);
    }
}

TEST_CASE("Zero cost basis holdings", "[Attribution]") {
    auto snapshot = make_snapshot({
        make_holding("Gifted", data::AssetCategory::EQUITIES, 0.0, 500.0),
        make_holding("Bought", data::AssetCategory::EQUITIES, 400.0, 500.0)});

    auto result = AttributionAnalyzer().attribute(snapshot);

    REQUIRE(result.best_performers.size() == 1);
    REQUIRE(result.best_performers[0].name == "Bought");
    REQUIRE(result.excluded_holdings == std::vector<std::string>{"Gifted"});

    const auto& equities = result.sector_analysis.at(data::AssetCategory::EQUITIES);
    REQUIRE(equities.holding_count == 2);
    REQUIRE(equities.returns_counted == 1);
    REQUIRE_THAT(equities.current_value, WithinAbs(1000.0, 1e-12));
    REQUIRE_THAT(equities.average_return, WithinAbs(25.0, 1e-12));

    auto report = result.report();
    REQUIRE(report.find("Excluded (no cost basis): Gifted") != std::string::npos);
}

TEST_CASE("Empty snapshot attribution", "[Attribution]") {
    auto result = AttributionAnalyzer().attribute(make_snapshot({}));
    REQUIRE(result.best_performers.empty());
    REQUIRE(result.sector_analysis.empty());
    REQUIRE(result.portfolio_return_pct == 0.0);

    auto j = result.to_json();
    REQUIRE(j["best_performers"].empty());
}
