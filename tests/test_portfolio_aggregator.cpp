/**
 * @file test_portfolio_aggregator.cpp
 * @brief Unit tests for PortfolioAggregator and PortfolioProjection export
 */

#include <catch2/catch.hpp>
#include "common/errors.hpp"
#include "projection/portfolio_aggregator.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace wealth;
using namespace wealth::projection;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

ProjectionRequest make_request(data::AssetCategory category, double value, double growth, int horizon) {
    ProjectionRequest request;
    request.category = category;
    request.current_value = value;
    request.annual_growth_rate_pct = growth;
    request.horizon_years = horizon;
    return request;
}

} // namespace

TEST_CASE("Aggregate sums category trajectories", "[PortfolioAggregator]") {
    auto a = GrowthProjector::project(1000.0, 10.0, 0.0, 100.0, 0.0, 5);
    auto b = GrowthProjector::project(2000.0, 6.0, 50.0, 0.0, 0.0, 5);

    auto totals = PortfolioAggregator::aggregate({a, b}, 5);

    REQUIRE(totals.size() == 5);
    for (int y = 0; y < 5; ++y) {
        REQUIRE(totals[y].year == y + 1);
        REQUIRE_THAT(totals[y].total_value, WithinRel(a[y].total_value + b[y].total_value, 1e-12));
        REQUIRE_THAT(totals[y].contribution_value,
                     WithinRel(a[y].contribution_value + b[y].contribution_value, 1e-12));
        REQUIRE_THAT(totals[y].lumpsum_value, WithinRel(a[y].lumpsum_value + b[y].lumpsum_value, 1e-12));
    }
}

TEST_CASE("Aggregate rejects inconsistent input", "[PortfolioAggregator]") {
    SECTION("Empty input") {
        REQUIRE_THROWS_AS(PortfolioAggregator::aggregate({}, 5), ValidationError);
    }

    SECTION("Trajectory length differs from horizon") {
        auto a = GrowthProjector::project(1000.0, 10.0, 0.0, 0.0, 0.0, 5);
        auto b = GrowthProjector::project(1000.0, 10.0, 0.0, 0.0, 0.0, 4);
        REQUIRE_THROWS_AS(PortfolioAggregator::aggregate({a, b}, 5), ConfigurationError);
    }

    SECTION("Requests with mismatched horizons") {
        std::vector<ProjectionRequest> requests = {
            make_request(data::AssetCategory::EQUITIES, 1000.0, 12.0, 10),
            make_request(data::AssetCategory::FIXED_INCOME, 1000.0, 6.0, 8)};
        try {
            PortfolioAggregator::project_portfolio(requests);
            FAIL("Expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.category() == "fixed_income");
        }
    }

    SECTION("No requests") {
        REQUIRE_THROWS_AS(PortfolioAggregator::project_portfolio({}), ValidationError);
    }
}

TEST_CASE("Portfolio projection", "[PortfolioAggregator]") {
    std::vector<ProjectionRequest> requests = {
        make_request(data::AssetCategory::EQUITIES, 100000.0, 10.0, 3),
        make_request(data::AssetCategory::FIXED_INCOME, 50000.0, 0.0, 3)};

    auto projection = PortfolioAggregator::project_portfolio(requests);

    REQUIRE(projection.categories.size() == 2);
    REQUIRE(projection.totals.size() == 3);
    REQUIRE_THAT(projection.totals[0].total_value, WithinAbs(160000.0, 1e-6));
    REQUIRE_THAT(projection.final_value(), WithinAbs(100000.0 * 1.331 + 50000.0, 1e-6));

    auto j = projection.to_json();
    REQUIRE(j["totals"].size() == 3);
    REQUIRE(j["categories"].size() == 2);
}

TEST_CASE("Projection CSV export", "[PortfolioAggregator]") {
    auto projection = PortfolioAggregator::project_portfolio(
        {make_request(data::AssetCategory::EQUITIES, 1000.0, 0.0, 2)});

    auto dir = std::filesystem::temp_directory_path() / "wealth_engine_projection_test";
    std::filesystem::remove_all(dir);
    auto file = (dir / "nested" / "projection.csv").string();

    projection.export_to_csv(file);
    REQUIRE(std::filesystem::exists(file));

    std::ifstream in(file);
    std::string line;
    std::getline(in, line);
    REQUIRE(line == "year,total_value,contribution_value,lumpsum_value");
    std::getline(in, line);
    REQUIRE(line == "1,1000.00,0.00,1000.00");
    std::getline(in, line);
    REQUIRE(line == "2,1000.00,0.00,1000.00");

    std::filesystem::remove_all(dir);
}
