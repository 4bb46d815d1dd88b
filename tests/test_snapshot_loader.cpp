/**
 * @file test_snapshot_loader.cpp
 * @brief Unit tests for holdings, dates and SnapshotLoader
 */

#include <catch2/catch.hpp>
#include "common/errors.hpp"
#include "data/date_utils.hpp"
#include "data/snapshot_loader.hpp"
#include <filesystem>
#include <fstream>
#include <future>
#include <vector>

using namespace wealth;
using Catch::Matchers::WithinAbs;

namespace {

std::filesystem::path test_dir() {
    auto dir = std::filesystem::temp_directory_path() / "wealth_engine_loader_test";
    std::filesystem::create_directories(dir);
    return dir;
}

std::string write_file(const std::string& name, const std::string& contents) {
    auto path = test_dir() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

} // namespace

TEST_CASE("Date utilities", "[Dates]") {
    SECTION("Validation") {
        REQUIRE(data::is_valid_date("2024-02-29"));
        REQUIRE_FALSE(data::is_valid_date("2023-02-29"));
        REQUIRE_FALSE(data::is_valid_date("2024-13-01"));
        REQUIRE_FALSE(data::is_valid_date("2024/01/01"));
        REQUIRE_FALSE(data::is_valid_date(""));
        REQUIRE_THROWS_AS(data::require_valid_date("date", "01-01-2024"), ValidationError);
    }

    SECTION("Components") {
        REQUIRE(data::extract_year("2024-06-30") == 2024);
        REQUIRE(data::extract_month("2024-06-30") == 6);
        REQUIRE(data::extract_day("2024-06-30") == 30);
    }

    SECTION("Day arithmetic") {
        REQUIRE(data::days_between("2024-01-01", "2025-01-01") == 366);
        REQUIRE(data::days_between("2023-01-01", "2024-01-01") == 365);
        REQUIRE(data::days_between("2024-03-10", "2024-03-01") == -9);
        REQUIRE(data::add_days("2024-02-28", 1) == "2024-02-29");
        REQUIRE(data::add_days("2024-03-01", -1) == "2024-02-29");
        REQUIRE(data::is_valid_date(data::today()));
    }

    SECTION("Today from several threads") {
        std::vector<std::future<std::string>> futures;
        for (int i = 0; i < 8; ++i) {
            futures.push_back(std::async(std::launch::async, [] { return data::today(); }));
        }
        for (auto& f : futures) {
            REQUIRE(data::is_valid_date(f.get()));
        }
    }
}

TEST_CASE("Holding parsing", "[Holding]") {
    SECTION("Category aliases") {
        REQUIRE(data::parse_category("Stocks") == data::AssetCategory::EQUITIES);
        REQUIRE(data::parse_category("mutual_funds") == data::AssetCategory::POOLED_FUNDS);
        REQUIRE(data::parse_category("cryptocurrency") == data::AssetCategory::CRYPTO_ASSETS);
        REQUIRE(data::parse_category("fixed_deposits") == data::AssetCategory::FIXED_INCOME);
        REQUIRE(data::parse_category("gold") == data::AssetCategory::PRECIOUS_METALS);
        REQUIRE(data::parse_category("others") == data::AssetCategory::OTHER);
        REQUIRE_THROWS_AS(data::parse_category("bonds_and_stuff"), ValidationError);
    }

    SECTION("Legacy field names") {
        auto j = nlohmann::json::parse(R"({
            "id": 7,
            "name": "Bluechip Fund",
            "asset_type": "mutual_funds",
            "purchase_value": 10000,
            "current_value": 12500,
            "purchase_date": "2022-04-01",
            "monthly_sip_amount": 2000,
            "sip_start_date": "2022-05-01",
            "step_up_percentage": 10,
            "is_sip_active": true
        })");
        auto h = data::Holding::from_json(j);
        REQUIRE(h.id == "7");
        REQUIRE(h.category == data::AssetCategory::POOLED_FUNDS);
        REQUIRE(h.cost_basis == 10000.0);
        REQUIRE(h.acquisition_date == "2022-04-01");
        REQUIRE(h.has_active_contribution());
        REQUIRE(h.monthly_contribution() == 2000.0);
        REQUIRE(h.contribution->step_up_pct == 10.0);
        REQUIRE_THAT(h.return_percentage(), WithinAbs(25.0, 1e-12));
        REQUIRE(h.holding_period_days("2023-04-01") == 365);
    }

    SECTION("Legacy field names with null SIP start date") {
        auto j = nlohmann::json::parse(R"({
            "valuation_date": "2024-06-30",
            "holdings": [{
                "id": 3,
                "name": "Liquid Fund",
                "asset_type": "mutual_funds",
                "purchase_value": 5000,
                "current_value": 5200,
                "purchase_date": "2023-01-15",
                "monthly_sip_amount": 500,
                "sip_start_date": null,
                "step_up_percentage": null,
                "is_sip_active": true
            }]
        })");
        auto snapshot = data::HoldingSnapshot::from_json(j);
        REQUIRE(snapshot.holdings.size() == 1);
        const auto& h = snapshot.holdings[0];
        REQUIRE(h.has_active_contribution());
        REQUIRE(h.contribution->start_date.empty());
        REQUIRE(h.contribution->step_up_pct == 0.0);
        REQUIRE(h.monthly_contribution() == 500.0);
    }

    SECTION("Wrongly typed fields raise ValidationError") {
        auto bad_date = nlohmann::json::parse(R"({
            "name": "X", "category": "equities", "cost_basis": 10,
            "current_value": 12, "acquisition_date": 20220401
        })");
        REQUIRE_THROWS_AS(data::Holding::from_json(bad_date), ValidationError);

        auto bad_schedule = nlohmann::json::parse(R"({
            "name": "X", "category": "equities", "cost_basis": 10,
            "current_value": 12, "acquisition_date": "2022-04-01",
            "contribution": {"amount": "lots"}
        })");
        REQUIRE_THROWS_AS(data::Holding::from_json(bad_schedule), ValidationError);
    }

    SECTION("Return on zero cost basis is undefined") {
        data::Holding h;
        h.current_value = 100.0;
        REQUIRE_THROWS_AS(h.return_percentage(), ValidationError);
    }

    SECTION("Missing current value") {
        auto j = nlohmann::json::parse(R"({"name": "X", "category": "equities", "cost_basis": 10})");
        REQUIRE_THROWS_AS(data::Holding::from_json(j), ValidationError);
    }
}

TEST_CASE("Snapshot validation", "[Holding]") {
    auto valid = nlohmann::json::parse(R"({
        "valuation_date": "2024-06-30",
        "holdings": [
            {"id": "a", "name": "A", "category": "equities", "cost_basis": 100,
             "current_value": 120, "acquisition_date": "2023-01-01"}
        ]
    })");

    SECTION("Valid snapshot") {
        auto snapshot = data::HoldingSnapshot::from_json(valid);
        REQUIRE(snapshot.holdings.size() == 1);
        REQUIRE(snapshot.valuation_date == "2024-06-30");
        REQUIRE_NOTHROW(snapshot.validate());
    }

    SECTION("Negative values") {
        auto j = valid;
        j["holdings"][0]["current_value"] = -5;
        REQUIRE_THROWS_AS(data::HoldingSnapshot::from_json(j), ValidationError);
    }

    SECTION("Malformed acquisition date") {
        auto j = valid;
        j["holdings"][0]["acquisition_date"] = "2023-02-30";
        REQUIRE_THROWS_AS(data::HoldingSnapshot::from_json(j), ValidationError);
    }

    SECTION("Acquired after valuation") {
        auto j = valid;
        j["holdings"][0]["acquisition_date"] = "2024-07-01";
        REQUIRE_THROWS_AS(data::HoldingSnapshot::from_json(j), ValidationError);
    }

    SECTION("Missing holdings array") {
        REQUIRE_THROWS_AS(data::HoldingSnapshot::from_json(nlohmann::json::parse(R"({"valuation_date": "2024-06-30"})")),
                          ValidationError);
    }
}

TEST_CASE("Snapshot files", "[SnapshotLoader]") {
    SECTION("JSON snapshot") {
        auto path = write_file("snapshot.json", R"({
            "valuation_date": "2024-06-30",
            "holdings": [
                {"id": "a", "name": "A", "category": "equities", "cost_basis": 100,
                 "current_value": 120, "acquisition_date": "2023-01-01",
                 "contribution": {"amount": 500, "start_date": "2023-02-01", "step_up_pct": 5}},
                {"id": "b", "name": "B", "category": "gold", "cost_basis": 50,
                 "current_value": 40, "acquisition_date": "2022-01-01"}
            ]
        })");
        auto snapshot = SnapshotLoader::load_snapshot(path);
        REQUIRE(snapshot.holdings.size() == 2);
        REQUIRE(snapshot.holdings[0].monthly_contribution() == 500.0);
        REQUIRE(snapshot.holdings[1].category == data::AssetCategory::PRECIOUS_METALS);
        REQUIRE_THAT(snapshot.total_current_value(), WithinAbs(160.0, 1e-12));
    }

    SECTION("CSV snapshot") {
        auto path = write_file("snapshot.csv",
                               "id,name,category,cost_basis,current_value,acquisition_date,sip_amount,sip_start_date,step_up_pct,sip_active\n"
                               "1,\"Index Fund, Direct\",pooled_funds,1000,1300,2022-01-01,200,2022-02-01,10,true\n"
                               "2,Deposit,fixed_income,500,520,2023-05-01,,,,\n"
                               "\n"
                               "3,Paused Plan,mutual_funds,300,330,2023-05-01,100,2023-06-01,0,no\n");
        auto snapshot = SnapshotLoader::load_snapshot(path, "2024-06-30");

        REQUIRE(snapshot.valuation_date == "2024-06-30");
        REQUIRE(snapshot.holdings.size() == 3);
        REQUIRE(snapshot.holdings[0].name == "Index Fund, Direct");
        REQUIRE(snapshot.holdings[0].has_active_contribution());
        REQUIRE(snapshot.holdings[0].contribution->step_up_pct == 10.0);
        REQUIRE_FALSE(snapshot.holdings[1].contribution.has_value());
        REQUIRE(snapshot.holdings[2].contribution.has_value());
        REQUIRE_FALSE(snapshot.holdings[2].has_active_contribution());
    }

    SECTION("CSV with a bad number") {
        auto path = write_file("bad.csv",
                               "name,category,cost_basis,current_value,acquisition_date\n"
                               "A,equities,12x,100,2023-01-01\n");
        REQUIRE_THROWS_AS(SnapshotLoader::load_snapshot_csv(path, "2024-06-30"), ValidationError);
    }

    SECTION("CSV with an unrecognised SIP flag") {
        auto path = write_file("flag.csv",
                               "name,category,cost_basis,current_value,acquisition_date,sip_amount,sip_active\n"
                               "A,equities,100,120,2023-01-01,50,on\n");
        REQUIRE_THROWS_AS(SnapshotLoader::load_snapshot_csv(path, "2024-06-30"), ValidationError);
    }

    SECTION("CSV missing a required column") {
        auto path = write_file("short.csv", "name,category,current_value\nA,equities,100\n");
        REQUIRE_THROWS_AS(SnapshotLoader::load_snapshot_csv(path, "2024-06-30"), ValidationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(SnapshotLoader::load_snapshot((test_dir() / "nope.json").string()), std::runtime_error);
    }

    SECTION("Malformed JSON") {
        auto path = write_file("broken.json", "{\"holdings\": [");
        REQUIRE_THROWS_AS(SnapshotLoader::load_json(path), std::runtime_error);
    }
}

TEST_CASE("Facts, milestones and configuration files", "[SnapshotLoader]") {
    SECTION("Facts with missing keys") {
        auto path = write_file("facts.json", R"({"monthly_income": 90000, "monthly_expenses": 50000})");
        auto facts = SnapshotLoader::load_facts(path);
        REQUIRE(facts.monthly_income == 90000.0);
        REQUIRE(facts.monthly_expenses == 50000.0);
        REQUIRE_FALSE(facts.emergency_fund.has_value());
        REQUIRE_FALSE(facts.monthly_debt_payments.has_value());
    }

    SECTION("Milestones object") {
        auto path = write_file("milestones.json", R"({"milestones": [
            {"name": "House", "target_amount": 5000000, "target_date": "2030-01-01"}
        ]})");
        auto milestones = SnapshotLoader::load_milestones(path);
        REQUIRE(milestones.size() == 1);
        REQUIRE(milestones[0].name == "House");
    }

    SECTION("Partial configuration keeps defaults") {
        auto path = write_file("config.json", R"({
            "projection": {"horizon_years": 20},
            "tax": {"short_term_rate_pct": 20}
        })");
        auto config = SnapshotLoader::load_config(path);
        REQUIRE(config.projection.horizon_years == 20);
        REQUIRE(config.tax.short_term_rate_pct == 20.0);
        REQUIRE(config.tax.holding_period_days.size() == 7);
        REQUIRE(config.monte_carlo.default_simulation_count == 5000);
        REQUIRE(config.attribution.top_k == 5);
    }

    SECTION("Invalid configuration section") {
        auto path = write_file("bad_config.json", R"({"projection": {"horizon_years": 0}})");
        REQUIRE_THROWS_AS(SnapshotLoader::load_config(path), ConfigurationError);
    }

    SECTION("Round trip through save_json") {
        EngineConfig config;
        config.projection.horizon_years = 12;
        auto path = (test_dir() / "out" / "config.json").string();
        SnapshotLoader::save_json(config.to_json(), path);
        auto loaded = EngineConfig::load_from_file(path);
        REQUIRE(loaded.projection.horizon_years == 12);
        REQUIRE(loaded.tax.long_term_exemption == 100000.0);
    }
}
