/**
 * @file main.cpp
 * @brief Main entry point for the Wealth Projection Engine
 *
 * Command-line application that loads a holdings snapshot, projects its
 * growth, simulates outcomes, and reports health, attribution and tax.
 */

#include "analytics/attribution.hpp"
#include "analytics/health_scorer.hpp"
#include "analytics/portfolio_summary.hpp"
#include "analytics/tax_estimator.hpp"
#include "data/snapshot_loader.hpp"
#include "projection/growth_projector.hpp"
#include "projection/portfolio_aggregator.hpp"
#include "simulation/monte_carlo_simulator.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace wealth;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Wealth Projection Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --snapshot PATH       Holdings snapshot, .json or .csv (required)\n"
              << "  --config PATH         Engine configuration JSON file\n"
              << "  --facts PATH          Financial facts JSON file (income, expenses, ...)\n"
              << "  --milestones PATH     Net-worth milestones JSON file\n"
              << "  --output PATH         Write projection.csv and analytics.json to this directory\n"
              << "  --seed N              Seed for the Monte Carlo simulation\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --snapshot data/snapshots/sample_snapshot.json --verbose\n"
              << "  " << program_name << " --snapshot data/snapshots/sample_snapshot.json"
              << " --config data/config/engine_config.json --facts data/facts/sample_facts.json"
              << " --output results --seed 42\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Wealth Projection Engine v1.0.0                          \n"
              << "       Projection, Simulation and Portfolio Analytics           \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string snapshot_path;
    std::string config_path;
    std::string facts_path;
    std::string milestones_path;
    std::string output_dir;
    std::optional<std::uint64_t> seed;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--snapshot" && i + 1 < argc)
            {
                args.snapshot_path = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--facts" && i + 1 < argc)
            {
                args.facts_path = argv[++i];
            }
            else if (arg == "--milestones" && i + 1 < argc)
            {
                args.milestones_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--seed" && i + 1 < argc)
            {
                args.seed = std::stoull(argv[++i]);
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !snapshot_path.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Inputs
        // ====================================================================
        std::cout << "[1/7] Loading inputs..." << std::endl;

        EngineConfig config;
        if (!args.config_path.empty())
        {
            config = SnapshotLoader::load_config(args.config_path);
        }

        auto snapshot = SnapshotLoader::load_snapshot(args.snapshot_path);

        analytics::FinancialFacts facts;
        if (!args.facts_path.empty())
        {
            facts = SnapshotLoader::load_facts(args.facts_path);
        }

        std::vector<analytics::Milestone> milestones;
        if (!args.milestones_path.empty())
        {
            milestones = SnapshotLoader::load_milestones(args.milestones_path);
        }

        std::cout << "  - Loaded " << snapshot.holdings.size() << " holdings valued on "
                  << snapshot.valuation_date << std::endl;

        if (args.verbose)
        {
            std::cout << "  - Config: " << (args.config_path.empty() ? "(defaults)" : args.config_path) << "\n";
            std::cout << "  - Horizon: " << config.projection.horizon_years << " years\n";
            std::cout << "  - Facts: " << (args.facts_path.empty() ? "(none)" : args.facts_path) << "\n";
            std::cout << "  - Milestones: " << milestones.size() << "\n";
        }

        // ====================================================================
        // 2. Portfolio Summary
        // ====================================================================
        std::cout << "[2/7] Summarizing portfolio..." << std::endl;

        auto summary = analytics::PortfolioSummary::from_snapshot(snapshot);
        summary.print_summary();

        // ====================================================================
        // 3. Growth Projection
        // ====================================================================
        std::cout << "\n[3/7] Projecting growth..." << std::endl;

        auto requests = projection::GrowthProjector::build_requests(snapshot, config.projection);
        projection::PortfolioProjection portfolio_projection;

        if (requests.empty())
        {
            std::cout << "  - Snapshot is empty, nothing to project\n";
        }
        else
        {
            if (args.verbose)
            {
                for (const auto &request : requests)
                {
                    std::cout << "  - " << std::left << std::setw(16) << data::to_string(request.category)
                              << std::right << std::fixed << std::setprecision(2)
                              << " value " << request.current_value
                              << ", growth " << request.annual_growth_rate_pct << "%"
                              << ", monthly contribution " << request.periodic_contribution << "\n";
                }
            }

            portfolio_projection = projection::PortfolioAggregator::project_portfolio(requests);
            portfolio_projection.print_summary();
        }

        // ====================================================================
        // 4. Monte Carlo Simulation
        // ====================================================================
        std::cout << "\n[4/7] Running Monte Carlo simulation..." << std::endl;

        simulation::MonteCarloResult monte_carlo;
        bool simulated = false;

        if (summary.total_net_worth > 0.0)
        {
            simulation::MonteCarloParams params;
            params.starting_value = summary.total_net_worth;
            params.expected_return_pct =
                simulation::MonteCarloSimulator::blended_expected_return(snapshot, config.projection);
            params.volatility_pct = config.monte_carlo.default_volatility_pct;
            params.horizon_years = config.monte_carlo.default_horizon_years;
            params.simulation_count = config.monte_carlo.default_simulation_count;
            params.seed = args.seed;

            for (const auto &holding : snapshot.holdings)
            {
                params.annual_contribution += holding.monthly_contribution() * projection::MONTHS_PER_YEAR;
            }

            if (args.verbose)
            {
                std::cout << "  - Expected return: " << std::fixed << std::setprecision(2)
                          << params.expected_return_pct << "%\n";
                std::cout << "  - Volatility: " << params.volatility_pct << "%\n";
                std::cout << "  - Paths: " << params.simulation_count
                          << " over " << params.horizon_years << " years\n";
            }

            simulation::MonteCarloSimulator simulator(config.monte_carlo);
            monte_carlo = simulator.simulate(params);
            monte_carlo.print_summary();
            simulated = true;
        }
        else
        {
            std::cout << "  - Net worth is zero, skipping simulation\n";
        }

        // ====================================================================
        // 5. Financial Health
        // ====================================================================
        std::cout << "\n[5/7] Scoring financial health..." << std::endl;

        analytics::HealthScorer scorer(config.health);
        auto health = scorer.score(snapshot, facts);
        std::cout << health.report();

        // ====================================================================
        // 6. Performance Attribution
        // ====================================================================
        std::cout << "\n[6/7] Attributing performance..." << std::endl;

        analytics::AttributionConfig attribution_config = config.attribution;
        attribution_config.verbose = attribution_config.verbose || args.verbose;
        analytics::AttributionAnalyzer analyzer(attribution_config);
        auto attribution = analyzer.attribute(snapshot);
        std::cout << attribution.report();

        // ====================================================================
        // 7. Tax Estimate
        // ====================================================================
        std::cout << "\n[7/7] Estimating capital gains tax..." << std::endl;

        auto tax = analytics::TaxEstimator::estimate(snapshot, config.tax);
        std::cout << tax.report();

        // ---- Milestones
        auto progress = analytics::track_milestones(summary, milestones, portfolio_projection.totals,
                                                    snapshot.valuation_date);
        if (!progress.empty())
        {
            std::cout << "\nMilestones:\n";
            for (const auto &entry : progress)
            {
                std::cout << "  " << std::left << std::setw(24) << entry.name << std::right
                          << std::fixed << std::setprecision(1) << std::setw(6) << entry.progress_pct << "%";
                if (entry.achieved)
                {
                    std::cout << "  achieved";
                }
                else if (entry.projected_year)
                {
                    std::cout << "  year " << *entry.projected_year
                              << (entry.on_track ? " (on track)" : " (behind)");
                }
                else
                {
                    std::cout << "  not reached within horizon";
                }
                std::cout << "\n";
            }
        }

        // ====================================================================
        // Export
        // ====================================================================
        if (!args.output_dir.empty())
        {
            std::filesystem::create_directories(args.output_dir);

            if (!portfolio_projection.totals.empty())
            {
                std::string projection_file = args.output_dir + "/projection.csv";
                portfolio_projection.export_to_csv(projection_file);
                std::cout << "\n  Projection exported to: " << projection_file << "\n";
            }

            nlohmann::json analytics_json;
            analytics_json["valuation_date"] = snapshot.valuation_date;
            analytics_json["summary"] = summary.to_json();
            analytics_json["projection"] = portfolio_projection.to_json();
            analytics_json["monte_carlo"] = simulated ? monte_carlo.to_json() : nlohmann::json();
            analytics_json["health"] = health.to_json();
            analytics_json["attribution"] = attribution.to_json();
            analytics_json["tax"] = tax.to_json();
            analytics_json["milestones"] = nlohmann::json::array();
            for (const auto &entry : progress)
            {
                analytics_json["milestones"].push_back(entry.to_json());
            }

            std::string analytics_file = args.output_dir + "/analytics.json";
            SnapshotLoader::save_json(analytics_json, analytics_file);
            std::cout << "  Analytics exported to: " << analytics_file << "\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
