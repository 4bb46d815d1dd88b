/**
 * @file snapshot_loader.hpp
 * @brief Loads holdings snapshots, financial facts, milestones and engine configuration.
 *
 * These are file adapters for the command-line driver. The analytics
 * components themselves only ever see the in-memory structures.
 */

#ifndef WEALTH_DATA_SNAPSHOT_LOADER_HPP
#define WEALTH_DATA_SNAPSHOT_LOADER_HPP

#include "analytics/attribution.hpp"
#include "analytics/health_scorer.hpp"
#include "analytics/portfolio_summary.hpp"
#include "analytics/tax_estimator.hpp"
#include "data/holding.hpp"
#include "projection/growth_projector.hpp"
#include "simulation/monte_carlo_simulator.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace wealth {

/**
 * @struct EngineConfig
 * @brief Complete engine configuration. Every section is optional.
 */
struct EngineConfig {
    projection::ProjectionSettings projection;
    simulation::MonteCarloConfig monte_carlo;
    analytics::HealthConfig health;
    analytics::TaxConfig tax = analytics::TaxConfig::default_config();
    analytics::AttributionConfig attribution;

    static EngineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    /**
     * @brief Load complete configuration from JSON file
     */
    static EngineConfig load_from_file(const std::string& config_path);
};

/**
 * @class SnapshotLoader
 * @brief Reads engine inputs from JSON and CSV files.
 *
 * Snapshot CSV layout (header required, columns matched by name):
 * id,name,category,cost_basis,current_value,acquisition_date,sip_amount,sip_start_date,step_up_pct,sip_active
 *
 * The last four columns are optional. A row with an empty or zero
 * sip_amount carries no contribution schedule.
 */
class SnapshotLoader {
public:
    SnapshotLoader() = default;
    ~SnapshotLoader() = default;

    // ========================================================================
    // Snapshots
    // ========================================================================

    /**
     * @brief Load a snapshot, choosing the format from the file extension.
     * @param filepath .json or .csv file
     * @param valuation_date Valuation date for CSV files (default: today)
     * @throws std::runtime_error if the file cannot be read
     * @throws ValidationError if the contents are invalid
     */
    static data::HoldingSnapshot load_snapshot(const std::string& filepath,
                                               const std::string& valuation_date = "");

    static data::HoldingSnapshot load_snapshot_json(const std::string& filepath);

    static data::HoldingSnapshot load_snapshot_csv(const std::string& filepath,
                                                   const std::string& valuation_date = "");

    // ========================================================================
    // Other inputs
    // ========================================================================

    /** @brief Facts object; missing keys stay unset. */
    static analytics::FinancialFacts load_facts(const std::string& filepath);

    /** @brief Array of milestones, or an object with a "milestones" array. */
    static std::vector<analytics::Milestone> load_milestones(const std::string& filepath);

    /**
     * @brief Load engine configuration.
     * @throws ConfigurationError for invalid sections
     */
    static EngineConfig load_config(const std::string& config_path);

    // ========================================================================
    // JSON helpers
    // ========================================================================

    /**
     * @brief Parse a JSON file.
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Write JSON with two-space indentation, creating parent directories.
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_json(const nlohmann::json& j, const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);
    static double parse_number(const std::string& field, const std::string& value);
    static bool parse_bool(const std::string& field, const std::string& value);
};

} // namespace wealth

#endif // WEALTH_DATA_SNAPSHOT_LOADER_HPP
