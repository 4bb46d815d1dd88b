/**
 * @file snapshot_loader.cpp
 * @brief Implementation of SnapshotLoader and EngineConfig
 */

#include "data/snapshot_loader.hpp"

#include "common/errors.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>

namespace wealth
{

    // =============================================
    // EngineConfig
    // =============================================

    EngineConfig EngineConfig::from_json(const nlohmann::json &j)
    {
        EngineConfig config;

        try
        {
            if (j.contains("projection"))
            {
                config.projection = projection::ProjectionSettings::from_json(j["projection"]);
            }

            if (j.contains("monte_carlo"))
            {
                config.monte_carlo = simulation::MonteCarloConfig::from_json(j["monte_carlo"]);
            }

            if (j.contains("health"))
            {
                config.health = analytics::HealthConfig::from_json(j["health"]);
            }

            if (j.contains("tax"))
            {
                config.tax = analytics::TaxConfig::from_json(j["tax"]);
            }

            if (j.contains("attribution"))
            {
                config.attribution = analytics::AttributionConfig::from_json(j["attribution"]);
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ConfigurationError("config", "Invalid value type: " + std::string(e.what()));
        }
        catch (const ValidationError &e)
        {
            throw ConfigurationError(e.field(), e.message());
        }

        return config;
    }

    nlohmann::json EngineConfig::to_json() const
    {
        return nlohmann::json{
            {"projection", projection.to_json()},
            {"monte_carlo", monte_carlo.to_json()},
            {"health", health.to_json()},
            {"tax", tax.to_json()},
            {"attribution", attribution.to_json()}};
    }

    EngineConfig EngineConfig::load_from_file(const std::string &config_path)
    {
        return SnapshotLoader::load_config(config_path);
    }

    // ===========================
    // Snapshots
    // ===========================

    data::HoldingSnapshot SnapshotLoader::load_snapshot(const std::string &filepath,
                                                        const std::string &valuation_date)
    {
        std::string extension = std::filesystem::path(filepath).extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c)
                       { return std::tolower(c); });

        if (extension == ".csv")
        {
            return load_snapshot_csv(filepath, valuation_date);
        }
        return load_snapshot_json(filepath);
    }

    data::HoldingSnapshot SnapshotLoader::load_snapshot_json(const std::string &filepath)
    {
        auto j = load_json(filepath);
        try
        {
            return data::HoldingSnapshot::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ValidationError("snapshot", "Invalid value type in " + filepath + ": " + e.what());
        }
    }

    data::HoldingSnapshot SnapshotLoader::load_snapshot_csv(const std::string &filepath,
                                                            const std::string &valuation_date)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        // Map column names to positions
        std::map<std::string, size_t> columns;
        auto header = parse_csv_line(line);
        for (size_t i = 0; i < header.size(); ++i)
        {
            columns[trim(header[i])] = i;
        }
        for (const char *required : {"name", "category", "cost_basis", "current_value", "acquisition_date"})
        {
            if (columns.find(required) == columns.end())
            {
                throw ValidationError(required, "CSV header is missing column '" + std::string(required) + "'");
            }
        }

        data::HoldingSnapshot snapshot;
        snapshot.valuation_date = valuation_date.empty() ? data::today() : valuation_date;

        int row = 1;
        while (std::getline(file, line))
        {
            ++row;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            auto field = [&](const std::string &name) -> std::string
            {
                auto it = columns.find(name);
                if (it == columns.end() || it->second >= fields.size())
                {
                    return "";
                }
                return trim(fields[it->second]);
            };

            const std::string context = "row " + std::to_string(row) + ".";

            data::Holding holding;
            holding.id = field("id").empty() ? std::to_string(row - 1) : field("id");
            holding.name = field("name");
            holding.category = data::parse_category(field("category"));
            holding.cost_basis = parse_number(context + "cost_basis", field("cost_basis"));
            holding.current_value = parse_number(context + "current_value", field("current_value"));
            holding.acquisition_date = field("acquisition_date");

            const std::string sip_amount = field("sip_amount");
            if (!sip_amount.empty() && parse_number(context + "sip_amount", sip_amount) > 0.0)
            {
                data::ContributionSchedule schedule;
                schedule.amount = parse_number(context + "sip_amount", sip_amount);
                schedule.start_date = field("sip_start_date");
                const std::string step_up = field("step_up_pct");
                schedule.step_up_pct = step_up.empty() ? 0.0 : parse_number(context + "step_up_pct", step_up);
                const std::string active = field("sip_active");
                schedule.active = active.empty() ? true : parse_bool(context + "sip_active", active);
                holding.contribution = schedule;
            }

            snapshot.holdings.push_back(holding);
        }

        snapshot.validate();
        return snapshot;
    }

    // ================
    // Other inputs
    // ================

    analytics::FinancialFacts SnapshotLoader::load_facts(const std::string &filepath)
    {
        return analytics::FinancialFacts::from_json(load_json(filepath));
    }

    std::vector<analytics::Milestone> SnapshotLoader::load_milestones(const std::string &filepath)
    {
        auto j = load_json(filepath);
        const nlohmann::json &list = j.is_object() && j.contains("milestones") ? j["milestones"] : j;
        if (!list.is_array())
        {
            throw ValidationError("milestones", "Expected an array of milestones in " + filepath);
        }

        std::vector<analytics::Milestone> milestones;
        for (const auto &entry : list)
        {
            milestones.push_back(analytics::Milestone::from_json(entry));
        }
        return milestones;
    }

    EngineConfig SnapshotLoader::load_config(const std::string &config_path)
    {
        return EngineConfig::from_json(load_json(config_path));
    }

    // ================
    // JSON helpers
    // ================

    nlohmann::json SnapshotLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
        }

        return j;
    }

    void SnapshotLoader::save_json(const nlohmann::json &j, const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }
        file << j.dump(2) << "\n";
    }

    // ================
    // Private helpers
    // ================

    std::vector<std::string> SnapshotLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string SnapshotLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double SnapshotLoader::parse_number(const std::string &field, const std::string &value)
    {
        size_t consumed = 0;
        double parsed = 0.0;
        try
        {
            parsed = std::stod(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw ValidationError(field, "Expected a number, got: '" + value + "'");
        }
        if (consumed != value.size())
        {
            throw ValidationError(field, "Expected a number, got: '" + value + "'");
        }
        return parsed;
    }

    bool SnapshotLoader::parse_bool(const std::string &field, const std::string &value)
    {
        std::string s = value;
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return std::tolower(c); });
        if (s == "1" || s == "true" || s == "yes" || s == "y")
            return true;
        if (s == "0" || s == "false" || s == "no" || s == "n")
            return false;
        throw ValidationError(field, "Expected true/false, yes/no or 1/0, got: '" + value + "'");
    }

} // namespace wealth
