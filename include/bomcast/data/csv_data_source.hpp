#pragma once

#include "bomcast/data/data_source.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bomcast::data {

/**
 * @class CsvTable
 * @brief A header-addressed CSV file held in memory.
 *
 * Fields are trimmed; double-quoted fields may contain commas and doubled
 * quotes. Blank lines are skipped.
 */
class CsvTable {
public:
	/// @throws UpstreamDataError If the file cannot be opened or has no header.
	static CsvTable read(const std::string &path);
	static CsvTable parse(const std::string &text, const std::string &name);

	std::size_t rowCount() const {
		return rows_.size();
	}
	bool hasColumn(const std::string &column) const {
		return columns_.count(column) > 0;
	}

	const std::string &field(std::size_t row, const std::string &column) const;
	double number(std::size_t row, const std::string &column) const;
	/// Empty fields read as nullopt.
	std::optional<double> optionalNumber(std::size_t row, const std::string &column) const;
	TimePoint date(std::size_t row, const std::string &column) const;

	const std::string &name() const {
		return name_;
	}

private:
	[[noreturn]] void fail(std::size_t row, const std::string &message) const;

	std::string name_;
	std::unordered_map<std::string, std::size_t> columns_;
	std::vector<std::vector<std::string>> rows_;
	std::vector<std::size_t> line_numbers_;
};

/**
 * @class CsvDataSource
 * @brief Reads the planning tables from CSV files in one directory.
 *
 * Required: weekly_totals.csv, weekly_product_units.csv, size_mix.csv,
 * variation_mix.csv, bom_lines.csv, fabric_stock.csv. Optional:
 * weekly_fabric_consumption.csv and product_fabric_consumption.csv.
 */
class CsvDataSource final : public IDataSource {
public:
	explicit CsvDataSource(std::string directory);

	PlanningInputs load() override;

	std::string describe() const override {
		return "csv:" + directory_;
	}

private:
	std::string pathOf(const std::string &file) const;

	std::string directory_;
};

} // namespace bomcast::data
