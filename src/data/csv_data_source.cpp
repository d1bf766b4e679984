#include "bomcast/data/csv_data_source.hpp"

#include "bomcast/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace bomcast::data {

namespace {

std::string trim(const std::string &text) {
	const auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
	const auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); });
	if (begin >= end.base()) {
		return {};
	}
	return std::string(begin, end.base());
}

std::vector<std::string> splitLine(const std::string &line) {
	std::vector<std::string> fields;
	std::string current;
	bool quoted = false;
	for (std::size_t i = 0; i < line.size(); ++i) {
		const char c = line[i];
		if (quoted) {
			if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
				current.push_back('"');
				++i;
			} else if (c == '"') {
				quoted = false;
			} else {
				current.push_back(c);
			}
		} else if (c == '"') {
			quoted = true;
		} else if (c == ',') {
			fields.push_back(trim(current));
			current.clear();
		} else {
			current.push_back(c);
		}
	}
	fields.push_back(trim(current));
	return fields;
}

bool fileExists(const std::string &path) {
	std::ifstream file(path);
	return file.good();
}

} // namespace

CsvTable CsvTable::read(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw UpstreamDataError("Cannot open " + path);
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	return parse(buffer.str(), path);
}

CsvTable CsvTable::parse(const std::string &text, const std::string &name) {
	CsvTable table;
	table.name_ = name;

	std::istringstream stream(text);
	std::string line;
	std::size_t line_number = 0;
	bool have_header = false;
	while (std::getline(stream, line)) {
		++line_number;
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (trim(line).empty()) {
			continue;
		}
		auto fields = splitLine(line);
		if (!have_header) {
			for (std::size_t i = 0; i < fields.size(); ++i) {
				table.columns_.emplace(fields[i], i);
			}
			have_header = true;
			continue;
		}
		fields.resize(std::max(fields.size(), table.columns_.size()));
		table.rows_.push_back(std::move(fields));
		table.line_numbers_.push_back(line_number);
	}
	if (!have_header) {
		throw UpstreamDataError(name + " has no header row.");
	}
	return table;
}

void CsvTable::fail(std::size_t row, const std::string &message) const {
	throw UpstreamDataError(name_ + ":" + std::to_string(line_numbers_[row]) + ": " + message);
}

const std::string &CsvTable::field(std::size_t row, const std::string &column) const {
	auto it = columns_.find(column);
	if (it == columns_.end()) {
		throw UpstreamDataError(name_ + " is missing column '" + column + "'.");
	}
	return rows_.at(row)[it->second];
}

double CsvTable::number(std::size_t row, const std::string &column) const {
	auto value = optionalNumber(row, column);
	if (!value) {
		fail(row, "empty value in column '" + column + "'");
	}
	return *value;
}

std::optional<double> CsvTable::optionalNumber(std::size_t row, const std::string &column) const {
	const auto &text = field(row, column);
	if (text.empty()) {
		return std::nullopt;
	}
	try {
		std::size_t consumed = 0;
		const double value = std::stod(text, &consumed);
		if (consumed != text.size()) {
			fail(row, "trailing characters in '" + text + "'");
		}
		return value;
	} catch (const std::invalid_argument &) {
		fail(row, "'" + text + "' is not a number");
	} catch (const std::out_of_range &) {
		fail(row, "'" + text + "' is out of range");
	}
}

TimePoint CsvTable::date(std::size_t row, const std::string &column) const {
	const auto &text = field(row, column);
	try {
		return core::calendar::parseIsoDate(text);
	} catch (const std::invalid_argument &e) {
		fail(row, e.what());
	}
}

CsvDataSource::CsvDataSource(std::string directory) : directory_(std::move(directory)) {
}

std::string CsvDataSource::pathOf(const std::string &file) const {
	if (directory_.empty() || directory_.back() == '/') {
		return directory_ + file;
	}
	return directory_ + "/" + file;
}

PlanningInputs CsvDataSource::load() {
	PlanningInputs inputs;

	const auto totals = CsvTable::read(pathOf("weekly_totals.csv"));
	for (std::size_t r = 0; r < totals.rowCount(); ++r) {
		WeeklyTotalRow row;
		row.week = totals.date(r, "week");
		row.order_count = totals.number(r, "orders");
		row.revenue = totals.optionalNumber(r, "revenue").value_or(0.0);
		if (totals.hasColumn("unique_customers")) {
			row.distinct_customers = totals.optionalNumber(r, "unique_customers").value_or(0.0);
		}
		if (totals.hasColumn("aov")) {
			row.average_order_value = totals.optionalNumber(r, "aov");
		}
		inputs.weekly_totals.push_back(row);
	}

	const auto units = CsvTable::read(pathOf("weekly_product_units.csv"));
	for (std::size_t r = 0; r < units.rowCount(); ++r) {
		inputs.product_units.push_back(
		    ProductUnitsRow{units.date(r, "week"), units.field(r, "product_name"), units.number(r, "units")});
	}

	const auto sizes = CsvTable::read(pathOf("size_mix.csv"));
	for (std::size_t r = 0; r < sizes.rowCount(); ++r) {
		const auto &size = sizes.field(r, "size");
		inputs.size_mix.push_back(MixRow{sizes.field(r, "product_name"), size, size, sizes.number(r, "units")});
	}

	const auto variations = CsvTable::read(pathOf("variation_mix.csv"));
	for (std::size_t r = 0; r < variations.rowCount(); ++r) {
		inputs.variation_mix.push_back(MixRow{variations.field(r, "product_name"), variations.field(r, "variation_id"),
		                                      variations.field(r, "colour"), variations.number(r, "units")});
	}

	const auto bom = CsvTable::read(pathOf("bom_lines.csv"));
	for (std::size_t r = 0; r < bom.rowCount(); ++r) {
		planning::BomLine line;
		line.product = bom.field(r, "product_name");
		line.variation = bom.field(r, "variation_id");
		line.size = bom.field(r, "size");
		line.fabric_colour_code = bom.field(r, "fc_code");
		line.fabric.fabric_name = bom.field(r, "fabric_name");
		line.fabric.unit = bom.field(r, "fabric_unit");
		line.fabric.colour_name = bom.field(r, "fabric_colour");
		line.fabric.cost_per_unit = bom.optionalNumber(r, "cost_per_unit").value_or(0.0);
		line.qty_per_unit = bom.number(r, "qty_per_unit");
		line.wastage_percent = bom.optionalNumber(r, "wastage_percent");
		inputs.bom_lines.push_back(std::move(line));
	}

	const auto stock = CsvTable::read(pathOf("fabric_stock.csv"));
	for (std::size_t r = 0; r < stock.rowCount(); ++r) {
		StockRow row;
		row.fabric_colour_code = stock.field(r, "fc_code");
		row.fabric.fabric_name = stock.field(r, "fabric_name");
		row.fabric.unit = stock.field(r, "fabric_unit");
		row.fabric.colour_name = stock.field(r, "fabric_colour");
		row.balance = stock.optionalNumber(r, "current_balance");
		inputs.fabric_stock.push_back(std::move(row));
	}

	if (fileExists(pathOf("weekly_fabric_consumption.csv"))) {
		const auto consumption = CsvTable::read(pathOf("weekly_fabric_consumption.csv"));
		for (std::size_t r = 0; r < consumption.rowCount(); ++r) {
			inputs.fabric_consumption.push_back(FabricConsumptionRow{
			    consumption.date(r, "week"), consumption.field(r, "fc_code"), consumption.number(r, "quantity")});
		}
	}
	if (fileExists(pathOf("product_fabric_consumption.csv"))) {
		const auto drivers = CsvTable::read(pathOf("product_fabric_consumption.csv"));
		for (std::size_t r = 0; r < drivers.rowCount(); ++r) {
			inputs.product_fabric_consumption.push_back(ProductFabricConsumptionRow{
			    drivers.field(r, "fc_code"), drivers.field(r, "product_name"), drivers.number(r, "quantity")});
		}
	}

	BOMCAST_INFO("Loaded {} weekly totals, {} product rows and {} BOM lines from {}.", inputs.weekly_totals.size(),
	             inputs.product_units.size(), inputs.bom_lines.size(), directory_);
	return inputs;
}

} // namespace bomcast::data
