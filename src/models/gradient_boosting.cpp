#include "bomcast/models/gradient_boosting.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace bomcast::models {

namespace {

constexpr double kMinSplitGain = 1e-12;
constexpr double kTieTolerance = 1e-12;

} // namespace

RegressionTree::RegressionTree(int max_depth, double reg_lambda, int min_child_rows)
    : max_depth_(max_depth), reg_lambda_(reg_lambda), min_child_rows_(std::max(1, min_child_rows)) {
	if (max_depth < 1) {
		throw std::invalid_argument("Tree depth must be at least 1.");
	}
	if (reg_lambda < 0.0) {
		throw std::invalid_argument("Leaf regularisation must be non-negative.");
	}
}

void RegressionTree::fit(const Eigen::MatrixXd &features, const Eigen::VectorXd &gradients,
                         const std::vector<Eigen::Index> &rows, const std::vector<Eigen::Index> &columns) {
	if (rows.empty()) {
		throw std::invalid_argument("Cannot fit a tree on zero rows.");
	}
	columns_ = columns;
	nodes_.clear();
	build(features, gradients, rows, 0);
}

double RegressionTree::leafWeight(double gradient_sum, std::size_t count) const {
	return -gradient_sum / (static_cast<double>(count) + reg_lambda_);
}

int RegressionTree::build(const Eigen::MatrixXd &features, const Eigen::VectorXd &gradients,
                          std::vector<Eigen::Index> rows, int depth) {
	const int index = static_cast<int>(nodes_.size());
	nodes_.emplace_back();

	double gradient_sum = 0.0;
	for (auto row : rows) {
		gradient_sum += gradients[row];
	}

	if (depth >= max_depth_ || rows.size() < static_cast<std::size_t>(2 * min_child_rows_)) {
		nodes_[index].value = leafWeight(gradient_sum, rows.size());
		return index;
	}

	const Split split = findBestSplit(features, gradients, rows);
	if (split.feature < 0 || split.gain <= kMinSplitGain) {
		nodes_[index].value = leafWeight(gradient_sum, rows.size());
		return index;
	}

	std::vector<Eigen::Index> left_rows;
	std::vector<Eigen::Index> right_rows;
	for (auto row : rows) {
		if (features(row, split.feature) <= split.threshold) {
			left_rows.push_back(row);
		} else {
			right_rows.push_back(row);
		}
	}
	rows.clear();
	rows.shrink_to_fit();

	// nodes_ may reallocate while children are built, so write through the index.
	const int left = build(features, gradients, std::move(left_rows), depth + 1);
	const int right = build(features, gradients, std::move(right_rows), depth + 1);
	nodes_[index].leaf = false;
	nodes_[index].feature = split.feature;
	nodes_[index].threshold = split.threshold;
	nodes_[index].left = left;
	nodes_[index].right = right;
	return index;
}

RegressionTree::Split RegressionTree::findBestSplit(const Eigen::MatrixXd &features, const Eigen::VectorXd &gradients,
                                                    const std::vector<Eigen::Index> &rows) const {
	const std::size_t n = rows.size();
	double total = 0.0;
	for (auto row : rows) {
		total += gradients[row];
	}
	const double parent_score = total * total / (static_cast<double>(n) + reg_lambda_);

	Split best;
	std::vector<Eigen::Index> order(rows);
	for (auto column : columns_) {
		std::sort(order.begin(), order.end(),
		          [&](Eigen::Index a, Eigen::Index b) { return features(a, column) < features(b, column); });

		double left_sum = 0.0;
		for (std::size_t i = 0; i + 1 < n; ++i) {
			left_sum += gradients[order[i]];
			const double current = features(order[i], column);
			const double next = features(order[i + 1], column);
			if (next - current <= kTieTolerance) {
				continue;
			}
			const std::size_t left_count = i + 1;
			const std::size_t right_count = n - left_count;
			if (left_count < static_cast<std::size_t>(min_child_rows_) ||
			    right_count < static_cast<std::size_t>(min_child_rows_)) {
				continue;
			}
			const double right_sum = total - left_sum;
			const double gain = 0.5 * (left_sum * left_sum / (static_cast<double>(left_count) + reg_lambda_) +
			                           right_sum * right_sum / (static_cast<double>(right_count) + reg_lambda_) -
			                           parent_score);
			if (gain > best.gain) {
				best.gain = gain;
				best.feature = column;
				best.threshold = 0.5 * (current + next);
			}
		}
	}
	return best;
}

double RegressionTree::predict(const Eigen::Ref<const Eigen::RowVectorXd> &row) const {
	if (nodes_.empty()) {
		return 0.0;
	}
	int index = 0;
	while (!nodes_[index].leaf) {
		const Node &node = nodes_[index];
		index = row[node.feature] <= node.threshold ? node.left : node.right;
	}
	return nodes_[index].value;
}

std::size_t RegressionTree::leafCount() const {
	return static_cast<std::size_t>(std::count_if(nodes_.begin(), nodes_.end(), [](const Node &n) { return n.leaf; }));
}

GradientBoostedRegressor::GradientBoostedRegressor(BoostingParams params) : params_(params) {
	if (params_.n_estimators < 1) {
		throw std::invalid_argument("Boosting requires at least one estimator.");
	}
	if (params_.learning_rate <= 0.0) {
		throw std::invalid_argument("Learning rate must be positive.");
	}
	if (params_.subsample <= 0.0 || params_.subsample > 1.0) {
		throw std::invalid_argument("Row subsample must be in (0, 1].");
	}
	if (params_.colsample <= 0.0 || params_.colsample > 1.0) {
		throw std::invalid_argument("Column subsample must be in (0, 1].");
	}
}

std::vector<Eigen::Index> GradientBoostedRegressor::sampleIndices(Eigen::Index total, double fraction,
                                                                  std::mt19937 &rng) const {
	std::vector<Eigen::Index> indices(static_cast<std::size_t>(total));
	std::iota(indices.begin(), indices.end(), Eigen::Index{0});
	const auto keep = std::max<Eigen::Index>(1, static_cast<Eigen::Index>(std::floor(fraction * total)));
	if (keep >= total) {
		return indices;
	}
	std::shuffle(indices.begin(), indices.end(), rng);
	indices.resize(static_cast<std::size_t>(keep));
	std::sort(indices.begin(), indices.end());
	return indices;
}

void GradientBoostedRegressor::fit(const Eigen::MatrixXd &features, const Eigen::VectorXd &target) {
	if (features.rows() == 0 || features.cols() == 0) {
		throw std::invalid_argument("Cannot fit a boosted model on an empty feature matrix.");
	}
	if (features.rows() != target.size()) {
		throw std::invalid_argument("Feature rows and target length differ.");
	}
	if (!features.allFinite() || !target.allFinite()) {
		throw std::invalid_argument("Boosted model inputs must be finite.");
	}

	fitted_ = false;
	trees_.clear();
	trees_.reserve(static_cast<std::size_t>(params_.n_estimators));
	feature_count_ = features.cols();
	base_score_ = target.mean();

	std::mt19937 rng(params_.seed);
	Eigen::VectorXd prediction = Eigen::VectorXd::Constant(target.size(), base_score_);
	for (int round = 0; round < params_.n_estimators; ++round) {
		const Eigen::VectorXd gradients = prediction - target;
		const auto rows = sampleIndices(features.rows(), params_.subsample, rng);
		const auto columns = sampleIndices(features.cols(), params_.colsample, rng);

		RegressionTree tree(params_.max_depth, params_.reg_lambda, params_.min_child_rows);
		tree.fit(features, gradients, rows, columns);
		for (Eigen::Index i = 0; i < features.rows(); ++i) {
			prediction[i] += params_.learning_rate * tree.predict(features.row(i));
		}
		trees_.push_back(std::move(tree));
	}
	fitted_ = true;
}

double GradientBoostedRegressor::predict(const Eigen::Ref<const Eigen::RowVectorXd> &row) const {
	if (!fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (row.size() != feature_count_) {
		throw std::invalid_argument("Feature row width does not match the fitted model.");
	}
	double value = base_score_;
	for (const auto &tree : trees_) {
		value += params_.learning_rate * tree.predict(row);
	}
	return value;
}

Eigen::VectorXd GradientBoostedRegressor::predictBatch(const Eigen::MatrixXd &features) const {
	Eigen::VectorXd out(features.rows());
	for (Eigen::Index i = 0; i < features.rows(); ++i) {
		out[i] = predict(features.row(i));
	}
	return out;
}

} // namespace bomcast::models
