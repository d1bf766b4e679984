#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <random>
#include <vector>

namespace bomcast::models {

/// Hyper-parameters of the boosted ensemble (squared-error objective).
struct BoostingParams {
	int n_estimators = 200;
	int max_depth = 4;
	double learning_rate = 0.05;
	double subsample = 0.8;        // row fraction drawn per tree
	double colsample = 0.8;        // column fraction drawn per tree
	double reg_lambda = 1.0;       // L2 penalty on leaf weights
	int min_child_rows = 1;
	std::uint32_t seed = 42;
};

/**
 * @class RegressionTree
 * @brief Depth-limited regression tree fitted to first-order gradients.
 *
 * With a squared-error objective every hessian is 1, so a leaf weight is
 * -sum(g) / (n + lambda) and the split gain is the usual second-order gain.
 * Nodes are stored flat; children are indices into the node array.
 */
class RegressionTree {
public:
	RegressionTree(int max_depth, double reg_lambda, int min_child_rows);

	void fit(const Eigen::MatrixXd &features, const Eigen::VectorXd &gradients, const std::vector<Eigen::Index> &rows,
	         const std::vector<Eigen::Index> &columns);

	double predict(const Eigen::Ref<const Eigen::RowVectorXd> &row) const;

	std::size_t nodeCount() const {
		return nodes_.size();
	}
	std::size_t leafCount() const;

private:
	struct Node {
		bool leaf = true;
		Eigen::Index feature = -1;
		double threshold = 0.0;
		double value = 0.0;
		int left = -1;
		int right = -1;
	};

	struct Split {
		Eigen::Index feature = -1;
		double threshold = 0.0;
		double gain = 0.0;
	};

	int build(const Eigen::MatrixXd &features, const Eigen::VectorXd &gradients, std::vector<Eigen::Index> rows,
	          int depth);
	Split findBestSplit(const Eigen::MatrixXd &features, const Eigen::VectorXd &gradients,
	                    const std::vector<Eigen::Index> &rows) const;
	double leafWeight(double gradient_sum, std::size_t count) const;

	int max_depth_;
	double reg_lambda_;
	int min_child_rows_;
	std::vector<Eigen::Index> columns_;
	std::vector<Node> nodes_;
};

/**
 * @class GradientBoostedRegressor
 * @brief Additive ensemble of regression trees with row and column
 * subsampling.
 *
 * The base score is the training mean. Sampling is driven by a generator
 * seeded from BoostingParams::seed, so identical inputs give identical
 * models.
 */
class GradientBoostedRegressor {
public:
	explicit GradientBoostedRegressor(BoostingParams params = {});

	/**
	 * @throws std::invalid_argument On empty input, mismatched shapes or
	 *         non-finite values.
	 */
	void fit(const Eigen::MatrixXd &features, const Eigen::VectorXd &target);

	double predict(const Eigen::Ref<const Eigen::RowVectorXd> &row) const;
	Eigen::VectorXd predictBatch(const Eigen::MatrixXd &features) const;

	bool isFitted() const {
		return fitted_;
	}
	std::size_t treeCount() const {
		return trees_.size();
	}
	Eigen::Index featureCount() const {
		return feature_count_;
	}
	double baseScore() const {
		return base_score_;
	}
	const BoostingParams &params() const {
		return params_;
	}

private:
	std::vector<Eigen::Index> sampleIndices(Eigen::Index total, double fraction, std::mt19937 &rng) const;

	BoostingParams params_;
	std::vector<RegressionTree> trees_;
	double base_score_ = 0.0;
	Eigen::Index feature_count_ = 0;
	bool fitted_ = false;
};

} // namespace bomcast::models
