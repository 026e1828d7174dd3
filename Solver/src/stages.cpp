#include "model.h"

using namespace std;

StageStatus Model::singleStage(ReadWrite* _rw)
{
	PRINT_SECTION("Single-stage optimization");
	std::vector<StageConfig> stages;
	stages.push_back(stageConfig(paramReg->singleStageYear, 1.0));
	return runStages(stages, _rw);
}

StageStatus Model::multiStage(ReadWrite* _rw)
{
	PRINT_SECTION("Multi-stage optimization");
	std::vector<StageConfig> stages;
	for (int t = 0; t < int(paramReg->stageYears.size()); t++) {
		stages.push_back(stageConfig(paramReg->stageYears[t], paramReg->devFraction[t]));
	}
	return runStages(stages, _rw);
}

// Solves the stages in order. Capacity realized in a usable stage becomes the lower bound of the
// following stages; a failed stage leaves the bounds untouched.
StageStatus Model::runStages(const std::vector<StageConfig> &_stages, ReadWrite* _rw)
{
	if (!networkBuilt) createNetworkModel();
	stageResults.clear();

	const ResultExtractor extractor(network, resultForm);
	Solution lowerBounds(network, paramReg->numCountries());
	StageStatus lastStatus = StageStatus::NOT_SOLVED;

	for (const auto &stage : _stages) {
		PRINT_SUBSECTION("Solving for " << stage.year);
		applyLowerBounds(lowerBounds);

		const std::string logFile = output_directory.empty() ? ""
			: output_directory + "/" + filePrefix() + "_solverlog_" + to_string(stage.year) + ".txt";
		const auto status = solveStage(stage, logFile);

		StageResult result;
		if (isUsable(status)) {
			const Solution current = getSolution();
			result = extractor.extract(stage.year, current, lowerBounds);
			lowerBounds = realized(current);
		}
		result.year = stage.year;
		result.status = status;
		stageResults.push_back(result);
		lastStatus = status;

		cout << "Stage " << stage.year << ": " << statusName(status);
		if (isUsable(status)) cout << ", objective " << result.objective;
		cout << endl;

		if (isUsable(status)) {
			if (_rw) _rw->writeStageResult(*this, result);
		}
		else if (paramReg->haltOnFailure) {
			cerr << "Stage " << stage.year << " did not produce a usable solution; later stages are skipped" << endl;
			break;
		}
	}
	return lastStatus;
}
