#include <vector>
#include "model.h"

using namespace std;

std::string statusName(StageStatus _status)
{
	switch (_status)
	{
	case StageStatus::OPTIMAL:
		return "optimal";
	case StageStatus::LIMIT_REACHED:
		return "limit reached";
	case StageStatus::INFEASIBLE:
		return "infeasible";
	case StageStatus::SOLVER_WARNING:
		return "solver warning";
	case StageStatus::SOLVER_ERROR:
		return "solver error";
	default:
		return "not solved";
	}
}

Model::Model(): modelType(ModelType::COMBINED), crossBorder(CrossBorder::POOLED), stageMode(StageMode::SINGLE_STAGE),
	resultForm(ResultForm::LINEAR_RESULT), paramReg(ParamRegistry::instance()), cmp_time(0), networkFiltered(false), networkBuilt(false), env(), grbModel(env)
{
}

int Model::optimize(ReadWrite* _rw)
{
	const auto start = chrono::steady_clock::now();
	if (!networkBuilt) {
		PRINT_SECTION("Building the network model");
		createNetworkModel();
	}
	if (_rw) _rw->writeRunMetadata(*this);

	StageStatus status = StageStatus::NOT_SOLVED;
	switch (stageMode)
	{
	case StageMode::SINGLE_STAGE:
		status = singleStage(_rw);
		break;
	case StageMode::MULTI_STAGE:
		status = multiStage(_rw);
		break;
	default:
		break;
	}
	cmp_time = chrono::duration<double>(chrono::steady_clock::now() - start).count();
	cout << "Computation time <seconds>: -> " << cmp_time << endl;

	int failed = 0;
	for (const auto &res : stageResults) {
		if (!isUsable(res.status)) failed++;
	}
	if (!isUsable(status) && failed == 0) failed = 1;
	return failed;
}

StageConfig Model::stageConfig(int _year, double _devFraction) const
{
	StageConfig stage;
	stage.year = _year;
	stage.refIndex = paramReg->refYearIndex(_year);
	for (int c = 1; c <= paramReg->numCountries(); c++) {
		stage.countryFraction.push_back(paramReg->countryFraction(c, _devFraction));
	}
	return stage;
}

StageStatus Model::classifyStatus(int _grbStatus, int _solCount)
{
	switch (_grbStatus)
	{
	case GRB_OPTIMAL:
		return StageStatus::OPTIMAL;
	case GRB_TIME_LIMIT:
	case GRB_NODE_LIMIT:
	case GRB_SOLUTION_LIMIT:
	case GRB_ITERATION_LIMIT:
		// a limit without an incumbent leaves nothing to report
		return (_solCount > 0) ? StageStatus::LIMIT_REACHED : StageStatus::SOLVER_WARNING;
	case GRB_INFEASIBLE:
	case GRB_INF_OR_UNBD:
		return StageStatus::INFEASIBLE;
	default:
		return StageStatus::SOLVER_WARNING;
	}
}

void Model::setSolverParameters(const std::string &_logFile)
{
	grbModel.set(GRB_IntParam_OutputFlag, paramReg->outputFlag);
#ifdef SolverStreamOff
	grbModel.set(GRB_IntParam_LogToConsole, 0);
#endif
	grbModel.set(GRB_StringParam_LogFile, _logFile);
	grbModel.set(GRB_DoubleParam_MIPGap, paramReg->mipGap);
	grbModel.set(GRB_DoubleParam_NodeLimit, paramReg->nodeLimit);
	if (paramReg->solutionLimit > 0) grbModel.set(GRB_IntParam_SolutionLimit, paramReg->solutionLimit);
	grbModel.set(GRB_DoubleParam_TimeLimit, paramReg->timeLimit);
	grbModel.set(GRB_DoubleParam_FeasibilityTol, paramReg->feasibilityTol);
	grbModel.set(GRB_DoubleParam_OptimalityTol, paramReg->optimalityTol);
	grbModel.set(GRB_IntParam_Presolve, paramReg->presolve);
	grbModel.set(GRB_IntParam_Cuts, paramReg->cuts);
}

StageStatus Model::solveStage(const StageConfig &_stage, const std::string &_logFile)
{
	StageStatus status = StageStatus::NOT_SOLVED;
	try {
		applyStage(_stage);
		setSolverParameters(_logFile);
		grbModel.optimize();
		status = classifyStatus(grbModel.get(GRB_IntAttr_Status), grbModel.get(GRB_IntAttr_SolCount));
	}
	catch (GRBException &e) {
		cerr << "Gurobi error in stage " << _stage.year << " <" << e.getErrorCode() << ">: " << e.getMessage() << endl;
		status = StageStatus::SOLVER_ERROR;
	}
	return status;
}

Solution Model::getSolution() const
{
	Solution sol(network, paramReg->numCountries());
	sol.objective = grbModel.get(GRB_DoubleAttr_ObjVal);
	for (int w = 0; w < network.numWindFarms(); w++) {
		sol.wf[w] = var_wf[w].get(GRB_DoubleAttr_X);
		for (int c = 0; c < paramReg->numCountries(); c++) {
			sol.alloc[w][c] = var_alloc[w][c].get(GRB_DoubleAttr_X);
		}
	}
	for (int h = 0; h < network.numHubs(); h++) {
		sol.hub[h] = var_hub[h].get(GRB_DoubleAttr_X);
		sol.hubActive[h] = var_hubActive[h].get(GRB_DoubleAttr_X);
	}
	for (int s = 0; s < network.numSubstations(); s++) {
		sol.onss[s] = var_onss[s].get(GRB_DoubleAttr_X);
	}
	for (int t = 0; t < ConnectionType::numConnectionTypes; t++) {
		const auto type = static_cast<ConnectionType>(t);
		const auto &vars = connectionVars(type);
		auto &values = sol.connection(type);
		for (int k = 0; k < int(vars.size()); k++) {
			values[k] = vars[k].get(GRB_DoubleAttr_X);
		}
	}
	return sol;
}

// values that carry over to the next stage: rounded, with solver noise removed
Solution Model::realized(const Solution &_sol) const
{
	const double zeroTh = paramReg->zeroThreshold;
	auto clean = [zeroTh](std::vector<double> &_values) {
		for (auto &v : _values) v = (v > zeroTh) ? roundTo(v) : 0.0;
	};
	Solution res = _sol;
	clean(res.wf);
	clean(res.hub);
	clean(res.onss);
	clean(res.ec1);
	clean(res.ec2);
	clean(res.ec3);
	clean(res.onc);
	for (auto &row : res.alloc) clean(row);
	for (auto &v : res.hubActive) v = std::round(v);
	return res;
}

std::string Model::filePrefix() const
{
	std::string prefix = (stageMode == StageMode::MULTI_STAGE) ? "r_mf_" : "r_sf_";
	switch (modelType)
	{
	case ModelType::POINT_TO_POINT:
		prefix += "d_";
		break;
	case ModelType::HUB_AND_SPOKE:
		prefix += "hs_";
		break;
	default:
		prefix += "c_";
		break;
	}
	prefix += (crossBorder == CrossBorder::POOLED) ? "in" : "n";
	return prefix;
}

std::string Model::note() const
{
	stringstream ss;
	switch (modelType)
	{
	case ModelType::POINT_TO_POINT:
		ss << "Point-to-point model: wind farms connect directly to onshore substations." << endl;
		break;
	case ModelType::HUB_AND_SPOKE:
		ss << "Hub-and-spoke model: wind farms connect through energy hubs." << endl;
		break;
	default:
		ss << "Combined model: direct and hub connections are both allowed." << endl;
		break;
	}
	if (crossBorder == CrossBorder::POOLED) {
		ss << "Cross-border: wind capacity of any country counts towards every country requirement." << endl;
	}
	else {
		ss << "Domestic: each country requirement is met by its own wind farms and connections stay within one country." << endl;
	}
	if (stageMode == StageMode::MULTI_STAGE) {
		ss << "Multi-stage run over";
		for (auto year : paramReg->stageYears) ss << " " << year;
		ss << "; capacity built in a stage is kept in later stages." << endl;
	}
	else {
		ss << "Single-stage run for " << paramReg->singleStageYear << "." << endl;
	}
	ss << ((resultForm == ResultForm::CEIL_RESULT)
		? "Reported costs use whole cables and turbine-rounded wind farm capacity."
		: "Reported costs are linear in capacity.") << endl;
	return ss.str();
}
