#include "model.h"

using namespace std;

void Model::filterNetwork()
{
	network.filter(FeasibilityThresholds(*paramReg), crossBorder);

	cout << "Viable wind farms: " << network.numWindFarms() << " of " << network.get_candidate_wind_farms().size() << endl;
	cout << "Viable energy hubs: " << network.numHubs() << " of " << network.get_candidate_hubs().size() << endl;
	cout << "Viable onshore substations: " << network.numSubstations() << " of " << network.get_candidate_substations().size() << endl;
	cout << "Viable connections: ec1 " << network.ec1.size() << ", ec2 " << network.ec2.size()
		<< ", ec3 " << network.ec3.size() << ", onc " << network.onc.size() << endl;

	countryCapacity = std::vector<double>(paramReg->numCountries(), 0.0);
	for (int c = 1; c <= paramReg->numCountries(); c++) {
		countryCapacity[c - 1] = network.viableCapacity(c);
		cout << "Total available capacity " << paramReg->isoCodes[c - 1] << ": " << countryCapacity[c - 1] << " MW" << endl;
	}
	networkFiltered = true;
	networkBuilt = false;
}

void Model::createNetworkModel()
{
	const auto start = chrono::steady_clock::now();
	if (!networkFiltered) filterNetwork();
	const int numWf = network.numWindFarms();
	const int numHub = network.numHubs();
	const int numOnss = network.numSubstations();
	const int numCountries = paramReg->numCountries();
	const double hubLimit = paramReg->hubCapacityLimit;

	// the topology restricts connection classes through zero upper bounds
	const double hubSideUb = (modelType == ModelType::POINT_TO_POINT) ? 0.0 : GRB_INFINITY;
	const double directUb = (modelType == ModelType::HUB_AND_SPOKE) ? 0.0 : GRB_INFINITY;

	// a rebuild starts from an empty model
	grbModel.update();
	if (grbModel.get(GRB_IntAttr_NumVars) > 0) {
		GRBConstr* constrs = grbModel.getConstrs();
		for (int i = 0; i < grbModel.get(GRB_IntAttr_NumConstrs); i++) grbModel.remove(constrs[i]);
		delete[] constrs;
		GRBVar* vars = grbModel.getVars();
		for (int i = 0; i < grbModel.get(GRB_IntAttr_NumVars); i++) grbModel.remove(vars[i]);
		delete[] vars;
		grbModel.update();
	}

	var_wf.clear(); var_hub.clear(); var_hubActive.clear(); var_onss.clear(); var_onssCost.clear();
	var_ec1.clear(); var_ec2.clear(); var_ec3.clear(); var_onc.clear(); var_alloc.clear();
	CountryConstrs.clear(); OnssCostConstrs.clear();

	grbModel.set(GRB_StringAttr_ModelName, "offshore_grid");
	grbModel.set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);

	/* ****************************** Decision variables ****************************** */
	PRINT_SUBSECTION("Defining decision variables");
	// objective coefficients are stage dependent and set in applyStage
	for (const auto &wf : network.windFarms) {
		var_wf.push_back(grbModel.addVar(0, GRB_INFINITY, 0, GRB_CONTINUOUS, "wf_cap_" + to_string(wf.id)));
	}
	for (const auto &hub : network.hubs) {
		var_hub.push_back(grbModel.addVar(0, hubSideUb, 0, GRB_CONTINUOUS, "eh_cap_" + to_string(hub.id)));
		var_hubActive.push_back(grbModel.addVar(0, (hubSideUb > 0) ? 1 : 0, 0, GRB_BINARY, "eh_active_" + to_string(hub.id)));
	}
	for (const auto &onss : network.substations) {
		var_onss.push_back(grbModel.addVar(0, GRB_INFINITY, 0, GRB_CONTINUOUS, "onss_cap_" + to_string(onss.id)));
		var_onssCost.push_back(grbModel.addVar(0, GRB_INFINITY, 0, GRB_CONTINUOUS, "onss_cost_" + to_string(onss.id)));
	}
	for (const auto &conn : network.ec1) {
		var_ec1.push_back(grbModel.addVar(0, hubSideUb, 0, GRB_CONTINUOUS,
			"ec1_cap_" + to_string(network.windFarms[conn.from].id) + "_" + to_string(network.hubs[conn.to].id)));
	}
	for (const auto &conn : network.ec2) {
		var_ec2.push_back(grbModel.addVar(0, hubSideUb, 0, GRB_CONTINUOUS,
			"ec2_cap_" + to_string(network.hubs[conn.from].id) + "_" + to_string(network.substations[conn.to].id)));
	}
	for (const auto &conn : network.ec3) {
		var_ec3.push_back(grbModel.addVar(0, directUb, 0, GRB_CONTINUOUS,
			"ec3_cap_" + to_string(network.windFarms[conn.from].id) + "_" + to_string(network.substations[conn.to].id)));
	}
	for (const auto &conn : network.onc) {
		var_onc.push_back(grbModel.addVar(0, GRB_INFINITY, 0, GRB_CONTINUOUS,
			"onc_cap_" + to_string(network.substations[conn.from].id) + "_" + to_string(network.substations[conn.to].id)));
	}
	var_alloc.resize(numWf);
	for (int w = 0; w < numWf; w++) {
		for (int c = 1; c <= numCountries; c++) {
			var_alloc[w].push_back(grbModel.addVar(0, GRB_INFINITY, 0, GRB_CONTINUOUS,
				"wf_alloc_" + to_string(network.windFarms[w].id) + "_" + paramReg->isoCodes[c - 1]));
		}
	}

	/* ****************************** Country requirements ****************************** */
	PRINT_SUBSECTION("Defining country requirement constraints");
	for (int c = 1; c <= numCountries; c++) {
		GRBLinExpr xpr = 0;
		for (int w = 0; w < numWf; w++) {
			if (crossBorder == CrossBorder::POOLED || network.windFarms[w].country == c) xpr += var_alloc[w][c - 1];
		}
		// right-hand side is set per stage
		CountryConstrs.push_back(grbModel.addConstr(xpr >= 0, "country_req_" + paramReg->isoCodes[c - 1]));
	}

	/* ****************************** Wind farm constraints ****************************** */
	PRINT_SUBSECTION("Defining wind farm constraints");
	for (int w = 0; w < numWf; w++) {
		const auto &wf = network.windFarms[w];
		GRBLinExpr sumAlloc = 0;
		for (int c = 0; c < numCountries; c++) sumAlloc += var_alloc[w][c];
		grbModel.addConstr(sumAlloc == var_wf[w], "wf_alloc_" + to_string(wf.id));
		grbModel.addConstr(var_wf[w] <= wf.capacity, "wf_cap_" + to_string(wf.id));

		// capacity allocated to a country leaves over export cables ending in that country
		for (int c = 1; c <= numCountries; c++) {
			GRBLinExpr xpr = 0;
			for (auto k : network.wfEc1[w]) {
				if (network.hubs[network.ec1[k].to].country == c) xpr += var_ec1[k];
			}
			for (auto k : network.wfEc3[w]) {
				if (network.substations[network.ec3[k].to].country == c) xpr += var_ec3[k];
			}
			grbModel.addConstr(xpr >= var_alloc[w][c - 1], "wf_export_" + to_string(wf.id) + "_" + paramReg->isoCodes[c - 1]);
		}
	}

	/* ****************************** Energy hub constraints ****************************** */
	PRINT_SUBSECTION("Defining energy hub constraints");
	for (int h = 0; h < numHub; h++) {
		const auto &hub = network.hubs[h];
		GRBLinExpr inflow = 0;
		for (auto k : network.hubEc1[h]) inflow += var_ec1[k];
		grbModel.addConstr(var_hub[h] >= inflow, "eh_inflow_" + to_string(hub.id));
		grbModel.addConstr(var_hub[h] <= hubLimit, "eh_limit_" + to_string(hub.id));
		grbModel.addConstr(var_hub[h] <= hubLimit * var_hubActive[h] + paramReg->zeroThreshold, "eh_active_" + to_string(hub.id));

		GRBLinExpr outflow = 0;
		for (auto k : network.hubEc2[h]) {
			if (network.substations[network.ec2[k].to].country == hub.country) outflow += var_ec2[k];
		}
		grbModel.addConstr(outflow >= var_hub[h], "eh_outflow_" + to_string(hub.id));
	}

	/* ****************************** Onshore substation constraints ****************************** */
	PRINT_SUBSECTION("Defining onshore substation constraints");
	for (int s = 0; s < numOnss; s++) {
		const auto &onss = network.substations[s];
		GRBLinExpr xpr = 0;
		for (auto k : network.onssEc2[s]) xpr += var_ec2[k];
		for (auto k : network.onssEc3[s]) xpr += var_ec3[k];
		for (auto k : network.onssOncIn[s]) {
			if (network.substations[network.onc[k].from].country == onss.country) xpr += var_onc[k];
		}
		for (auto k : network.onssOncOut[s]) {
			if (network.substations[network.onc[k].to].country == onss.country) xpr -= var_onc[k];
		}
		grbModel.addConstr(var_onss[s] >= xpr, "onss_balance_" + to_string(onss.id));
		grbModel.addConstr(var_onss[s] <= paramReg->onssCapacityFactor * onss.threshold, "onss_limit_" + to_string(onss.id));

		// coefficient and right-hand side are set per stage
		OnssCostConstrs.push_back(grbModel.addConstr(var_onssCost[s] - var_onss[s] >= 0, "onss_cost_" + to_string(onss.id)));
	}

	grbModel.update();
	networkBuilt = true;

#ifdef LPMODEL
	grbModel.write(output_directory + "/network_model.lp");
#endif

	cmp_time = chrono::duration<double>(chrono::steady_clock::now() - start).count();
	cout << "Model built with " << grbModel.get(GRB_IntAttr_NumVars) << " variables and "
		<< grbModel.get(GRB_IntAttr_NumConstrs) << " constraints in " << cmp_time << " s" << endl;
}

void Model::applyStage(const StageConfig &_stage)
{
	const double ecSf[ConnectionType::numConnectionTypes] = { cableSensitivity(EC1), cableSensitivity(EC2), cableSensitivity(EC3), cableSensitivity(ONC) };

	for (int w = 0; w < network.numWindFarms(); w++) {
		const auto &wf = network.windFarms[w];
		var_wf[w].set(GRB_DoubleAttr_Obj, paramReg->sfWindFarm * CostModel::windFarmCost(wf.cost[_stage.refIndex], wf.capacity, 1.0));
	}
	for (int h = 0; h < network.numHubs(); h++) {
		const auto &hub = network.hubs[h];
		var_hub[h].set(GRB_DoubleAttr_Obj,
			paramReg->sfHub * CostModel::energyHubCost(_stage.year, hub.waterDepth, hub.iceCover, hub.portDistance, 1.0, 0.0));
		var_hubActive[h].set(GRB_DoubleAttr_Obj,
			paramReg->sfHub * CostModel::energyHubCost(_stage.year, hub.waterDepth, hub.iceCover, hub.portDistance, 0.0, 1.0));
	}
	for (int t = 0; t < ConnectionType::numConnectionTypes; t++) {
		const auto type = static_cast<ConnectionType>(t);
		const auto &conns = network.connections(type);
		auto &vars = connectionVars(type);
		for (int k = 0; k < int(conns.size()); k++) {
			vars[k].set(GRB_DoubleAttr_Obj, ecSf[t] * CostModel::cableCost(type, _stage.year, conns[k].distance, 1.0));
		}
	}

	// onss_cost >= k * (capacity - threshold), k the discounted cost per MW
	const double k = paramReg->sfOnss * CostModel::substationCost(_stage.year, 1.0, 0.0);
	for (int s = 0; s < network.numSubstations(); s++) {
		// substation capacity also enters the objective at unit weight
		var_onss[s].set(GRB_DoubleAttr_Obj, 1.0);
		var_onssCost[s].set(GRB_DoubleAttr_Obj, 1.0);
		grbModel.chgCoeff(OnssCostConstrs[s], var_onss[s], -k);
		OnssCostConstrs[s].set(GRB_DoubleAttr_RHS, -k * network.substations[s].threshold);
	}

	for (int c = 1; c <= paramReg->numCountries(); c++) {
		CountryConstrs[c - 1].set(GRB_DoubleAttr_RHS, _stage.countryFraction[c - 1] * countryCapacity[c - 1]);
	}
	grbModel.update();
}

double Model::upperLimit(const GRBVar &_var, double _limit) const
{
	return std::min(_var.get(GRB_DoubleAttr_UB), _limit);
}

void Model::applyLowerBounds(const Solution &_realized)
{
	const double zeroTh = paramReg->zeroThreshold;
	auto bound = [&](GRBVar &_var, double _value, double _limit) {
		const double lb = (_value > zeroTh) ? std::min(roundTo(_value), upperLimit(_var, _limit)) : 0.0;
		_var.set(GRB_DoubleAttr_LB, lb);
	};

	for (int w = 0; w < network.numWindFarms(); w++) {
		bound(var_wf[w], _realized.wf[w], network.windFarms[w].capacity);
	}
	for (int h = 0; h < network.numHubs(); h++) {
		bound(var_hub[h], _realized.hub[h], paramReg->hubCapacityLimit);
	}
	for (int s = 0; s < network.numSubstations(); s++) {
		bound(var_onss[s], _realized.onss[s], paramReg->onssCapacityFactor * network.substations[s].threshold);
	}
	for (int t = 0; t < ConnectionType::numConnectionTypes; t++) {
		const auto type = static_cast<ConnectionType>(t);
		auto &vars = connectionVars(type);
		const auto &values = _realized.connection(type);
		for (int k = 0; k < int(vars.size()); k++) {
			bound(vars[k], values[k], GRB_INFINITY);
		}
	}
	grbModel.update();
}

std::vector<GRBVar>& Model::connectionVars(ConnectionType _type)
{
	switch (_type)
	{
	case ConnectionType::EC1:
		return var_ec1;
	case ConnectionType::EC2:
		return var_ec2;
	case ConnectionType::EC3:
		return var_ec3;
	default:
		return var_onc;
	}
}

const std::vector<GRBVar>& Model::connectionVars(ConnectionType _type) const
{
	switch (_type)
	{
	case ConnectionType::EC1:
		return var_ec1;
	case ConnectionType::EC2:
		return var_ec2;
	case ConnectionType::EC3:
		return var_ec3;
	default:
		return var_onc;
	}
}

double Model::cableSensitivity(ConnectionType _type) const
{
	switch (_type)
	{
	case ConnectionType::EC1:
		return paramReg->sfEc1;
	case ConnectionType::EC2:
		return paramReg->sfEc2;
	case ConnectionType::EC3:
		return paramReg->sfEc3;
	default:
		return paramReg->sfOnc;
	}
}

std::vector< std::pair<std::string, int> > Model::variableCounts() const
{
	std::vector< std::pair<std::string, int> > counts;
	counts.emplace_back("wind_farms", int(var_wf.size()));
	counts.emplace_back("energy_hubs", int(var_hub.size()));
	counts.emplace_back("energy_hub_binaries", int(var_hubActive.size()));
	counts.emplace_back("substations", int(var_onss.size()));
	counts.emplace_back("substation_costs", int(var_onssCost.size()));
	counts.emplace_back("ec1", int(var_ec1.size()));
	counts.emplace_back("ec2", int(var_ec2.size()));
	counts.emplace_back("ec3", int(var_ec3.size()));
	counts.emplace_back("onc", int(var_onc.size()));
	int numAlloc = 0;
	for (const auto &row : var_alloc) numAlloc += int(row.size());
	counts.emplace_back("allocations", numAlloc);
	return counts;
}
