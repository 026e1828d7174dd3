#pragma once

#include "util.h"
#include "parameter.h"
#include "network.h"
#include "cost.h"
#include "results.h"
#include "rw.h"
#include "gurobi_c++.h"

// coefficients that change from one planning stage to the next
struct StageConfig
{
	int year;
	int refIndex;							// wind farm cost column and hub coefficient set
	std::vector<double> countryFraction;	// countryFraction[c - 1]: required share of the viable capacity of country c

	StageConfig(): year(0), refIndex(0) {}
};

class Model
{
private:
	ModelType modelType;
	CrossBorder crossBorder;
	StageMode stageMode;
	ResultForm resultForm;
	ParamRegistry* paramReg;

	std::string output_directory;
	double cmp_time;
	bool networkFiltered;		// viable sets match the candidates and the cross-border mode
	bool networkBuilt;

	Network network;
	std::vector<double> countryCapacity;		// viable rated wind capacity per country
	std::vector<StageResult> stageResults;

protected:
	GRBEnv env;
	GRBModel grbModel;

	//Decision variables
	std::vector<GRBVar> var_wf;				// selected wind farm capacity
	std::vector<GRBVar> var_hub;			// energy hub capacity
	std::vector<GRBVar> var_hubActive;		// whether an energy hub is built
	std::vector<GRBVar> var_onss;			// onshore substation capacity
	std::vector<GRBVar> var_onssCost;		// non-negative onshore substation expansion cost
	std::vector<GRBVar> var_ec1;
	std::vector<GRBVar> var_ec2;
	std::vector<GRBVar> var_ec3;
	std::vector<GRBVar> var_onc;
	std::vector< std::vector<GRBVar> > var_alloc;	// var_alloc[wf][c - 1]: capacity of a wind farm allocated to country c

	//Constraints
	std::vector<GRBConstr> CountryConstrs;		// right-hand side changes per stage
	std::vector<GRBConstr> OnssCostConstrs;		// coefficients change per stage

	void setSolverParameters(const std::string &_logFile);
	std::vector<GRBVar>& connectionVars(ConnectionType _type);
	const std::vector<GRBVar>& connectionVars(ConnectionType _type) const;
	double cableSensitivity(ConnectionType _type) const;
	double upperLimit(const GRBVar &_var, double _limit) const;

public:
	Model();

	// stage orchestration
	int optimize(ReadWrite* _rw = nullptr);
	StageStatus singleStage(ReadWrite* _rw = nullptr);
	StageStatus multiStage(ReadWrite* _rw = nullptr);
	StageStatus runStages(const std::vector<StageConfig> &_stages, ReadWrite* _rw);
	StageConfig stageConfig(int _year, double _devFraction) const;

	// network and model construction
	void filterNetwork();
	void createNetworkModel();
	void applyStage(const StageConfig &_stage);
	void applyLowerBounds(const Solution &_realized);
	StageStatus solveStage(const StageConfig &_stage, const std::string &_logFile = "");
	Solution getSolution() const;
	Solution realized(const Solution &_sol) const;
	static StageStatus classifyStatus(int _grbStatus, int _solCount);

	std::vector< std::pair<std::string, int> > variableCounts() const;
	std::string filePrefix() const;
	std::string note() const;

	void set_model_type(ModelType _t) { modelType = _t; networkBuilt = false; }
	ModelType get_model_type() const { return modelType; }
	void set_cross_border(CrossBorder _c) { crossBorder = _c; networkFiltered = false; networkBuilt = false; }
	CrossBorder get_cross_border() const { return crossBorder; }
	void set_stage_mode(StageMode _s) { stageMode = _s; }
	StageMode get_stage_mode() const { return stageMode; }
	void set_result_form(ResultForm _f) { resultForm = _f; }
	ResultForm get_result_form() const { return resultForm; }
	void set_output_directory(std::string _s) { output_directory = _s; }
	std::string get_output_directory() const { return output_directory; }

	void set_network(const Network &_network) { network = _network; networkFiltered = false; networkBuilt = false; }
	const Network& get_network() const { return network; }
	bool is_network_filtered() const { return networkFiltered; }
	bool is_network_built() const { return networkBuilt; }
	const std::vector<StageResult>& get_stage_results() const { return stageResults; }
	double get_country_capacity(int _country) const { return countryCapacity[_country - 1]; }
	double get_objective() const { return grbModel.get(GRB_DoubleAttr_ObjVal); }

	friend class ReadWrite;
};
