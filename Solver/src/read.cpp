#include "model.h"
#include <string>
#include <cmath>
#include <iostream>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <iomanip>

using namespace std;

void ReadWrite::readParameters(Model &_model)
{
	auto paramReg = ParamRegistry::instance();
	const string fileName = inputDirectory + paramFile;
	ifstream inputFile(fileName.c_str());
	if (!inputFile)
	{
		std::cout << "Couldn't find the parameter file. Will use the default values!" << std::endl;
		return;
	}

	string fieldName;
	while (inputFile >> fieldName)
	{
		if (fieldName == "END")
			break;
		else if (fieldName == "ModelType")
		{
			int val;
			inputFile >> val;
			if (val < 0 || val > 2) throw InputDataError("Parameters.dat: ModelType must be 0, 1 or 2");
			_model.set_model_type(static_cast<ModelType>(val));
		}
		else if (fieldName == "CrossBorder")
		{
			int val;
			inputFile >> val;
			_model.set_cross_border(val ? CrossBorder::POOLED : CrossBorder::DOMESTIC);
		}
		else if (fieldName == "MultiStage")
		{
			int val;
			inputFile >> val;
			_model.set_stage_mode(val ? StageMode::MULTI_STAGE : StageMode::SINGLE_STAGE);
		}
		else if (fieldName == "LinearResult")
		{
			int val;
			inputFile >> val;
			_model.set_result_form(val ? ResultForm::LINEAR_RESULT : ResultForm::CEIL_RESULT);
		}
		else if (fieldName == "SingleStageYear")
		{
			inputFile >> paramReg->singleStageYear;
		}
		else if (fieldName == "StageYears")
		{
			for (auto &year : paramReg->stageYears) inputFile >> year;
		}
		else if (fieldName == "DevFractions")
		{
			for (auto &frac : paramReg->devFraction) inputFile >> frac;
		}
		else if (fieldName == "CountryFraction")
		{
			string iso;
			double val;
			inputFile >> iso >> val;
			const int c = paramReg->countryOf(iso);
			if (c < 0) throw InputDataError("Parameters.dat: unknown ISO code " + iso);
			paramReg->baseCountryFraction[c - 1] = val;
		}
		else if (fieldName == "SelectCountry")
		{
			string iso;
			int val;
			inputFile >> iso >> val;
			const int c = paramReg->countryOf(iso);
			if (c < 0) throw InputDataError("Parameters.dat: unknown ISO code " + iso);
			paramReg->selectCountry[c - 1] = val ? 1 : 0;
		}
		else if (fieldName == "MaxDistEc1")
		{
			inputFile >> paramReg->maxDistEc1;
		}
		else if (fieldName == "MaxDistEc2")
		{
			inputFile >> paramReg->maxDistEc2;
		}
		else if (fieldName == "MaxDistEc3")
		{
			inputFile >> paramReg->maxDistEc3;
		}
		else if (fieldName == "MaxDistOnc")
		{
			inputFile >> paramReg->maxDistOnc;
		}
		else if (fieldName == "ZeroThreshold")
		{
			inputFile >> paramReg->zeroThreshold;
		}
		else if (fieldName == "TurbineCapacity")
		{
			inputFile >> paramReg->turbineCapacity;
		}
		else if (fieldName == "HubCapacityLimit")
		{
			inputFile >> paramReg->hubCapacityLimit;
		}
		else if (fieldName == "OnssCapacityFactor")
		{
			inputFile >> paramReg->onssCapacityFactor;
		}
		else if (fieldName == "DiscountRate")
		{
			inputFile >> paramReg->discountRate;
		}
		else if (fieldName == "BaseYear")
		{
			inputFile >> paramReg->baseYear;
		}
		else if (fieldName == "Lifetime")
		{
			inputFile >> paramReg->lifetime;
		}
		else if (fieldName == "Sensitivity")
		{
			string component;
			double val;
			inputFile >> component >> val;
			if (component == "wind_farms") paramReg->sfWindFarm = val;
			else if (component == "energy_hubs") paramReg->sfHub = val;
			else if (component == "ec1") paramReg->sfEc1 = val;
			else if (component == "ec2") paramReg->sfEc2 = val;
			else if (component == "ec3") paramReg->sfEc3 = val;
			else if (component == "substations") paramReg->sfOnss = val;
			else if (component == "onc") paramReg->sfOnc = val;
			else cerr << "Unknown sensitivity component " << component << " ignored" << endl;
		}
		else if (fieldName == "MipGap")
		{
			inputFile >> paramReg->mipGap;
		}
		else if (fieldName == "NodeLimit")
		{
			inputFile >> paramReg->nodeLimit;
		}
		else if (fieldName == "SolutionLimit")
		{
			inputFile >> paramReg->solutionLimit;
		}
		else if (fieldName == "TimeLimit")
		{
			inputFile >> paramReg->timeLimit;
		}
		else if (fieldName == "FeasibilityTol")
		{
			inputFile >> paramReg->feasibilityTol;
		}
		else if (fieldName == "OptimalityTol")
		{
			inputFile >> paramReg->optimalityTol;
		}
		else if (fieldName == "Presolve")
		{
			inputFile >> paramReg->presolve;
		}
		else if (fieldName == "Cuts")
		{
			inputFile >> paramReg->cuts;
		}
		else if (fieldName == "OutputFlag")
		{
			inputFile >> paramReg->outputFlag;
		}
		else if (fieldName == "HaltOnFailure")
		{
			int val;
			inputFile >> val;
			paramReg->haltOnFailure = (val != 0);
		}
		else
		{
			cerr << "Unknown parameter " << fieldName << " ignored" << endl;
			continue;
		}
		if (inputFile.fail()) throw InputDataError("Parameters.dat: missing or malformed value for " + fieldName);
	}
}

bool ReadWrite::applySwitch(Model &_model, const std::string &_flag) const
{
	if (_flag == "-d") _model.set_model_type(ModelType::POINT_TO_POINT);
	else if (_flag == "-hs") _model.set_model_type(ModelType::HUB_AND_SPOKE);
	else if (_flag == "-c") _model.set_model_type(ModelType::COMBINED);
	else if (_flag == "-n") _model.set_cross_border(CrossBorder::DOMESTIC);
	else if (_flag == "-i") _model.set_cross_border(CrossBorder::POOLED);
	else if (_flag == "-sf") _model.set_stage_mode(StageMode::SINGLE_STAGE);
	else if (_flag == "-mf") _model.set_stage_mode(StageMode::MULTI_STAGE);
	else if (_flag == "-lin") _model.set_result_form(ResultForm::LINEAR_RESULT);
	else if (_flag == "-ceil") _model.set_result_form(ResultForm::CEIL_RESULT);
	else return false;
	return true;
}

double ReadWrite::toDouble(const std::string &_value, const std::string &_file, int _row)
{
	size_t pos = 0;
	double val = 0;
	try {
		val = stod(_value, &pos);
	}
	catch (const std::exception &) {
		throw InputDataError(_file + ", row " + to_string(_row) + ": '" + _value + "' is not a number");
	}
	if (pos != _value.size() || !std::isfinite(val)) {
		throw InputDataError(_file + ", row " + to_string(_row) + ": '" + _value + "' is not a number");
	}
	return val;
}

int ReadWrite::toInt(const std::string &_value, const std::string &_file, int _row)
{
	size_t pos = 0;
	int val = 0;
	try {
		val = stoi(_value, &pos);
	}
	catch (const std::exception &) {
		throw InputDataError(_file + ", row " + to_string(_row) + ": '" + _value + "' is not an integer");
	}
	if (pos != _value.size()) {
		throw InputDataError(_file + ", row " + to_string(_row) + ": '" + _value + "' is not an integer");
	}
	return val;
}

int ReadWrite::countryOf(const std::string &_iso, const std::string &_file, int _row) const
{
	const int c = ParamRegistry::instance()->countryOf(_iso);
	if (c < 0) throw InputDataError(_file + ", row " + to_string(_row) + ": unknown ISO code '" + _iso + "'");
	return c;
}

// data rows of a csv file with one header row; blank lines are skipped
std::vector< std::pair<int, std::vector<std::string> > > ReadWrite::readTable(const std::string &_file, int _numCols) const
{
	const string fileName = inputDirectory + _file;
	ifstream input(fileName.c_str());
	if (!input.good()) throw InputDataError("Cannot open " + fileName);

	std::vector< std::pair<int, std::vector<std::string> > > rows;
	string s;
	int row = 0;
	while (getline(input, s)) {
		row++;
		if (!s.empty() && s.back() == '\r') s.pop_back();
		if (row == 1 || s.find_first_not_of(" \t") == string::npos) continue;
		auto fields = split(s);
		if (int(fields.size()) != _numCols) {
			throw InputDataError(fileName + ", row " + to_string(row) + ": expected " + to_string(_numCols)
				+ " fields, found " + to_string(fields.size()));
		}
		rows.push_back(make_pair(row, fields));
	}
	input.close();
	return rows;
}

std::vector<WindFarm> ReadWrite::readWindFarms() const
{
	std::vector<WindFarm> wfs;
	set<int> ids;
	for (const auto &entry : readTable(windFarmFile, 5 + NUM_REF_YEARS)) {
		const int row = entry.first;
		const auto &fields = entry.second;
		WindFarm wf;
		wf.id = toInt(fields[0], windFarmFile, row);
		wf.country = countryOf(fields[1], windFarmFile, row);
		wf.lon = toDouble(fields[2], windFarmFile, row);
		wf.lat = toDouble(fields[3], windFarmFile, row);
		wf.capacity = toDouble(fields[4], windFarmFile, row);
		for (int r = 0; r < NUM_REF_YEARS; r++) {
			wf.cost[r] = toDouble(fields[5 + r], windFarmFile, row);
		}
		if (wf.capacity <= 0) throw InputDataError(windFarmFile + ", row " + to_string(row) + ": capacity must be positive");
		if (!ids.insert(wf.id).second) throw InputDataError(windFarmFile + ", row " + to_string(row) + ": duplicate id " + to_string(wf.id));
		wfs.push_back(wf);
	}
	if (wfs.empty()) throw InputDataError(inputDirectory + windFarmFile + " contains no wind farms");
	return wfs;
}

std::vector<EnergyHub> ReadWrite::readHubs() const
{
	std::vector<EnergyHub> hubs;
	set<int> ids;
	for (const auto &entry : readTable(hubFile, 7)) {
		const int row = entry.first;
		const auto &fields = entry.second;
		EnergyHub hub;
		hub.id = toInt(fields[0], hubFile, row);
		hub.country = countryOf(fields[1], hubFile, row);
		hub.lon = toDouble(fields[2], hubFile, row);
		hub.lat = toDouble(fields[3], hubFile, row);
		hub.waterDepth = toDouble(fields[4], hubFile, row);
		hub.iceCover = toInt(fields[5], hubFile, row);
		hub.portDistance = toDouble(fields[6], hubFile, row);
		if (hub.iceCover != 0 && hub.iceCover != 1) throw InputDataError(hubFile + ", row " + to_string(row) + ": ice_cover must be 0 or 1");
		if (hub.waterDepth < 0 || hub.portDistance < 0) throw InputDataError(hubFile + ", row " + to_string(row) + ": negative depth or port distance");
		if (!ids.insert(hub.id).second) throw InputDataError(hubFile + ", row " + to_string(row) + ": duplicate id " + to_string(hub.id));
		hubs.push_back(hub);
	}
	return hubs;
}

std::vector<Substation> ReadWrite::readSubstations() const
{
	std::vector<Substation> substations;
	set<int> ids;
	for (const auto &entry : readTable(substationFile, 5)) {
		const int row = entry.first;
		const auto &fields = entry.second;
		Substation onss;
		onss.id = toInt(fields[0], substationFile, row);
		onss.country = countryOf(fields[1], substationFile, row);
		onss.lon = toDouble(fields[2], substationFile, row);
		onss.lat = toDouble(fields[3], substationFile, row);
		onss.threshold = toDouble(fields[4], substationFile, row);
		if (onss.threshold < 0) throw InputDataError(substationFile + ", row " + to_string(row) + ": negative threshold");
		if (!ids.insert(onss.id).second) throw InputDataError(substationFile + ", row " + to_string(row) + ": duplicate id " + to_string(onss.id));
		substations.push_back(onss);
	}
	if (substations.empty()) throw InputDataError(inputDirectory + substationFile + " contains no substations");
	return substations;
}

void ReadWrite::readSystemData(Model &_model)
{
	const auto wfs = readWindFarms();
	const auto hubs = readHubs();
	const auto substations = readSubstations();
	cout << "Read " << wfs.size() << " wind farms, " << hubs.size() << " energy hubs and "
		<< substations.size() << " onshore substations" << endl;
	_model.network.set_candidates(wfs, hubs, substations);
	_model.networkFiltered = false;
	_model.networkBuilt = false;
}

std::vector<std::string> ReadWrite::split(const std::string &s, char delim) const
{
	std::vector<std::string> result;
	std::stringstream ss(s);
	std::string item;
	while (std::getline(ss, item, delim)) {
		const auto first = item.find_first_not_of(" \t");
		const auto last = item.find_last_not_of(" \t");
		result.push_back(first == std::string::npos ? "" : item.substr(first, last - first + 1));
	}
	return result;
}

std::string ReadWrite::outputPath(const Model &_model, const std::string &_suffix) const
{
	return outputDirectory + "/" + _model.filePrefix() + "_" + _suffix;
}

void ReadWrite::writeRunMetadata(const Model &_model)
{
	const string countsFile = outputPath(_model, "variable_counts.csv");
	ofstream counts(countsFile.c_str());
	if (!counts) {
		cerr << "CANNOT OPEN " << countsFile << endl;
	}
	else {
		counts << "variable,count" << endl;
		for (const auto &entry : _model.variableCounts()) {
			counts << entry.first << "," << entry.second << endl;
		}
	}

	const string noteFile = outputPath(_model, "note.txt");
	ofstream note(noteFile.c_str());
	if (!note) {
		cerr << "CANNOT OPEN " << noteFile << endl;
		return;
	}
	note << _model.note();
}

void ReadWrite::writeStageResult(const Model &_model, const StageResult &_res)
{
	PRINT_SUBSECTION("Writing results for " << _res.year);
	const string year = to_string(_res.year);
	std::vector<string> failed;

	{
		const string fileName = outputPath(_model, "wind_farms_" + year + ".csv");
		ofstream output(fileName.c_str());
		if (!output) failed.push_back(fileName);
		output << setprecision(10);
		output << "id,iso,lon,lat,capacity,turbine_capacity,rate,cost,cumulative_cost" << endl;
		for (const auto &rec : _res.windFarms) {
			output << rec.id << "," << rec.iso << "," << rec.lon << "," << rec.lat << "," << rec.capacity << ","
				<< rec.turbineCapacity << "," << rec.rate << "," << rec.cost << "," << rec.cumulativeCost << endl;
		}
	}
	{
		const string fileName = outputPath(_model, "energy_hubs_" + year + ".csv");
		ofstream output(fileName.c_str());
		if (!output) failed.push_back(fileName);
		output << setprecision(10);
		output << "id,iso,lon,lat,water_depth,ice_cover,port_distance,capacity,cost,cumulative_cost" << endl;
		for (const auto &rec : _res.hubs) {
			output << rec.id << "," << rec.iso << "," << rec.lon << "," << rec.lat << "," << rec.waterDepth << ","
				<< rec.iceCover << "," << rec.portDistance << "," << rec.capacity << "," << rec.cost << "," << rec.cumulativeCost << endl;
		}
	}
	{
		const string fileName = outputPath(_model, "substations_" + year + ".csv");
		ofstream output(fileName.c_str());
		if (!output) failed.push_back(fileName);
		output << setprecision(10);
		output << "id,iso,lon,lat,threshold,capacity,cost,cumulative_cost" << endl;
		for (const auto &rec : _res.substations) {
			output << rec.id << "," << rec.iso << "," << rec.lon << "," << rec.lat << "," << rec.threshold << ","
				<< rec.capacity << "," << rec.cost << "," << rec.cumulativeCost << endl;
		}
	}
	for (int t = 0; t < ConnectionType::numConnectionTypes; t++) {
		const string component = ResultExtractor::componentName(static_cast<ConnectionType>(t));
		const string fileName = outputPath(_model, component + "_" + year + ".csv");
		ofstream output(fileName.c_str());
		if (!output) failed.push_back(fileName);
		output << setprecision(10);
		output << "cable_id,iso,from_id,to_id,lon_from,lat_from,lon_to,lat_to,distance,capacity,cost,cumulative_cost" << endl;
		for (const auto &rec : _res.cables[t]) {
			output << rec.cableId << "," << rec.iso << "," << rec.fromId << "," << rec.toId << "," << rec.lon1 << "," << rec.lat1 << ","
				<< rec.lon2 << "," << rec.lat2 << "," << rec.distance << "," << rec.capacity << "," << rec.cost << "," << rec.cumulativeCost << endl;
		}
	}
	{
		const string fileName = outputPath(_model, "global_" + year + ".csv");
		ofstream output(fileName.c_str());
		if (!output) failed.push_back(fileName);
		output << setprecision(10);
		output << "component,capacity,cost" << endl;
		for (const auto &row : _res.totals) {
			output << row.component << "," << row.capacity << "," << row.cost << endl;
		}
		output << "objective,," << _res.objective << endl;
		// limit-stopped stages are kept but flagged
		output << "status,," << statusName(_res.status) << endl;
	}

	for (const auto &fileName : failed) {
		cerr << "CANNOT WRITE " << fileName << endl;
	}
	if (_res.status == StageStatus::LIMIT_REACHED) {
		cerr << "Warning: stage " << _res.year << " stopped at a solver limit; results are not proven optimal" << endl;
	}
}
