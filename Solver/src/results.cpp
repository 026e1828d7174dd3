#include "results.h"
#include "cost.h"

Solution::Solution(const Network &_network, int _numCountries): objective(0)
{
	wf = std::vector<double>(_network.numWindFarms(), 0.0);
	hub = std::vector<double>(_network.numHubs(), 0.0);
	hubActive = std::vector<double>(_network.numHubs(), 0.0);
	onss = std::vector<double>(_network.numSubstations(), 0.0);
	ec1 = std::vector<double>(_network.ec1.size(), 0.0);
	ec2 = std::vector<double>(_network.ec2.size(), 0.0);
	ec3 = std::vector<double>(_network.ec3.size(), 0.0);
	onc = std::vector<double>(_network.onc.size(), 0.0);
	alloc = vector2double(_network.numWindFarms(), std::vector<double>(_numCountries, 0.0));
}

std::vector<double>& Solution::connection(ConnectionType _type)
{
	switch (_type)
	{
	case ConnectionType::EC1:
		return ec1;
	case ConnectionType::EC2:
		return ec2;
	case ConnectionType::EC3:
		return ec3;
	default:
		return onc;
	}
}

const std::vector<double>& Solution::connection(ConnectionType _type) const
{
	switch (_type)
	{
	case ConnectionType::EC1:
		return ec1;
	case ConnectionType::EC2:
		return ec2;
	case ConnectionType::EC3:
		return ec3;
	default:
		return onc;
	}
}

ResultExtractor::ResultExtractor(const Network &_network, ResultForm _form): network(_network), resultForm(_form)
{
	const auto paramReg = ParamRegistry::instance();
	zeroTh = paramReg->zeroThreshold;
	turbineCap = paramReg->turbineCapacity;
}

std::string ResultExtractor::componentName(ConnectionType _type)
{
	switch (_type)
	{
	case ConnectionType::EC1:
		return "ec1";
	case ConnectionType::EC2:
		return "ec2";
	case ConnectionType::EC3:
		return "ec3";
	default:
		return "onc";
	}
}

std::string ResultExtractor::isoOf(int _country) const
{
	const auto &isoCodes = ParamRegistry::instance()->isoCodes;
	if (_country < 1 || _country > int(isoCodes.size())) return "??";
	return isoCodes[_country - 1];
}

double ResultExtractor::turbineRounded(double _capacity) const
{
	if (_capacity <= 0) return 0;
	// tolerance keeps an exact multiple from being pushed up by rounding noise
	return std::ceil(_capacity / turbineCap - 1e-9) * turbineCap;
}

StageResult ResultExtractor::extract(int _year, const Solution &_cur, const Solution &_prev) const
{
	StageResult res;
	res.year = _year;
	res.objective = _cur.objective;

	extractWindFarms(res, _cur, _prev);
	extractHubs(res, _cur, _prev);
	extractSubstations(res, _cur, _prev);
	for (int t = 0; t < ConnectionType::numConnectionTypes; t++) {
		extractCables(static_cast<ConnectionType>(t), res, _cur, _prev);
	}
	computeTotals(res);
	return res;
}

void ResultExtractor::extractWindFarms(StageResult &_res, const Solution &_cur, const Solution &_prev) const
{
	const auto paramReg = ParamRegistry::instance();
	const int refIndex = paramReg->refYearIndex(_res.year);
	for (int i = 0; i < network.numWindFarms(); i++) {
		if (_cur.wf[i] <= zeroTh) continue;
		const auto &wf = network.windFarms[i];
		WindFarmRecord rec;
		rec.id = wf.id;
		rec.iso = isoOf(wf.country);
		rec.lon = wf.lon;
		rec.lat = wf.lat;
		rec.capacity = roundTo(_cur.wf[i]);
		rec.turbineCapacity = turbineRounded(rec.capacity);
		rec.rate = roundTo(rec.capacity / wf.capacity);

		double added = CostModel::clampIncrement(rec.capacity, _prev.wf[i]);
		double cumulative = rec.capacity;
		if (resultForm == ResultForm::CEIL_RESULT) {
			added = turbineRounded(added);
			cumulative = rec.turbineCapacity;
		}
		rec.cost = roundTo(paramReg->sfWindFarm * CostModel::windFarmCost(wf.cost[refIndex], wf.capacity, added));
		rec.cumulativeCost = roundTo(paramReg->sfWindFarm * CostModel::windFarmCost(wf.cost[refIndex], wf.capacity, cumulative));
		_res.windFarms.push_back(rec);
	}
}

void ResultExtractor::extractHubs(StageResult &_res, const Solution &_cur, const Solution &_prev) const
{
	const auto paramReg = ParamRegistry::instance();
	for (int h = 0; h < network.numHubs(); h++) {
		if (_cur.hub[h] <= zeroTh) continue;
		const auto &hub = network.hubs[h];
		HubRecord rec;
		rec.id = hub.id;
		rec.iso = isoOf(hub.country);
		rec.lon = hub.lon;
		rec.lat = hub.lat;
		rec.waterDepth = hub.waterDepth;
		rec.iceCover = hub.iceCover;
		rec.portDistance = hub.portDistance;
		rec.capacity = roundTo(_cur.hub[h]);

		const double active = std::round(_cur.hubActive[h]);
		// installation and decommissioning are paid in the stage the hub is first built
		const double newlyActive = (_prev.hub[h] <= zeroTh) ? active : 0.0;
		const double added = CostModel::clampIncrement(rec.capacity, _prev.hub[h]);
		rec.cost = roundTo(paramReg->sfHub * CostModel::energyHubCost(_res.year, hub.waterDepth, hub.iceCover, hub.portDistance, added, newlyActive));
		rec.cumulativeCost = roundTo(paramReg->sfHub * CostModel::energyHubCost(_res.year, hub.waterDepth, hub.iceCover, hub.portDistance, rec.capacity, active));
		_res.hubs.push_back(rec);
	}
}

void ResultExtractor::extractSubstations(StageResult &_res, const Solution &_cur, const Solution &_prev) const
{
	const auto paramReg = ParamRegistry::instance();
	for (int s = 0; s < network.numSubstations(); s++) {
		if (_cur.onss[s] <= zeroTh) continue;
		const auto &onss = network.substations[s];
		SubstationRecord rec;
		rec.id = onss.id;
		rec.iso = isoOf(onss.country);
		rec.lon = onss.lon;
		rec.lat = onss.lat;
		rec.threshold = onss.threshold;
		rec.capacity = roundTo(_cur.onss[s]);

		const double cumulative = std::max(0.0, CostModel::substationCost(_res.year, rec.capacity, onss.threshold));
		const double previous = std::max(0.0, CostModel::substationCost(_res.year, _prev.onss[s], onss.threshold));
		rec.cost = roundTo(paramReg->sfOnss * std::max(0.0, cumulative - previous));
		rec.cumulativeCost = roundTo(paramReg->sfOnss * cumulative);
		_res.substations.push_back(rec);
	}
}

void ResultExtractor::extractCables(ConnectionType _type, StageResult &_res, const Solution &_cur, const Solution &_prev) const
{
	const auto paramReg = ParamRegistry::instance();
	const bool ceilCount = (resultForm == ResultForm::CEIL_RESULT);
	double sf = paramReg->sfOnc;
	if (_type == ConnectionType::EC1) sf = paramReg->sfEc1;
	else if (_type == ConnectionType::EC2) sf = paramReg->sfEc2;
	else if (_type == ConnectionType::EC3) sf = paramReg->sfEc3;

	const auto &conns = network.connections(_type);
	const auto &cur = _cur.connection(_type);
	const auto &prev = _prev.connection(_type);
	auto &records = _res.cables[_type];
	int cableId = 1;
	for (int k = 0; k < int(conns.size()); k++) {
		if (cur[k] <= zeroTh) continue;
		const auto &conn = conns[k];
		CableRecord rec;
		rec.cableId = cableId++;
		switch (_type)
		{
		case ConnectionType::EC1: {
			const auto &wf = network.windFarms[conn.from];
			const auto &hub = network.hubs[conn.to];
			rec.iso = isoOf(hub.country);
			rec.fromId = wf.id; rec.lon1 = wf.lon; rec.lat1 = wf.lat;
			rec.toId = hub.id; rec.lon2 = hub.lon; rec.lat2 = hub.lat;
			break;
		}
		case ConnectionType::EC2: {
			const auto &hub = network.hubs[conn.from];
			const auto &onss = network.substations[conn.to];
			rec.iso = isoOf(onss.country);
			rec.fromId = hub.id; rec.lon1 = hub.lon; rec.lat1 = hub.lat;
			rec.toId = onss.id; rec.lon2 = onss.lon; rec.lat2 = onss.lat;
			break;
		}
		case ConnectionType::EC3: {
			const auto &wf = network.windFarms[conn.from];
			const auto &onss = network.substations[conn.to];
			rec.iso = isoOf(onss.country);
			rec.fromId = wf.id; rec.lon1 = wf.lon; rec.lat1 = wf.lat;
			rec.toId = onss.id; rec.lon2 = onss.lon; rec.lat2 = onss.lat;
			break;
		}
		default: {
			const auto &from = network.substations[conn.from];
			const auto &to = network.substations[conn.to];
			rec.iso = isoOf(from.country);
			rec.fromId = from.id; rec.lon1 = from.lon; rec.lat1 = from.lat;
			rec.toId = to.id; rec.lon2 = to.lon; rec.lat2 = to.lat;
			break;
		}
		}
		rec.distance = roundTo(conn.distance);
		rec.capacity = roundTo(cur[k]);
		const double added = CostModel::clampIncrement(rec.capacity, prev[k]);
		rec.cost = roundTo(sf * CostModel::cableCost(_type, _res.year, conn.distance, added, ceilCount));
		rec.cumulativeCost = roundTo(sf * CostModel::cableCost(_type, _res.year, conn.distance, rec.capacity, ceilCount));
		records.push_back(rec);
	}
}

void ResultExtractor::computeTotals(StageResult &_res) const
{
	_res.totals.clear();
	double capacity = 0, cost = 0;

	for (const auto &rec : _res.windFarms) { capacity += rec.capacity; cost += rec.cost; }
	_res.totals.emplace_back("wind_farms", capacity, cost);

	capacity = 0; cost = 0;
	for (const auto &rec : _res.hubs) { capacity += rec.capacity; cost += rec.cost; }
	_res.totals.emplace_back("energy_hubs", capacity, cost);

	capacity = 0; cost = 0;
	for (const auto &rec : _res.substations) { capacity += rec.capacity; cost += rec.cost; }
	_res.totals.emplace_back("substations", capacity, cost);

	for (int t = 0; t < ConnectionType::numConnectionTypes; t++) {
		capacity = 0; cost = 0;
		for (const auto &rec : _res.cables[t]) { capacity += rec.capacity; cost += rec.cost; }
		_res.totals.emplace_back(componentName(static_cast<ConnectionType>(t)), capacity, cost);
	}

	double totalCapacity = 0, totalCost = 0;
	for (auto &row : _res.totals) {
		row.capacity = roundTo(row.capacity);
		row.cost = roundTo(row.cost);
		totalCapacity += row.capacity;
		totalCost += row.cost;
	}
	_res.totals.emplace_back("overall", roundTo(totalCapacity), roundTo(totalCost));
}
