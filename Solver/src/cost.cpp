#include "cost.h"

// export and onshore cables
constexpr auto CABLE_CAPACITY = 348.0;			// MW per cable
constexpr auto CABLE_CAPACITY_FACTOR = 0.95;
constexpr auto CABLE_EQUIP_COST = 0.860;			// per km
constexpr auto CABLE_INST_COST = 0.540;			// per km
constexpr auto CABLE_ROUTE_FACTOR = 1.10;
constexpr auto CABLE_TRANSITION_LENGTH = 2.0;		// km, offshore to onshore transition
constexpr auto CABLE_OPE_RATE = 0.2 * 1e-2;
constexpr auto CABLE_DECO_RATE = 0.5;

// energy hubs
constexpr auto HUB_CONVERTER_COST = 0.0745;		// per MW
constexpr auto HUB_OPE_RATE = 0.03;
constexpr auto ICE_COVER_FACTOR = 1 + 0.4 * 0.5714;

// onshore substations
constexpr auto ONSS_EQUIP_COST = 0.02287;			// per MW above threshold
constexpr auto ONSS_OPE_RATE = 0.015;

// support structure coefficients (c1, c2, c3) per reference year and structure
static const double SUPPORT_COEFF[NUM_REF_YEARS][3][3] = {
	{ {181, 552, 370}, {103, -2043, 478}, {0, 697, 1223} },		// 2030
	{ {176, 536, 270}, {100, -1986, 375}, {0, 678, 1034} },		// 2040
	{ {171, 521, 170}, {97, -1930, 658}, {0, 658, 844} }		// 2050
};

// vessel coefficients: units per trip, speed (km/h), loading time (h), operation time (h), day rate (kEUR)
static const double PSIV_COEFF[5] = {1, 18.5, 24, 144, 200};
static const double TUG_COEFF[5] = {1.0 / 3.0, 7.5, 5, 0, 2.5};
static const double AHV_INST_COEFF[5] = {7, 18.5, 30, 90, 40};
static const double AHV_DECO_COEFF[5] = {7, 18.5, 30, 30, 40};

static double vesselCost(const double *c, double _portDistanceKm)
{
	return ((1 / c[0]) * ((2 * _portDistanceKm) / c[1] + c[2]) + c[3]) * ((c[4] * 1e3) / 24);
}

double CostModel::presentValue(int _firstYear, double _equip, double _inst, double _opeYearly, double _deco)
{
	const auto paramReg = ParamRegistry::instance();
	const double r = paramReg->discountRate;
	const int n = paramReg->lifetime;

	const double df0 = std::pow(1 + r, -(_firstYear - paramReg->baseYear));
	double opeFactor = 0;
	for (int y = 1; y <= n; y++) {
		opeFactor += std::pow(1 + r, -(_firstYear + y - paramReg->baseYear));
	}
	const double dfEnd = std::pow(1 + r, -(_firstYear + n - paramReg->baseYear));

	return (_equip + _inst) * df0 + _opeYearly * opeFactor + _deco * dfEnd;
}

SupportStructure CostModel::supportStructure(double _waterDepth)
{
	if (_waterDepth < 25) return SupportStructure::MONOPILE;
	if (_waterDepth < 55) return SupportStructure::JACKET;
	return SupportStructure::FLOATING;
}

double CostModel::windFarmCost(double _cost, double _ratedCapacity, double _capacity)
{
	if (_ratedCapacity <= 0) return 0;
	return _cost * (_capacity / _ratedCapacity);
}

double CostModel::hubConverterCost(int _iceCover, double _capacity)
{
	double cost = _capacity * HUB_CONVERTER_COST;
	if (_iceCover == 1) cost *= ICE_COVER_FACTOR;
	return cost;
}

double CostModel::hubEquipmentCost(int _year, double _waterDepth, int _iceCover, double _capacity)
{
	const auto supp = supportStructure(_waterDepth);
	const auto &c = SUPPORT_COEFF[ParamRegistry::instance()->refYearIndex(_year)][supp];
	double suppCost = _capacity * (c[0] * _waterDepth * _waterDepth + c[1] * _waterDepth + c[2] * 1e3) * 1e-6;
	if (_iceCover == 1) suppCost *= ICE_COVER_FACTOR;
	return suppCost + hubConverterCost(_iceCover, _capacity);
}

double CostModel::hubVesselCost(SupportStructure _supp, double _portDistance, bool _installation)
{
	const double portDistanceKm = _portDistance * 1e-3;
	double total = 0;
	if (_supp == SupportStructure::FLOATING) {
		total = vesselCost(TUG_COEFF, portDistanceKm);
		total += vesselCost(_installation ? AHV_INST_COEFF : AHV_DECO_COEFF, portDistanceKm);
	}
	else {
		total = vesselCost(PSIV_COEFF, portDistanceKm);
	}
	return total * 1e-6;
}

double CostModel::energyHubCost(int _year, double _waterDepth, int _iceCover, double _portDistance, double _capacity, double _active)
{
	const auto supp = supportStructure(_waterDepth);
	const double equipCost = hubEquipmentCost(_year, _waterDepth, _iceCover, _capacity);
	const double instCost = _active * hubVesselCost(supp, _portDistance, true);
	const double decoCost = _active * hubVesselCost(supp, _portDistance, false);
	const double opeYearly = HUB_OPE_RATE * hubConverterCost(_iceCover, _capacity);

	return presentValue(_year, equipCost, instCost, opeYearly, decoCost);
}

double CostModel::parallelCables(double _capacity, bool _ceilCount)
{
	const double cables = _capacity / (CABLE_CAPACITY * CABLE_CAPACITY_FACTOR);
	return _ceilCount ? std::ceil(cables) : cables;
}

double CostModel::cableLifecycleCost(int _year, double _cableLength, double _capacity, double _instCostPerKm, bool _ceilCount)
{
	const double cables = parallelCables(_capacity, _ceilCount);
	const double equipCost = cables * _cableLength * CABLE_EQUIP_COST;
	const double instCost = cables * _cableLength * _instCostPerKm;
	const double opeYearly = CABLE_OPE_RATE * equipCost;
	const double decoCost = CABLE_DECO_RATE * instCost;

	return presentValue(_year, equipCost, instCost, opeYearly, decoCost);
}

double CostModel::exportCable1Cost(int _year, double _distance, double _capacity, bool _ceilCount)
{
	return cableLifecycleCost(_year, CABLE_ROUTE_FACTOR * _distance, _capacity, CABLE_INST_COST, _ceilCount);
}

double CostModel::exportCable2Cost(int _year, double _distance, double _capacity, bool _ceilCount)
{
	const double length = CABLE_ROUTE_FACTOR * _distance + CABLE_TRANSITION_LENGTH;
	return cableLifecycleCost(_year, length, _capacity, CABLE_INST_COST, _ceilCount);
}

double CostModel::exportCable3Cost(int _year, double _distance, double _capacity, bool _ceilCount)
{
	const double length = CABLE_ROUTE_FACTOR * _distance + CABLE_TRANSITION_LENGTH;
	return cableLifecycleCost(_year, length, _capacity, CABLE_INST_COST, _ceilCount);
}

double CostModel::onshoreCableCost(int _year, double _distance, double _capacity, bool _ceilCount)
{
	return cableLifecycleCost(_year, CABLE_ROUTE_FACTOR * _distance, _capacity, CABLE_INST_COST * 0.5, _ceilCount);
}

double CostModel::cableCost(ConnectionType _type, int _year, double _distance, double _capacity, bool _ceilCount)
{
	switch (_type)
	{
	case ConnectionType::EC1:
		return exportCable1Cost(_year, _distance, _capacity, _ceilCount);
	case ConnectionType::EC2:
		return exportCable2Cost(_year, _distance, _capacity, _ceilCount);
	case ConnectionType::EC3:
		return exportCable3Cost(_year, _distance, _capacity, _ceilCount);
	default:
		return onshoreCableCost(_year, _distance, _capacity, _ceilCount);
	}
}

double CostModel::substationCost(int _year, double _capacity, double _threshold)
{
	const double equipCost = (_capacity - _threshold) * ONSS_EQUIP_COST;
	const double opeYearly = ONSS_OPE_RATE * equipCost;
	return presentValue(_year, equipCost, 0, opeYearly, 0);
}
