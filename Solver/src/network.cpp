#include "network.h"

double haversine(double lon1, double lat1, double lon2, double lat2)
{
	const double dlon = (lon2 - lon1) * DEG_TO_RAD;
	const double dlat = (lat2 - lat1) * DEG_TO_RAD;
	const double a = std::sin(dlat / 2.0) * std::sin(dlat / 2.0) +
		std::cos(lat1 * DEG_TO_RAD) * std::cos(lat2 * DEG_TO_RAD) * std::sin(dlon / 2.0) * std::sin(dlon / 2.0);
	const double c = 2 * std::asin(std::sqrt(std::min(1.0, a)));
	return c * EARTH_RADIUS_KM;
}

std::vector<Connection> Network::findViable(const std::vector<std::pair<double, double> > &_from,
	const std::vector<int> &_fromCountry, const std::vector<std::pair<double, double> > &_to,
	const std::vector<int> &_toCountry, double _threshold, bool _domesticOnly, bool _excludeSelf)
{
	std::vector<Connection> viable;
	for (int i = 0; i < int(_from.size()); i++) {
		for (int j = 0; j < int(_to.size()); j++) {
			if (_excludeSelf && i == j) continue;
			if (_domesticOnly && _fromCountry[i] != _toCountry[j]) continue;
			const double distance = haversine(_from[i].first, _from[i].second, _to[j].first, _to[j].second);
			if (distance <= _threshold) {
				viable.emplace_back(i, j, distance);
			}
		}
	}
	return viable;
}

void Network::filter(const FeasibilityThresholds &_thresholds, CrossBorder _crossBorder)
{
	const bool domesticOnly = (_crossBorder == CrossBorder::DOMESTIC);

	std::vector<std::pair<double, double> > wfPos, hubPos, onssPos;
	std::vector<int> wfIso, hubIso, onssIso;
	for (const auto &wf : candidateWindFarms) {
		wfPos.emplace_back(wf.lon, wf.lat);
		wfIso.push_back(wf.country);
	}
	for (const auto &hub : candidateHubs) {
		hubPos.emplace_back(hub.lon, hub.lat);
		hubIso.push_back(hub.country);
	}
	for (const auto &onss : candidateSubstations) {
		onssPos.emplace_back(onss.lon, onss.lat);
		onssIso.push_back(onss.country);
	}

	// candidate level connections
	const auto allEc1 = findViable(wfPos, wfIso, hubPos, hubIso, _thresholds.ec1, domesticOnly, false);
	const auto allEc2 = findViable(hubPos, hubIso, onssPos, onssIso, _thresholds.ec2, domesticOnly, false);
	const auto allEc3 = findViable(wfPos, wfIso, onssPos, onssIso, _thresholds.ec3, domesticOnly, false);
	const auto allOnc = findViable(onssPos, onssIso, onssPos, onssIso, _thresholds.onc, domesticOnly, true);

	// an entity is viable if it takes part in at least one export connection
	std::vector<int> wfMap(candidateWindFarms.size(), -1);
	std::vector<int> hubMap(candidateHubs.size(), -1);
	std::vector<int> onssMap(candidateSubstations.size(), -1);
	for (const auto &conn : allEc1) {
		wfMap[conn.from] = 0;
		hubMap[conn.to] = 0;
	}
	for (const auto &conn : allEc2) {
		hubMap[conn.from] = 0;
		onssMap[conn.to] = 0;
	}
	for (const auto &conn : allEc3) {
		wfMap[conn.from] = 0;
		onssMap[conn.to] = 0;
	}

	windFarms.clear();
	hubs.clear();
	substations.clear();
	for (int i = 0; i < int(candidateWindFarms.size()); i++) {
		if (wfMap[i] < 0) continue;
		wfMap[i] = static_cast<int>(windFarms.size());
		windFarms.push_back(candidateWindFarms[i]);
	}
	for (int i = 0; i < int(candidateHubs.size()); i++) {
		if (hubMap[i] < 0) continue;
		hubMap[i] = static_cast<int>(hubs.size());
		hubs.push_back(candidateHubs[i]);
	}
	for (int i = 0; i < int(candidateSubstations.size()); i++) {
		if (onssMap[i] < 0) continue;
		onssMap[i] = static_cast<int>(substations.size());
		substations.push_back(candidateSubstations[i]);
	}

	ec1.clear();
	ec2.clear();
	ec3.clear();
	onc.clear();
	for (const auto &conn : allEc1) ec1.emplace_back(wfMap[conn.from], hubMap[conn.to], conn.distance);
	for (const auto &conn : allEc2) ec2.emplace_back(hubMap[conn.from], onssMap[conn.to], conn.distance);
	for (const auto &conn : allEc3) ec3.emplace_back(wfMap[conn.from], onssMap[conn.to], conn.distance);
	for (const auto &conn : allOnc) {
		if (onssMap[conn.from] < 0 || onssMap[conn.to] < 0) continue;
		onc.emplace_back(onssMap[conn.from], onssMap[conn.to], conn.distance);
	}

	buildAdjacency();
}

void Network::buildAdjacency()
{
	wfEc1 = vector2int(windFarms.size());
	wfEc3 = vector2int(windFarms.size());
	hubEc1 = vector2int(hubs.size());
	hubEc2 = vector2int(hubs.size());
	onssEc2 = vector2int(substations.size());
	onssEc3 = vector2int(substations.size());
	onssOncOut = vector2int(substations.size());
	onssOncIn = vector2int(substations.size());

	for (int k = 0; k < int(ec1.size()); k++) {
		wfEc1[ec1[k].from].push_back(k);
		hubEc1[ec1[k].to].push_back(k);
	}
	for (int k = 0; k < int(ec2.size()); k++) {
		hubEc2[ec2[k].from].push_back(k);
		onssEc2[ec2[k].to].push_back(k);
	}
	for (int k = 0; k < int(ec3.size()); k++) {
		wfEc3[ec3[k].from].push_back(k);
		onssEc3[ec3[k].to].push_back(k);
	}
	for (int k = 0; k < int(onc.size()); k++) {
		onssOncOut[onc[k].from].push_back(k);
		onssOncIn[onc[k].to].push_back(k);
	}
}

const std::vector<Connection>& Network::connections(ConnectionType _type) const
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

double Network::viableCapacity(int _country) const
{
	double total = 0;
	for (const auto &wf : windFarms) {
		if (wf.country == _country) total += wf.capacity;
	}
	return total;
}
