#pragma once

#include "util.h"
#include "parameter.h"
#include "windfarm.h"
#include "energyhub.h"
#include "substation.h"
#include "connection.h"

// great-circle distance (km) between two points given in decimal degrees
double haversine(double lon1, double lat1, double lon2, double lat2);

struct FeasibilityThresholds
{
   double ec1;
   double ec2;
   double ec3;
   double onc;

   FeasibilityThresholds(): ec1(0), ec2(0), ec3(0), onc(0) {}
   explicit FeasibilityThresholds(const ParamRegistry &_param):
      ec1(_param.maxDistEc1), ec2(_param.maxDistEc2), ec3(_param.maxDistEc3), onc(_param.maxDistOnc) {}
};

class Network
{
private:
   // candidate sites as read from the datasets
   std::vector<WindFarm> candidateWindFarms;
   std::vector<EnergyHub> candidateHubs;
   std::vector<Substation> candidateSubstations;

   static std::vector<Connection> findViable(const std::vector<std::pair<double, double> > &_from,
      const std::vector<int> &_fromCountry, const std::vector<std::pair<double, double> > &_to,
      const std::vector<int> &_toCountry, double _threshold, bool _domesticOnly, bool _excludeSelf);
   void buildAdjacency();

public:
   // viable entities; connections index these vectors
   std::vector<WindFarm> windFarms;
   std::vector<EnergyHub> hubs;
   std::vector<Substation> substations;

   std::vector<Connection> ec1;		// wind farm -> energy hub
   std::vector<Connection> ec2;		// energy hub -> onshore substation
   std::vector<Connection> ec3;		// wind farm -> onshore substation
   std::vector<Connection> onc;		// onshore substation -> onshore substation

   // adjacency: entity -> positions of incident connections
   vector2int wfEc1, wfEc3;
   vector2int hubEc1, hubEc2;
   vector2int onssEc2, onssEc3, onssOncOut, onssOncIn;

   void set_candidates(const std::vector<WindFarm> &_wfs, const std::vector<EnergyHub> &_hubs, const std::vector<Substation> &_onss) {
      candidateWindFarms = _wfs;
      candidateHubs = _hubs;
      candidateSubstations = _onss;
   }
   const std::vector<WindFarm>& get_candidate_wind_farms() const { return candidateWindFarms; }
   const std::vector<EnergyHub>& get_candidate_hubs() const { return candidateHubs; }
   const std::vector<Substation>& get_candidate_substations() const { return candidateSubstations; }

   void filter(const FeasibilityThresholds &_thresholds, CrossBorder _crossBorder);

   int numWindFarms() const { return static_cast<int>(windFarms.size()); }
   int numHubs() const { return static_cast<int>(hubs.size()); }
   int numSubstations() const { return static_cast<int>(substations.size()); }
   const std::vector<Connection>& connections(ConnectionType _type) const;

   double viableCapacity(int _country) const;		// rated capacity of the viable wind farms of a country
};
