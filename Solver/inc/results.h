#pragma once

#include "util.h"
#include "network.h"

// values of the capacity variables of one stage, aligned with the Network vectors
struct Solution
{
   std::vector<double> wf;
   std::vector<double> hub;
   std::vector<double> hubActive;
   std::vector<double> onss;
   std::vector<double> ec1;
   std::vector<double> ec2;
   std::vector<double> ec3;
   std::vector<double> onc;
   vector2double alloc;				// alloc[wf][country - 1]
   double objective;

   Solution(): objective(0) {}
   explicit Solution(const Network &_network, int _numCountries = 0);

   std::vector<double>& connection(ConnectionType _type);
   const std::vector<double>& connection(ConnectionType _type) const;
};

struct WindFarmRecord
{
   int id;
   std::string iso;
   double lon, lat;
   double capacity;
   double turbineCapacity;		// capacity rounded up to whole turbines
   double rate;					// share of the rated capacity
   double cost;					// cost of the capacity added in this stage
   double cumulativeCost;
};

struct HubRecord
{
   int id;
   std::string iso;
   double lon, lat;
   double waterDepth;
   int iceCover;
   double portDistance;
   double capacity;
   double cost;
   double cumulativeCost;
};

struct SubstationRecord
{
   int id;
   std::string iso;
   double lon, lat;
   double threshold;
   double capacity;
   double cost;
   double cumulativeCost;
};

struct CableRecord
{
   int cableId;
   std::string iso;
   int fromId, toId;
   double lon1, lat1, lon2, lat2;
   double distance;
   double capacity;
   double cost;
   double cumulativeCost;
};

struct ClassTotal
{
   std::string component;
   double capacity;
   double cost;

   ClassTotal(const std::string &_component, double _capacity, double _cost): component(_component), capacity(_capacity), cost(_cost) {}
};

struct StageResult
{
   int year;
   StageStatus status;
   double objective;

   std::vector<WindFarmRecord> windFarms;
   std::vector<HubRecord> hubs;
   std::vector<SubstationRecord> substations;
   std::vector<CableRecord> cables[ConnectionType::numConnectionTypes];
   std::vector<ClassTotal> totals;			// one row per class followed by the overall row

   StageResult(): year(0), status(StageStatus::NOT_SOLVED), objective(0) {}
};

class ResultExtractor
{
private:
   const Network &network;
   ResultForm resultForm;
   double zeroTh;
   double turbineCap;

   std::string isoOf(int _country) const;
   double turbineRounded(double _capacity) const;
   void extractWindFarms(StageResult &_res, const Solution &_cur, const Solution &_prev) const;
   void extractHubs(StageResult &_res, const Solution &_cur, const Solution &_prev) const;
   void extractSubstations(StageResult &_res, const Solution &_cur, const Solution &_prev) const;
   void extractCables(ConnectionType _type, StageResult &_res, const Solution &_cur, const Solution &_prev) const;
   void computeTotals(StageResult &_res) const;

public:
   ResultExtractor(const Network &_network, ResultForm _form);

   StageResult extract(int _year, const Solution &_cur, const Solution &_prev) const;

   static std::string componentName(ConnectionType _type);
};
