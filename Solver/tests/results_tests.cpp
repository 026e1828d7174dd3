#include "test_framework.h"

#include "../inc/results.h"
#include "../inc/cost.h"

namespace {

constexpr int kYear = 2040;

// one DE wind farm, one DE hub, a DE and a DK substation, all mutually reachable
Network MakeNetwork() {
   WindFarm wf;
   wf.id = 1; wf.country = 1; wf.lon = 14.0; wf.lat = 54.6; wf.capacity = 100;
   wf.cost[0] = 300; wf.cost[1] = 240; wf.cost[2] = 200;

   EnergyHub hub;
   hub.id = 5; hub.country = 1; hub.lon = 14.1; hub.lat = 54.8;
   hub.waterDepth = 35; hub.iceCover = 0; hub.portDistance = 60000;

   Substation onssDe;
   onssDe.id = 10; onssDe.country = 1; onssDe.lon = 14.0; onssDe.lat = 54.0; onssDe.threshold = 50;
   Substation onssDk;
   onssDk.id = 11; onssDk.country = 2; onssDk.lon = 14.5; onssDk.lat = 54.0; onssDk.threshold = 300;

   Network network;
   network.set_candidates({wf}, {hub}, {onssDe, onssDk});
   network.filter(FeasibilityThresholds(*ParamRegistry::instance()), CrossBorder::POOLED);
   return network;
}

const ClassTotal* FindTotal(const StageResult &res, const std::string &component) {
   for (const auto &row : res.totals) {
      if (row.component == component) return &row;
   }
   return nullptr;
}

bool Test_WindFarm_IncrementalAndCumulativeCost() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::LINEAR_RESULT);

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   prev.wf[0] = 40;
   cur.wf[0] = 100;

   const auto res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_EQ(res.windFarms.size(), size_t(1));
   const auto &rec = res.windFarms[0];
   OWGRID_EXPECT_EQ(rec.id, 1);
   OWGRID_EXPECT_EQ(rec.iso, std::string("DE"));
   OWGRID_EXPECT_NEAR(rec.capacity, 100.0, 1e-9);
   OWGRID_EXPECT_NEAR(rec.rate, 1.0, 1e-9);
   // 2040 uses the second cost column
   OWGRID_EXPECT_NEAR(rec.cost, 240.0 * 0.6, 1e-6);
   OWGRID_EXPECT_NEAR(rec.cumulativeCost, 240.0, 1e-6);
   return true;
}

bool Test_NegativeIncrementIsClamped() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::LINEAR_RESULT);

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   prev.ec3[0] = 120;
   cur.ec3[0] = 100;

   const auto res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_EQ(res.cables[EC3].size(), size_t(1));
   OWGRID_EXPECT_EQ(res.cables[EC3][0].cost, 0.0);
   OWGRID_EXPECT_TRUE(res.cables[EC3][0].cumulativeCost > 0);
   return true;
}

bool Test_Ceil_SnapsWindFarmsToWholeTurbines() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::CEIL_RESULT);

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   cur.wf[0] = 47;
   auto res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_NEAR(res.windFarms[0].capacity, 47.0, 1e-9);
   OWGRID_EXPECT_NEAR(res.windFarms[0].turbineCapacity, 60.0, 1e-9);
   OWGRID_EXPECT_NEAR(res.windFarms[0].cumulativeCost, 240.0 * 0.6, 1e-6);

   // an exact multiple stays put
   cur.wf[0] = 45;
   res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_NEAR(res.windFarms[0].turbineCapacity, 45.0, 1e-9);
   OWGRID_EXPECT_NEAR(res.windFarms[0].cost, 240.0 * 0.45, 1e-6);
   return true;
}

bool Test_Ceil_UsesWholeCables() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor linear(network, ResultForm::LINEAR_RESULT);
   const ResultExtractor ceil(network, ResultForm::CEIL_RESULT);

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   cur.ec1[0] = 100;

   const auto linRes = linear.extract(kYear, cur, prev);
   const auto ceilRes = ceil.extract(kYear, cur, prev);
   const double d = network.ec1[0].distance;
   OWGRID_EXPECT_NEAR(linRes.cables[EC1][0].cost, roundTo(CostModel::exportCable1Cost(kYear, d, 100, false)), 1e-9);
   OWGRID_EXPECT_NEAR(ceilRes.cables[EC1][0].cost, roundTo(CostModel::exportCable1Cost(kYear, d, 100, true)), 1e-9);
   OWGRID_EXPECT_TRUE(ceilRes.cables[EC1][0].cost > linRes.cables[EC1][0].cost);
   return true;
}

bool Test_ValuesBelowZeroThresholdAreNotReported() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::LINEAR_RESULT);

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   cur.wf[0] = 5e-4;
   cur.hub[0] = 1e-3;
   cur.ec2[0] = 2e-3;

   const auto res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_EQ(res.windFarms.size(), size_t(0));
   OWGRID_EXPECT_EQ(res.hubs.size(), size_t(0));
   OWGRID_EXPECT_EQ(res.cables[EC2].size(), size_t(1));
   return true;
}

bool Test_Hub_FixedCostOnlyAtFirstActivation() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::LINEAR_RESULT);
   const auto &hub = network.hubs[0];

   Solution none(network, ParamRegistry::instance()->numCountries());
   Solution first(network, ParamRegistry::instance()->numCountries());
   first.hub[0] = 200;
   first.hubActive[0] = 1;
   Solution second = first;
   second.hub[0] = 300;

   const auto built = extractor.extract(kYear, first, none);
   OWGRID_EXPECT_NEAR(built.hubs[0].cost,
      roundTo(CostModel::energyHubCost(kYear, hub.waterDepth, hub.iceCover, hub.portDistance, 200, 1)), 1e-9);

   const auto expanded = extractor.extract(kYear, second, first);
   OWGRID_EXPECT_NEAR(expanded.hubs[0].cost,
      roundTo(CostModel::energyHubCost(kYear, hub.waterDepth, hub.iceCover, hub.portDistance, 100, 0)), 1e-9);
   OWGRID_EXPECT_NEAR(expanded.hubs[0].cumulativeCost,
      roundTo(CostModel::energyHubCost(kYear, hub.waterDepth, hub.iceCover, hub.portDistance, 300, 1)), 1e-9);
   return true;
}

bool Test_Substation_CostOfIncreaseAboveThreshold() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::LINEAR_RESULT);
   const int s = (network.substations[0].id == 10) ? 0 : 1;

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   prev.onss[s] = 40;			// below the threshold of 50
   cur.onss[s] = 80;

   const auto res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_EQ(res.substations.size(), size_t(1));
   const double expected = CostModel::substationCost(kYear, 80, 50);
   OWGRID_EXPECT_NEAR(res.substations[0].cost, roundTo(expected), 1e-9);
   OWGRID_EXPECT_NEAR(res.substations[0].cumulativeCost, roundTo(expected), 1e-9);

   // capacity within the threshold costs nothing
   cur.onss[s] = 45;
   const auto within = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_EQ(within.substations[0].cost, 0.0);
   OWGRID_EXPECT_EQ(within.substations[0].cumulativeCost, 0.0);
   return true;
}

bool Test_CableRecords_CarryEndpointsAndIso() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::LINEAR_RESULT);

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   for (auto &v : cur.ec2) v = 150;
   for (auto &v : cur.onc) v = 20;

   const auto res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_EQ(res.cables[EC2].size(), network.ec2.size());
   for (size_t k = 0; k < res.cables[EC2].size(); k++) {
      const auto &rec = res.cables[EC2][k];
      const auto &onss = network.substations[network.ec2[k].to];
      OWGRID_EXPECT_EQ(rec.cableId, int(k) + 1);
      OWGRID_EXPECT_EQ(rec.fromId, 5);
      OWGRID_EXPECT_EQ(rec.toId, onss.id);
      OWGRID_EXPECT_EQ(rec.iso, ParamRegistry::instance()->isoCodes[onss.country - 1]);
      OWGRID_EXPECT_NEAR(rec.lon2, onss.lon, 1e-12);
      OWGRID_EXPECT_NEAR(rec.distance, roundTo(network.ec2[k].distance), 1e-12);
   }
   OWGRID_EXPECT_EQ(res.cables[ONC].size(), size_t(2));
   for (size_t k = 0; k < res.cables[ONC].size(); k++) {
      const auto &from = network.substations[network.onc[k].from];
      OWGRID_EXPECT_EQ(res.cables[ONC][k].iso, ParamRegistry::instance()->isoCodes[from.country - 1]);
   }
   return true;
}

bool Test_Totals_SumPerClassAndOverall() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   const ResultExtractor extractor(network, ResultForm::LINEAR_RESULT);

   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   cur.wf[0] = 90;
   cur.hub[0] = 90;
   cur.hubActive[0] = 1;
   cur.ec1[0] = 90;
   for (auto &v : cur.ec2) v = 45;
   for (auto &v : cur.onss) v = 45;

   const auto res = extractor.extract(kYear, cur, prev);
   OWGRID_EXPECT_EQ(res.totals.size(), size_t(8));
   OWGRID_EXPECT_EQ(res.totals.back().component, std::string("overall"));

   const auto ec2 = FindTotal(res, "ec2");
   OWGRID_EXPECT_TRUE(ec2 != nullptr);
   OWGRID_EXPECT_NEAR(ec2->capacity, 90.0, 1e-9);
   double ec2Cost = 0;
   for (const auto &rec : res.cables[EC2]) ec2Cost += rec.cost;
   OWGRID_EXPECT_NEAR(ec2->cost, roundTo(ec2Cost), 1e-9);

   double capacity = 0, cost = 0;
   for (size_t i = 0; i + 1 < res.totals.size(); i++) {
      capacity += res.totals[i].capacity;
      cost += res.totals[i].cost;
   }
   OWGRID_EXPECT_NEAR(res.totals.back().capacity, capacity, 1e-6);
   OWGRID_EXPECT_NEAR(res.totals.back().cost, cost, 1e-6);
   OWGRID_EXPECT_NEAR(FindTotal(res, "wind_farms")->cost, 216.0, 1e-6);
   OWGRID_EXPECT_NEAR(FindTotal(res, "onc")->capacity, 0.0, 1e-12);
   return true;
}

bool Test_SensitivityFactorScalesClassCost() {
   ParamRegistry::instance()->reset();
   const Network network = MakeNetwork();
   Solution prev(network, ParamRegistry::instance()->numCountries());
   Solution cur(network, ParamRegistry::instance()->numCountries());
   cur.ec1[0] = 200;

   const double base = ResultExtractor(network, ResultForm::LINEAR_RESULT).extract(kYear, cur, prev).cables[EC1][0].cost;
   ParamRegistry::instance()->sfEc1 = 1.5;
   const double scaled = ResultExtractor(network, ResultForm::LINEAR_RESULT).extract(kYear, cur, prev).cables[EC1][0].cost;
   ParamRegistry::instance()->reset();
   OWGRID_EXPECT_NEAR(scaled, 1.5 * base, 1e-5);
   return true;
}

} // namespace

int main() {
   std::vector<TestCase> cases{
      {"wind farm incremental and cumulative cost", Test_WindFarm_IncrementalAndCumulativeCost},
      {"negative increment is clamped", Test_NegativeIncrementIsClamped},
      {"ceil form snaps wind farms to whole turbines", Test_Ceil_SnapsWindFarmsToWholeTurbines},
      {"ceil form uses whole cables", Test_Ceil_UsesWholeCables},
      {"values at the zero threshold are not reported", Test_ValuesBelowZeroThresholdAreNotReported},
      {"hub fixed cost only at first activation", Test_Hub_FixedCostOnlyAtFirstActivation},
      {"substation pays for the increase above threshold", Test_Substation_CostOfIncreaseAboveThreshold},
      {"cable records carry endpoints and iso", Test_CableRecords_CarryEndpointsAndIso},
      {"totals per class and overall", Test_Totals_SumPerClassAndOverall},
      {"sensitivity factor scales a class", Test_SensitivityFactorScalesClassCost},
   };
   return RunAll(cases);
}
