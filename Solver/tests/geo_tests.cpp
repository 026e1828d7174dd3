#include "test_framework.h"

#include "../inc/network.h"

namespace {

WindFarm MakeWindFarm(int id, int country, double lon, double lat, double capacity) {
   WindFarm wf;
   wf.id = id;
   wf.country = country;
   wf.lon = lon;
   wf.lat = lat;
   wf.capacity = capacity;
   return wf;
}

EnergyHub MakeHub(int id, int country, double lon, double lat) {
   EnergyHub hub;
   hub.id = id;
   hub.country = country;
   hub.lon = lon;
   hub.lat = lat;
   hub.waterDepth = 30;
   hub.portDistance = 50000;
   return hub;
}

Substation MakeSubstation(int id, int country, double lon, double lat, double threshold) {
   Substation onss;
   onss.id = id;
   onss.country = country;
   onss.lon = lon;
   onss.lat = lat;
   onss.threshold = threshold;
   return onss;
}

FeasibilityThresholds Thresholds(double ec1, double ec2, double ec3, double onc) {
   FeasibilityThresholds th;
   th.ec1 = ec1;
   th.ec2 = ec2;
   th.ec3 = ec3;
   th.onc = onc;
   return th;
}

bool Test_Haversine_SymmetricAndZero() {
   const double ab = haversine(13.4, 54.1, 20.7, 58.3);
   const double ba = haversine(20.7, 58.3, 13.4, 54.1);
   OWGRID_EXPECT_NEAR(ab, ba, 1e-9);
   OWGRID_EXPECT_TRUE(ab > 0);
   OWGRID_EXPECT_NEAR(haversine(13.4, 54.1, 13.4, 54.1), 0.0, 1e-12);
   return true;
}

bool Test_Haversine_OneDegreeOfLatitude() {
   const double expected = EARTH_RADIUS_KM * DEG_TO_RAD;
   OWGRID_EXPECT_NEAR(haversine(15.0, 55.0, 15.0, 56.0), expected, 1e-6);
   OWGRID_EXPECT_NEAR(expected, 111.19493, 1e-4);
   // along the equator a degree of longitude has the same length
   OWGRID_EXPECT_NEAR(haversine(0.0, 0.0, 1.0, 0.0), expected, 1e-6);
   return true;
}

bool Test_Filter_BoundaryIncludedEpsilonExcluded() {
   const auto wf = MakeWindFarm(1, 1, 14.0, 54.6, 100);
   const auto onss = MakeSubstation(10, 1, 14.0, 53.9, 200);
   const double d = haversine(wf.lon, wf.lat, onss.lon, onss.lat);

   Network network;
   network.set_candidates({wf}, {}, {onss});
   network.filter(Thresholds(250, 250, d, 250), CrossBorder::POOLED);
   OWGRID_EXPECT_EQ(network.ec3.size(), size_t(1));
   OWGRID_EXPECT_NEAR(network.ec3[0].distance, d, 1e-12);

   network.filter(Thresholds(250, 250, d - 1e-6, 250), CrossBorder::POOLED);
   OWGRID_EXPECT_EQ(network.ec3.size(), size_t(0));
   OWGRID_EXPECT_EQ(network.numWindFarms(), 0);
   OWGRID_EXPECT_EQ(network.numSubstations(), 0);
   return true;
}

bool Test_Filter_DomesticDropsCrossBorderPairs() {
   // DE wind farm, DK hub and substations roughly 55 km apart
   const auto wf = MakeWindFarm(1, 1, 13.0, 54.5, 100);
   const auto hub = MakeHub(5, 2, 13.0, 55.0);
   const auto onssDk = MakeSubstation(10, 2, 12.6, 55.6, 300);
   const auto onssDe = MakeSubstation(11, 1, 13.2, 54.1, 300);

   Network network;
   network.set_candidates({wf}, {hub}, {onssDk, onssDe});

   network.filter(Thresholds(250, 250, 500, 250), CrossBorder::POOLED);
   OWGRID_EXPECT_EQ(network.ec1.size(), size_t(1));
   OWGRID_EXPECT_EQ(network.ec2.size(), size_t(2));
   OWGRID_EXPECT_EQ(network.ec3.size(), size_t(2));
   OWGRID_EXPECT_EQ(network.onc.size(), size_t(2));

   network.filter(Thresholds(250, 250, 500, 250), CrossBorder::DOMESTIC);
   OWGRID_EXPECT_EQ(network.ec1.size(), size_t(0));
   OWGRID_EXPECT_EQ(network.ec2.size(), size_t(1));
   OWGRID_EXPECT_EQ(network.ec3.size(), size_t(1));
   OWGRID_EXPECT_EQ(network.onc.size(), size_t(0));
   for (const auto &conn : network.ec3) {
      OWGRID_EXPECT_EQ(network.windFarms[conn.from].country, network.substations[conn.to].country);
   }
   for (const auto &conn : network.ec2) {
      OWGRID_EXPECT_EQ(network.hubs[conn.from].country, network.substations[conn.to].country);
   }
   return true;
}

bool Test_Filter_ViableSetsAndRemapping() {
   const auto wfNear = MakeWindFarm(1, 1, 14.0, 54.6, 100);
   const auto wfFar = MakeWindFarm(2, 1, 14.0, 70.0, 400);			// beyond every threshold
   const auto wfNear2 = MakeWindFarm(3, 1, 14.3, 54.7, 80);
   const auto hub = MakeHub(5, 1, 14.1, 54.8);
   const auto hubFar = MakeHub(6, 1, 30.0, 70.0);
   const auto onssA = MakeSubstation(10, 1, 14.0, 54.0, 200);
   const auto onssB = MakeSubstation(11, 1, 14.5, 54.0, 150);
   const auto onssFar = MakeSubstation(12, 1, 30.0, 65.0, 150);
   const auto onssNoLink = MakeSubstation(13, 1, 14.0, 52.5, 150);	// onc reachable only

   Network network;
   network.set_candidates({wfNear, wfFar, wfNear2}, {hubFar, hub}, {onssA, onssFar, onssB, onssNoLink});
   network.filter(Thresholds(250, 250, 100, 250), CrossBorder::POOLED);

   OWGRID_EXPECT_EQ(network.numWindFarms(), 2);
   OWGRID_EXPECT_EQ(network.windFarms[0].id, 1);
   OWGRID_EXPECT_EQ(network.windFarms[1].id, 3);
   OWGRID_EXPECT_EQ(network.numHubs(), 1);
   OWGRID_EXPECT_EQ(network.hubs[0].id, 5);
   OWGRID_EXPECT_EQ(network.numSubstations(), 2);
   OWGRID_EXPECT_EQ(network.substations[0].id, 10);
   OWGRID_EXPECT_EQ(network.substations[1].id, 11);
   OWGRID_EXPECT_NEAR(network.viableCapacity(1), 180.0, 1e-12);
   OWGRID_EXPECT_NEAR(network.viableCapacity(2), 0.0, 1e-12);

   // endpoints index the viable vectors and distances match the coordinates
   for (const auto &conn : network.ec1) {
      const auto &wf = network.windFarms[conn.from];
      const auto &h = network.hubs[conn.to];
      OWGRID_EXPECT_NEAR(conn.distance, haversine(wf.lon, wf.lat, h.lon, h.lat), 1e-9);
   }
   OWGRID_EXPECT_EQ(network.ec1.size(), size_t(2));
   OWGRID_EXPECT_EQ(network.ec2.size(), size_t(2));
   OWGRID_EXPECT_EQ(network.ec3.size(), size_t(4));

   // no self pairs, and links to substations without export connections are dropped
   OWGRID_EXPECT_EQ(network.onc.size(), size_t(2));
   for (const auto &conn : network.onc) {
      OWGRID_EXPECT_TRUE(conn.from != conn.to);
   }
   return true;
}

bool Test_Filter_AdjacencyMatchesConnections() {
   const auto wf1 = MakeWindFarm(1, 1, 14.0, 54.6, 100);
   const auto wf2 = MakeWindFarm(2, 1, 14.3, 54.7, 80);
   const auto hub = MakeHub(5, 1, 14.1, 54.8);
   const auto onssA = MakeSubstation(10, 1, 14.0, 54.0, 200);
   const auto onssB = MakeSubstation(11, 1, 14.5, 54.0, 150);

   Network network;
   network.set_candidates({wf1, wf2}, {hub}, {onssA, onssB});
   network.filter(Thresholds(250, 250, 500, 250), CrossBorder::POOLED);

   size_t count = 0;
   for (int w = 0; w < network.numWindFarms(); w++) {
      for (auto k : network.wfEc1[w]) OWGRID_EXPECT_EQ(network.ec1[k].from, w);
      for (auto k : network.wfEc3[w]) OWGRID_EXPECT_EQ(network.ec3[k].from, w);
      count += network.wfEc1[w].size();
   }
   OWGRID_EXPECT_EQ(count, network.ec1.size());
   for (int h = 0; h < network.numHubs(); h++) {
      for (auto k : network.hubEc1[h]) OWGRID_EXPECT_EQ(network.ec1[k].to, h);
      for (auto k : network.hubEc2[h]) OWGRID_EXPECT_EQ(network.ec2[k].from, h);
   }
   count = 0;
   for (int s = 0; s < network.numSubstations(); s++) {
      for (auto k : network.onssEc2[s]) OWGRID_EXPECT_EQ(network.ec2[k].to, s);
      for (auto k : network.onssEc3[s]) OWGRID_EXPECT_EQ(network.ec3[k].to, s);
      for (auto k : network.onssOncOut[s]) OWGRID_EXPECT_EQ(network.onc[k].from, s);
      for (auto k : network.onssOncIn[s]) OWGRID_EXPECT_EQ(network.onc[k].to, s);
      count += network.onssOncIn[s].size();
   }
   OWGRID_EXPECT_EQ(count, network.onc.size());
   return true;
}

bool Test_Filter_IsDeterministic() {
   const auto wf1 = MakeWindFarm(1, 1, 14.0, 54.6, 100);
   const auto wf2 = MakeWindFarm(2, 2, 12.3, 55.2, 80);
   const auto hub = MakeHub(5, 1, 14.1, 54.8);
   const auto onss = MakeSubstation(10, 2, 12.5, 55.6, 200);

   Network first, second;
   first.set_candidates({wf1, wf2}, {hub}, {onss});
   second.set_candidates({wf1, wf2}, {hub}, {onss});
   first.filter(Thresholds(250, 250, 500, 250), CrossBorder::POOLED);
   second.filter(Thresholds(250, 250, 500, 250), CrossBorder::POOLED);

   OWGRID_EXPECT_EQ(first.ec3.size(), second.ec3.size());
   for (size_t k = 0; k < first.ec3.size(); k++) {
      OWGRID_EXPECT_EQ(first.ec3[k].from, second.ec3[k].from);
      OWGRID_EXPECT_EQ(first.ec3[k].to, second.ec3[k].to);
      OWGRID_EXPECT_EQ(first.ec3[k].distance, second.ec3[k].distance);
   }
   return true;
}

} // namespace

int main() {
   std::vector<TestCase> cases{
      {"haversine is symmetric and zero on identical points", Test_Haversine_SymmetricAndZero},
      {"haversine of one degree", Test_Haversine_OneDegreeOfLatitude},
      {"filter keeps the boundary and drops epsilon above", Test_Filter_BoundaryIncludedEpsilonExcluded},
      {"domestic filter drops cross-border pairs", Test_Filter_DomesticDropsCrossBorderPairs},
      {"viable sets and remapped endpoints", Test_Filter_ViableSetsAndRemapping},
      {"adjacency matches connections", Test_Filter_AdjacencyMatchesConnections},
      {"filter is deterministic", Test_Filter_IsDeterministic},
   };
   return RunAll(cases);
}
