#pragma once

#include "util.h"
#include "parameter.h"

// Lifecycle costs in million EUR, discounted to ParamRegistry::baseYear.
// Every function is linear in its capacity argument.
class CostModel
{
public:
   static double presentValue(int _firstYear, double _equip, double _inst, double _opeYearly, double _deco);

   static SupportStructure supportStructure(double _waterDepth);

   static double windFarmCost(double _cost, double _ratedCapacity, double _capacity);

   // _active scales the fixed installation and decommissioning part
   static double energyHubCost(int _year, double _waterDepth, int _iceCover, double _portDistance, double _capacity, double _active);
   static double hubEquipmentCost(int _year, double _waterDepth, int _iceCover, double _capacity);
   static double hubConverterCost(int _iceCover, double _capacity);
   static double hubVesselCost(SupportStructure _supp, double _portDistance, bool _installation);

   static double parallelCables(double _capacity, bool _ceilCount);
   static double exportCable1Cost(int _year, double _distance, double _capacity, bool _ceilCount = false);
   static double exportCable2Cost(int _year, double _distance, double _capacity, bool _ceilCount = false);
   static double exportCable3Cost(int _year, double _distance, double _capacity, bool _ceilCount = false);
   static double onshoreCableCost(int _year, double _distance, double _capacity, bool _ceilCount = false);
   static double cableCost(ConnectionType _type, int _year, double _distance, double _capacity, bool _ceilCount = false);

   // negative when _capacity is below _threshold; callers clamp
   static double substationCost(int _year, double _capacity, double _threshold);

   static double clampIncrement(double _current, double _previous) { return std::max(0.0, _current - _previous); }

private:
   static double cableLifecycleCost(int _year, double _cableLength, double _capacity, double _instCostPerKm, bool _ceilCount);
};
