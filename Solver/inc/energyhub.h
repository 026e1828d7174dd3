#pragma once

#include "util.h"

struct EnergyHub
{
   int id;
   int country;
   double lon;
   double lat;
   double waterDepth;		// m
   int iceCover;			// 1 if the site is ice covered
   double portDistance;		// distance to the closest port (m)

   EnergyHub(): id(-1), country(-1), lon(0), lat(0), waterDepth(0), iceCover(0), portDistance(0) {}
};
