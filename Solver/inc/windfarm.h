#pragma once

#include "util.h"

struct WindFarm
{
   int id;
   int country;
   double lon;
   double lat;
   double capacity;					// rated capacity (MW)
   double cost[NUM_REF_YEARS];		// full-farm cost per reference year (M EUR)

   WindFarm(): id(-1), country(-1), lon(0), lat(0), capacity(0)
   {
      for (int i = 0; i < NUM_REF_YEARS; i++) cost[i] = 0;
   }
};
