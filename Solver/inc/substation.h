#pragma once

#include "util.h"

struct Substation
{
   int id;
   int country;
   double lon;
   double lat;
   double threshold;			// capacity available without expansion (MW)

   Substation(): id(-1), country(-1), lon(0), lat(0), threshold(0) {}

   friend bool operator==(const Substation &lhs, const Substation &rhs) { return lhs.id == rhs.id; }
   friend bool operator!=(const Substation &lhs, const Substation &rhs) { return lhs.id != rhs.id; }
};
