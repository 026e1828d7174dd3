#pragma once

#include "util.h"

struct Connection
{
   int from;			// position of the source entity in the viable network
   int to;
   double distance;	// km

   Connection(int _from, int _to, double _distance): from(_from), to(_to), distance(_distance) {}
};
