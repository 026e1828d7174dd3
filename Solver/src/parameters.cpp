#include "parameter.h"
#include "util.h"

ParamRegistry* ParamRegistry::paramInstance = nullptr;


ParamRegistry::ParamRegistry()
{
   reset();
}

void ParamRegistry::reset()
{
   isoCodes = {"DE", "DK", "EE", "FI", "LV", "LT", "PL", "SE"};
   isoToCountry.clear();
   for (int c = 0; c < int(isoCodes.size()); c++) {
      isoToCountry[isoCodes[c]] = c + 1;
   }
   // DE and PL are limited to 100%
   baseCountryFraction = {1.0, 0.0563, 0.1219, 0.0792, 0.0509, 0.0282, 1.0, 0.0201};
   selectCountry = std::vector<int>(isoCodes.size(), 1);

   singleStageYear = 2040;
   stageYears = {2030, 2040, 2050};
   devFraction = {0.3056, 0.7115, 1.0};
   refYears = {2030, 2040, 2050};

   maxDistEc1 = 250;
   maxDistEc2 = 250;
   maxDistEc3 = 500;
   maxDistOnc = 250;

   zeroThreshold = 1e-3;
   turbineCapacity = 15;
   hubCapacityLimit = 2500;
   onssCapacityFactor = 2.5;

   discountRate = 0.05;
   baseYear = 2024;
   lifetime = 25;

   sfWindFarm = 1;
   sfHub = 1;
   sfEc1 = 1;
   sfEc2 = 1;
   sfEc3 = 1;
   sfOnss = 1;
   sfOnc = 1;

   mipGap = 0;
   nodeLimit = 1e4;
   solutionLimit = -1;
   timeLimit = 3600;
   feasibilityTol = 1e-5;
   optimalityTol = 1e-5;
   presolve = -1;
   cuts = -1;
   outputFlag = 1;

   haltOnFailure = true;
}

int ParamRegistry::countryOf(const std::string &_iso) const
{
   const auto itr = isoToCountry.find(_iso);
   if (itr == isoToCountry.end()) return -1;
   return itr->second;
}

// latest reference year not later than _year; earlier years use the first table
int ParamRegistry::refYearIndex(int _year) const
{
   int index = 0;
   for (int i = 0; i < int(refYears.size()); i++) {
      if (refYears[i] <= _year) index = i;
   }
   return index;
}

double ParamRegistry::countryFraction(int _country, double _devFraction) const
{
   const int c = _country - 1;
   return _devFraction * baseCountryFraction[c] * selectCountry[c];
}
