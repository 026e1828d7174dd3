#pragma once
#include <vector>
#include <string>
#include <map>

class ParamRegistry{
private:
   static ParamRegistry* paramInstance;
   ParamRegistry();

public:

   static ParamRegistry* instance(){
      if(!paramInstance){
         paramInstance = new ParamRegistry();
      }
      return paramInstance;
   }

   void reset();			// restore the compiled-in defaults

   // countries
   std::vector<std::string> isoCodes;				// isoCodes[c - 1] is the ISO code of country c
   std::map<std::string, int> isoToCountry;
   std::vector<double> baseCountryFraction;			// final-year requirement per country
   std::vector<int> selectCountry;					// 0 removes the requirement of a country

   // planning years
   int singleStageYear;
   std::vector<int> stageYears;
   std::vector<double> devFraction;				// share of the final-year requirement per stage
   std::vector<int> refYears;						// years the cost tables are given for

   // feasibility thresholds (km)
   double maxDistEc1;
   double maxDistEc2;
   double maxDistEc3;
   double maxDistOnc;

   // model parameters
   double zeroThreshold;
   double turbineCapacity;			// MW per wind turbine, used when rounding reported capacity
   double hubCapacityLimit;
   double onssCapacityFactor;

   // present value
   double discountRate;
   int baseYear;
   int lifetime;

   // cost sensitivity factors
   double sfWindFarm;
   double sfHub;
   double sfEc1;
   double sfEc2;
   double sfEc3;
   double sfOnss;
   double sfOnc;

   // solver
   double mipGap;
   double nodeLimit;
   int solutionLimit;				// <= 0: no limit
   double timeLimit;
   double feasibilityTol;
   double optimalityTol;
   int presolve;
   int cuts;
   int outputFlag;

   bool haltOnFailure;

   int countryOf(const std::string &_iso) const;
   int numCountries() const { return static_cast<int>(isoCodes.size()); }
   int refYearIndex(int _year) const;
   double countryFraction(int _country, double _devFraction = 1.0) const;
};
