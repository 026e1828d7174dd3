#pragma once
#include <iostream>
#include <string>
#include <sstream>
#include <fstream>
#include <cmath>
#include <vector>
#include <map>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstdlib>

//#define LPMODEL
//#define SolverStreamOff

typedef std::vector< std::vector<double> > vector2double;
typedef std::vector< std::vector<int> > vector2int;

constexpr auto EARTH_RADIUS_KM = 6371.0;
constexpr auto DEG_TO_RAD = 3.14159265358979323846 / 180.0;
constexpr auto NUM_REF_YEARS = 3;			// wind farm costs and hub coefficient sets are given for three reference years
constexpr auto NUM_STAGES = 3;
constexpr auto ROUND_DECIMALS = 6;

#define PRINT_SECTION(log) {std::cout << "=============" << log << "==============" << std::endl;}
#define PRINT_SUBSECTION(log) {std::cout << "--" << log << "--" << std::endl;}

enum ModelType {
   POINT_TO_POINT = 0,
   HUB_AND_SPOKE = 1,
   COMBINED = 2
};

enum CrossBorder {
   DOMESTIC = 0,
   POOLED = 1
};

enum StageMode {
   SINGLE_STAGE = 0,
   MULTI_STAGE = 1
};

enum ResultForm {
   CEIL_RESULT = 0,			// integer cable count, turbine-rounded wind farm capacity
   LINEAR_RESULT = 1
};

enum StageStatus {
   OPTIMAL = 0,
   LIMIT_REACHED = 1,
   INFEASIBLE = 2,
   SOLVER_WARNING = 3,
   SOLVER_ERROR = 4,
   NOT_SOLVED = 5
};

enum ConnectionType {
   EC1 = 0,		// wind farm -> energy hub
   EC2 = 1,		// energy hub -> onshore substation
   EC3 = 2,		// wind farm -> onshore substation
   ONC = 3,		// onshore substation -> onshore substation
   numConnectionTypes = 4
};

enum SupportStructure {
   MONOPILE = 0,
   JACKET = 1,
   FLOATING = 2
};

class InputDataError : public std::runtime_error
{
public:
   explicit InputDataError(const std::string &_msg) : std::runtime_error(_msg) {}
};

inline bool isUsable(StageStatus _status) { return _status == OPTIMAL || _status == LIMIT_REACHED; }

inline double roundTo(double _val, int _decimals = ROUND_DECIMALS) {
   const double scale = std::pow(10.0, _decimals);
   return std::round(_val * scale) / scale;
}

std::string statusName(StageStatus _status);
