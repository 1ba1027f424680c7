#ifndef __TILEPATH_UTIL
#define __TILEPATH_UTIL

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/random.hpp>

using std::cin;
using std::cout;
using std::min;
using std::max;
using std::endl;
using std::runtime_error;
using std::string;
using std::vector;
using boost::lexical_cast;

extern boost::mt19937 random_engine;
extern bool debug;

#ifndef DEBUG
#define DEBUG 0
#endif

#define DEBUG_CONDITION (DEBUG && debug)
#define dout if (!DEBUG_CONDITION) {} else std::cerr

// Movement weight of one diagonal step.  A fixed approximation of sqrt(2).
const float DIAGONAL_COST = 1.4f;

// Neighbour offsets: the first four are the square (orthogonal) moves, the
// last four the diagonal ones.  This is the generation order; the search
// handles each batch last to first.
const int NUM_SQUARE = 4;
const int NUM_DIRECTION = 8;
const int DX[8] = { -1,  1,  0,  0, -1,  1, -1,  1 };
const int DY[8] = {  0,  0, -1,  1, -1, -1,  1,  1 };
const float COST[8] = {1, 1, 1, 1,
                       DIAGONAL_COST, DIAGONAL_COST, DIAGONAL_COST, DIAGONAL_COST};

#endif
