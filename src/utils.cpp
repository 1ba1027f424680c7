#include "utils.hpp"

boost::mt19937 random_engine;
bool debug = false;
