#ifndef __PATHWAY_INPUT_HPP_R3KV8NWE
#define __PATHWAY_INPUT_HPP_R3KV8NWE

#include "pathway/tilemap.hpp"
#include "vec2.hpp"

// Source of a map together with the start and end cells.  The endpoints
// are valid only after generate() has run.
class PathwayInput {
public:
    virtual ~PathwayInput() { }
    virtual vec2 getStartPoint() const = 0;
    virtual vec2 getEndPoint() const = 0;
    virtual void generate(GridMap &map) = 0;
};

#endif /* end of include guard: __PATHWAY_INPUT_HPP_R3KV8NWE */
