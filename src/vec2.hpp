#ifndef __VEC2_HPP_T7RWQ2LM
#define __VEC2_HPP_T7RWQ2LM

#include "utils.hpp"

// A cell coordinate on the tile grid.
class vec2 {
public:
    int x, y;

    vec2(): x(0), y(0) { }
    vec2(int x, int y): x(x), y(y) { }
    vec2 operator +(const vec2 &r) const {
        return vec2(x + r.x, y + r.y);
    }
    bool operator ==(const vec2 &r) const {
        return x == r.x && y == r.y;
    }

    int manhattan(const vec2 &r) const { return std::abs(r.x - x) + std::abs(r.y - y); }

    // Packs both coordinates into one hashable value.  Negative coordinates
    // are allowed; they never collide with non-negative ones.
    uint64_t key() const {
        return (uint64_t)(uint32_t)x << 32 | (uint32_t)y;
    }

    string str() const {
        return
            "(" + boost::lexical_cast<string>(x) +
            "," + boost::lexical_cast<string>(y) + ")";
    }

    friend std::ostream &operator<<(std::ostream &o, const vec2 &v) {
        o << v.str();
        return o;
    }
};

#endif /* end of include guard: __VEC2_HPP_T7RWQ2LM */
