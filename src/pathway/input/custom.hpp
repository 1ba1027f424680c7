#ifndef __CUSTOM_INPUT_HPP_H5TQZ2BD
#define __CUSTOM_INPUT_HPP_H5TQZ2BD

#include "pathway/input.hpp"

// Reads "sx sy ex ey" followed by `height` rows of `width` numbers from a
// stream.  A zero cell is blocked, anything else is open.
class CustomPathwayInput : public PathwayInput {
public:
    CustomPathwayInput(int height, int width, std::istream &in);
    vec2 getStartPoint() const override;
    vec2 getEndPoint() const override;
    void generate(GridMap &map) override;

protected:
    int readInt(const char *what);

    int m_height;
    int m_width;
    std::istream &m_in;
    vec2 m_start;
    vec2 m_end;
};

#endif /* end of include guard: __CUSTOM_INPUT_HPP_H5TQZ2BD */
