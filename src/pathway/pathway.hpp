#ifndef __TILEPATH_PATHWAY
#define __TILEPATH_PATHWAY

#include "pathway/path-finder.hpp"
#include "pathway/input.hpp"

struct PathwayConfig {
    int width;
    int height;
    string inputModule;
    int blockRate;
    int zigzagGap;
    bool allowSquare;
    bool allowDiagonal;
    int searchLimit;
    string solutionFile;

    PathwayConfig()
        : width(0), height(0), inputModule("custom"), blockRate(50),
          zigzagGap(2), allowSquare(true), allowDiagonal(false),
          searchLimit(PathFinder::DEFAULT_SEARCH_LIMIT),
          solutionFile("solution.txt") { }
};

class Pathway {
public:
    Pathway(const PathwayConfig &config, std::istream &in);
    void prepare();
    void solve();
    // Prints a report and writes the solution file.  Returns whether a path
    // was found.
    bool output(std::ostream &out) const;

    const GridMap &map() const;
    const SearchResult &solution() const;
    vec2 start() const;
    vec2 end() const;

private:
    void generateGraph(PathwayInput &input);
    void printSolution(const vector<vec2> &pathList,
                       const string &filename) const;

    PathwayConfig m_config;
    std::istream &m_in;
    GridMap m_map;
    vec2 m_start;
    vec2 m_end;
    bool m_solved;
    SearchResult m_solution;
};

inline const GridMap &Pathway::map() const
{
    return m_map;
}

inline const SearchResult &Pathway::solution() const
{
    return m_solution;
}

inline vec2 Pathway::start() const
{
    return m_start;
}

inline vec2 Pathway::end() const
{
    return m_end;
}

#endif
