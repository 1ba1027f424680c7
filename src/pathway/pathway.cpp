#include <fstream>
#include <boost/format.hpp>

#include "pathway/pathway.hpp"
#include "pathway/input/custom.hpp"
#include "pathway/input/random.hpp"
#include "pathway/input/zigzag.hpp"

Pathway::Pathway(const PathwayConfig &config, std::istream &in)
    : m_config(config), m_in(in), m_map(config.width, config.height),
      m_solved(false)
{
    // pass
}

void Pathway::prepare()
{
    if (m_config.inputModule == "custom") {
        CustomPathwayInput input(m_config.height, m_config.width, m_in);
        generateGraph(input);
    } else if (m_config.inputModule == "zigzag") {
        ZigzagPathwayInput input(m_config.height, m_config.width,
                                 m_config.zigzagGap);
        generateGraph(input);
    } else if (m_config.inputModule == "random") {
        RandomPathwayInput input(m_config.height, m_config.width,
                                 m_config.blockRate, random_engine);
        generateGraph(input);
    } else {
        throw runtime_error("unknown input module: " + m_config.inputModule);
    }
}

void Pathway::solve()
{
    StreamLog log(std::cerr);
    PathFinder finder(m_config.searchLimit);
    finder.setLog(&log);
    m_solution = finder.search(m_map, m_start, m_end, walkable,
                               m_config.allowSquare, m_config.allowDiagonal);
    m_solved = true;
}

bool Pathway::output(std::ostream &out) const
{
    if (!m_solved) {
        out << "No search has been run." << endl;
        return false;
    }

    out << " > " << statusName(m_solution.status) << endl;
    out << boost::format(" > Number of nodes expanded: %d\n")
           % m_solution.expanded;
    if (!m_solution.found())
        return false;

    const vector<vec2> &path = m_solution.path;
    int count1 = 0;
    int count2 = 0;
    for (int i = 1; i < (int)path.size(); ++i) {
        if (path[i].manhattan(path[i-1]) == 2)
            count2++;
        else
            count1++;
    }
    out << boost::format(" > Path cost: %.3f\n") % m_solution.cost;
    out << boost::format(" > Number of -: %d, +: %d\n") % count1 % count2;

    printSolution(path, m_config.solutionFile);
    return true;
}

void Pathway::generateGraph(PathwayInput &input)
{
    input.generate(m_map);
    m_start = input.getStartPoint();
    m_end = input.getEndPoint();
}

void Pathway::printSolution(const vector<vec2> &pathList,
                            const string &filename) const
{
    std::ofstream fout(filename.c_str());
    if (!fout)
        throw runtime_error(filename + " cannot be opened for writing");

    int count = 0;
    for (const vec2 &v : pathList) {
        if (count)
            fout << " -> ";
        if (count && count % 6 == 0)
            fout << "\n\t";
        ++count;
        fout << "(" << v.x << " " << v.y << ")";
    }
    fout << endl;
}
