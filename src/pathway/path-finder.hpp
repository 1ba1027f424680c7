#ifndef __PATH_FINDER_HPP_W2JX5DKS
#define __PATH_FINDER_HPP_W2JX5DKS

#include "pathway/tilemap.hpp"
#include "vec2.hpp"
#include "log.hpp"
#include <functional>
#include <unordered_set>
#include <unordered_map>

// Decides whether the cell (x, y) holding `tile` may be entered.  `tile` is
// boost::none for off-map and undefined cells.
typedef std::function<bool(const boost::optional<tile_t> &tile, int x, int y)>
    PassableFunc;

const int NO_NODE = -1;

struct SearchNode {
    int x;
    int y;
    float score;     // accumulated movement cost from the start
    float priority;  // selection key of the open list
    int prev;        // index of the predecessor, NO_NODE for the start
    SearchNode() = default;
    SearchNode(int x, int y, float score, float priority, int prev)
        : x(x), y(y), score(score), priority(priority), prev(prev) { }
    vec2 pos() const { return vec2(x, y); }
};

enum SearchStatus {
    SEARCH_FOUND,
    SEARCH_DESTINATION_BLOCKED,
    SEARCH_UNREACHABLE,
    SEARCH_LIMIT_EXCEEDED
};

const char *statusName(SearchStatus status);

struct SearchResult {
    SearchStatus status;
    vector<vec2> path;
    float cost;
    int expanded;

    SearchResult() : status(SEARCH_UNREACHABLE), cost(0), expanded(0) { }
    bool found() const { return status == SEARCH_FOUND; }
};

// Receives exactly one event per search.  A blocked destination is
// reported as noPathFound().
class SearchObserver {
public:
    virtual ~SearchObserver() { }
    // `chain` runs from the start node to the goal node; each prev indexes
    // into `chain`.
    virtual void pathFound(const vector<SearchNode> &chain) { }
    virtual void noPathFound() { }
    virtual void limitExceeded() { }
};

class PathFinder {
public:
    static const int DEFAULT_SEARCH_LIMIT = 1000;

    PathFinder();
    explicit PathFinder(int searchLimit);

    // Neither collaborator is owned.  Both may be null.
    void setObserver(SearchObserver *observer);
    void setLog(DiagnosticLog *log);
    int searchLimit() const;

    SearchResult search(const TileMap &map, vec2 start, vec2 end,
                        const PassableFunc &isPassable,
                        bool allowSquare = true,
                        bool allowDiagonal = false) const;

private:
    struct neighbour_t {
        vec2 pos;
        float cost;
    };

    void getNeighbours(const TileMap &map, const SearchNode &node,
                       const PassableFunc &isPassable,
                       bool allowSquare, bool allowDiagonal,
                       vector<neighbour_t> *list) const;
    static float heuristic(vec2 a, vec2 b);

    int m_searchLimit;
    SearchObserver *m_observer;
    DiagnosticLog *m_log;
};

inline int PathFinder::searchLimit() const
{
    return m_searchLimit;
}

#endif /* end of include guard: __PATH_FINDER_HPP_W2JX5DKS */
