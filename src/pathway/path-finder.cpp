#include "pathway/path-finder.hpp"

const char *statusName(SearchStatus status)
{
    switch (status) {
    case SEARCH_FOUND:
        return "Path found";
    case SEARCH_DESTINATION_BLOCKED:
        return "Destination blocked";
    case SEARCH_UNREACHABLE:
        return "No path found";
    case SEARCH_LIMIT_EXCEEDED:
        return "Search limit exceeded";
    }
    return "Unknown";
}

const int PathFinder::DEFAULT_SEARCH_LIMIT;

PathFinder::PathFinder()
    : m_searchLimit(DEFAULT_SEARCH_LIMIT), m_observer(nullptr), m_log(nullptr)
{
    // pass
}

PathFinder::PathFinder(int searchLimit)
    : m_searchLimit(searchLimit), m_observer(nullptr), m_log(nullptr)
{
    if (searchLimit < 1)
        throw runtime_error(
            "search limit must be positive, got " +
            lexical_cast<string>(searchLimit));
}

void PathFinder::setObserver(SearchObserver *observer)
{
    m_observer = observer;
}

void PathFinder::setLog(DiagnosticLog *log)
{
    m_log = log;
}

SearchResult PathFinder::search(
    const TileMap &map, vec2 start, vec2 end,
    const PassableFunc &isPassable,
    bool allowSquare, bool allowDiagonal) const
{
    SearchResult result;

    if (!isPassable(map.tile(end.x, end.y), end.x, end.y)) {
        if (m_log)
            m_log->info("Cannot path to destination " + end.str() +
                        " because the destination tile is not pathable");
        if (m_observer)
            m_observer->noPathFound();
        result.status = SEARCH_DESTINATION_BLOCKED;
        return result;
    }

    // Every node created by this call lives in `nodes`; the open list and
    // the hashes refer to it by index.
    vector<SearchNode> nodes;
    vector<int> openList;
    std::unordered_map<uint64_t, int> openHash;
    std::unordered_set<uint64_t> closeList;
    vector<neighbour_t> neighbours;

    nodes.push_back(SearchNode(start.x, start.y, 0, 0, NO_NODE));
    openList.push_back(0);
    openHash[start.key()] = 0;

    while (!openList.empty()) {
        if ((int)openList.size() > m_searchLimit) {
            if (m_log)
                m_log->error("Path finder error, open list nodes exceeded " +
                             lexical_cast<string>(m_searchLimit) + "!");
            if (m_observer)
                m_observer->limitExceeded();
            result.status = SEARCH_LIMIT_EXCEEDED;
            return result;
        }

        // Linear scan from the back.  The head keeps a tie; past the head
        // the newest minimal entry wins.
        int lowInd = 0;
        for (int i = (int)openList.size() - 1; i >= 0; --i) {
            if (nodes[openList[i]].priority < nodes[openList[lowInd]].priority)
                lowInd = i;
        }
        int current = openList[lowInd];
        SearchNode node = nodes[current];

        if (node.pos() == end) {
            vector<SearchNode> chain;
            for (int id = current; id != NO_NODE; id = nodes[id].prev)
                chain.push_back(nodes[id]);
            std::reverse(chain.begin(), chain.end());
            for (int i = 0; i < (int)chain.size(); ++i) {
                chain[i].prev = i - 1;
                result.path.push_back(chain[i].pos());
            }
            result.status = SEARCH_FOUND;
            result.cost = node.score;
            if (m_observer)
                m_observer->pathFound(chain);
            return result;
        }

        openList.erase(openList.begin() + lowInd);
        openHash.erase(node.pos().key());
        closeList.insert(node.pos().key());
        ++result.expanded;
        dout << node.pos() << " s " << node.score << endl;

        getNeighbours(map, node, isPassable, allowSquare, allowDiagonal,
                      &neighbours);
        // Last generated is handled first.
        for (int k = (int)neighbours.size() - 1; k >= 0; --k) {
            const neighbour_t &n = neighbours[k];
            uint64_t key = n.pos.key();
            if (closeList.count(key))
                continue;

            std::unordered_map<uint64_t, int>::iterator it = openHash.find(key);
            if (it == openHash.end()) {
                int id = (int)nodes.size();
                nodes.push_back(SearchNode(n.pos.x, n.pos.y,
                                           node.score + n.cost,
                                           heuristic(n.pos, end), current));
                openList.push_back(id);
                openHash[key] = id;
                dout << '\t' << n.pos << " n " << nodes[id].priority << endl;
            } else {
                SearchNode &onode = nodes[it->second];
                if (node.score < onode.score) {
                    // Only the link and the rank change; the stored score
                    // stays what the first discoverer gave it.
                    onode.prev = current;
                    onode.priority = onode.score;
                    dout << '\t' << n.pos << " u " << onode.priority << endl;
                }
            }
        }
    }

    if (m_log)
        m_log->info("Could not find a path to destination " + end.str());
    if (m_observer)
        m_observer->noPathFound();
    result.status = SEARCH_UNREACHABLE;
    return result;
}

void PathFinder::getNeighbours(
    const TileMap &map, const SearchNode &node,
    const PassableFunc &isPassable,
    bool allowSquare, bool allowDiagonal,
    vector<neighbour_t> *list) const
{
    list->clear();
    for (int i = 0; i < NUM_DIRECTION; ++i) {
        if (i < NUM_SQUARE ? !allowSquare : !allowDiagonal)
            continue;
        vec2 pos = node.pos() + vec2(DX[i], DY[i]);
        // The predicate owns the bounds check; off-map cells reach it as
        // boost::none.
        if (isPassable(map.tile(pos.x, pos.y), pos.x, pos.y)) {
            neighbour_t n;
            n.pos = pos;
            n.cost = COST[i];
            list->push_back(n);
        }
    }
}

float PathFinder::heuristic(vec2 a, vec2 b)
{
    return (float)a.manhattan(b);
}
