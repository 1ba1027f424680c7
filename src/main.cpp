#include <chrono>
#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "utils.hpp"
#include "pathway/pathway.hpp"
#include "pathway/plot.hpp"

const char *program_description =
R"(tilepath finds a route between two cells of a tile map.  Moves are
orthogonal by default; diagonal moves cost 1.4 and can be enabled with
--diagonal.  The search gives up once its open list holds more than
--search-limit cells.

     EXAMPLE (manually input map through IO):
         ./tilepath -H 5 -W 5 --input-module custom
         > 0 0 4 4     # find path from (0, 0) to (4, 4)
         > 1 0 1 1 1   # 0 represents obstacle
         > 1 0 1 1 1
         > 1 0 1 1 1
         > 1 1 1 0 1
         > 1 1 1 0 1

     EXAMPLE (random generated map with 30% cells blocked):
         ./tilepath -H 20 -W 20 --input-module random --block-rate 30 -d

)";

namespace po = boost::program_options;
static po::options_description desc("tilepath Options");

static po::variables_map vm_options;

static void help()
{
    cout << program_description << desc << endl;
}

static string time_pass(std::chrono::steady_clock::time_point start_time)
{
    using namespace std::chrono;
    auto elapse = duration_cast<milliseconds>(steady_clock::now() - start_time);
    string time = (boost::format("%07i") % elapse.count()).str();
    return "[" + time + "]";
}

static PathwayConfig read_config()
{
    PathwayConfig config;
    config.width = vm_options["width"].as<int>();
    config.height = vm_options["height"].as<int>();
    config.inputModule = vm_options["input-module"].as<string>();
    config.blockRate = vm_options["block-rate"].as<int>();
    config.zigzagGap = vm_options["gap"].as<int>();
    config.allowSquare = !vm_options.count("no-square");
    config.allowDiagonal = vm_options.count("diagonal") > 0;
    config.searchLimit = vm_options["search-limit"].as<int>();
    config.solutionFile = vm_options["solution"].as<string>();
    return config;
}

static bool solve_problem(Pathway &pathway)
{
    auto start_time = std::chrono::steady_clock::now();

    cout << time_pass(start_time)
         << " Generating input data ......"
         << endl;
    pathway.prepare();

    cout << time_pass(start_time)
         << " Searching for a path ......"
         << endl;
    pathway.solve();

    cout << time_pass(start_time)
         << " Writing the result ......"
         << endl;
    bool found = pathway.output(cout);

    if (vm_options.count("plot")) {
        string filename = vm_options["plot"].as<string>();
        if (plotSolution(pathway.map(), pathway.solution().path, filename))
            cout << time_pass(start_time)
                 << " Plot saved to " << filename
                 << endl;
    }
    return found;
}

int main(int argc, char *argv[])
{
    const char *env_debug = getenv("DEBUG");
    debug = !!env_debug;

    desc.add_options()
        ("help,h", "Print usage message")
        ("height,H", po::value<int>(), "Height of the map")
        ("width,W", po::value<int>(), "Width of the map")
        ("input-module", po::value<string>()->default_value("custom"),
         "Choose how to generate the input data.\n"
         "    custom    -- Fetch the map from system IO\n"
         "    zigzag    -- Walls with alternating openings\n"
         "    random    -- Random generated map")
        ("block-rate,b", po::value<int>()->default_value(50),
         "Set the block rate (1-99) (only for random module)")
        ("gap,g", po::value<int>()->default_value(2),
         "Rows between two walls (only for zigzag module)")
        ("diagonal,d", "Allow diagonal moves")
        ("no-square", "Do not allow orthogonal moves")
        ("search-limit,l",
         po::value<int>()->default_value(PathFinder::DEFAULT_SEARCH_LIMIT),
         "Give up once the open list holds more cells than this")
        ("solution,o", po::value<string>()->default_value("solution.txt"),
         "Write the path to this file")
        ("plot,p", po::value<string>(), "Plot the path to a BMP image")
        ("seed,s", po::value<int>(), "Random seed of this run")
        ;

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm_options);
        po::notify(vm_options);
    } catch (std::exception &e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (argc == 1 || vm_options.count("help")) {
        help();
        return 1;
    }
    if (!vm_options.count("width") || !vm_options.count("height")) {
        cout << "Please set the width and height for your map." << endl
             << "=============================================" << endl
             << endl;
        help();
        return 1;
    }
    if (vm_options.count("seed"))
        random_engine.seed(vm_options["seed"].as<int>());

    try {
        Pathway pathway(read_config(), cin);
        return solve_problem(pathway) ? 0 : 2;
    } catch (std::exception &e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
