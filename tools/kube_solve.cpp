#include "KubeAlgebra/Errors.h"
#include "KubeAlgebra/MoveToken.h"
#include "KubeAlgebra/Solver.h"
#include "KubeAlgebra/TurnGeometry.h"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace KubeAlgebra;

int main(int argc, char* argv[]) {
    CLI::App app{"Solve a 3x3x3 cube scramble with the four-phase conjugation method"};

    std::vector<std::string> scrambleArgs;
    std::string scrambleText;
    std::string separator = " ";
    SolverOptions options;
    bool showGeometry = false;

    auto* scrambleOpt = app.add_option("-s,--scramble", scrambleText,
                                       "Scramble as a run of symbols, e.g. \"FRur\" (F R U B L D clockwise, lowercase counter-clockwise)");
    app.add_option("moves", scrambleArgs, "Scramble symbols, one or more per argument")->excludes(scrambleOpt);
    app.add_option("--max-corner-moves", options.cornerMaxMoves, "Connector search depth bound for corner queries")
        ->default_val(ConnectorSearch::kDefaultCornerMaxMoves)
        ->check(CLI::Range(1, ConnectorSearch::kMaxSearchMoves));
    app.add_option("--max-edge-moves", options.edgeMaxMoves, "Connector search depth bound for edge queries")
        ->default_val(ConnectorSearch::kDefaultEdgeMaxMoves)
        ->check(CLI::Range(1, ConnectorSearch::kMaxSearchMoves));
    app.add_option("--separator", separator, "Separator between solution symbols")->default_val(" ");
    app.add_flag("-v,--verbose", options.verbose, "Print per-phase move counts");
    app.add_flag("-g,--geometry", showGeometry, "Print the turn axis and angle of every solution move");

    CLI11_PARSE(app, argc, argv);

    for (const auto& arg : scrambleArgs) {
        scrambleText += arg;
    }

    try {
        TokenSequence scramble = parseTokens(scrambleText);
        Solver solver(options);
        TokenSequence solution = solver.solve(scramble);

        if (!showGeometry) {
            std::cout << formatTokens(solution, separator) << std::endl;
            return 0;
        }

        for (const auto& token : solution) {
            TurnGeometry turn = turnGeometry(token);
            std::cout << token.symbol() << " " << faceName(turn.face)
                      << " axis(" << turn.axis.x << ", " << turn.axis.y << ", " << turn.axis.z << ")"
                      << " angle " << turn.angleDegrees << "\n";
        }
        std::cout.flush();
    } catch (const InvalidTokenError& e) {
        std::cerr << "Invalid scramble: " << e.what() << std::endl;
        return 1;
    } catch (const KubeError& e) {
        std::cerr << "Solver error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
