// Connector search: enumeration order, depth bounds, pruning and query validation.

#include <cassert>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "KubeAlgebra/ConnectorSearch.h"
#include "KubeAlgebra/Errors.h"
#include "KubeAlgebra/Generators.h"

using namespace KubeAlgebra;

static const Move& turn(char symbol) {
    return fundamentalMove(*MoveToken::fromSymbol(symbol));
}

static void printResult(const std::optional<Move>& found, const SearchStats& stats) {
    std::cout << "  " << (found ? "found \"" + formatTokens(found->getTokens(), "") + "\"" : std::string("none"))
              << " depth " << stats.depthReached << ", " << stats.candidatesExamined << " examined\n";
}

static bool noFaceRepeats(const TokenSequence& tokens) {
    for (size_t k = 1; k < tokens.size(); k++) {
        // Only a half turn repeats a face
        if (tokens[k].sameFace(tokens[k - 1]) && tokens[k] != tokens[k - 1]) return false;
    }
    return true;
}

void testGeneratingSet() {
    std::cout << "\n=== Test: Generating Set ===\n";

    ConnectorSearch search;
    const auto& gens = search.getGenerators();
    assert(gens.size() == 18);
    assert(gens.size() == authorizedMoves().size());

    // Per face: quarter turn, half turn, inverse quarter turn
    assert(formatTokens(gens[0].getTokens(), "") == "F");
    assert(formatTokens(gens[1].getTokens(), "") == "FF");
    assert(formatTokens(gens[2].getTokens(), "") == "f");
    assert(formatTokens(gens[16].getTokens(), "") == "DD");
    assert(gens[4] == turn('R').power(2));
    assert(gens[4] == turn('r').power(2));

    std::cout << "PASSED: Generating set\n";
}

void testAlreadyPlacedReturnsIdentity() {
    std::cout << "\n=== Test: Already Placed ===\n";

    ConnectorSearch search;
    auto found = search.connectCorners(1, 3, 1, 3, Placement::Exact);
    printResult(found, search.lastStats());
    assert(found && found->isIdentity());
    assert(found->getTokens().empty());
    assert(search.lastStats().depthReached == 1);
    assert(search.lastStats().candidatesExamined == 1);

    // Either order accepts the swapped pair too, but the identity still comes first
    found = search.connectCorners(0, 7, 7, 0, Placement::EitherOrder);
    assert(found && found->isIdentity());

    found = search.connectEdges(4, 9, 4, 9);
    assert(found && found->isIdentity());

    std::cout << "PASSED: Already placed\n";
}

void testFirstMatchInEnumerationOrder() {
    std::cout << "\n=== Test: Enumeration Order ===\n";

    ConnectorSearch search;

    auto found = search.connectCorners(7, 0, 0, 7, Placement::Exact, 3);
    printResult(found, search.lastStats());
    assert(found);
    assert(formatTokens(found->getTokens(), "") == "fRRF");
    assert(search.lastStats().depthReached == 3);
    assert(search.lastStats().candidatesExamined == 307);
    assert(found->getCornerPerm()[0] == 7 && found->getCornerPerm()[7] == 0);

    // A half turn is one generator
    found = search.connectEdges(0, 3, 0, 11, 3);
    printResult(found, search.lastStats());
    assert(found);
    assert(formatTokens(found->getTokens(), "") == "UU");
    assert(search.lastStats().depthReached == 1);
    assert(search.lastStats().candidatesExamined == 9);

    std::cout << "PASSED: Enumeration order\n";
}

void testExactAgainstEitherOrder() {
    std::cout << "\n=== Test: Exact vs Either Order ===\n";

    ConnectorSearch search;

    // Swapped pair is already satisfied when order does not matter
    auto loose = search.connectCorners(1, 3, 3, 1, Placement::EitherOrder);
    assert(loose && loose->isIdentity());

    auto exact = search.connectCorners(1, 3, 3, 1, Placement::Exact);
    printResult(exact, search.lastStats());
    assert(exact);
    assert(formatTokens(exact->getTokens(), "") == "lFU");
    assert(search.lastStats().depthReached == 3);
    assert(search.lastStats().candidatesExamined == 1651);
    assert(exact->getCornerPerm()[3] == 1);
    assert(exact->getCornerPerm()[1] == 3);

    std::cout << "PASSED: Exact vs either order\n";
}

void testDepthBound() {
    std::cout << "\n=== Test: Depth Bound ===\n";

    ConnectorSearch search;

    // Needs three generators; two levels are 19 + 270 candidates
    auto found = search.connectCorners(7, 0, 0, 7, Placement::Exact, 2);
    printResult(found, search.lastStats());
    assert(!found);
    assert(search.lastStats().depthReached == 2);
    assert(search.lastStats().candidatesExamined == 289);

    found = search.connectCorners(7, 0, 0, 7, Placement::Exact, 0);
    assert(!found);
    found = search.connectCorners(7, 0, 0, 7, Placement::Exact, -3);
    assert(!found);

    // Larger bounds after a smaller one reuse the buffers
    found = search.connectCorners(7, 0, 0, 7, Placement::Exact, 4);
    assert(found && formatTokens(found->getTokens(), "") == "fRRF");

    std::cout << "PASSED: Depth bound\n";
}

// Up/Down turns never move a corner between the two layers
void testRestrictedSetCounts() {
    std::cout << "\n=== Test: Restricted Generating Set ===\n";

    std::vector<Move> upDown = {
        turn('U'), turn('U').power(2), turn('u'),
        turn('D'), turn('D').power(2), turn('d')
    };
    ConnectorSearch search(upDown);

    // 1 + 6, then 6 * 3 after pruning, then 18 * 3, then 54 * 3
    auto found = search.connectCorners(0, 1, 2, 3, Placement::Exact, 3);
    printResult(found, search.lastStats());
    assert(!found);
    assert(search.lastStats().depthReached == 3);
    assert(search.lastStats().candidatesExamined == 79);

    found = search.connectCorners(0, 1, 2, 3, Placement::Exact, 4);
    printResult(found, search.lastStats());
    assert(!found);
    assert(search.lastStats().candidatesExamined == 241);

    found = search.connectCorners(0, 4, 1, 0, Placement::Exact, 2);
    assert(found);
    assert(found->getCornerPerm()[1] == 0 && found->getCornerPerm()[0] == 4);

    std::cout << "PASSED: Restricted generating set\n";
}

void testNoConsecutiveSameFace() {
    std::cout << "\n=== Test: No Consecutive Face Turns ===\n";

    ConnectorSearch search;
    int found = 0;
    for (int a = 0; a < kCornerCount; a++) {
        for (int s = 0; s < kCornerCount; s++) {
            if (s == 0 || a == 1) continue;
            auto g = search.connectCorners(a, 1, s, 0, Placement::Exact, 4);
            if (!g) continue;
            ++found;
            assert(g->getCornerPerm()[s] == a);
            assert(g->getCornerPerm()[0] == 1);

            const auto& tokens = g->getTokens();
            assert(noFaceRepeats(tokens));
            for (size_t k = 2; k < tokens.size(); k++) {
                assert(!(tokens[k] == tokens[k - 1] && tokens[k] == tokens[k - 2]));
            }
        }
    }
    std::cout << "  " << found << " corner queries answered\n";
    assert(found > 0);

    std::cout << "PASSED: No consecutive face turns\n";
}

void testEdgeZone() {
    std::cout << "\n=== Test: Edge Zone ===\n";

    ConnectorSearch search;
    const std::array<int, 3> zone = {5, 6, 7};

    auto found = search.connectEdgeZone(zone, 0, 3);
    printResult(found, search.lastStats());
    assert(found);
    assert(formatTokens(found->getTokens(), "") == "DU");
    assert(search.lastStats().depthReached == 2);
    assert(search.lastStats().candidatesExamined == 122);

    const EdgeArray& perm = found->getEdgePerm();
    assert(perm[0] == 5 && perm[3] == 6);
    bool third = false;
    for (int k = 1; k < kEdgeCount; k++) {
        if (perm[k] == 7) third = true;
    }
    assert(third);

    std::cout << "PASSED: Edge zone\n";
}

void testInvalidQueries() {
    std::cout << "\n=== Test: Invalid Queries ===\n";

    ConnectorSearch search;
    auto expectThrow = [](auto&& query) {
        bool thrown = false;
        try {
            query();
        } catch (const InvalidArgumentError& e) {
            std::cout << "  rejected: " << e.what() << "\n";
            thrown = true;
        }
        assert(thrown);
    };

    expectThrow([&] { search.connectCorners(8, 0, 0, 1, Placement::Exact); });
    expectThrow([&] { search.connectCorners(0, 1, -1, 1, Placement::Exact); });
    expectThrow([&] { search.connectCorners(2, 2, 0, 1, Placement::Exact); });
    expectThrow([&] { search.connectCorners(0, 1, 4, 4, Placement::EitherOrder); });
    expectThrow([&] { search.connectEdges(0, 12, 0, 1); });
    expectThrow([&] { search.connectEdgeZone({0, 3, 3}, 0, 1); });
    expectThrow([&] { search.connectEdgeZone({0, 3, 12}, 0, 1); });

    // Depth is capped, every level stays in memory
    expectThrow([&] { search.connectCorners(7, 0, 0, 7, Placement::Exact, ConnectorSearch::kMaxSearchMoves + 1); });
    expectThrow([&] { search.connectEdges(0, 3, 0, 5, 9); });

    expectThrow([] { ConnectorSearch empty{std::vector<Move>{}}; });
    expectThrow([] { ConnectorSearch anonymous{std::vector<Move>{Move::identity()}}; });

    std::cout << "PASSED: Invalid queries\n";
}

void testExhaustedQueryLogged() {
    std::cout << "\n=== Test: Exhausted Query Log ===\n";

    ConnectorSearch search;
    std::ostringstream captured;
    std::streambuf* saved = std::cout.rdbuf(captured.rdbuf());

    search.connectCorners(7, 0, 0, 7, Placement::Exact, 2);
    std::string quiet = captured.str();

    search.setVerbose(true);
    search.connectCorners(7, 0, 0, 7, Placement::Exact, 2);
    std::string loud = captured.str();

    // A successful query stays silent
    captured.str("");
    search.connectCorners(7, 0, 0, 7, Placement::Exact, 3);
    std::string found = captured.str();

    std::cout.rdbuf(saved);
    std::cout << "  " << loud;

    assert(quiet.empty());
    assert(loud.find("[ConnectorSearch]") == 0);
    assert(loud.find("maximum of 2 moves reached") != std::string::npos);
    assert(loud.find("289 candidates") != std::string::npos);
    assert(found.empty());

    std::cout << "PASSED: Exhausted query log\n";
}

int main() {
    std::cout << "=================================\n";
    std::cout << "Connector Search Tests\n";
    std::cout << "=================================\n";

    testGeneratingSet();
    testAlreadyPlacedReturnsIdentity();
    testFirstMatchInEnumerationOrder();
    testExactAgainstEitherOrder();
    testDepthBound();
    testRestrictedSetCounts();
    testNoConsecutiveSameFace();
    testEdgeZone();
    testInvalidQueries();
    testExhaustedQueryLogged();

    std::cout << "\n=================================\n";
    std::cout << "All tests completed!\n";
    std::cout << "=================================\n";

    return 0;
}
