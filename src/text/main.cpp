#include "lr_puzzle/abacus.hpp"
#include "lr_puzzle/bijection.hpp"
#include "lr_puzzle/text/document.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <optional>
#include <stdexcept>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-v] [-s] [-c] [-n SIZE] <file.lrp>\n";
    std::cerr << "  -v       Verbose mode (print boundary words and traced rows)\n";
    std::cerr << "  -s       Print conversion statistics to stderr\n";
    std::cerr << "  -c       Check each conversion by converting the result back\n";
    std::cerr << "  -n SIZE  Puzzle size for tableau statements without 'size'\n";
}

bool g_print_stats = false;
bool g_verbose = false;
bool g_check = false;
std::optional<int> g_default_size;

void print_stats(const lr_puzzle::Bijection& bijection) {
    if (!g_print_stats) return;
    const auto& s = bijection.stats();
    std::cerr << "% Stats: traced_rows=" << s.traced_rows
              << " trace_steps=" << s.trace_steps
              << " delta_blue=" << s.delta_blue_count
              << " nabla_blue=" << s.nabla_blue_count
              << " constrained_edges=" << s.constrained_edges
              << " filled_cells=" << s.filled_cells
              << " candidate_checks=" << s.candidate_checks
              << "\n";
}

void run_abacus(const lr_puzzle::text::AbacusDecl& decl) {
    auto partition = lr_puzzle::abacus_to_partition(decl.word);
    std::cout << "partition " << partition.to_string() << ";\n";
}

void run_partition(const lr_puzzle::text::PartitionDecl& decl) {
    size_t min_size = decl.size ? static_cast<size_t>(*decl.size) : 0;
    std::cout << "abacus \"" << lr_puzzle::partition_to_abacus(decl.parts, min_size) << "\";\n";
}

void run_tableau(const lr_puzzle::text::TableauDecl& decl, lr_puzzle::Bijection& bijection) {
    auto tableau = decl.to_tableau();
    std::optional<int> size = decl.size ? decl.size : g_default_size;
    auto puzzle = bijection.tableau_to_puzzle(tableau, size);
    lr_puzzle::text::write_puzzle(std::cout, puzzle);

    if (g_check) {
        auto back = bijection.puzzle_to_tableau(puzzle);
        if (back != tableau) {
            throw std::runtime_error("line " + std::to_string(decl.line) +
                                     ": check failed, puzzle gives back " + back.to_string());
        }
        std::cout << "% check: ok\n";
    }
}

void run_puzzle(const lr_puzzle::text::PuzzleDecl& decl, lr_puzzle::Bijection& bijection) {
    auto puzzle = decl.to_puzzle(bijection.catalog());
    auto tableau = bijection.puzzle_to_tableau(puzzle);
    std::cout << "tableau " << tableau.to_string() << " size " << puzzle.size() << ";\n";

    if (g_check) {
        auto back = bijection.puzzle_to_tableau(bijection.tableau_to_puzzle(tableau));
        if (back != tableau) {
            throw std::runtime_error("line " + std::to_string(decl.line) +
                                     ": check failed, rebuilt puzzle gives " + back.to_string());
        }
        std::cout << "% check: ok\n";
    }
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-c") == 0) {
            g_check = true;
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            g_default_size = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto document = lr_puzzle::text::parse_file(filename);

        auto catalog = std::make_shared<const lr_puzzle::PieceCatalog>(
            lr_puzzle::PieceCatalog::h_grassmannian());
        lr_puzzle::Bijection bijection(catalog);
        bijection.set_verbose(g_verbose);

        for (const auto& statement : document->statements()) {
            if (std::holds_alternative<lr_puzzle::text::AbacusDecl>(statement)) {
                run_abacus(std::get<lr_puzzle::text::AbacusDecl>(statement));
            } else if (std::holds_alternative<lr_puzzle::text::PartitionDecl>(statement)) {
                run_partition(std::get<lr_puzzle::text::PartitionDecl>(statement));
            } else if (std::holds_alternative<lr_puzzle::text::TableauDecl>(statement)) {
                run_tableau(std::get<lr_puzzle::text::TableauDecl>(statement), bijection);
            } else {
                run_puzzle(std::get<lr_puzzle::text::PuzzleDecl>(statement), bijection);
            }
        }
        print_stats(bijection);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
