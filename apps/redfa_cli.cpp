#include <iostream>
#include <stdexcept>
#include <string_view>
#include "expression.hpp"

namespace {

void print_statistics(const redfa::dfa::Automaton& automaton) {
    const auto stats = redfa::dfa::statistics(automaton);
    std::cout << "states: " << stats.states
              << ", accepting: " << stats.accepting_states
              << ", transitions: " << stats.transitions
              << ", alphabet: " << stats.alphabet_size
              << (stats.total ? ", total" : ", partial")
              << (stats.has_dead_state ? ", with dead state" : "") << '\n';
}

void print_automaton(std::string_view title,
                     const redfa::Expression& expression,
                     int argc,
                     char** argv) {
    std::cout << "== " << title << '\n'
              << redfa::dfa::to_string(expression.automaton());
    print_statistics(expression.automaton());
    std::cout << "accepted:";
    for (const auto& word :
         redfa::recognize::accepted_strings(expression.automaton(), 4, 10)) {
        std::cout << " \"" << word << '"';
    }
    std::cout << '\n';
    for (int i = 2; i < argc; ++i) {
        std::cout << "-- \"" << argv[i] << "\"\n"
                  << redfa::recognize::to_string(expression.recognize(argv[i]));
    }
    std::cout << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <pattern> [input...]\n";
        return 1;
    }

    try {
        const redfa::Expression direct(argv[1],
                                       redfa::construction_constants::direct);
        const redfa::Expression full(argv[1],
                                     redfa::construction_constants::full);

        std::cout << "== syntax tree\n"
                  << redfa::tree::to_string(direct.annotated()) << '\n'
                  << "== followpos\n"
                  << redfa::tree::followpos_table(direct.annotated()) << '\n';

        print_automaton("AFD short (followpos)", direct, argc, argv);
        print_automaton("AFD full (subset construction)", full, argc, argv);
        print_automaton("AFD full, significant states merged",
                        redfa::Expression(
                            argv[1], redfa::construction_constants::full |
                                         redfa::construction_constants::optimize),
                        argc, argv);
    } catch (const redfa::SyntaxError& e) {
        std::cerr << "syntax error: " << e.what() << '\n';
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
