/** \file   record_states.cc
 *  \brief  Displays the record lifecycle.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include <iostream>
#include <string>
#include <cstdlib>
#include "RecordState.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--dot] [state]\n"
            "With a state, its allowed successor states are listed.  Otherwise the full transition table, or with --dot a\n"
            "GraphViz digraph of it, is printed.");
}


void ListTransitions() {
    for (const auto &transition : RecordState::GetTransitions())
        std::cout << RecordState::StateToString(transition.from_) << " -> " << RecordState::StateToString(transition.to_) << " ("
                  << RecordState::OperationToString(transition.operation_) << (transition.reverting_ ? ", reverting" : "") << ")\n";
}


void GenerateDot() {
    std::cout << "digraph record_states {\n";
    for (const auto state : RecordState::GetAllStates()) {
        std::cout << "    " << RecordState::StateToString(state);
        if (RecordState::IsTerminal(state))
            std::cout << " [shape=doublecircle]";
        else if (RecordState::IsManualState(state))
            std::cout << " [shape=box]";
        std::cout << ";\n";
    }

    for (const auto &transition : RecordState::GetTransitions()) {
        std::cout << "    " << RecordState::StateToString(transition.from_) << " -> " << RecordState::StateToString(transition.to_)
                  << " [label=\"" << RecordState::OperationToString(transition.operation_) << '"';
        if (transition.reverting_)
            std::cout << ", style=dashed";
        std::cout << "];\n";
    }
    std::cout << "}\n";
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    bool generate_dot(false);
    if (argc > 1 and std::string(argv[1]) == "--dot") {
        generate_dot = true;
        --argc, ++argv;
    }

    if (argc > 2 or (generate_dot and argc == 2))
        Usage();

    if (argc == 2) {
        const auto state(RecordState::StringToState(argv[1]));
        if (RecordState::IsTerminal(state))
            std::cout << argv[1] << " is a terminal state.\n";
        for (const auto next_state : RecordState::GetAllowedNextStates(state))
            std::cout << RecordState::StateToString(next_state) << '\n';
    } else if (generate_dot)
        GenerateDot();
    else
        ListTransitions();

    return EXIT_SUCCESS;
}
