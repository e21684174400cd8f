#ifndef __STATE_FILE_OPERATIONS_HPP___
#define __STATE_FILE_OPERATIONS_HPP___

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"

/**
 * @file state_file_operations.hpp
 * @brief Simple helpers to read/write lists of `PuzzleState` values from plain text files.
 *
 * One state per line, tile values separated by spaces and 0 for the blank.
 * Lines starting with `#` and empty lines are ignored.
 */

/**
 * @brief Read every state of the requested board size from a plain-text file.
 *
 * Lines whose token count does not match `side_length * side_length` belong to
 * another board size and are skipped.
 *
 * @param filename Path to the input file.
 * @param side_length Board side length (3 or 4).
 * @throws std::runtime_error if the file cannot be opened.
 * @throws InvalidStateError if a line of the right length is not a valid board.
 * @return States in file order.
 */
inline std::vector<PuzzleState> read_states_from_file(const std::string& filename, int side_length) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::vector<PuzzleState> states;
    size_t expected = static_cast<size_t>(side_length * side_length);
    std::string line;
    while (std::getline(infile, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        std::istringstream tokens(line);
        size_t count = 0;
        std::string token;
        while (tokens >> token) ++count;
        if (count != expected) continue;
        states.push_back(PuzzleState::from_string(line));
    }
    return states;
}

/**
 * @brief Write states to a plain-text file, one per line, after a short header comment.
 *
 * @param states States to serialize.
 * @param filename Output file path.
 * @param append Append to an existing file instead of truncating it (no header is written).
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
inline void write_states_to_file(const std::vector<PuzzleState>& states, const std::string& filename, bool append = false) {
    bool needs_newline = false;
    if (append) {
        std::ifstream existing(filename, std::ios::binary);
        if (existing.is_open() && existing.seekg(0, std::ios::end) && existing.tellg() > 0) {
            existing.seekg(-1, std::ios::end);
            char last = '\n';
            existing.get(last);
            needs_newline = last != '\n';
        }
    }
    std::ofstream outfile(filename, append ? std::ios::app : std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    if (needs_newline) outfile << "\n";
    if (!append) {
        outfile << "# Format: Each line represents one initial state\n";
        outfile << "# Use 0 to represent the blank tile\n";
        if (!states.empty()) {
            outfile << "# The goal state is always: " << PuzzleState::goal(states.front().get_side_length()).to_string() << "\n";
        }
        outfile << "\n";
    }
    for (const auto& state : states) {
        outfile << state.to_string() << "\n";
    }
}

#endif // __STATE_FILE_OPERATIONS_HPP___
