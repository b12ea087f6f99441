/* Loading candidate words from a line-per-word file and picking the target word.
   The list is read fresh for every round; nothing is cached between rounds. */

#pragma once
#include <string>
#include <vector>
#include "word.hpp"
#include "random.hpp"

namespace WordList {
    // quiets the warnings about skipped lines
    extern bool silence;

    // Trims each line, skips empty ones and warns about (and skips) lines that are
    // not a single word of letters. Throws ResourceUnavailable if the file can't be read.
    std::vector<Word> load_from_file(const std::string& filename, bool debug_output);

    // same rules as load_from_file, for words already in memory
    std::vector<Word> parse(std::istream& is, const std::string& source_name);

    // uniform over [0, words.size()), throws EmptySource when words is empty
    const Word& pick_random(const std::vector<Word>& words, Rng& rng);

    void test();
}
