/* What the player can see of the word: every cell is either the true letter or
   the placeholder. A mask always has the length of its word and a revealed cell
   is never hidden again. */

#pragma once
#include <string>
#include <vector>
#include <iostream>
#include "word.hpp"
#include "random.hpp"

class RevealMask {
public:
    // everything hidden
    RevealMask(const Word& w);

    // start-of-round mask: max(0, len/2 - 1) positions are drawn independently
    // from [0, len) and revealed. Draws may repeat, so fewer letters can show.
    static RevealMask initial(const Word& w, Rng& rng);

    // returns a copy with [positions] revealed, positions outside the word are ignored
    RevealMask applied(const Word& w, const std::vector<int>& positions) const;

    bool is_revealed(int pos) const { return cells[pos] != placeholder; }
    bool is_complete(const Word& w) const;
    int count_hidden() const;
    int length() const { return static_cast<int>(cells.length()); }
    const std::string& str() const { return cells; }

    bool operator==(const RevealMask& m) const;

    static const char placeholder;

    static void test();
private:
    std::string cells;
};

std::ostream& operator<<(std::ostream& os, const RevealMask& m);
