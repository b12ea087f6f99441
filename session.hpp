/* One round of hangman: the word, what is visible of it, the attempts left and
   the letters tried so far. A session is driven by guess() until it is won or lost. */

#pragma once
#include <vector>
#include <string>
#include <iostream>
#include "word.hpp"
#include "reveal.hpp"
#include "guess.hpp"

class Session {
public:
    enum class State { awaiting_guess, won, lost };
    enum class Outcome { hit, miss, already_tried };

    static const int default_attempts;

    // Throws if attempts < 1. With penalize_repeats == false a letter already in
    // either history is reported as already_tried and changes nothing; with true
    // every guess is scored, so a repeated miss costs another attempt.
    Session(const Word& word, const RevealMask& mask, int attempts, bool penalize_repeats);

    // letter must be A-Z (either case), throws if the session is already over
    Outcome guess(char letter);

    State get_state() const { return state; }
    const Word& get_word() const { return word; }
    const RevealMask& get_mask() const { return mask; }
    int get_attempts_left() const { return attempts_left; }
    int get_wrong_count() const { return wrong_count; }

    // letters in the order they were tried
    const std::vector<char>& get_used_true() const { return used_true; }
    const std::vector<char>& get_used_false() const { return used_false; }

    static void test();
private:
    bool was_tried(char letter) const;
    void update_state();

    Word word;
    RevealMask mask;
    int attempts_left;
    int wrong_count;
    bool penalize_repeats;
    State state;
    std::vector<char> used_true;
    std::vector<char> used_false;
};

std::ostream& operator<<(std::ostream& os, Session::State s);
std::ostream& operator<<(std::ostream& os, Session::Outcome o);

// "A P L " style, the way the used-letter lines are printed
std::string letters_to_string(const std::vector<char>& letters);
