#include <iostream>
#include <string>
#include <stdexcept>
#include "word.hpp"
#include "guess.hpp"
#include "reveal.hpp"
#include "word_list.hpp"
#include "art.hpp"
#include "input.hpp"
#include "session.hpp"
#include "game.hpp"

#ifndef HANGMAN_DATA_DIR
#define HANGMAN_DATA_DIR "data"
#endif

// the files installed with the game must load and have the shapes the game expects
static void test_data_files() {
    Game::Config c;
    std::vector<Word> words = WordList::load_from_file(c.words_file, false);
    if (words.empty()) throw std::runtime_error("no words in " + c.words_file);

    Art::Lines frames = Art::load_from_file(c.frames_file);
    if (frames.size() != static_cast<size_t>((Session::default_attempts + 1) * Art::frame_height)) {
        throw std::runtime_error("expected one frame per wrong guess in " + c.frames_file);
    }
    for (const std::string& f : { c.start_file, c.win_file, c.lose_file }) {
        Art::banner(Art::load_from_file(f), f);
    }
}

int main() {
    try {
        Word::test();
        GuessResult::test();
        RevealMask::test();
        WordList::test();
        Art::test();
        Input::test();
        Session::test();
        Game::test();
        test_data_files();
    } catch (const std::exception& e) {
        std::cerr << "FAILED: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All tests passed (data from " << HANGMAN_DATA_DIR << ")" << std::endl;
    return 0;
}
