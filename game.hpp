/* The interactive part: a menu that starts rounds until the exit command or
   end-of-input, and the round itself, which reads guesses until the session is
   won or lost. Word list and art files are re-read at the start of every round. */

#pragma once
#include <string>
#include <iostream>
#include <cstdint>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "random.hpp"
#include "session.hpp"

namespace Game {
    struct Config {
        Config();

        std::string words_file;
        std::string frames_file;
        std::string start_file;
        std::string win_file;
        std::string lose_file;

        int attempts;
        boost::posix_time::time_duration pause; // after the win/loss screen
        std::string exit_command;               // typed at the menu to quit
        bool penalize_repeats;
        bool ansi;                              // colors and screen clearing
        bool debug_output;                      // timings and loading info on cerr
    };

    struct Options {
        Options();

        Config config;
        uint32_t seed;     // 0 seeds from std::random_device
        bool help;
        std::string usage; // option descriptions, filled in even when parsing fails
    };

    // Command line first, then the --config file for whatever the command line
    // left unset. Throws boost::program_options::error for malformed options and
    // for attempts < 1, a seed outside [0, 2^32) or an empty exit command.
    void parse_options(int argc, const char* const argv[], Options& out);

    // Everything main does. Returns the process exit status: 1 for bad options,
    // --help or any error, 0 after the exit command or end-of-input (a round cut
    // short by end-of-input says "Goodbye." on [os]).
    int run_program(int argc, const char* const argv[], std::istream& is, std::ostream& os, std::ostream& err);

    // Plays one round and returns how it ended. Throws ResourceUnavailable,
    // EmptySource or ResourceTooShort for bad resources and ReadStreamClosed if
    // [is] ends mid-round.
    Session::State play_round(const Config& config, Rng& rng, std::istream& is, std::ostream& os);

    // Menu loop: an empty line plays a round, config.exit_command returns, anything
    // else re-prompts. Returns the number of rounds played once the exit command
    // is typed or [is] ends at the menu.
    int run(const Config& config, Rng& rng, std::istream& is, std::ostream& os);

    void test();
}
