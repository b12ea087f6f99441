#include <fstream>
#include <sstream>
#include <cstdio>
#include <chrono>
#include <thread>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "game.hpp"
#include "word_list.hpp"
#include "art.hpp"
#include "input.hpp"
#include "errors.hpp"
#include "tmp_file.hpp"

using std::string;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

namespace po = boost::program_options;

#ifndef HANGMAN_DATA_DIR
#define HANGMAN_DATA_DIR "data"
#endif

namespace Game {
    const string esc_clear  = "\033[H\033[2J";
    const string esc_red    = "\033[31m";
    const string esc_green  = "\033[32m";
    const string esc_yellow = "\033[33m";
    const string esc_blue   = "\033[34m";
    const string esc_normal = "\033[0m";

    Config::Config() :
        words_file(string(HANGMAN_DATA_DIR) + "/words.txt"),
        frames_file(string(HANGMAN_DATA_DIR) + "/hangman.txt"),
        start_file(string(HANGMAN_DATA_DIR) + "/start.txt"),
        win_file(string(HANGMAN_DATA_DIR) + "/win.txt"),
        lose_file(string(HANGMAN_DATA_DIR) + "/lose.txt"),
        attempts(Session::default_attempts),
        pause(boost::posix_time::seconds(5)),
        exit_command("99"),
        penalize_repeats(false),
        ansi(true),
        debug_output(false)
    {}

    // [text] in [esc] color when ansi output is on
    static string paint(const Config& config, const string& esc, const string& text) {
        if (!config.ansi) return text;
        return esc + text + esc_normal;
    }

    static void clear_screen(const Config& config, std::ostream& os) {
        if (config.ansi) os << esc_clear;
    }

    static void show_banner(const Config& config, std::ostream& os, const string& filename) {
        Art::Lines lines = Art::load_from_file(filename);
        Art::print(os, Art::banner(lines, filename), config.ansi ? esc_red : "");
    }

    static void show_status(const Config& config, std::ostream& os, const Art::Lines& frames,
                            const Session& session, char letter, Session::Outcome outcome) {
        clear_screen(config, os);
        Art::print(os, Art::frame(frames, session.get_wrong_count()), config.ansi ? esc_blue : "");
        switch (outcome) {
        case Session::Outcome::hit:
            os << "Letter found. Remaining attempts: " << session.get_attempts_left() << endl;
            break;
        case Session::Outcome::miss:
            os << "Letter not found. Remaining attempts: " << session.get_attempts_left() << endl;
            break;
        case Session::Outcome::already_tried:
            os << "Letter " << letter << " was already tried. Remaining attempts: " << session.get_attempts_left() << endl;
            break;
        }
        os << "Word: " << session.get_mask() << endl;
        os << "Used letter False: " << paint(config, esc_red, letters_to_string(session.get_used_false())) << endl;
        os << "Used letter True: " << paint(config, esc_green, letters_to_string(session.get_used_true())) << endl;
    }

    static void pause_after_round(const Config& config) {
        long micros = config.pause.total_microseconds();
        if (micros > 0) std::this_thread::sleep_for(std::chrono::microseconds(micros));
    }

    Session::State play_round(const Config& config, Rng& rng, std::istream& is, std::ostream& os) {
        ptime start = microsec_clock::local_time();
        std::vector<Word> words = WordList::load_from_file(config.words_file, config.debug_output);
        const Word& word = WordList::pick_random(words, rng);
        Art::Lines frames = Art::load_from_file(config.frames_file);

        Session session(word, RevealMask::initial(word, rng), config.attempts, config.penalize_repeats);

        clear_screen(config, os);
        Art::print(os, Art::frame(frames, session.get_wrong_count()), config.ansi ? esc_blue : "");
        os << session.get_mask() << endl;

        while (session.get_state() == Session::State::awaiting_guess) {
            char letter = Input::read_letter(is, os);
            Session::Outcome outcome = session.guess(letter);
            show_status(config, os, frames, session, letter, outcome);
        }

        clear_screen(config, os);
        if (session.get_state() == Session::State::won) {
            show_banner(config, os, config.win_file);
            os << paint(config, esc_yellow, "Congratulations! You guessed the word: " + word.str()) << endl;
        } else {
            show_banner(config, os, config.lose_file);
            os << paint(config, esc_red, "The word was: " + word.str()) << endl;
        }
        if (config.debug_output) {
            std::cerr << "Round " << session.get_state() << " with " << session.get_attempts_left()
                      << " attempts left, took " << (microsec_clock::local_time() - start).total_microseconds() / 1e6
                      << "s" << endl;
        }
        pause_after_round(config);
        return session.get_state();
    }

    int run(const Config& config, Rng& rng, std::istream& is, std::ostream& os) {
        int rounds = 0;
        for (;;) {
            clear_screen(config, os);
            show_banner(config, os, config.start_file);
            os << paint(config, esc_red, "INPUT : ") << std::flush;

            string line;
            if (!Input::read_line(is, line)) return rounds;
            if (line == config.exit_command) return rounds;
            if (line.empty()) {
                play_round(config, rng, is, os);
                rounds++;
            }
        }
    }

    Options::Options() : seed(0), help(false) {}

    void parse_options(int argc, const char* const argv[], Options& out) {
        Config& config = out.config;
        int pause_seconds = static_cast<int>(config.pause.total_seconds());
        int64_t seed = 0;
        bool penalize_repeats = false;
        bool no_color = false;
        bool verbose = false;
        string config_file;

        po::options_description desc("Play hangman in the terminal. At the menu press Enter to start a round");
        desc.add_options()
            ("words,w",          po::value<string>(&config.words_file)->default_value(config.words_file),   "word list, one word per line")
            ("frames,f",         po::value<string>(&config.frames_file)->default_value(config.frames_file), "gallows art, 7 lines per wrong guess")
            ("start",            po::value<string>(&config.start_file)->default_value(config.start_file),   "16-line start screen")
            ("win",              po::value<string>(&config.win_file)->default_value(config.win_file),       "16-line win screen")
            ("lose",             po::value<string>(&config.lose_file)->default_value(config.lose_file),     "16-line loss screen")
            ("attempts,a",       po::value<int>(&config.attempts)->default_value(config.attempts),          "wrong guesses allowed per round")
            ("pause,p",          po::value<int>(&pause_seconds)->default_value(pause_seconds),              "seconds to show the win/loss screen")
            ("exit",             po::value<string>(&config.exit_command)->default_value(config.exit_command), "menu input that quits")
            ("seed,s",           po::value<int64_t>(&seed)->default_value(0),                               "random seed, 0 seeds from the system")
            ("penalize-repeats", po::bool_switch(&penalize_repeats),                                        "a repeated wrong letter costs another attempt")
            ("no-color",         po::bool_switch(&no_color),                                                "plain output, no ANSI escapes")
            ("verbose,v",        po::bool_switch(&verbose),                                                 "loading and timing info on stderr")
            ("config,c",         po::value<string>(&config_file),                                           "read options from an ini-style file")
            ("help,h",                                                                                      "produce help message");
        std::stringstream usage;
        usage << desc;
        out.usage = usage.str();

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            const string& filename = vm["config"].as<string>();
            std::ifstream ifs(filename);
            if (!ifs) throw po::error("can't open config file " + filename);
            po::store(po::parse_config_file(ifs, desc), vm);
        }
        po::notify(vm);

        out.help = vm.count("help") > 0;
        if (out.help) return;

        if (config.attempts < 1) {
            throw po::error("--attempts must be at least 1");
        }
        if (seed < 0 || seed > static_cast<int64_t>(UINT32_MAX)) {
            throw po::error("--seed must be between 0 and " + boost::lexical_cast<string>(UINT32_MAX)
                            + ", not " + boost::lexical_cast<string>(seed));
        }
        // the menu trims what it reads, so the exit command is compared trimmed too
        boost::algorithm::trim(config.exit_command);
        if (config.exit_command.empty()) {
            throw po::error("--exit must not be empty, an empty line starts a round");
        }
        config.pause = boost::posix_time::seconds(pause_seconds);
        config.penalize_repeats = penalize_repeats;
        config.ansi = !no_color;
        config.debug_output = verbose;
        out.seed = static_cast<uint32_t>(seed);
    }

    int run_program(int argc, const char* const argv[], std::istream& is, std::ostream& os, std::ostream& err) {
        Options opts;
        try {
            parse_options(argc, argv, opts);
        } catch (const po::error& e) {
            err << "Error: " << e.what() << endl << opts.usage << endl;
            return 1;
        }
        if (opts.help) {
            err << opts.usage << endl;
            return 1;
        }

        Rng rng = make_rng(opts.seed);
        try {
            int rounds = run(opts.config, rng, is, os);
            if (opts.config.debug_output) err << "Played " << rounds << " rounds" << endl;
        } catch (const ReadStreamClosed&) {
            os << endl << "Goodbye." << endl;
        } catch (const std::exception& e) {
            err << "Error: " << e.what() << endl;
            return 1;
        }
        return 0;
    }

    //////////////////
    // tests write their own resources under a per-run temp prefix

    static string tmp_prefix;

    static void write_lines(const string& filename, const std::vector<string>& lines) {
        std::ofstream ofs(filename);
        for (const string& l : lines) ofs << l << "\n";
    }

    static std::vector<string> banner_lines(const string& name) {
        std::vector<string> lines;
        for (int i = 0; i < Art::banner_height; i++) {
            lines.push_back(name + " " + boost::lexical_cast<string>(i));
        }
        return lines;
    }

    static Config test_config(const std::vector<string>& words, int attempts) {
        Config c;
        c.words_file  = tmp_prefix + "words.txt";
        c.frames_file = tmp_prefix + "hangman.txt";
        c.start_file  = tmp_prefix + "start.txt";
        c.win_file    = tmp_prefix + "win.txt";
        c.lose_file   = tmp_prefix + "lose.txt";
        c.attempts = attempts;
        c.pause = boost::posix_time::seconds(0);
        c.ansi = false;

        write_lines(c.words_file, words);
        std::vector<string> frames;
        for (int f = 0; f <= 10; f++) {
            for (int i = 0; i < Art::frame_height; i++) {
                frames.push_back("frame" + boost::lexical_cast<string>(f));
            }
        }
        write_lines(c.frames_file, frames);
        write_lines(c.start_file, banner_lines("START"));
        write_lines(c.win_file, banner_lines("WIN"));
        write_lines(c.lose_file, banner_lines("LOSE"));
        return c;
    }

    static void remove_test_files(const Config& c) {
        remove(c.words_file.c_str());
        remove(c.frames_file.c_str());
        remove(c.start_file.c_str());
        remove(c.win_file.c_str());
        remove(c.lose_file.c_str());
    }

    static bool contains(const string& haystack, const string& needle) {
        return haystack.find(needle) != string::npos;
    }

    static void check(bool ok, const string& what, const string& output) {
        if (!ok) throw std::runtime_error("Game::test() " + what + " failed, output was:\n" + output);
    }

    // APPLE: one miss then a win with 9 attempts left
    static void test1() {
        Config c = test_config({ "APPLE" }, 10);
        Rng rng(1);
        std::stringstream in("A\nP\nZ\nL\nE\n");
        std::stringstream out;
        Session::State s = play_round(c, rng, in, out);
        remove_test_files(c);

        string o = out.str();
        check(s == Session::State::won, "1 state", o);
        check(contains(o, "Letter not found. Remaining attempts: 9"), "1 miss", o);
        check(contains(o, "frame1"), "1 frame after miss", o);
        check(!contains(o, "frame2"), "1 no second miss", o);
        check(contains(o, "Used letter False: Z"), "1 used false", o);
        check(contains(o, "WIN 15"), "1 win banner", o);
        check(!contains(o, "LOSE"), "1 no lose banner", o);
        check(contains(o, "Congratulations! You guessed the word: APPLE"), "1 win line", o);
        check(!contains(o, "\033["), "1 plain output", o);
    }

    // CAT with a single attempt: the first miss ends the round
    static void test2() {
        Config c = test_config({ "CAT" }, 1);
        Rng rng(2);
        std::stringstream in("Z\n");
        std::stringstream out;
        Session::State s = play_round(c, rng, in, out);
        remove_test_files(c);

        string o = out.str();
        check(s == Session::State::lost, "2 state", o);
        check(contains(o, "Letter not found. Remaining attempts: 0"), "2 miss", o);
        check(contains(o, "LOSE 0"), "2 lose banner", o);
        check(contains(o, "The word was: CAT"), "2 lose line", o);
    }

    // bad input is re-prompted, repeats are free, end-of-input mid-round throws
    static void test3() {
        Config c = test_config({ "QUIZ" }, 10);
        Rng rng(3);
        std::stringstream in("hello\n7\nx\nx\n");
        std::stringstream out;
        bool closed = false;
        try {
            play_round(c, rng, in, out);
        } catch (const ReadStreamClosed&) {
            closed = true;
        }
        string o = out.str();
        check(closed, "3 stream closed", o);
        check(contains(o, "Invalid input. Please enter a single letter."), "3 invalid", o);
        check(contains(o, "Letter X was already tried. Remaining attempts: 9"), "3 repeat", o);

        c.penalize_repeats = true;
        std::stringstream in2("x\nx\n");
        std::stringstream out2;
        closed = false;
        try {
            play_round(c, rng, in2, out2);
        } catch (const ReadStreamClosed&) {
            closed = true;
        }
        o = out2.str();
        check(closed, "3 stream closed again", o);
        check(contains(o, "Letter not found. Remaining attempts: 8"), "3 repeat penalized", o);
        check(contains(o, "Used letter False: X X"), "3 repeat history", o);
        remove_test_files(c);
    }

    // menu: other input re-prompts, "" plays, the exit command or end-of-input leaves
    static void test4() {
        Config c = test_config({ "OX" }, 10);
        Rng rng(4);
        std::stringstream in("what\n\nO\nX\n99\n");
        std::stringstream out;
        int rounds = run(c, rng, in, out);
        string o = out.str();
        check(rounds == 1, "4 rounds", o);
        check(contains(o, "START 15"), "4 start banner", o);
        check(contains(o, "INPUT : "), "4 prompt", o);
        check(contains(o, "You guessed the word: OX"), "4 round won", o);

        std::stringstream in2("\nO\nX\n\nO\nX\n");
        std::stringstream out2;
        check(run(c, rng, in2, out2) == 2, "4 end of input", out2.str());

        std::stringstream empty;
        std::stringstream out3;
        check(run(c, rng, empty, out3) == 0, "4 empty input", out3.str());
        remove_test_files(c);
    }

    // broken resources end the round with the matching error
    static void test5() {
        Config c = test_config({ "OX" }, 10);
        Rng rng(5);
        std::stringstream out;
        int caught = 0;

        write_lines(c.words_file, { "", "  ", "123" });
        try {
            std::stringstream in("O\n");
            play_round(c, rng, in, out);
        } catch (const EmptySource&) {
            caught++;
        }

        write_lines(c.words_file, { "OX" });
        write_lines(c.win_file, { "too", "short" });
        try {
            std::stringstream in("O\nX\n");
            play_round(c, rng, in, out);
        } catch (const ResourceTooShort&) {
            caught++;
        }

        remove_test_files(c);
        try {
            std::stringstream in("O\n");
            play_round(c, rng, in, out);
        } catch (const ResourceUnavailable&) {
            caught++;
        }
        check(caught == 3, "5 resource errors (" + boost::lexical_cast<string>(caught) + ")", out.str());
    }

    // argv for run_program/parse_options, pointing at the test resources
    class Args {
    public:
        Args(const Config& c, const std::vector<string>& extra) {
            strings = { "hangman", "--no-color", "-p", "0",
                        "-w", c.words_file, "-f", c.frames_file,
                        "--start", c.start_file, "--win", c.win_file, "--lose", c.lose_file };
            strings.insert(strings.end(), extra.begin(), extra.end());
            for (const string& s : strings) ptrs.push_back(s.c_str());
        }
        int argc() const { return static_cast<int>(ptrs.size()); }
        const char* const* argv() const { return ptrs.data(); }
    private:
        std::vector<string> strings;
        std::vector<const char*> ptrs;
    };

    static int run_args(const Config& c, const std::vector<string>& extra, const string& input,
                        string& out, string& err) {
        Args args(c, extra);
        std::stringstream in(input);
        std::stringstream os;
        std::stringstream es;
        int rc = run_program(args.argc(), args.argv(), in, os, es);
        out = os.str();
        err = es.str();
        return rc;
    }

    static bool rejected(const Config& c, const std::vector<string>& extra) {
        Args args(c, extra);
        Options opts;
        try {
            parse_options(args.argc(), args.argv(), opts);
        } catch (const po::error&) {
            return true;
        }
        return false;
    }

    // option validation and the --config file, which loses to the command line
    static void test6() {
        Config c = test_config({ "OX" }, 10);
        string out;
        string err;

        check(run_args(c, { "-a", "0" }, "", out, err) == 1, "6 zero attempts rc", err);
        check(contains(err, "Error: --attempts must be at least 1"), "6 zero attempts message", err);
        check(rejected(c, { "--seed=-1" }), "6 negative seed", "");
        check(rejected(c, { "--seed=4294967296" }), "6 seed too big", "");
        check(rejected(c, { "--exit", "  " }), "6 blank exit", "");
        check(rejected(c, { "--attempts=many" }), "6 attempts not a number", "");
        check(rejected(c, { "--no-such-option" }), "6 unknown option", "");

        Options opts;
        Args big(c, { "--seed=4294967295", "--exit", " q ", "--penalize-repeats" });
        parse_options(big.argc(), big.argv(), opts);
        check(opts.seed == 4294967295u && opts.config.exit_command == "q" && opts.config.penalize_repeats
              && !opts.config.ansi && opts.config.pause.total_seconds() == 0, "6 parsed options", "");

        string ini = unique_tmp_path("ini");
        {
            std::ofstream ofs(ini);
            ofs << "attempts=0\n";
        }
        check(run_args(c, { "-c", ini }, "", out, err) == 1, "6 ini zero attempts", err);

        Options from_both;
        Args both(c, { "-c", ini, "-a", "3" });
        parse_options(both.argc(), both.argv(), from_both);
        check(from_both.config.attempts == 3, "6 command line wins over ini", "");

        {
            std::ofstream ofs(ini);
            ofs << "attempts=4\n" << "exit=q\n";
        }
        Options from_ini;
        Args ini_only(c, { "-c", ini });
        parse_options(ini_only.argc(), ini_only.argv(), from_ini);
        check(from_ini.config.attempts == 4 && from_ini.config.exit_command == "q", "6 ini values", "");
        remove(ini.c_str());

        check(rejected(c, { "-c", ini }), "6 missing ini", "");
        remove_test_files(c);
    }

    // exit statuses of the whole program
    static void test7() {
        Config c = test_config({ "OX" }, 10);
        string out;
        string err;

        check(run_args(c, {}, "\nO\nX\n99\n", out, err) == 0, "7 normal exit rc", err);
        check(contains(out, "You guessed the word: OX") && !contains(out, "Goodbye."), "7 normal exit", out);

        check(run_args(c, {}, "", out, err) == 0, "7 eof at menu", err);

        check(run_args(c, {}, "\nA\n", out, err) == 0, "7 eof mid-round rc", err);
        check(contains(out, "Letter not found. Remaining attempts: 9"), "7 eof mid-round miss", out);
        check(contains(out, "Goodbye."), "7 eof mid-round goodbye", out);

        check(run_args(c, { "--help" }, "", out, err) == 1, "7 help rc", err);
        check(contains(err, "--attempts"), "7 help text", err);

        remove_test_files(c);
        check(run_args(c, {}, "\n", out, err) == 1, "7 missing resources rc", err);
        check(contains(err, "Error: Error opening art file: " + c.start_file), "7 missing resources message", err);

        c = test_config({ "OX" }, 10);
        remove(c.words_file.c_str());
        check(run_args(c, {}, "\n", out, err) == 1, "7 missing words rc", err);
        check(contains(err, "Error: Error opening word list: " + c.words_file), "7 missing words message", err);
        remove_test_files(c);
    }

    void test() {
        tmp_prefix = unique_tmp_path("game") + ".";
        WordList::silence = true;
        test1();
        test2();
        test3();
        test4();
        test5();
        test6();
        test7();
        WordList::silence = false;
    }
}
