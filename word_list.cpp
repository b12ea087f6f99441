#include <fstream>
#include <sstream>
#include <cstdio>
#include <map>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>
#include "word_list.hpp"
#include "errors.hpp"
#include "tmp_file.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

namespace WordList {
    // not set externally, only used for the test.
    bool silence = false;

    vector<Word> parse(std::istream& is, const string& source_name) {
        vector<Word> words;
        string line;
        int line_no = 0;
        while (std::getline(is, line)) {
            line_no++;
            boost::algorithm::trim(line);
            if (line.empty()) continue;
            if (!Word::is_valid(line)) {
                if (!silence) {
                    cerr << "Skipping " << source_name << ":" << line_no << ", not a word: " << line << endl;
                }
                continue;
            }
            words.push_back(Word(line));
        }
        if (is.bad()) {
            throw ResourceUnavailable("Error reading word list: " + source_name);
        }
        return words;
    }

    vector<Word> load_from_file(const string& filename, bool debug_output) {
        ptime start = microsec_clock::local_time();
        std::ifstream ifs(filename);
        if (!ifs.is_open()) {
            throw ResourceUnavailable("Error opening word list: " + filename);
        }
        vector<Word> words = parse(ifs, filename);
        if (debug_output) {
            cerr << "Loaded " << words.size() << " words from " << filename
                 << ", took " << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
        }
        return words;
    }

    const Word& pick_random(const vector<Word>& words, Rng& rng) {
        if (words.empty()) {
            throw EmptySource("No words to pick from");
        }
        std::uniform_int_distribution<size_t> dist(0, words.size() - 1);
        return words[dist(rng)];
    }

    static void test1() {
        std::stringstream input;
        input << "apple\n"
              << "\n"
              << "  Banana  \r\n"
              << "two words\n"
              << "   \n"
              << "CHERRY\n"
              << "date";

        std::stringstream output;
        std::stringstream expected;
        for (const Word& w : parse(input, "test1")) {
            output << w << " ";
        }
        output << endl;
        expected << "APPLE BANANA CHERRY DATE " << endl;

        std::stringstream empty_input("\n\n  \n");
        output << parse(empty_input, "test1-empty").size() << endl;
        expected << 0 << endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("WordList::test1() failed, got " + output_str + ", but expected " + expected_str);
        }
    }

    static void test2() {
        string tmpfile = unique_tmp_path("words");
        if (tmpfile == unique_tmp_path("words")) {
            throw std::runtime_error("WordList::test2() temp file names repeat: " + tmpfile);
        }

        bool unavailable = false;
        try {
            load_from_file(tmpfile, false);
        } catch (const ResourceUnavailable&) {
            unavailable = true;
        }
        if (!unavailable) throw std::runtime_error("WordList::test2() missing file not reported");

        {
            std::ofstream ofs(tmpfile);
            ofs << "one\ntwo\nthree\n";
        }
        vector<Word> words = load_from_file(tmpfile, false);
        remove(tmpfile.c_str());
        if (words.size() != 3 || words[2] != Word("THREE")) {
            throw std::runtime_error("WordList::test2() loaded " + boost::lexical_cast<string>(words.size()) + " words");
        }

        Rng rng(7);
        bool empty = false;
        try {
            pick_random(vector<Word>(), rng);
        } catch (const EmptySource&) {
            empty = true;
        }
        if (!empty) throw std::runtime_error("WordList::test2() empty list not reported");
    }

    // picks only come from the list, and every entry shows up roughly 1/K of the time
    static void test3() {
        vector<Word> words = { Word("RED"), Word("GREEN"), Word("BLUE"), Word("CYAN") };
        std::map<Word, int> counts;
        Rng rng(2024);
        const int draws = 40000;
        for (int i = 0; i < draws; i++) {
            counts[pick_random(words, rng)]++;
        }
        if (counts.size() != words.size()) {
            throw std::runtime_error("WordList::test3() picked " + boost::lexical_cast<string>(counts.size())
                                     + " distinct words, expected " + boost::lexical_cast<string>(words.size()));
        }
        for (const auto& kv : counts) {
            bool member = false;
            for (const Word& w : words) member |= (w == kv.first);
            double share = kv.second / static_cast<double>(draws);
            if (!member || share < 0.22 || share > 0.28) {
                throw std::runtime_error("WordList::test3() " + kv.first.str() + " picked with share "
                                         + boost::lexical_cast<string>(share));
            }
        }

        vector<Word> single = { Word("ONLY") };
        for (int i = 0; i < 10; i++) {
            if (pick_random(single, rng) != Word("ONLY")) throw std::runtime_error("WordList::test3() single");
        }
    }

    void test() {
        silence = true;
        test1();
        test2();
        test3();
        silence = false;
    }
}
