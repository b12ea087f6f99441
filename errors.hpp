/* Everything the game can fail with. InvalidGuessInput is deliberately missing:
   bad input is handled by re-prompting inside Input::read_letter. */

#pragma once
#include <stdexcept>
#include <string>

// a word list or art file could not be opened or read
class ResourceUnavailable : public std::runtime_error {
public:
    explicit ResourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// asked to pick from zero candidate words
class EmptySource : public std::runtime_error {
public:
    explicit EmptySource(const std::string& what) : std::runtime_error(what) {}
};

// a banner file has fewer lines than a banner needs
class ResourceTooShort : public std::runtime_error {
public:
    explicit ResourceTooShort(const std::string& what) : std::runtime_error(what) {}
};

// end-of-input on the interactive stream
class ReadStreamClosed : public std::runtime_error {
public:
    explicit ReadStreamClosed(const std::string& what) : std::runtime_error(what) {}
};
