#ifndef SHELL_HPP
#define SHELL_HPP

#include <iosfwd>
#include <string>

class KVStore;

// Line-oriented front end: SET <key> <value>, GET <key>, EXIT.
// Absent keys print NULL, rejected or failed operations print "ERR: ...".
class Shell {
public:
    Shell(KVStore& store, std::istream& in, std::ostream& out, bool prompt = true);

    // Runs until EXIT or end of input.
    void run();

    // Handles one input line. Returns false once EXIT has been seen.
    bool handleLine(const std::string& line);

private:
    void reply(const std::string& text);

    KVStore& store;
    std::istream& in;
    std::ostream& out;
    bool prompt;
};

#endif // SHELL_HPP
