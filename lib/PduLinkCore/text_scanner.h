#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

// -------------------------------------------------------------------------
// Text Scanner
// -------------------------------------------------------------------------
// Forward-only cursor over CLI output. Every read either consumes what it
// matched and returns true, or leaves the cursor where it was.

class TextScanner
{
public:
    explicit TextScanner(const std::string &text, size_t start = 0, size_t end = std::string::npos);

    // Moves the cursor to the next occurrence of literal (cursor lands on it)
    bool seek(const std::string &literal);
    bool accept(const std::string &literal);
    bool acceptChar(char c);
    void skipSpaces();
    void skipToLineEnd();

    bool readUnsigned(uint32_t &value);
    bool readDecimal(std::string &value); // [0-9.]+
    bool readWord(std::string &value);    // [A-Za-z]+
    std::string readUntilAny(const char *stops);

    bool startsWith(const std::string &literal) const;
    bool atEnd() const { return pos >= end; }
    size_t position() const { return pos; }
    void setPosition(size_t position) { pos = position < end ? position : end; }

    static std::string trim(const std::string &value);
    static std::string toLower(const std::string &value);

private:
    const std::string &text;
    size_t pos;
    size_t end;
};
