#include "text_scanner.h"
#include <ctype.h>
#include <string.h>

TextScanner::TextScanner(const std::string &text, size_t start, size_t end)
    : text(text), pos(start), end(end > text.size() ? text.size() : end)
{
    if (pos > this->end)
    {
        pos = this->end;
    }
}

bool TextScanner::seek(const std::string &literal)
{
    size_t found = text.find(literal, pos);
    if (found == std::string::npos || found + literal.size() > end)
    {
        return false;
    }
    pos = found;
    return true;
}

bool TextScanner::startsWith(const std::string &literal) const
{
    if (pos + literal.size() > end)
    {
        return false;
    }
    return text.compare(pos, literal.size(), literal) == 0;
}

bool TextScanner::accept(const std::string &literal)
{
    if (!startsWith(literal))
    {
        return false;
    }
    pos += literal.size();
    return true;
}

bool TextScanner::acceptChar(char c)
{
    if (pos < end && text[pos] == c)
    {
        pos++;
        return true;
    }
    return false;
}

void TextScanner::skipSpaces()
{
    while (pos < end && isspace((unsigned char)text[pos]))
    {
        pos++;
    }
}

void TextScanner::skipToLineEnd()
{
    while (pos < end && text[pos] != '\r' && text[pos] != '\n')
    {
        pos++;
    }
}

bool TextScanner::readUnsigned(uint32_t &value)
{
    size_t start = pos;
    uint32_t result = 0;
    while (pos < end && isdigit((unsigned char)text[pos]))
    {
        // Anything past 9 digits is not an index or count we care about
        if (pos - start >= 9)
        {
            pos = start;
            return false;
        }
        result = result * 10 + (uint32_t)(text[pos] - '0');
        pos++;
    }
    if (pos == start)
    {
        return false;
    }
    value = result;
    return true;
}

bool TextScanner::readDecimal(std::string &value)
{
    size_t start = pos;
    while (pos < end && (isdigit((unsigned char)text[pos]) || text[pos] == '.'))
    {
        pos++;
    }
    if (pos == start)
    {
        return false;
    }
    value = text.substr(start, pos - start);
    return true;
}

bool TextScanner::readWord(std::string &value)
{
    size_t start = pos;
    while (pos < end && isalpha((unsigned char)text[pos]))
    {
        pos++;
    }
    if (pos == start)
    {
        return false;
    }
    value = text.substr(start, pos - start);
    return true;
}

std::string TextScanner::readUntilAny(const char *stops)
{
    size_t start = pos;
    while (pos < end && strchr(stops, text[pos]) == nullptr)
    {
        pos++;
    }
    return text.substr(start, pos - start);
}

std::string TextScanner::trim(const std::string &value)
{
    size_t first = 0;
    size_t last = value.size();
    while (first < last && isspace((unsigned char)value[first]))
    {
        first++;
    }
    while (last > first && isspace((unsigned char)value[last - 1]))
    {
        last--;
    }
    return value.substr(first, last - first);
}

std::string TextScanner::toLower(const std::string &value)
{
    std::string result(value);
    for (size_t i = 0; i < result.size(); i++)
    {
        result[i] = (char)tolower((unsigned char)result[i]);
    }
    return result;
}
