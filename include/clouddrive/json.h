#pragma once

#include <cstdint>
#include <string>

namespace clouddrive
{

// Linear non-strict JSON scanner.
//
// Separators and whitespace are skipped silently. Methods that fail
// leave the scanner where it was.
class JSON
{
    // Skip whitespace and separators.
    void skip();

    const char* mPosition;

public:
    JSON();

    explicit JSON(const std::string& data);

    explicit JSON(const char* data);

    // Have we consumed all of the input?
    bool eof();

    bool enterarray();

    bool enterobject();

    // Retrieve a boolean, or a number interpreted as one.
    bool getbool(bool& value);

    // Retrieve an integer.
    bool getint(std::int64_t& value);

    // Retrieve the next name in the current object.
    //
    // Returns an empty string at the end of the object.
    std::string getname();

    // Is the next value null? Consumes it if so.
    bool isnull();

    bool leavearray();

    bool leaveobject();

    // Retrieve a string, resolving any escapes.
    bool storestring(std::string& value);

    // Skip a value of any kind, optionally storing its raw text.
    bool storeobject(std::string* value = nullptr);
}; // JSON

} // clouddrive
