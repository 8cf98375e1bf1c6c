#pragma once
#include "growing_string.hpp"
#include <string_view>

using std::string_view;

// Flags

const unsigned SPACES = 1;
const unsigned INDENT = 128;
const unsigned NEWLINE = 256;

const unsigned PRETTY = SPACES | INDENT | NEWLINE;

inline char hex_digit(unsigned v)
{
    return "0123456789abcdef"[v & 0xF];
}

// Appends `s` as a quoted JSON string. `s` must be valid UTF-8; only quote,
// backslash and control characters are escaped.
inline void append_json_string(growing_string &out, string_view s)
{
    out.reserve_extra(s.size() + 2);
    out.append('"');
    const char *begin = s.data();
    const char *run = begin;
    const char *end = begin + s.size();
    for (const char *p = begin; p < end; p++)
    {
        unsigned char c = static_cast<unsigned char>(*p);
        if (c >= 0x20 && c != '"' && c != '\\')
        {
            continue;
        }
        out.append(string_view(run, p - run));
        run = p + 1;
        switch (c)
        {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            out.append("\\u00");
            out.append(hex_digit(c >> 4));
            out.append(hex_digit(c));
        }
    }
    out.append(string_view(run, end - run));
    out.append('"');
}
