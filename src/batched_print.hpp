#pragma once
#include "growing_string.hpp"
#include "jsonutils.hpp"
#include <cerrno>
#include <cstdlib>
#include <iostream>
using std::cerr;
#ifdef _MSC_VER
#include <BaseTsd.h>
#include <io.h>
typedef SSIZE_T ssize_t;
#else
#include <unistd.h>
#endif

// Output staged for file descriptor 1.
inline growing_string batched_out;

inline void write_all(string_view s)
{
    size_t written = 0;
    while (written < s.size())
    {
        ssize_t w = write(1, s.data() + written, s.size() - written);
        if (w == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            cerr << "write failed\n";
            exit(EXIT_FAILURE);
        }
        written += w;
    }
}

inline void batched_print_flush()
{
    write_all(batched_out.view());
    batched_out.erase(0);
}

inline void batched_print_flush_if_needed()
{
    if (batched_out.size() > 1000000)
    {
        batched_print_flush();
    }
}

inline void batched_print(string_view s)
{
    batched_out.append(s);
    batched_print_flush_if_needed();
}

inline void batched_print(char c)
{
    batched_out.append(c);
    batched_print_flush_if_needed();
}

// Lowercase hex, two digits per byte.
inline void batched_print_hex(string_view bytes)
{
    batched_out.reserve_extra(bytes.size() * 2);
    for (char c : bytes)
    {
        batched_out.append(hex_digit(static_cast<uint8_t>(c) >> 4));
        batched_out.append(hex_digit(static_cast<uint8_t>(c)));
    }
    batched_print_flush_if_needed();
}
