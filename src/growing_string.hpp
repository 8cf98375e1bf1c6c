#pragma once

#include <string_view>
#include <string>
#include <algorithm>
#include <cstring>
#include <cstdint>
using std::max;
using std::string_view;

// Append-only byte buffer used for variant encoding and JSON output.
struct growing_string
{
    char *data;
    size_t len = 0;
    size_t capacity;

    growing_string() : capacity(1000)
    {
        data = new char[capacity];
    }

    growing_string(string_view s) : capacity(s.size() + 100)
    {
        data = new char[capacity];
        memcpy(data, s.data(), s.size());
        len = s.size();
    }

    growing_string(const growing_string &) = delete;
    growing_string &operator=(const growing_string &) = delete;

    growing_string(growing_string &&other) noexcept
        : data(other.data), len(other.len), capacity(other.capacity)
    {
        other.data = nullptr;
        other.len = 0;
        other.capacity = 0;
    }

    growing_string &operator=(growing_string &&other) noexcept
    {
        if (this != &other)
        {
            delete[] data;
            data = other.data;
            len = other.len;
            capacity = other.capacity;
            other.data = nullptr;
            other.len = 0;
            other.capacity = 0;
        }
        return *this;
    }

    ~growing_string()
    {
        delete[] data;
    }

    void reserve_extra(size_t extra)
    {
        if (len + extra > capacity)
        {
            capacity = max(capacity * 2, len + extra);
            char *new_data = new char[capacity];
            if (len > 0)
            {
                memcpy(new_data, data, len);
            }
            delete[] data;
            data = new_data;
        }
    }

    string_view view() const
    {
        return std::string_view(data, len);
    }

    string_view view(size_t pos, size_t count) const
    {
        return std::string_view(data + pos, count);
    }

    growing_string &append(string_view s)
    {
        reserve_extra(s.size());
        if (!s.empty())
        {
            memcpy(data + len, s.data(), s.size());
        }
        len += s.size();
        return *this;
    }

    growing_string &append(char c)
    {
        reserve_extra(1);
        data[len++] = c;
        return *this;
    }

    growing_string &append_byte(uint8_t b)
    {
        return append(static_cast<char>(b));
    }

    // Writes the low `width` bytes of `value`, least significant first.
    growing_string &append_uint_le(uint32_t value, unsigned width)
    {
        reserve_extra(width);
        for (unsigned i = 0; i < width; i++)
        {
            data[len++] = static_cast<char>((value >> (8 * i)) & 0xFF);
        }
        return *this;
    }

    template <typename T>
    growing_string &append_le(T value)
    {
        reserve_extra(sizeof(T));
        unsigned char bytes[sizeof(T)];
        memcpy(bytes, &value, sizeof(T));
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
        std::reverse(bytes, bytes + sizeof(T));
#endif
        memcpy(data + len, bytes, sizeof(T));
        len += sizeof(T);
        return *this;
    }

    growing_string &erase(size_t newlen)
    {
        if (newlen <= len)
        {
            len = newlen;
        }
        return *this;
    }

    inline size_t size() const
    {
        return len;
    }

    operator string_view() const
    {
        return {data, len};
    }

    std::string str() const
    {
        return std::string(data, len);
    }
};
