#include "simdjson.h"
#include <cerrno>
#include <cstring> // for strcmp
#include <fcntl.h>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#ifndef FASTVARIANT_VERSION
#define FASTVARIANT_VERSION "<MISSING VERSION INFORMATION>"
#endif

#ifdef _MSC_VER
#include <BaseTsd.h>
#include <io.h>
typedef SSIZE_T ssize_t;
#else
#include <unistd.h>
#endif

#ifdef CURL_FOUND
#include <curl/curl.h>
bool curl_found = true;
#else
bool curl_found = false;
#endif

#include "batched_print.hpp"
#include "jsonutils.hpp"
#include "parse_json.hpp"
#include "print_json.hpp"
#include "validate.hpp"

using namespace std;

enum class mode
{
    encode,
    decode,
    validate,
};

struct options
{
    std::string filename;
    mode run = mode::encode;
    bool help = false;
    bool version = false;
    bool sorted = true;
    size_t max_depth = 0;
    big_integer_policy big_integers = big_integer_policy::reject;
};

string user_agent = "fastvariant";
unsigned flags = SPACES | INDENT | NEWLINE;

bool is_url(string_view url)
{
    return url.starts_with("http://") || url.starts_with("https://");
}

void print_simdjson_version()
{
    cerr << "simdjson v" << SIMDJSON_VERSION << endl;
    cerr << "  Detected the best implementation for your machine: " << simdjson::get_active_implementation()->name();
    cerr << "(" << simdjson::get_active_implementation()->description() << ")" << endl;
}

void print_help()
{
    cerr <<
#ifdef CURL_FOUND
        "Usage: fastvariant [OPTIONS] [FILE | URL]\n\n"
#else
        "Usage: fastvariant [OPTIONS] [FILE]\n\n"
#endif
        "Encodes JSON as a binary variant (metadata and value, printed as hex),\n"
        "or decodes that hex form back to JSON.\n\n"
        "positional arguments:\n"
        "  FILE           file name (or '-' for standard input)\n\n"
        "options:\n"
        "  -h, --help     show this help message and exit\n"
        "  -V, --version  show version information and exit\n"
        "  --simdjson-version  show the simdjson version and implementation\n"
        "  -u, --decode   read 'metadata <hex>' and 'value <hex>' lines and print JSON\n"
        "  --validate     read the hex form and check that it is well formed\n"
        "  --unsorted     keep field names in first-seen order in the dictionary\n"
        "  --max-depth N  deepest allowed nesting of arrays and objects\n"
        "  --big-int reject|decimal|double\n"
        "                 what to do with integers outside the 64-bit range (default reject)\n"
        "  --user-agent   set user agent\n"
        "  --no-indent    don't indent output\n"
        "  --no-newline   no newline inside JSON output\n"
        "  --no-spaces    don't add spaces after : and ,\n";
}

void print_version()
{
    cerr << "fastvariant version " << FASTVARIANT_VERSION << "\n";
}

std::string readFileIntoString(int fd)
{
    std::vector<char> buffer(1000000);
    std::string content;

    ssize_t bytesRead = 0;
    while ((bytesRead = read(fd, buffer.data(), buffer.size())) > 0)
    {
        content.append(buffer.data(), bytesRead);
    }

    if (bytesRead == -1)
    {
        cerr << "Failed to read file\n";
        exit(EXIT_FAILURE);
    }

    close(fd);
    return content;
}

#ifdef CURL_FOUND
size_t writefunc(void *ptr, size_t size, size_t nmemb, std::string *s)
{
    s->append(static_cast<const char *>(ptr), size * nmemb);
    return size * nmemb;
}
#endif

std::string download(const std::string &url)
{
#ifdef CURL_FOUND
    CURL *curl = curl_easy_init();
    string r;
    if (curl)
    {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writefunc);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &r);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
        CURLcode res = curl_easy_perform(curl);
        curl_easy_cleanup(curl);
        if (res != CURLE_OK)
        {
            cerr << "Error when downloading data: " << curl_easy_strerror(res) << "\n";
            exit(EXIT_FAILURE);
        }
    }
    return r;
#else
    cerr << "CURL wasn't compiled in fastvariant\n";
    exit(EXIT_FAILURE);
#endif
}

std::string load_input(const std::string &filename)
{
    if (filename.empty() || filename == "-")
    {
        return readFileIntoString(0);
    }
    if (curl_found && is_url(filename))
    {
        return download(filename);
    }
    int fd = open(filename.c_str(), O_RDONLY);
    if (fd == -1)
    {
        cerr << "Could not open " << filename << ": " << strerror(errno) << "\n";
        exit(EXIT_FAILURE);
    }
    return readFileIntoString(fd);
}

void print_hex(string_view label, string_view bytes)
{
    batched_print(label);
    batched_print(' ');
    batched_print_hex(bytes);
    batched_print('\n');
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Finds the line starting with `label` and decodes the hex after it.
string parse_hex_line(string_view input, string_view label)
{
    size_t pos = 0;
    while (pos < input.size())
    {
        size_t end = input.find('\n', pos);
        if (end == string_view::npos)
        {
            end = input.size();
        }
        string_view line = input.substr(pos, end - pos);
        pos = end + 1;
        while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
        {
            line.remove_suffix(1);
        }
        if (!line.starts_with(label) || line.size() <= label.size() || line[label.size()] != ' ')
        {
            continue;
        }
        string_view hex = line.substr(label.size() + 1);
        if (hex.size() % 2 != 0)
        {
            cerr << "Odd number of hex digits on the " << label << " line\n";
            exit(EXIT_FAILURE);
        }
        string bytes;
        bytes.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2)
        {
            int high = hex_value(hex[i]);
            int low = hex_value(hex[i + 1]);
            if (high < 0 || low < 0)
            {
                cerr << "Invalid hex digit on the " << label << " line\n";
                exit(EXIT_FAILURE);
            }
            bytes.push_back(static_cast<char>(high << 4 | low));
        }
        return bytes;
    }
    cerr << "Missing '" << label << " <hex>' line\n";
    exit(EXIT_FAILURE);
}

options parse_options(int argc, char *argv[])
{
    options opts;

    if (argc == 1 && isatty(0))
    {
        opts.help = true;
    }

    for (int i = 1; i < argc; ++i)
    {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0)
        {
            opts.help = true;
            break; // No need to process further arguments
        }
        else if (strcmp(argv[i], "--version") == 0 || strcmp(argv[i], "-V") == 0)
        {
            opts.version = true;
            break; // No need to process further arguments
        }
        else if (strcmp(argv[i], "--simdjson-version") == 0)
        {
            print_simdjson_version();
            exit(EXIT_SUCCESS);
        }
        else if (strcmp(argv[i], "-u") == 0 || strcmp(argv[i], "--decode") == 0)
        {
            opts.run = mode::decode;
        }
        else if (strcmp(argv[i], "--validate") == 0)
        {
            opts.run = mode::validate;
        }
        else if (strcmp(argv[i], "--unsorted") == 0)
        {
            opts.sorted = false;
        }
        else if (strcmp(argv[i], "--max-depth") == 0)
        {
            if (i + 1 >= argc)
            {
                cerr << "Missing argument for --max-depth\n";
                exit(EXIT_FAILURE);
            }
            char *end = nullptr;
            unsigned long long depth = strtoull(argv[++i], &end, 10);
            if (*end != '\0' || depth == 0)
            {
                cerr << "Invalid depth: " << argv[i] << "\n";
                exit(EXIT_FAILURE);
            }
            opts.max_depth = depth;
        }
        else if (strcmp(argv[i], "--big-int") == 0)
        {
            if (i + 1 >= argc)
            {
                cerr << "Missing argument for --big-int\n";
                exit(EXIT_FAILURE);
            }
            string_view policy = argv[++i];
            if (policy == "reject")
                opts.big_integers = big_integer_policy::reject;
            else if (policy == "decimal")
                opts.big_integers = big_integer_policy::decimal;
            else if (policy == "double")
                opts.big_integers = big_integer_policy::to_double;
            else
            {
                cerr << "Unknown --big-int policy: " << policy << "\n";
                exit(EXIT_FAILURE);
            }
        }
        else if (strcmp(argv[i], "--user-agent") == 0)
        {
            if (i + 1 >= argc)
            {
                cerr << "Missing argument for --user-agent\n";
                exit(EXIT_FAILURE);
            }
            user_agent = argv[++i];
        }
        else if (strcmp(argv[i], "--no-indent") == 0)
        {
            flags &= ~INDENT;
        }
        else if (strcmp(argv[i], "--no-newline") == 0)
        {
            flags &= ~NEWLINE;
        }
        else if (strcmp(argv[i], "--no-spaces") == 0)
        {
            flags &= ~SPACES;
        }
        else if (argv[i][0] == '-' && argv[i][1] != '\0')
        {
            cerr << "Unknown option: " << argv[i] << "\n";
            exit(EXIT_FAILURE);
        }
        else
        {
            if (!is_url(argv[i]) && access(argv[i], F_OK) == -1 && argv[i] != string("-"))
            {
                cerr << "File not found: " << argv[i] << "\n";
                exit(EXIT_FAILURE);
            }
            opts.filename = argv[i];
        }
    }

    return opts;
}

void print_failure(const validation_result &result)
{
    cerr << error_kind_name(result.kind) << " in " << (result.in_metadata ? "metadata" : "value") << " at byte "
         << result.offset << ": " << result.message << "\n";
}

int main(int argc, char *argv[])
{
    options opts = parse_options(argc, argv);

    if (opts.help)
    {
        print_help();
        return 0;
    }

    if (opts.version)
    {
        print_version();
        return 0;
    }

    string input = load_input(opts.filename);

    try
    {
        if (opts.run == mode::encode)
        {
            json_options json_opts;
            json_opts.big_integers = opts.big_integers;
            json_opts.builder.sorted_keys = opts.sorted;
            if (opts.max_depth)
            {
                json_opts.max_depth = opts.max_depth;
            }
            variant_buffers buffers = from_json(input, json_opts);
            print_hex("metadata", buffers.metadata);
            print_hex("value", buffers.value);
            batched_print_flush();
            return EXIT_SUCCESS;
        }

        string metadata = parse_hex_line(input, "metadata");
        string value = parse_hex_line(input, "value");
        validate_options validate_opts;
        if (opts.max_depth)
        {
            validate_opts.max_depth = opts.max_depth;
        }
        validation_result result = validate_variant(metadata, value, validate_opts);
        if (!result && opts.run == mode::validate)
        {
            batched_print(error_kind_name(result.kind));
            batched_print(result.in_metadata ? " in metadata at byte " : " in value at byte ");
            batched_print(std::to_string(result.offset));
            batched_print('\n');
            batched_print_flush();
            return EXIT_FAILURE;
        }
        if (!result)
        {
            print_failure(result);
            return EXIT_FAILURE;
        }
        if (opts.run == mode::validate)
        {
            batched_print("valid\n");
            batched_print_flush();
            return EXIT_SUCCESS;
        }

        variant_metadata md(metadata);
        to_json(batched_out, variant_value(md, value), flags, validate_opts.max_depth);
        batched_print("\n"); // Final newline is always printed
        batched_print_flush();
    }
    catch (const variant_error &e)
    {
        cerr << error_kind_name(e.kind()) << ": " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
