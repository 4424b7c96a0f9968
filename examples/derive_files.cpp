// Derive an Avro record schema from JSON files.
//
// Usage: avroinfer_example_derive [--lenient] FILE...
//
// A file holding one JSON object yields that object's schema. A file holding
// a top-level array is read as a batch of messages and yields ranked schemas.
// AVROINFER_* environment variables configure the remaining options.

#include <avroinfer.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace
{

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw avroinfer::Error("cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

int main(int argc, char** argv)
{
    using namespace avroinfer;

    DeriveOptions options;
    std::vector<std::string> files;
    try
    {
        options = Settings::from_env().to_options();
    }
    catch (const Error& e)
    {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    }
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--lenient")
            options.mode = Mode::Lenient;
        else if (arg == "--strict")
            options.mode = Mode::Strict;
        else
            files.push_back(arg);
    }
    if (files.empty())
    {
        std::cerr << "usage: " << argv[0] << " [--lenient] FILE...\n";
        return 2;
    }

    int failures = 0;
    for (const auto& path : files)
    {
        try
        {
            auto messages = read_messages(read_file(path), options.max_depth);
            if (messages.size() == 1)
            {
                std::cout << derive_schema(messages.front(), options.record_name, options).dump(2)
                          << "\n";
                continue;
            }
            for (const auto& entry : derive_multiple(messages, options))
                std::cout << entry.dump(2) << "\n";
        }
        catch (const DeriveFailure& e)
        {
            std::cerr << path << ": " << to_string(e.kind()) << ": " << e.what() << "\n";
            ++failures;
        }
        catch (const Error& e)
        {
            std::cerr << path << ": " << e.what() << "\n";
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}
