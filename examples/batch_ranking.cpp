#include <avroinfer.hpp>
#include <iostream>
#include <string>
#include <vector>

int main()
{
    using namespace avroinfer;

    std::vector<std::string> messages = {
        R"({"user": "ann", "clicks": 3, "vip": true})",
        R"({"user": "bob", "clicks": 7})",
        R"({"user": "cid", "clicks": 2.5, "vip": false})",
        R"({"user": "dee", "clicks": 5})",
        R"({"user": "eve", "clicks": [1.5, true]})",
    };

    for (auto mode : {Mode::Strict, Mode::Lenient})
    {
        DeriveOptions options;
        options.mode = mode;
        options.log_level = LogLevel::Warning;
        std::cout << "--- " << to_string(mode) << " ---\n";
        try
        {
            for (const auto& group : derive_multiple(messages, options))
                std::cout << group.dump() << "\n";
        }
        catch (const NoSchemaDerivedError& e)
        {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }
    return 0;
}
