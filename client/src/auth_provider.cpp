#include "chunklift/client/auth_provider.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chunklift::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

    } // namespace

    TokenFileAuthProvider::TokenFileAuthProvider(std::optional<std::filesystem::path> token_file, std::istream &input,
                                                 std::ostream &output)
        : token_file_(std::move(token_file)),
          input_(input),
          output_(output) {}

    std::optional<std::string> TokenFileAuthProvider::token_silently(const std::string & /*account_id*/)
    {
        if (token_file_)
        {
            std::ifstream in(*token_file_);
            if (in.is_open())
            {
                std::ostringstream contents;
                contents << in.rdbuf();
                auto token = trim(contents.str());
                if (!token.empty())
                {
                    return token;
                }
            }
        }
        if (const char *env = std::getenv("CHUNKLIFT_ACCESS_TOKEN"))
        {
            auto token = trim(env);
            if (!token.empty())
            {
                return token;
            }
        }
        return std::nullopt;
    }

    std::string TokenFileAuthProvider::token_interactive()
    {
        output_ << "Access token: " << std::flush;
        std::string line;
        if (!std::getline(input_, line))
        {
            throw std::runtime_error("No access token entered");
        }
        auto token = trim(line);
        if (token.empty())
        {
            throw std::runtime_error("No access token entered");
        }
        return token;
    }

} // namespace chunklift::client
