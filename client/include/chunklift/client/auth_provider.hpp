#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace chunklift::client
{

    // Token acquisition collaborator. How tokens are obtained is up to the implementation.
    class AuthProvider
    {
    public:
        virtual ~AuthProvider() = default;

        // Cached or refreshed token without user interaction.
        virtual std::optional<std::string> token_silently(const std::string &account_id) = 0;

        // May block on the user. Throws when no token could be obtained.
        virtual std::string token_interactive() = 0;
    };

    // Reads the token from a file (re-read on every silent request so an external refresher
    // can rotate it) or from CHUNKLIFT_ACCESS_TOKEN, and prompts on the console interactively.
    class TokenFileAuthProvider final : public AuthProvider
    {
    public:
        TokenFileAuthProvider(std::optional<std::filesystem::path> token_file, std::istream &input, std::ostream &output);

        std::optional<std::string> token_silently(const std::string &account_id) override;

        std::string token_interactive() override;

    private:
        std::optional<std::filesystem::path> token_file_;
        std::istream &input_;
        std::ostream &output_;
    };

} // namespace chunklift::client
