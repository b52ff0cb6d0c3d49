#include "sftpgate/server/command_line.hpp"

#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    namespace
    {

        enum class LexState : std::uint8_t
        {
            Start,
            Word,
            SingleQuoted,
            DoubleQuoted
        };

        bool is_space(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

        std::string_view trim_chars(std::string_view value, char c)
        {
            while (!value.empty() && value.front() == c)
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && value.back() == c)
            {
                value.remove_suffix(1);
            }
            return value;
        }

    } // namespace

    ParsedCommand parse_command_payload(std::string_view payload)
    {
        std::vector<std::string> words;
        std::string current;
        auto state = LexState::Start;

        for (std::size_t i = 0; i < payload.size(); ++i)
        {
            const char c = payload[i];
            switch (state)
            {
            case LexState::Start:
            case LexState::Word:
                if (is_space(c))
                {
                    if (state == LexState::Word)
                    {
                        words.push_back(std::move(current));
                        current.clear();
                    }
                    state = LexState::Start;
                }
                else if (c == '\\')
                {
                    if (i + 1 >= payload.size())
                    {
                        throw Error(ErrorCode::SyntaxError, "EOF found after escape character");
                    }
                    current.push_back(payload[++i]);
                    state = LexState::Word;
                }
                else if (c == '\'')
                {
                    state = LexState::SingleQuoted;
                }
                else if (c == '"')
                {
                    state = LexState::DoubleQuoted;
                }
                else
                {
                    current.push_back(c);
                    state = LexState::Word;
                }
                break;
            case LexState::SingleQuoted:
                if (c == '\'')
                {
                    state = LexState::Word;
                }
                else
                {
                    current.push_back(c);
                }
                break;
            case LexState::DoubleQuoted:
                if (c == '"')
                {
                    state = LexState::Word;
                }
                else if (c == '\\' && i + 1 < payload.size() &&
                         (payload[i + 1] == '"' || payload[i + 1] == '\\' || payload[i + 1] == '$' ||
                          payload[i + 1] == '`' || payload[i + 1] == '\n'))
                {
                    current.push_back(payload[++i]);
                }
                else
                {
                    current.push_back(c);
                }
                break;
            }
        }

        if (state == LexState::SingleQuoted || state == LexState::DoubleQuoted)
        {
            throw Error(ErrorCode::SyntaxError, "EOF found when expecting closing quote");
        }
        if (state == LexState::Word)
        {
            words.push_back(std::move(current));
        }
        if (words.empty())
        {
            throw Error(ErrorCode::SyntaxError, "no command found in payload");
        }

        ParsedCommand parsed;
        parsed.name = std::move(words.front());
        parsed.args.assign(std::make_move_iterator(words.begin() + 1), std::make_move_iterator(words.end()));
        return parsed;
    }

    std::string clean_command_path(std::string_view name)
    {
        const auto trimmed = trim_chars(trim_chars(name, '\''), '"');
        auto result = vpath::clean(trimmed);
        if (vpath::has_trailing_slash(trimmed) && !vpath::has_trailing_slash(result))
        {
            result.push_back('/');
        }
        return result;
    }

    std::string join_args(const std::vector<std::string> &args)
    {
        std::string joined;
        for (const auto &arg : args)
        {
            if (!joined.empty())
            {
                joined.push_back(' ');
            }
            joined.append(arg);
        }
        return joined;
    }

} // namespace sftpgate::server
