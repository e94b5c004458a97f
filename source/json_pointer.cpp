// json_pointer.cpp
// JSON Pointer (RFC 6901) token handling

#include <record_patch/json_pointer.h>
#include <record_patch/errors.h>

#include <algorithm>
#include <cctype>

namespace record_patch {

std::string escape_token(std::string_view token)
{
    std::string result;
    result.reserve(token.size());

    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }

    return result;
}

std::optional<std::string> unescape_token(std::string_view token)
{
    std::string result;
    result.reserve(token.size());

    for (size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            result += token[i];
            continue;
        }
        if (i + 1 >= token.size()) {
            return std::nullopt;
        }
        if (token[i + 1] == '1') {
            result += '/';
        } else if (token[i + 1] == '0') {
            result += '~';
        } else {
            return std::nullopt;
        }
        ++i;
    }

    return result;
}

std::vector<std::string> parse_json_pointer(std::string_view pointer)
{
    std::vector<std::string> tokens;

    // Empty pointer refers to root
    if (pointer.empty()) {
        return tokens;
    }

    if (pointer[0] != '/') {
        throw SyntaxError("Invalid pointer \"" + std::string(pointer) + "\": must start with '/'.");
    }

    std::string_view rest = pointer.substr(1);
    while (true) {
        auto pos = rest.find('/');
        std::string_view segment = (pos == std::string_view::npos) ? rest : rest.substr(0, pos);

        auto token = unescape_token(segment);
        if (!token) {
            throw SyntaxError("Invalid pointer \"" + std::string(pointer) +
                              "\": invalid escape sequence in \"" + std::string(segment) + "\".");
        }
        tokens.push_back(std::move(*token));

        if (pos == std::string_view::npos) {
            break;
        }
        rest = rest.substr(pos + 1);
    }

    return tokens;
}

std::string tokens_to_json_pointer(const std::vector<std::string>& tokens)
{
    std::string result;
    for (const auto& token : tokens) {
        result += '/';
        result += escape_token(token);
    }
    return result;
}

bool is_array_index(std::string_view token) noexcept
{
    if (token.empty()) {
        return false;
    }
    if (token.size() > 1 && token[0] == '0') {
        return false;
    }
    return std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

} // namespace record_patch
