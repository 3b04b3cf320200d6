#include "mr/ai/config.hpp"

#include "mr/ai/errors.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mr::ai
{
namespace
{
std::string trim(std::string_view view)
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && std::isspace(static_cast<unsigned char>(view[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(view[end - 1])))
        --end;
    return std::string(view.substr(start, end - start));
}

void parse_assignment(std::string_view line, std::string &key, std::string &value)
{
    auto equal = line.find('=');
    if (equal == std::string_view::npos)
        return;
    key = trim(line.substr(0, equal));
    value = trim(line.substr(equal + 1));
}

bool is_section_header(std::string_view line, std::string &section)
{
    if (line.size() < 3 || line.front() != '[' || line.back() != ']')
        return false;
    section = trim(line.substr(1, line.size() - 2));
    return true;
}

std::string parse_string(std::string value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);
    return value;
}

std::optional<long long> parse_integer(const std::string &value)
{
    long long result = 0;
    auto begin = value.data();
    auto end = value.data() + value.size();
    auto rc = std::from_chars(begin, end, result);
    if (rc.ec == std::errc() && rc.ptr == end)
        return result;
    return std::nullopt;
}

std::optional<bool> parse_bool(const std::string &value)
{
    std::string lower;
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::filesystem::path home_directory()
{
    if (const char *home = std::getenv("HOME"); home && *home)
        return home;
    return std::filesystem::current_path();
}
} // namespace

std::filesystem::path ConfigLoader::default_config_path()
{
    std::filesystem::path config_home;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        config_home = xdg;
    else
        config_home = home_directory() / ".config";

    return config_home / "mroute" / "mroute.toml";
}

std::filesystem::path ConfigLoader::default_data_directory()
{
    if (const char *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "mroute";
    return home_directory() / ".local" / "share" / "mroute";
}

Config ConfigLoader::load_from_file(const std::filesystem::path &path)
{
    Config config;
    config.models_file = default_data_directory() / "models.json";
    config.preferences_file = default_data_directory() / "preferences.json";

    std::ifstream stream(path);
    if (!stream)
        return config;

    std::string line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(stream, line))
    {
        ++line_number;
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (line.empty())
            continue;

        std::string maybe_section;
        if (is_section_header(line, maybe_section))
        {
            section = maybe_section;
            continue;
        }

        std::string key;
        std::string value;
        parse_assignment(line, key, value);
        if (key.empty())
            continue;

        auto invalid = [&](const char *expected) {
            throw ValidationError(path.string() + ":" + std::to_string(line_number) + ": [" + section + "] " +
                                  key + " expects " + expected + ", got " + value);
        };

        if (section == "registry")
        {
            if (key == "models_file")
            {
                config.models_file = parse_string(value);
            }
            else if (key == "default_conflict")
            {
                if (auto parsed = parse_default_conflict_policy(parse_string(value)))
                    config.default_conflict = *parsed;
                else
                    invalid("\"repair\" or \"reject\"");
            }
        }
        else if (section == "preferences")
        {
            if (key == "file")
                config.preferences_file = parse_string(value);
        }
        else if (section == "selection")
        {
            if (key == "needs_vision")
            {
                if (auto parsed = parse_bool(value))
                    config.selection.needs_vision = *parsed;
                else
                    invalid("a boolean");
            }
            else if (key == "needs_thinking")
            {
                if (auto parsed = parse_bool(value))
                    config.selection.needs_thinking = *parsed;
                else
                    invalid("a boolean");
            }
            else if (key == "min_context")
            {
                if (auto parsed = parse_integer(value); parsed && *parsed >= 0)
                    config.selection.min_context = *parsed;
                else
                    invalid("a non-negative integer");
            }
            else if (key == "max_cost_input")
            {
                if (auto parsed = parse_cost_rate(parse_string(value)))
                    config.selection.max_cost_input = *parsed;
                else
                    invalid("a cost such as \"$1.50/1M tokens\"");
            }
        }
    }

    return config;
}

Config ConfigLoader::load_or_default()
{
    return load_from_file(default_config_path());
}

bool ConfigLoader::save(const Config &config, const std::filesystem::path &path,
                        std::string *error_message)
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path);
    if (!out.is_open())
    {
        if (error_message)
            *error_message = "Failed to write configuration: " + path.string();
        return false;
    }

    out << "[registry]\n";
    out << "models_file = \"" << config.models_file.string() << "\"\n";
    out << "default_conflict = \"" << to_string(config.default_conflict) << "\"\n";

    out << "\n[preferences]\n";
    out << "file = \"" << config.preferences_file.string() << "\"\n";

    out << "\n[selection]\n";
    out << "needs_vision = " << (config.selection.needs_vision ? "true" : "false") << "\n";
    out << "needs_thinking = " << (config.selection.needs_thinking ? "true" : "false") << "\n";
    out << "min_context = " << config.selection.min_context << "\n";
    if (config.selection.max_cost_input)
        out << "max_cost_input = \"" << format_cost_rate(*config.selection.max_cost_input) << "\"\n";

    return static_cast<bool>(out);
}

} // namespace mr::ai
