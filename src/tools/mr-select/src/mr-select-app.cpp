#include "mr/ai/config.hpp"
#include "mr/ai/errors.hpp"
#include "mr/ai/log.hpp"
#include "mr/ai/model_catalog.hpp"
#include "mr/ai/model_orchestrator.hpp"
#include "mr/ai/model_registry.hpp"
#include "mr/ai/preference_store.hpp"

#include <charconv>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace
{
    constexpr char kExecutable[] = "mr-select";

    constexpr int kExitOk = 0;
    constexpr int kExitError = 1;
    constexpr int kExitNoCompatibleModel = 2;

    struct CliOptions
    {
        bool showHelp = false;
        std::optional<std::filesystem::path> configPath;
        std::optional<std::filesystem::path> modelsPath;
        std::optional<std::filesystem::path> preferencesPath;
        std::string command;
        std::string userId;
        std::string modelId;
        std::optional<bool> needsVision;
        std::optional<bool> needsThinking;
        std::optional<std::int64_t> minContext;
        std::optional<std::string> maxCost;
        std::vector<std::string> errors;
    };

    bool is_help_flag(std::string_view arg)
    {
        return arg == "--help" || arg == "-h";
    }

    // Accepts "--name VALUE" and "--name=VALUE".
    std::optional<std::string> take_value(std::string_view arg, std::string_view name, int &i, int argc, char **argv)
    {
        if (arg == name)
        {
            if (i + 1 < argc)
                return std::string(argv[++i]);
            return std::nullopt;
        }
        if (arg.size() > name.size() + 1 && arg.rfind(name, 0) == 0 && arg[name.size()] == '=')
            return std::string(arg.substr(name.size() + 1));
        return std::nullopt;
    }

    bool matches_option(std::string_view arg, std::string_view name)
    {
        return arg == name || (arg.rfind(name, 0) == 0 && arg.size() > name.size() && arg[name.size()] == '=');
    }

    CliOptions parse_cli(int argc, char **argv)
    {
        CliOptions options;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            if (is_help_flag(arg))
            {
                options.showHelp = true;
                continue;
            }
            if (arg == "--vision")
            {
                options.needsVision = true;
                continue;
            }
            if (arg == "--thinking")
            {
                options.needsThinking = true;
                continue;
            }

            const std::pair<std::string_view, std::string *> stringOptions[] = {
                {"--user", &options.userId},
                {"--model", &options.modelId},
            };
            bool handled = false;
            for (const auto &[name, target] : stringOptions)
            {
                if (!matches_option(arg, name))
                    continue;
                handled = true;
                if (auto value = take_value(arg, name, i, argc, argv))
                    *target = *value;
                else
                    options.errors.push_back("missing value for " + std::string(name));
            }
            if (handled)
                continue;

            if (matches_option(arg, "--config") || matches_option(arg, "--models") ||
                matches_option(arg, "--preferences"))
            {
                std::string_view name = arg.substr(0, arg.find('='));
                auto value = take_value(arg, name, i, argc, argv);
                if (!value)
                {
                    options.errors.push_back("missing value for " + std::string(name));
                    continue;
                }
                if (name == "--config")
                    options.configPath = *value;
                else if (name == "--models")
                    options.modelsPath = *value;
                else
                    options.preferencesPath = *value;
                continue;
            }
            if (matches_option(arg, "--min-context"))
            {
                auto value = take_value(arg, "--min-context", i, argc, argv);
                std::int64_t parsed = 0;
                if (!value)
                {
                    options.errors.emplace_back("missing value for --min-context");
                    continue;
                }
                auto rc = std::from_chars(value->data(), value->data() + value->size(), parsed);
                if (rc.ec != std::errc() || rc.ptr != value->data() + value->size())
                    options.errors.push_back("--min-context expects an integer, got \"" + *value + "\"");
                else
                    options.minContext = parsed;
                continue;
            }
            if (matches_option(arg, "--max-cost"))
            {
                if (auto value = take_value(arg, "--max-cost", i, argc, argv))
                    options.maxCost = *value;
                else
                    options.errors.emplace_back("missing value for --max-cost");
                continue;
            }
            if (!arg.empty() && arg.front() == '-')
            {
                options.errors.push_back("unknown option " + std::string(arg));
                continue;
            }
            if (options.command.empty())
                options.command = std::string(arg);
            else
                options.errors.push_back("unexpected argument " + std::string(arg));
        }
        return options;
    }

    void print_usage(std::ostream &out)
    {
        out << "Usage: " << kExecutable << " [--config PATH] [--models PATH] [--preferences PATH] <command>\n\n";
        out << "Commands:\n";
        out << "  list                                List every model in the registry.\n";
        out << "  default                             Print the default model id.\n";
        out << "  select --user ID [--vision] [--thinking] [--min-context N] [--max-cost USD]\n";
        out << "                                      Choose a model for a request.\n";
        out << "  prefer --user ID --model ID         Store a user's preferred model.\n";
        out << "\nExit status is " << kExitNoCompatibleModel
            << " when no enabled model satisfies the requirement." << std::endl;
    }

    std::string yes_no(bool value)
    {
        return value ? "yes" : "no";
    }

    void print_models(const mr::ai::RegistrySnapshot &snapshot)
    {
        std::cout << std::left << std::setw(24) << "MODEL" << std::setw(12) << "PROVIDER" << std::right
                  << std::setw(10) << "CONTEXT" << "  " << std::left << std::setw(18) << "INPUT" << std::setw(18)
                  << "OUTPUT" << std::setw(8) << "VISION" << std::setw(10) << "THINKING" << std::setw(10)
                  << "INTEL" << std::setw(8) << "SPEED" << "STATE\n";

        for (const auto &model : snapshot.models())
        {
            std::string state = model.is_enabled ? "enabled" : "disabled";
            if (model.is_default)
                state += ", default";
            std::cout << std::left << std::setw(24) << model.model_id << std::setw(12) << model.provider
                      << std::right << std::setw(10) << model.context_window << "  " << std::left << std::setw(18)
                      << mr::ai::format_cost_rate(model.cost_input) << std::setw(18)
                      << mr::ai::format_cost_rate(model.cost_output) << std::setw(8)
                      << yes_no(model.supports_vision) << std::setw(10) << yes_no(model.supports_thinking)
                      << std::setw(10) << mr::ai::to_string(model.intelligence_tier) << std::setw(8)
                      << mr::ai::to_string(model.speed_tier) << state << "\n";
        }
    }

    mr::ai::ModelCatalog load_catalog(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec))
            return mr::ai::ModelCatalog::with_builtin_models();

        mr::ai::ModelCatalog catalog;
        catalog.load(path);
        return catalog;
    }

    int run_select(const CliOptions &options, const mr::ai::Config &config, mr::ai::ModelOrchestrator &orchestrator)
    {
        mr::ai::CapabilityRequirement requirement = config.selection;
        if (options.needsVision)
            requirement.needs_vision = *options.needsVision;
        if (options.needsThinking)
            requirement.needs_thinking = *options.needsThinking;
        if (options.minContext)
            requirement.min_context = *options.minContext;
        if (options.maxCost)
        {
            auto rate = mr::ai::parse_cost_rate(*options.maxCost);
            if (!rate)
            {
                std::cerr << kExecutable << ": --max-cost expects a price such as 1.50 or \"$1.50/1M tokens\"\n";
                return kExitError;
            }
            requirement.max_cost_input = *rate;
        }

        try
        {
            auto selection = orchestrator.select(options.userId, requirement);
            std::cout << selection.model.model_id << "\t" << mr::ai::to_string(selection.reason) << "\t"
                      << selection.candidate_count << " candidate(s), registry v" << selection.snapshot_version
                      << "\n";
            return kExitOk;
        }
        catch (const mr::ai::NoCompatibleModel &e)
        {
            std::cerr << kExecutable << ": " << e.what() << "\n";
            std::cerr << "requirement: " << mr::ai::describe_requirement(e.requirement()) << "\n";
            return kExitNoCompatibleModel;
        }
    }

    int run(const CliOptions &options)
    {
        mr::ai::Config config = options.configPath ? mr::ai::ConfigLoader::load_from_file(*options.configPath)
                                                   : mr::ai::ConfigLoader::load_or_default();
        if (options.modelsPath)
            config.models_file = *options.modelsPath;
        if (options.preferencesPath)
            config.preferences_file = *options.preferencesPath;

        mr::ai::ModelCatalog catalog = load_catalog(config.models_file);

        mr::ai::ModelRegistry registry(config.default_conflict);
        registry.load(catalog.rows());

        mr::ai::JsonPreferenceStore store(config.preferences_file);
        std::string storeError;
        if (!store.reload(&storeError))
            mr::ai::default_log_sink()(mr::ai::LogLevel::Warning,
                                       storeError + " (preferences fall back to the default model)");

        mr::ai::ModelOrchestrator orchestrator(registry, store);

        if (options.command == "list")
        {
            print_models(*registry.snapshot());
            return kExitOk;
        }
        if (options.command == "default")
        {
            std::cout << registry.default_model().model_id << "\n";
            return kExitOk;
        }
        if (options.command == "select")
        {
            if (options.userId.empty())
            {
                std::cerr << kExecutable << ": select requires --user\n";
                return kExitError;
            }
            return run_select(options, config, orchestrator);
        }
        if (options.command == "prefer")
        {
            if (options.userId.empty() || options.modelId.empty())
            {
                std::cerr << kExecutable << ": prefer requires --user and --model\n";
                return kExitError;
            }
            std::string error;
            if (!orchestrator.update_preference(options.userId, options.modelId, &error))
            {
                std::cerr << kExecutable << ": " << error << "\n";
                return kExitError;
            }
            std::cout << options.userId << " -> " << options.modelId << "\n";
            return kExitOk;
        }

        std::cerr << kExecutable << ": unknown command \"" << options.command << "\"\n";
        print_usage(std::cerr);
        return kExitError;
    }

} // namespace

int main(int argc, char **argv)
{
    CliOptions options = parse_cli(argc, argv);
    if (options.showHelp)
    {
        print_usage(std::cout);
        return kExitOk;
    }
    if (!options.errors.empty())
    {
        for (const auto &error : options.errors)
            std::cerr << kExecutable << ": " << error << "\n";
        print_usage(std::cerr);
        return kExitError;
    }
    if (options.command.empty())
    {
        print_usage(std::cerr);
        return kExitError;
    }

    try
    {
        return run(options);
    }
    catch (const mr::ai::SelectionError &e)
    {
        std::cerr << kExecutable << ": " << e.what() << "\n";
        return kExitError;
    }
    catch (const std::exception &e)
    {
        std::cerr << kExecutable << ": fatal: " << e.what() << "\n";
        return kExitError;
    }
}
