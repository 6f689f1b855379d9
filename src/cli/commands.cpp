#include "hearthfs/cli/commands.hpp"
#include "hearthfs/cli/messages.hpp"
#include "hearthfs/core/logger.hpp"

#include <exception>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "hearthfs/sandbox/path_sanitizer.hpp"
#include "hearthfs/sandbox/platform_backend.hpp"
#include "hearthfs/sandbox/root_key.hpp"
#include "hearthfs/sandbox/safe_file_ops.hpp"

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef HEARTHFS_VERSION_STRING
#define HEARTHFS_VERSION_STRING "0.1.0-dev"
#endif

namespace hearthfs::cli {

using sandbox::RootKey;

namespace {

/// Options of a sandboxed file command. Owned by the command's closure so
/// CLI11 can bind into it after registration returns.
struct FileArgs {
    RootKey root = RootKey::Attachments;
    std::string path;
    std::string text;
    bool has_text = false;
    bool recursive = false;
};

auto root_key_map() -> std::map<std::string, RootKey> {
    std::map<std::string, RootKey> map;
    for (auto key : sandbox::kAllRootKeys) {
        map.emplace(std::string(sandbox::root_key_to_string(key)), key);
    }
    return map;
}

void add_root_option(CLI::App* sub, FileArgs& args) {
    sub->add_option("root", args.root, "Storage root")
        ->required()
        ->transform(CLI::CheckedTransformer(root_key_map()));
}

/// Runs a coroutine to completion on a private io_context.
template <typename T>
auto run_awaitable(boost::asio::awaitable<T> coro) -> T {
    boost::asio::io_context ioc;
    std::optional<T> result;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, std::move(coro),
        [&](std::exception_ptr e, T value) {
            if (e) {
                failure = e;
            } else {
                result.emplace(std::move(value));
            }
        });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
    return std::move(*result);
}

auto report(const Error& error, const CommandContext& ctx) -> int {
    if (is_path_error(error.code())) {
        LOG_DEBUG("Path rejected: {} ({})", error.what(), error_code_to_string(error.code()));
    } else {
        LOG_WARN("Command failed: {} ({})", error.what(), error_code_to_string(error.code()));
    }
    std::cerr << "error: " << to_user_message(error);
    if (ctx.verbose) {
        std::cerr << " [" << error_code_to_string(error.code()) << "]";
    }
    std::cerr << "\n";
    return 1;
}

auto entry_kind(const sandbox::DirEntry& entry) -> char {
    if (entry.is_symlink) return 'l';
    if (entry.is_directory) return 'd';
    if (entry.is_file) return 'f';
    return '?';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// file commands
// ---------------------------------------------------------------------------

auto register_file_commands(CLI::App& app, CommandContext& ctx) -> std::vector<Command> {
    std::vector<Command> commands;

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("read", "Print a text file");
        add_root_option(sub, *args);
        sub->add_option("path", args->path, "Path relative to the root")->required();
        commands.push_back({sub, [args, &ctx]() {
            auto ops = sandbox::make_platform_file_ops(ctx.config.sandbox);
            auto result = run_awaitable(ops->read_text(args->path, args->root));
            if (!result) return report(result.error(), ctx);
            std::cout << *result;
            return 0;
        }});
    }

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("write", "Write a text file (from --text or stdin)");
        add_root_option(sub, *args);
        sub->add_option("path", args->path, "Path relative to the root")->required();
        auto* text_opt = sub->add_option("-t,--text", args->text, "Content to write");
        commands.push_back({sub, [args, text_opt, &ctx]() {
            std::string data = args->text;
            if (text_opt->count() == 0) {
                data.assign(std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>());
            }
            auto ops = sandbox::make_platform_file_ops(ctx.config.sandbox);
            auto result = run_awaitable(ops->write_text(args->path, args->root, std::move(data)));
            if (!result) return report(result.error(), ctx);
            return 0;
        }});
    }

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("ls", "List a directory");
        add_root_option(sub, *args);
        sub->add_option("path", args->path, "Directory relative to the root (default: root)");
        commands.push_back({sub, [args, &ctx]() {
            auto ops = sandbox::make_platform_file_ops(ctx.config.sandbox);
            auto result = run_awaitable(ops->read_dir(args->path, args->root));
            if (!result) return report(result.error(), ctx);
            for (const auto& entry : *result) {
                std::cout << entry_kind(entry) << ' ' << entry.name << "\n";
            }
            return 0;
        }});
    }

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("mkdir", "Create a directory");
        add_root_option(sub, *args);
        sub->add_option("path", args->path, "Path relative to the root")->required();
        sub->add_flag("-p,--parents", args->recursive, "Create missing parent directories");
        commands.push_back({sub, [args, &ctx]() {
            auto ops = sandbox::make_platform_file_ops(ctx.config.sandbox);
            auto result = run_awaitable(ops->mkdir(args->path, args->root,
                sandbox::MkdirOptions{.recursive = args->recursive}));
            if (!result) return report(result.error(), ctx);
            return 0;
        }});
    }

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("rm", "Remove a file or directory");
        add_root_option(sub, *args);
        sub->add_option("path", args->path, "Path relative to the root")->required();
        sub->add_flag("-r,--recursive", args->recursive, "Remove directories and their contents");
        commands.push_back({sub, [args, &ctx]() {
            auto ops = sandbox::make_platform_file_ops(ctx.config.sandbox);
            auto result = run_awaitable(ops->remove(args->path, args->root,
                sandbox::RemoveOptions{.recursive = args->recursive}));
            if (!result) return report(result.error(), ctx);
            return 0;
        }});
    }

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("exists", "Exit 0 if the path exists, 1 if not");
        add_root_option(sub, *args);
        sub->add_option("path", args->path, "Path relative to the root")->required();
        commands.push_back({sub, [args, &ctx]() {
            auto ops = sandbox::make_platform_file_ops(ctx.config.sandbox);
            auto result = run_awaitable(ops->exists(args->path, args->root));
            if (!result) return report(result.error(), ctx);
            std::cout << (*result ? "true" : "false") << "\n";
            return *result ? 0 : 1;
        }});
    }

    return commands;
}

// ---------------------------------------------------------------------------
// path commands
// ---------------------------------------------------------------------------

auto register_path_commands(CLI::App& app, CommandContext& ctx) -> std::vector<Command> {
    std::vector<Command> commands;

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("sanitize", "Validate and normalize a file name");
        sub->add_option("path", args->path, "Relative path to check")->required();
        commands.push_back({sub, [args, &ctx]() {
            auto result = sandbox::sanitize_relative_path(args->path);
            if (!result) return report(result.error(), ctx);
            std::cout << *result << "\n";
            return 0;
        }});
    }

    {
        auto args = std::make_shared<FileArgs>();
        auto* sub = app.add_subcommand("resolve",
            "Print the absolute location a relative path maps to");
        add_root_option(sub, *args);
        sub->add_option("path", args->path, "Path relative to the root");
        commands.push_back({sub, [args, &ctx]() {
            auto ops = sandbox::make_platform_file_ops(ctx.config.sandbox);
            auto result = ops->resolve(args->path, args->root);
            if (!result) return report(result.error(), ctx);
            std::cout << result->real_path << "\n";
            return 0;
        }});
    }

    return commands;
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app, CommandContext& ctx) -> Command {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    return {sub, [&ctx]() {
        json j = ctx.config;
        std::cout << j.dump(2) << "\n";
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("version", "Print version information");

    return {sub, []() {
        std::cout << "hearthfs " << HEARTHFS_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif

#if defined(__APPLE__)
        std::cout << "Platform: macOS\n";
#elif defined(__linux__)
        std::cout << "Platform: Linux\n";
#else
        std::cout << "Platform: other\n";
#endif
        return 0;
    }};
}

} // namespace hearthfs::cli
