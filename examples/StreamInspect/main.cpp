// main.cpp
// dasl-inspect: streams a file of concatenated DRISL values and reports throughput.
#include <chrono>
#include <charconv>
#include <iostream>
#include <string>
#include <string_view>

#include <DASL/Drisl/StreamDecoder.hpp>
#include <DASL/IO/FileReader.hpp>
#include <DASL/Log.hpp>

using namespace DASL;
using namespace DASL::Drisl;

namespace
{
    constexpr int      kExitOk         = 0;
    constexpr int      kExitDecodeFail = 1;
    constexpr int      kExitUsage      = 2;
    constexpr UIntSize kDotEvery       = 100;

    struct Arguments
    {
        std::string   path {};
        DecodeOptions options {};
        bool          quiet {false};
    };

    void PrintUsage(const char* program)
    {
        std::cerr << "usage: " << program << " <file> [--max-depth N] [--quiet]\n";
    }

    bool ParseArguments(int argc, char** argv, Arguments& args)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            if (arg == "--quiet")
            {
                args.quiet = true;
            }
            else if (arg == "--max-depth")
            {
                if (i + 1 >= argc)
                    return false;
                const std::string_view number = argv[++i];
                UIntSize               depth  = 0;
                const auto [ptr, ec]          = std::from_chars(number.data(), number.data() + number.size(), depth);
                if (ec != std::errc {} || ptr != number.data() + number.size() || depth == 0)
                    return false;
                args.options.maxDepth = depth;
            }
            else if (arg.starts_with("--") || !args.path.empty())
            {
                return false;
            }
            else
            {
                args.path = std::string(arg);
            }
        }
        return !args.path.empty();
    }
}// namespace

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    Arguments args;
    if (!ParseArguments(argc, argv, args))
    {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    IO::FileReader reader;
    auto           opened = reader.Open(args.path);
    if (!opened.HasValue())
    {
        DASL_LOG_ERROR << "cannot open " << args.path << ": " << opened.ErrorUnsafe().message;
        return kExitDecodeFail;
    }

    const auto start   = std::chrono::steady_clock::now();
    auto       session = DecodeStream(reader, args.options);

    int exitCode = kExitOk;
    for (auto&& item: session)
    {
        if (!item.HasValue())
        {
            const DecodeError& error = item.ErrorUnsafe();
            DASL_LOG_ERROR << args.path << ": " << ToString(error.code) << " at offset " << error.offset << ": "
                           << error.message;
            exitCode = kExitDecodeFail;
            break;
        }

        if (session.ValuesDecoded() == 1)
            std::cout << "first value: " << ToDebugString(item.ValueUnsafe()) << '\n';
        else if (!args.quiet && session.ValuesDecoded() % kDotEvery == 0)
            std::cout << '.' << std::flush;
    }

    const auto   elapsed = std::chrono::steady_clock::now() - start;
    const double seconds = std::chrono::duration<double>(elapsed).count();
    const double mib     = static_cast<double>(session.Offset()) / (1024.0 * 1024.0);

    if (!args.quiet && session.ValuesDecoded() >= kDotEvery)
        std::cout << '\n';
    std::cout << "values: " << session.ValuesDecoded() << '\n';
    std::cout << "bytes: " << session.Offset() << '\n';
    std::cout << "elapsed: " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms\n";
    if (seconds > 0.0)
    {
        std::cout << "values/s: " << static_cast<double>(session.ValuesDecoded()) / seconds << '\n';
        std::cout << "MiB/s: " << mib / seconds << '\n';
    }

    if (exitCode == kExitOk)
        DASL_LOG_INFO << args.path << ": decoded " << session.ValuesDecoded() << " values";
    return exitCode;
}
