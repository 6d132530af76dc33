#include <pdfscrub/ConvergenceDriver.hh>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubJob.hh>

#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace pdfscrub;

static char const* whoami = nullptr;

static void
usage(std::ostream& os)
{
    os << "Usage: " << whoami << " [options] check input.pdf\n"
       << "       " << whoami << " [options] remove input.pdf output.pdf\n"
       << "\n"
       << "Check PDF files for JavaScript actions, or remove them and save a sanitized copy.\n"
       << "\n"
       << "Commands:\n"
       << "  check input.pdf              report whether input.pdf contains JavaScript\n"
       << "  remove input.pdf output.pdf  remove JavaScript from input.pdf and write\n"
       << "                               the result to output.pdf\n"
       << "\n"
       << "Options:\n"
       << "  -v, --verbose                log each step of the traversal\n"
       << "  --max-passes=n               stop removal after n passes (default "
       << ConvergenceDriver::DEFAULT_MAX_PASSES << ")\n"
       << "  -h, --help                   show this help\n"
       << "  --version                    show the version\n"
       << "\n"
       << "Examples:\n"
       << "  " << whoami << " check document.pdf\n"
       << "  " << whoami << " --verbose remove input.pdf output_sanitized.pdf\n";
}

static void
usageExit(std::string const& msg)
{
    std::cerr << '\n' << whoami << ": " << msg << "\n\n";
    usage(std::cerr);
    exit(ScrubJob::EXIT_ERROR);
}

static int
doCheck(ScrubJob& j, std::string const& infile)
{
    auto r = j.check(infile);
    if (r.found) {
        std::cout << "Result: JavaScript DETECTED in '" << infile << "'.\n";
        return 0;
    }
    if (!r.checked()) {
        if (r.error == pdfscrub_e_input_not_found) {
            std::cout << "Result: Cannot check '" << infile
                      << "'. File not found or inaccessible.\n";
        } else {
            std::cout << "Result: Cannot check '" << infile << "'. "
                      << ScrubExc::describe(r.error) << ": " << r.cause << ".\n";
        }
        return ScrubJob::EXIT_CANNOT_CHECK;
    }
    std::cout << "Result: No JavaScript detected (based on checks) in '" << infile << "'.\n";
    return 0;
}

static int
doRemove(ScrubJob& j, std::string const& infile, std::string const& outfile)
{
    auto r = j.remove(infile, outfile);
    if (!r.success) {
        std::cout << "Result: Failed to sanitize '" << infile << "'. Check logs for errors.\n";
        return ScrubJob::EXIT_ERROR;
    }
    std::cout << "Result: Successfully processed '" << infile << "' and saved sanitized file to '"
              << outfile << "'.\n";

    int exit_code = 0;
    if (r.result.reached_limit) {
        std::cout << "Warning: removal stopped after " << r.result.passes
                  << " passes before the document became stable.\n";
        exit_code = ScrubJob::EXIT_WARNING;
    }

    auto verify = j.check(outfile);
    if (verify.found) {
        std::cout << "Verification Warning: JavaScript may still be present in '" << outfile
                  << "'. Manual review recommended.\n";
        exit_code = ScrubJob::EXIT_WARNING;
    } else if (!verify.checked()) {
        std::cout << "Verification Warning: could not verify '" << outfile << "': " << verify.cause
                  << ".\n";
        exit_code = ScrubJob::EXIT_WARNING;
    } else {
        std::cout << "Verification: Sanitized file '" << outfile << "' appears clean.\n";
    }
    return exit_code;
}

int
realmain(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);
    QUtil::setLineBuf(stdout);

    // Remove prefix added by libtool for consistency during testing.
    if (strncmp(whoami, "lt-", 3) == 0) {
        whoami += 3;
    }

    bool verbose = false;
    int max_passes = ConvergenceDriver::DEFAULT_MAX_PASSES;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-h") || (arg == "--help")) {
            usage(std::cout);
            return 0;
        } else if (arg == "--version") {
            std::cout << whoami << " version " << PDFSCRUB_VERSION << '\n';
            return 0;
        } else if ((arg == "-v") || (arg == "--verbose")) {
            verbose = true;
        } else if (arg.starts_with("--max-passes=")) {
            try {
                max_passes = QUtil::string_to_int(arg.substr(13).c_str());
            } catch (std::exception&) {
                usageExit("invalid value for --max-passes: " + arg.substr(13));
            }
            if (max_passes < 1) {
                usageExit("--max-passes must be at least 1");
            }
        } else if ((arg.size() > 1) && (arg.at(0) == '-')) {
            usageExit("unknown option " + arg);
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        usageExit("no command given");
    }

    ScrubJob j;
    j.setMessagePrefix(whoami);
    j.setVerbose(verbose);
    j.setMaxPasses(max_passes);
    // Keep standard output for result lines.
    j.getLogger()->setInfo(j.getLogger()->standardError());
    if (verbose) {
        j.getLogger()->info(std::string(whoami) + ": verbose logging enabled\n");
    }

    std::string const& command = args.at(0);
    try {
        if (command == "check") {
            if (args.size() != 2) {
                usageExit("check requires exactly one input file");
            }
            return doCheck(j, args.at(1));
        } else if (command == "remove") {
            if (args.size() != 3) {
                usageExit("remove requires an input file and an output file");
            }
            return doRemove(j, args.at(1), args.at(2));
        }
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << '\n';
        std::cout << "Result: An error occurred while processing '" << args.at(1)
                  << "'. Check logs.\n";
        return ScrubJob::EXIT_ERROR;
    }
    usageExit("unknown command " + command);
    return ScrubJob::EXIT_ERROR;
}

#ifdef WINDOWS_WMAIN

extern "C" int
wmain(int argc, wchar_t* argv[])
{
    return QUtil::call_main_from_wmain(argc, argv, realmain);
}

#else

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}

#endif
