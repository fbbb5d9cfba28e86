#include <functional>
#include <iostream>
#include <string>
#include <stdlib.h>
#include <sys/stat.h>

#include "MailCore/MailCore.h"
#include "StanfordCPPLib/exceptions.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "optionparser.h"

#include "maildrive/constants.hpp"
#include "maildrive/drive_config.hpp"
#include "maildrive/drive_exception.hpp"
#include "maildrive/imap_mail_transport.hpp"
#include "maildrive/listing_engine.hpp"
#include "maildrive/mail_utils.hpp"
#include "maildrive/path_mapper.hpp"
#include "maildrive/progress_collectors.hpp"
#include "maildrive/upload_pipeline.hpp"
#include "maildrive/models/account.hpp"

using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

#define EXIT_USAGE      1
#define EXIT_DRIVE      2
#define EXIT_TRANSPORT  3

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool msg)
    {
        if (option.arg != 0) {
            return option::ARG_OK;
        }
        if (msg) {
            std::cerr << "Option '" << std::string(option.name, option.namelen) << "' requires an argument\n";
        }
        return option::ARG_ILLEGAL;
    }
    static ArgStatus Numeric(const Option& option, bool msg)
    {
        char * endptr = 0;
        if (option.arg != 0) {
            strtol(option.arg, &endptr, 10);
        }
        if (option.arg != 0 && endptr != option.arg && *endptr == 0) {
            return option::ARG_OK;
        }
        if (msg) {
            std::cerr << "Option '" << std::string(option.name, option.namelen) << "' requires a numeric argument\n";
        }
        return option::ARG_ILLEGAL;
    }
};

#define USAGE_STRING "USAGE: maildrive <command> [options] [arguments]\n\n" \
    "Commands:\n" \
    "  list, ls [folder]                 List the files in a remote folder.\n" \
    "  download, d <file> [destination]  Download a remote file.\n" \
    "  upload, u <path> [folder]         Upload a local file or directory.\n" \
    "  remove, rm <file>                 Remove a remote file.\n" \
    "  list-folders, lsf                 List every remote folder.\n\n" \
    "Options:"

enum  optionIndex { UNKNOWN, HELP, CREDENTIALS, FOLDER, RECURSIVE, DEPTH, LONG, START_CHUNK, PART_SIZE, TRASH, LOG_FILE, DEBUG, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN,     0, "" , "",            CArg::None,     USAGE_STRING },
    {HELP,        0, "h", "help",        CArg::None,     "  --help, -h  \tPrint usage and exit." },
    {CREDENTIALS, 0, "c", "credentials", CArg::Required, "  --credentials, -c  \tPath of the credentials JSON file. Defaults to ./" MAILDRIVE_CREDENTIALS_FILE " or ~/.config/maildrive/" MAILDRIVE_CREDENTIALS_FILE "." },
    {FOLDER,      0, "f", "folder",      CArg::Required, "  --folder, -f  \tName of the mail folder holding the drive. Defaults to '" MAILDRIVE_DEFAULT_FOLDER "'." },
    {RECURSIVE,   0, "r", "recursive",   CArg::None,     "  --recursive, -r  \tlist: include subfolders." },
    {DEPTH,       0, "d", "depth",       CArg::Numeric,  "  --depth, -d  \tlist: how many levels of subfolders to expand. Implies --recursive." },
    {LONG,        0, "l", "long",        CArg::None,     "  --long, -l  \tlist: show parts, size and date." },
    {START_CHUNK, 0, "" , "start-chunk", CArg::Numeric,  "  --start-chunk  \tupload: resume a single file upload from this 0-based part." },
    {PART_SIZE,   0, "" , "part-size",   CArg::Numeric,  "  --part-size  \tupload: maximum part size in bytes." },
    {TRASH,       0, "" , "trash",       CArg::Required, "  --trash  \tremove: copy removed parts into this folder first." },
    {LOG_FILE,    0, "" , "log-file",    CArg::Required, "  --log-file  \tAlso write logs to this file (rotated at 5MB)." },
    {DEBUG,       0, "" , "debug",       CArg::None,     "  --debug  \tPrint debug logs." },
    {VERBOSE,     0, "v", "verbose",     CArg::None,     "  --verbose, -v  \tLog IMAP traffic (implies --debug)." },
    {0,0,0,0,0,0}
};

static bool fileExists(const std::string & path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

static std::string findCredentials(Option * options) {
    if (options[CREDENTIALS]) {
        return options[CREDENTIALS].last()->arg;
    }
    std::vector<std::string> candidates = {MAILDRIVE_CREDENTIALS_FILE};
    std::string home = MailUtils::getEnvUTF8("HOME");
    if (home != "") {
        candidates.push_back(home + "/.config/maildrive/" + MAILDRIVE_CREDENTIALS_FILE);
    }
    for (const auto & candidate : candidates) {
        if (fileExists(candidate)) {
            return candidate;
        }
    }
    throw NotFoundException("credentials-not-found", MAILDRIVE_CREDENTIALS_FILE, "No credentials file was found. Pass one with --credentials.");
}

static void setupLogging(Option * options) {
    bool debug = options[DEBUG] || options[VERBOSE];

    std::vector<spdlog::sink_ptr> sinks;

    // Console output is kept terse: warnings and errors only, unless
    // debugging was requested.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_pattern("%l: %v");
    stderr_sink->set_level(debug ? spdlog::level::trace : spdlog::level::warn);
    sinks.push_back(stderr_sink);

    if (options[LOG_FILE]) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(options[LOG_FILE].last()->arg, 1048576 * 5, 3);
        file_sink->set_pattern("%+");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_level(options[VERBOSE] ? spdlog::level::trace : (debug ? spdlog::level::debug : spdlog::level::info));
    spdlog::register_logger(logger);
}

static std::vector<std::string> splitRemoteFile(const std::string & remotePath, std::string & name) {
    std::vector<std::string> segments = PathMapper::parse(remotePath);
    if (segments.empty()) {
        throw DriveException("bad-remote-path", "'" + remotePath + "' does not name a file.");
    }
    name = segments.back();
    segments.pop_back();
    return segments;
}

int runCommandAndExit(std::function<void()> fn) {
    try {
        fn();
    } catch (TransportException & ex) {
        spdlog::get("logger")->debug("{}", ex.toJSON().dump());
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_TRANSPORT;
    } catch (DriveException & ex) {
        spdlog::get("logger")->debug("{}", ex.toJSON().dump());
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_DRIVE;
    }
    return 0;
}

int main(int argc, const char * argv[]) {
    // initialize the stanford exception handler
    exceptions::setProgramNameForStackTrace((char *)argv[0]);
    exceptions::setTopLevelExceptionHandlerEnabled(true);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(true, usage, argc, argv);
    std::vector<Option> options(stats.options_max), buffer(stats.buffer_max);
    option::Parser parse(true, usage, argc, argv, options.data(), buffer.data());

    if (parse.error()) {
        return EXIT_USAGE;
    }
    if (options[HELP] || parse.nonOptionsCount() == 0) {
        option::printUsage(std::cout, usage);
        return EXIT_USAGE;
    }
    if (options[UNKNOWN]) {
        std::cerr << "Unknown option: " << std::string(options[UNKNOWN].name, options[UNKNOWN].namelen) << "\n";
        return EXIT_USAGE;
    }

    std::string command = parse.nonOption(0);
    std::vector<std::string> args;
    for (int ii = 1; ii < parse.nonOptionsCount(); ii ++) {
        args.push_back(parse.nonOption(ii));
    }

    if (command == "ls") command = "list";
    if (command == "d") command = "download";
    if (command == "u") command = "upload";
    if (command == "rm") command = "remove";
    if (command == "lsf") command = "list-folders";

    size_t minArgs = 0, maxArgs = 0;
    if (command == "list") { minArgs = 0; maxArgs = 1; }
    else if (command == "download") { minArgs = 1; maxArgs = 2; }
    else if (command == "upload") { minArgs = 1; maxArgs = 2; }
    else if (command == "remove") { minArgs = 1; maxArgs = 1; }
    else if (command == "list-folders") { minArgs = 0; maxArgs = 0; }
    else {
        std::cerr << "Unknown command: " << command << "\n\n";
        option::printUsage(std::cerr, usage);
        return EXIT_USAGE;
    }
    if (args.size() < minArgs || args.size() > maxArgs) {
        std::cerr << "Wrong number of arguments for '" << command << "'.\n\n";
        option::printUsage(std::cerr, usage);
        return EXIT_USAGE;
    }

    setupLogging(options.data());
    if (options[VERBOSE]) {
        MailUtils::enableVerboseLogging();
    }

    DriveConfig config;
    if (options[FOLDER]) config.baseFolder = options[FOLDER].last()->arg;
    if (options[RECURSIVE]) config.recurse = true;
    if (options[DEPTH]) {
        config.recurse = true;
        config.maxDepth = atoi(options[DEPTH].last()->arg);
    }
    if (options[START_CHUNK]) {
        int start = atoi(options[START_CHUNK].last()->arg);
        if (start < 0) {
            std::cerr << "--start-chunk cannot be negative.\n";
            return EXIT_USAGE;
        }
        config.startPart = (unsigned int)start;
    }
    if (options[PART_SIZE]) {
        long long size = atoll(options[PART_SIZE].last()->arg);
        if (size <= 0) {
            std::cerr << "--part-size must be at least one byte.\n";
            return EXIT_USAGE;
        }
        config.maxPartSize = (size_t)size;
    }
    if (options[TRASH]) config.trashFolder = options[TRASH].last()->arg;
    config.debug = options[DEBUG] || options[VERBOSE];
    config.verbose = options[VERBOSE] ? true : false;

    spdlog::get("logger")->debug("-- Configuration: {}", config.toJSON().dump());

    return runCommandAndExit([&]() {
        mailcore::AutoreleasePool pool;

        std::shared_ptr<Account> account = Account::fromFile(findCredentials(options.data()));
        if (account->valid() != "") {
            throw DriveException("credentials-invalid", "The credentials file is missing required fields: " + account->valid() + ".");
        }

        IMAPMailTransport transport(account, config.trashFolder, config.verbose);
        char delimiter = transport.folderDelimiter();
        std::string base = MailUtils::pathWithNamespacePrefix(config.baseFolder, transport.namespacePrefix(), delimiter);
        PathMapper mapper(base, delimiter);

        spdlog::get("logger")->info("------------- {} ({}, {}) ---------------", command, account->emailAddress(), base);

        if (command == "list") {
            std::vector<std::string> folder = args.empty() ? std::vector<std::string>{} : PathMapper::parse(args[0]);
            ListingEngine engine(&transport, mapper, config);
            std::cout << Listing::format(engine.list(folder).collect(), options[LONG] ? true : false);

        } else if (command == "list-folders") {
            ListingEngine engine(&transport, mapper, config);
            for (const auto & folder : engine.listFolders()) {
                std::cout << PathMapper::format(folder) << "\n";
            }

        } else if (command == "download") {
            std::string name;
            std::vector<std::string> folder = splitRemoteFile(args[0], name);
            ConsoleProgress progress("Downloaded part(s) of");
            ListingEngine engine(&transport, mapper, config, &progress);
            engine.downloadTo(folder, name, args.size() > 1 ? args[1] : "");

        } else if (command == "upload") {
            std::vector<std::string> folder = args.size() > 1 ? PathMapper::parse(args[1]) : std::vector<std::string>{};
            ConsoleProgress progress("Uploaded part(s) of");
            UploadPipeline pipeline(&transport, mapper, config, &progress);
            UploadReport report = pipeline.upload(args[0], folder);
            std::cout << "Uploaded " << report.filesUploaded << " file(s) in " << report.partsSent << " part(s) ("
                      << MailUtils::humanReadableSize(report.bytesSent) << ").\n";

        } else if (command == "remove") {
            std::string name;
            std::vector<std::string> folder = splitRemoteFile(args[0], name);
            ConsoleProgress progress("Removed part(s) of");
            ListingEngine engine(&transport, mapper, config, &progress);
            engine.remove(folder, name);
        }
    });
}
