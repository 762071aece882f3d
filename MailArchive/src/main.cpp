#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <time.h>

#include "MailCore/MailCore.h"
#include "StanfordCPPLib/exceptions.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "mailarchive/archive_exception.hpp"
#include "mailarchive/confirmer.hpp"
#include "mailarchive/connection_probe.hpp"
#include "mailarchive/constants.hpp"
#include "mailarchive/download_engine.hpp"
#include "mailarchive/folder_catalog.hpp"
#include "mailarchive/imap_mailbox_session.hpp"
#include "mailarchive/mail_utils.hpp"
#include "mailarchive/mounted_share_session.hpp"
#include "mailarchive/retention_engine.hpp"
#include "mailarchive/retention_filter.hpp"
#include "mailarchive/share_path.hpp"
#include "mailarchive/upload_engine.hpp"
#include "mailarchive/models/account.hpp"
#include "mailarchive/models/provider_registry.hpp"
#include "mailarchive/models/share_config.hpp"

using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: MAIL_EMAIL=you@example.com MAIL_PASSWORD=... mailarchive [options]\n\n" \
    "Share credentials come from NAS_HOST, NAS_SHARE, NAS_USERNAME, NAS_PASSWORD,\n" \
    "NAS_PATH (default /mail-archive) and NAS_MOUNT (default /mnt/<share>).\n" \
    "The share must already be mounted at NAS_MOUNT. NAS_USERNAME and NAS_PASSWORD\n" \
    "are not checked against the server, the mount's own credentials are used.\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, LIST, FOLDER, OUTPUT, NAS, OVERWRITE, DRY_RUN, CLEAN, SINCE, INTERACTIVE, PROVIDER, CONFIG, TEST_MAIL, TEST_NAS, DELETE_LOCAL, VERBOSE, LOG_DIR };
const option::Descriptor usage[] =
{
    {UNKNOWN,     0,"" , "",            CArg::None,      USAGE_STRING },
    {HELP,        0,"h", "help",        CArg::None,      "  --help, -h  \tPrint usage and exit." },
    {LIST,        0,"l", "list",        CArg::None,      "  --list, -l  \tList all mail folders and their message counts." },
    {FOLDER,      0,"f", "folder",      CArg::Required,  "  --folder, -f  \tFolder name to download (use --list to see available folders)." },
    {OUTPUT,      0,"o", "output",      CArg::Required,  "  --output, -o  \tLocal output directory (default: ./downloads)." },
    {NAS,         0,"" , "nas",         CArg::None,      "  --nas  \tUpload to the share after downloading." },
    {OVERWRITE,   0,"" , "overwrite",   CArg::None,      "  --overwrite  \tOverwrite existing files on the share (default: skip existing)." },
    {DRY_RUN,     0,"n", "dry-run",     CArg::None,      "  --dry-run, -n  \tShow what would be done without doing it." },
    {CLEAN,       0,"c", "clean",       CArg::None,      "  --clean, -c  \tDelete messages from the folder. With --since and without --nas: clean only, no download." },
    {SINCE,       0,"" , "since",       CArg::Required,  "  --since  \tWith --clean: only delete messages older than this (30D, 2W, 6M, 1Y)." },
    {INTERACTIVE, 0,"i", "interactive", CArg::None,      "  --interactive, -i  \tSelect the folder from a list." },
    {PROVIDER,    0,"p", "provider",    CArg::Required,  "  --provider, -p  \tMail provider (gmx, gmail, outlook, custom...). Default from MAIL_PROVIDER, the config file, or gmx." },
    {CONFIG,      0,"" , "config",      CArg::Required,  "  --config  \tPath to a providers.json file." },
    {TEST_MAIL,   0,"" , "test-mail",   CArg::None,      "  --test-mail  \tTest the IMAP connection and exit." },
    {TEST_NAS,    0,"" , "test-nas",    CArg::None,      "  --test-nas  \tTest the share connection and exit." },
    {DELETE_LOCAL,0,"" , "delete-local",CArg::None,      "  --delete-local  \tDelete local files after a successful upload." },
    {VERBOSE,     0,"v", "verbose",     CArg::None,      "  --verbose, -v  \tDebug logging, including all IMAP traffic." },
    {LOG_DIR,     0,"" , "log-dir",     CArg::Required,  "  --log-dir  \tAlso write a rotating mailarchive.log into this directory." },
    {0,0,0,0,0,0}
};

static std::string optionValue(option::Option * options, optionIndex index, std::string fallback = "") {
    if (!options[index]) {
        return fallback;
    }
    return std::string(options[index].last()->arg);
}

static void setupLogging(bool verbose, std::string logDir) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("%l: %v");
    sinks.push_back(console);

    if (logDir != "") {
        std::string logPath = logDir + FS_PATH_SEP + "mailarchive.log";
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3);
        file->set_pattern("%P %+");
        sinks.push_back(file);
    }

    // Always log critical errors to stderr as well
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = std::make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::register_logger(logger);
}

static void printFolders(const std::string & providerName, const std::vector<FolderSummary> & folders) {
    std::cout << "\n" << providerName << " Folders\n";
    for (size_t ii = 0; ii < folders.size(); ii ++) {
        std::string count = folders[ii].messageCount < 0 ? "?" : std::to_string(folders[ii].messageCount);
        std::cout << "  " << (ii + 1) << ". " << folders[ii].path << " (" << count << ")\n";
    }
    std::cout.flush();
}

static std::string selectFolderInteractive(ConsoleConfirmer & console, const std::vector<FolderSummary> & folders) {
    while (true) {
        std::string choice = console.ask("\nEnter folder number (or 'q' to quit) [1]:");
        if (choice == "") {
            if (!std::cin.good()) {
                return "";
            }
            choice = "1";
        }
        if (choice == "q" || choice == "Q") {
            return "";
        }
        try {
            size_t idx = std::stoul(choice);
            if (idx >= 1 && idx <= folders.size()) {
                return folders[idx - 1].path;
            }
            std::cout << "Invalid selection. Please try again.\n";
        } catch (std::exception & ex) {
            std::cout << "Please enter a number or 'q' to quit.\n";
        }
    }
}

static int finish(nlohmann::json & resp, int code) {
    std::cout << "\n" << resp.dump() << "\n";
    return code;
}

static int runShareProbe(nlohmann::json & resp, std::shared_ptr<ShareConfig> share, bool dryRun) {
    if (share == nullptr) {
        resp["error"] = "Share credentials not configured. Set NAS_HOST, NAS_SHARE, NAS_USERNAME, NAS_PASSWORD in your environment.";
        return 1;
    }
    ProbeResult result = ConnectionProbe().probeShare(std::make_shared<MountedShareSession>(share->mountRoot()), share, dryRun);
    resp["probes"].push_back(result.toJSON());
    return result.passed ? 0 : 1;
}

static int runArchive(option::Option * options) {
    auto logger = spdlog::get("logger");
    nlohmann::json resp = {{"error", nullptr}, {"probes", nlohmann::json::array()}};

    bool dryRun = options[DRY_RUN];
    std::string output = optionValue(options, OUTPUT, "./downloads");

    // everything below can fail on configuration alone, before any connection is made
    std::optional<time_t> cutoff;
    if (options[SINCE]) {
        cutoff = RetentionFilter::cutoffForExpression(optionValue(options, SINCE), time(nullptr));
    }

    ProviderRegistry registry = ProviderRegistry::load(optionValue(options, CONFIG));
    std::string provider = optionValue(options, PROVIDER, MailUtils::getEnvUTF8("MAIL_PROVIDER"));
    if (provider == "") {
        provider = registry.defaultProvider();
    }

    std::shared_ptr<ShareConfig> share = ShareConfig::fromEnvironment();

    if (options[TEST_NAS] && !options[TEST_MAIL]) {
        return finish(resp, runShareProbe(resp, share, dryRun));
    }

    if (MailUtils::getEnvUTF8("MAIL_EMAIL") == "" || MailUtils::getEnvUTF8("MAIL_PASSWORD") == "") {
        resp["error"] = "MAIL_EMAIL and MAIL_PASSWORD environment variables are required.";
        return finish(resp, 1);
    }

    std::shared_ptr<Account> account = Account::fromEnvironment(provider, registry.configForProvider(provider));
    if (account->valid() != "") {
        resp["error"] = "Account is missing required fields: " + account->valid();
        return finish(resp, 1);
    }
    resp["account"] = account->toJSON();

    auto mailbox = std::make_shared<IMAPMailboxSession>(account);

    if (options[TEST_MAIL]) {
        ProbeResult mailProbe = ConnectionProbe().probeMailbox(mailbox, account);
        resp["probes"].push_back(mailProbe.toJSON());
        int code = mailProbe.passed ? 0 : 1;
        if (options[TEST_NAS]) {
            code = std::max(code, runShareProbe(resp, share, dryRun));
        }
        mailbox->logout();
        return finish(resp, code);
    }

    logger->info("Connecting to {}...", account->IMAPHost());
    mailbox->login(account->emailAddress(), account->password());

    FolderCatalog catalog(mailbox);
    std::vector<FolderSummary> folders = catalog.load();
    resp["folders"] = catalog.toJSON();

    bool interactive = options[INTERACTIVE];
    std::string folder = optionValue(options, FOLDER);

    if (options[LIST] || (folder == "" && !interactive)) {
        printFolders(account->displayName(), folders);
        if (!interactive) {
            logger->info("Use --folder <name> to download a folder, or --interactive for selection");
            mailbox->logout();
            return finish(resp, 0);
        }
    }

    ConsoleConfirmer console;
    if (interactive && folder == "") {
        printFolders(account->displayName(), folders);
        folder = selectFolderInteractive(console, folders);
        if (folder == "") {
            logger->info("No folder selected. Exiting.");
            mailbox->logout();
            return finish(resp, 0);
        }
    }

    if (!catalog.contains(folder)) {
        std::string available;
        for (const auto & f : folders) {
            available += (available == "" ? "" : ", ") + f.path;
        }
        resp["error"] = "Folder '" + folder + "' not found. Available folders: " + available;
        mailbox->logout();
        return finish(resp, 1);
    }
    resp["folder"] = folder;

    std::string folderDirName = DownloadEngine::folderDirectoryName(folder);
    std::shared_ptr<ShareConfig> uploadConfig = nullptr;

    if (options[NAS]) {
        if (share == nullptr) {
            resp["error"] = "Share credentials not configured. Set NAS_HOST, NAS_SHARE, NAS_USERNAME, NAS_PASSWORD in your environment.";
            mailbox->logout();
            return finish(resp, 1);
        }
        uploadConfig = share->withBasePath(share->folderPath(account->accountName(), folderDirName));
        logger->info("Share target: {}", SharePath::unc(share->host(), share->share(), SharePath::normalizeBasePath(uploadConfig->basePath())));

        if (!dryRun) {
            logger->info("Validating share connection...");
            if (runShareProbe(resp, share, false) != 0) {
                resp["error"] = "Share connection failed. Fix the share settings before downloading.";
                mailbox->logout();
                return finish(resp, 1);
            }
        }
    }

    auto confirmer = std::make_shared<ConsoleConfirmer>();
    RetentionEngine retention(mailbox, confirmer);

    if (options[CLEAN] && options[SINCE] && !options[NAS]) {
        logger->info("Clean-only mode (no download) for {}, deleting messages {}", folder, RetentionEngine::describeCutoff(cutoff));
        RetentionResult cleaned = retention.deleteMessages(folder, dryRun, cutoff);
        resp["clean"] = cleaned.toJSON();
        mailbox->logout();
        return finish(resp, cleaned.succeeded() ? 0 : 1);
    }

    logger->info("Selected folder: {}", folder);
    DownloadEngine downloader(mailbox);
    DownloadResult downloaded = downloader.download(folder, output, dryRun);
    resp["download"] = downloaded.toJSON();
    if (!downloaded.succeeded()) {
        resp["error"] = downloaded.error.describe();
        mailbox->logout();
        return finish(resp, 1);
    }

    int code = 0;
    bool uploadSucceeded = false;

    if (uploadConfig != nullptr) {
        auto shareSession = std::make_shared<MountedShareSession>(share->mountRoot());
        UploadEngine uploader(shareSession, uploadConfig);

        if (dryRun) {
            logger->info("[dry run] Would upload to {}, overwrite existing: {}{}", uploader.remoteBase(),
                         options[OVERWRITE] ? "yes" : "no",
                         options[DELETE_LOCAL] ? ", then delete local files" : "");
            uploadSucceeded = true;
        } else if (downloaded.downloaded > 0) {
            UploadResult uploaded = uploader.upload(downloaded.destination, false, options[OVERWRITE]);
            resp["upload"] = uploaded.toJSON();
            uploadSucceeded = uploaded.uploaded > 0;
            if (!uploaded.succeeded()) {
                code = 1;
            }

            if (uploadSucceeded && options[DELETE_LOCAL]) {
                logger->info("Cleaning up local files: {}", downloaded.destination);
                if (MailUtils::deleteDirectory(downloaded.destination)) {
                    logger->info("Local files deleted");
                    resp["localDeleted"] = true;
                }
            }
        }
    }

    if (options[CLEAN]) {
        if (dryRun || downloaded.downloaded > 0) {
            if (!dryRun) {
                logger->info("Clean mode enabled, deleting {}", RetentionEngine::describeCutoff(cutoff));
            }
            RetentionResult cleaned = retention.deleteMessages(folder, dryRun, cutoff);
            resp["clean"] = cleaned.toJSON();
            if (!cleaned.succeeded()) {
                code = 1;
            }
        } else {
            logger->info("Skipping clean: no emails were downloaded");
        }
    }

    if (!dryRun) {
        bool onShare = uploadSucceeded && options[DELETE_LOCAL];
        logger->info("Archive complete! Emails: {}, attachments: {}, location: {}", downloaded.downloaded, downloaded.attachments,
                     onShare ? "share (" + share->host() + ")" : downloaded.destination);
    }

    mailbox->logout();
    return finish(resp, code);
}

int main(int argc, const char * argv[]) {
    exceptions::setProgramNameForStackTrace(argv[0]);
    exceptions::setTopLevelExceptionHandlerEnabled(true);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    std::vector<option::Option> options(stats.options_max), buffer(stats.buffer_max);
    option::Parser parse(usage, argc, argv, options.data(), buffer.data());

    if (parse.error())
        return 1;

    if (options[HELP] || options[UNKNOWN]) {
        option::printUsage(std::cout, usage);
        return options[HELP] ? 0 : 1;
    }

    setupLogging(options[VERBOSE], optionValue(options.data(), LOG_DIR));
    if (options[VERBOSE]) {
        MailUtils::enableVerboseLogging();
    }

    mailcore::AutoreleasePool pool;
    nlohmann::json resp = {{"error", nullptr}};

    try {
        return runArchive(options.data());
    } catch (ArchiveException & ex) {
        spdlog::get("logger")->error("{}: {}", ErrorKindName(ex.kind), ex.what());
        ex.printStackTrace();
        resp["error"] = ex.toJSON();
    } catch (std::exception & ex) {
        spdlog::get("logger")->critical("Unexpected error: {}", ex.what());
        resp["error"] = ex.what();
    }
    return finish(resp, 1);
}
