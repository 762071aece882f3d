#include "mailarchive/connection_probe.hpp"
#include "mailarchive/constants.hpp"
#include "mailarchive/share_path.hpp"

static std::string nameForProbeStepOutcome(ProbeStepOutcome outcome) {
    switch (outcome) {
        case ProbeStepOutcome::Passed:
            return "passed";
        case ProbeStepOutcome::Warning:
            return "warning";
        case ProbeStepOutcome::Failed:
            return "failed";
    }
    return "unknown";
}

nlohmann::json ProbeStep::toJSON() const {
    return {
        {"name", name},
        {"outcome", nameForProbeStepOutcome(outcome)},
        {"detail", detail},
    };
}

nlohmann::json ProbeResult::toJSON() const {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto & step : this->steps) {
        steps.push_back(step.toJSON());
    }
    nlohmann::json j = {
        {"target", target},
        {"passed", passed},
        {"steps", steps},
        {"error", nullptr},
    };
    if (!passed) {
        j["error"] = error.toJSON();
    }
    return j;
}

ConnectionProbe::ConnectionProbe() :
    logger(spdlog::get("logger"))
{
}

void ConnectionProbe::record(ProbeResult & result, std::string name, ProbeStepOutcome outcome, std::string detail) {
    ProbeStep step;
    step.name = name;
    step.outcome = outcome;
    step.detail = detail;
    result.steps.push_back(step);

    if (outcome == ProbeStepOutcome::Passed) {
        logger->info("[ok] {}: {}", name, detail);
    } else if (outcome == ProbeStepOutcome::Warning) {
        logger->warn("[warning] {}: {}", name, detail);
    } else {
        logger->error("[failed] {}: {}", name, detail);
    }
}

ProbeResult ConnectionProbe::probeMailbox(std::shared_ptr<MailboxSession> session, std::shared_ptr<Account> account) {
    ProbeResult result;
    result.target = account->displayName() + " (" + account->IMAPHost() + ":" + std::to_string(account->IMAPPort()) + ")";
    std::string step = "login";

    try {
        session->login(account->emailAddress(), account->password());
        record(result, step, ProbeStepOutcome::Passed, "Connected to " + account->IMAPHost());

        step = "capabilities";
        std::vector<std::string> capabilities = session->capabilities();
        record(result, step, ProbeStepOutcome::Passed, "Server capabilities: " + std::to_string(capabilities.size()) + " features");

        step = "folders";
        std::vector<RemoteFolder> folders = session->listFolders();
        record(result, step, ProbeStepOutcome::Passed, "Found " + std::to_string(folders.size()) + " folders");

        step = "inbox";
        unsigned int count = session->selectFolder(DEFAULT_MAILBOX_FOLDER, true);
        record(result, step, ProbeStepOutcome::Passed, DEFAULT_MAILBOX_FOLDER + " accessible (" + std::to_string(count) + " messages)");

        step = "account";
        record(result, step, ProbeStepOutcome::Passed, "Logged in as: " + account->emailAddress());

    } catch (ArchiveException & ex) {
        record(result, step, ProbeStepOutcome::Failed, ex.what());
        result.error = ex.toError();
        result.passed = false;
        return result;
    }

    result.passed = true;
    return result;
}

ProbeResult ConnectionProbe::probeShare(std::shared_ptr<ShareSession> session, std::shared_ptr<ShareConfig> config, bool dryRun) {
    ProbeResult result;
    std::string root = SharePath::unc(config->host(), config->share());
    std::string basePath = SharePath::normalizeBasePath(config->basePath());
    result.target = SharePath::join(root, basePath);

    logger->info("Share host: {}, share: {}, base path: {}, username: {}",
                 config->host(), config->share(), basePath == "" ? "(root)" : basePath, config->username());

    if (dryRun) {
        record(result, "session", ProbeStepOutcome::Passed, "[dry run] Would test connection to " + result.target);
        result.passed = true;
        return result;
    }

    std::string step = "session";
    try {
        session->registerSession(config->host(), config->username(), config->password());
        if (session->acceptsAnyCredentials()) {
            record(result, step, ProbeStepOutcome::Warning, "Share for " + config->host() + " is reachable, but the username and password were not verified (the mount's own credentials are used)");
        } else {
            record(result, step, ProbeStepOutcome::Passed, "Session established with " + config->host());
        }

        step = "share";
        std::vector<std::string> items = session->listDirectory(root);
        record(result, step, ProbeStepOutcome::Passed, "Share accessible (" + std::to_string(items.size()) + " items in root)");

        if (basePath != "") {
            step = "base-path";
            try {
                std::vector<std::string> baseItems = session->listDirectory(result.target);
                record(result, step, ProbeStepOutcome::Passed, "Base path exists (" + std::to_string(baseItems.size()) + " items)");
            } catch (ArchiveException & ex) {
                if (std::string(ex.what()).find(SHARE_NO_SUCH_FILE) == std::string::npos && ex.key != "ErrorShareNotFound") {
                    throw;
                }
                record(result, step, ProbeStepOutcome::Warning, "Base path does not exist (will be created on upload)");
            }
        }

        step = "share-info";
        try {
            session->stat(root);
            record(result, step, ProbeStepOutcome::Passed, "Share is accessible");
        } catch (ArchiveException & ex) {
            record(result, step, ProbeStepOutcome::Warning, "Could not get share stats (may still work): " + std::string(ex.what()));
        }

    } catch (ArchiveException & ex) {
        record(result, step, ProbeStepOutcome::Failed, ex.what());
        result.error = ex.toError();
        result.passed = false;
        return result;
    }

    result.passed = true;
    return result;
}
