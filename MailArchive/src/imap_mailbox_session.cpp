#include "mailarchive/imap_mailbox_session.hpp"
#include "mailarchive/archive_exception.hpp"
#include "mailarchive/constants.hpp"
#include "mailarchive/mail_utils.hpp"

using namespace mailcore;

IMAPProgress::IMAPProgress() :
    logger(spdlog::get("logger"))
{
}

void IMAPProgress::bodyProgress(IMAPSession * session, unsigned int current, unsigned int maximum) {
    if (maximum > 0 && current == maximum) {
        logger->debug("Fetched message body ({} bytes)", maximum);
    }
}

void IMAPProgress::itemsProgress(IMAPSession * session, unsigned int current, unsigned int maximum) {
}

IMAPMailboxSession::IMAPMailboxSession(std::shared_ptr<Account> account) :
    account(account), logger(spdlog::get("logger"))
{
    MailUtils::configureSessionForAccount(session, account);
}

IMAPMailboxSession::~IMAPMailboxSession() {
    session.disconnect();
}

void IMAPMailboxSession::login(const std::string & address, const std::string & password) {
    session.setUsername(AS_MCSTR(address));
    session.setPassword(AS_MCSTR(password));

    ErrorCode err = ErrorCode::ErrorNone;
    session.connectIfNeeded(&err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::Connection, err, "connectIfNeeded " + account->IMAPHost() + ":" + std::to_string(account->IMAPPort()));
    }
    session.loginIfNeeded(&err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::Connection, err, "loginIfNeeded " + address);
    }
    logger->info("Connected to {} as {}", account->IMAPHost(), address);
}

void IMAPMailboxSession::logout() {
    session.disconnect();
}

std::vector<std::string> IMAPMailboxSession::capabilities() {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    IndexSet * set = session.capability(&err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::Connection, err, "capability");
    }
    std::vector<std::string> tokens;
    for (uint32_t value : MailUtils::uidsOfIndexSet(set)) {
        tokens.push_back(MailUtils::tokenForCapability((IMAPCapability)value));
    }
    return tokens;
}

std::vector<RemoteFolder> IMAPMailboxSession::listFolders() {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    Array * folders = session.fetchAllFolders(&err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::Connection, err, "fetchAllFolders");
    }
    std::vector<RemoteFolder> results;
    for (unsigned int ii = 0; ii < folders->count(); ii ++) {
        IMAPFolder * folder = (IMAPFolder *)folders->objectAtIndex(ii);
        RemoteFolder remote;
        remote.path = folder->path()->UTF8Characters();
        remote.flags = MailUtils::namesForFolderFlags(folder->flags());
        results.push_back(remote);
    }
    return results;
}

unsigned int IMAPMailboxSession::selectFolder(const std::string & folder, bool readonly) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;

    if (readonly) {
        // STATUS reads the count without selecting, so nothing about the folder changes
        IMAPFolderStatus * status = session.folderStatus(AS_MCSTR(folder), &err);
        if (err != ErrorCode::ErrorNone || status == nullptr) {
            throw ArchiveException(ErrorKind::FolderAccess, err, "folderStatus " + folder);
        }
        return status->messageCount();
    }

    session.select(AS_MCSTR(folder), &err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::FolderAccess, err, "select " + folder);
    }
    return session.lastFolderMessageCount();
}

std::vector<uint32_t> IMAPMailboxSession::search(const std::string & folder, const SearchCriteria & criteria) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;

    IMAPSearchExpression * expr = nullptr;
    if (criteria.all) {
        expr = IMAPSearchExpression::searchAll();
    } else {
        expr = IMAPSearchExpression::searchBeforeReceivedDate(criteria.before);
    }

    IndexSet * uids = session.search(AS_MCSTR(folder), expr, &err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::FolderAccess, err, "search " + folder);
    }
    return MailUtils::uidsOfIndexSet(uids);
}

std::map<uint32_t, FetchedMessage> IMAPMailboxSession::fetch(const std::string & folder, const std::vector<uint32_t> & uids) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    std::map<uint32_t, FetchedMessage> results;
    String * path = AS_MCSTR(folder);

    Array * envelopes = session.fetchMessagesByUID(path, IMAPMessagesRequestKindInternalDate, MailUtils::indexSetForUIDs(uids), nullptr, &err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::PerItem, err, "fetchMessagesByUID " + folder);
    }

    IMAPProgress cb;
    for (unsigned int ii = 0; ii < envelopes->count(); ii ++) {
        IMAPMessage * msg = (IMAPMessage *)envelopes->objectAtIndex(ii);
        Data * data = session.fetchMessageByUID(path, msg->uid(), &cb, &err);
        if (err != ErrorCode::ErrorNone || data == nullptr) {
            throw ArchiveException(ErrorKind::PerItem, err, "fetchMessageByUID " + folder + " UID " + std::to_string(msg->uid()));
        }
        FetchedMessage fetched;
        fetched.raw = std::string(data->bytes(), data->length());
        fetched.arrivedAt = msg->header()->receivedDate();
        results[msg->uid()] = fetched;
    }
    return results;
}

void IMAPMailboxSession::deleteMessages(const std::string & folder, const std::vector<uint32_t> & uids) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    session.storeFlagsByUID(AS_MCSTR(folder), MailUtils::indexSetForUIDs(uids), IMAPStoreFlagsRequestKindAdd, MessageFlagDeleted, &err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::FolderAccess, err, "storeFlagsByUID " + folder);
    }
}

void IMAPMailboxSession::expunge(const std::string & folder) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    session.expunge(AS_MCSTR(folder), &err);
    if (err != ErrorCode::ErrorNone) {
        throw ArchiveException(ErrorKind::FolderAccess, err, "expunge " + folder);
    }
}
