#include <stdlib.h>
#include <filesystem>

#include "mailarchive/mail_utils.hpp"
#include "mailarchive/constants.hpp"
#include "mailarchive/models/account.hpp"
#include "spdlog/spdlog.h"

std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string MailUtils::localTimestampForTime(time_t time) {
    tm ptm;
    localtime_r(&time, &ptm);
    char buffer[32];
    strftime(buffer, 32, "%Y%m%d_%H%M%S", &ptm);
    return std::string(buffer);
}

std::string MailUtils::localDateForTime(time_t time) {
    tm ptm;
    localtime_r(&time, &ptm);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%d", &ptm);
    return std::string(buffer);
}

std::vector<uint32_t> MailUtils::uidsOfIndexSet(mailcore::IndexSet * set) {
    std::vector<uint32_t> uids {};
    if (set == nullptr) {
        return uids;
    }
    mailcore::Range * ranges = set->allRanges();
    for (unsigned int ii = 0; ii < set->rangesCount(); ii++) {
        // a range covers location through location + length, inclusive
        for (uint64_t x = 0; x <= ranges[ii].length; x ++) {
            uids.push_back((uint32_t)(ranges[ii].location + x));
        }
    }
    return uids;
}

mailcore::IndexSet * MailUtils::indexSetForUIDs(const std::vector<uint32_t> & uids) {
    mailcore::IndexSet * set = new mailcore::IndexSet();
    set->autorelease();
    for (uint32_t uid : uids) {
        set->addIndex(uid);
    }
    return set;
}

std::vector<std::string> MailUtils::namesForFolderFlags(mailcore::IMAPFolderFlag flags) {
    std::vector<std::string> names {};
    if (flags & mailcore::IMAPFolderFlagNoSelect) {
        names.push_back("\\Noselect");
    }
    if (flags & mailcore::IMAPFolderFlagNoInferiors) {
        names.push_back("\\Noinferiors");
    }
    if (flags & mailcore::IMAPFolderFlagInbox) {
        names.push_back("\\Inbox");
    }
    if (flags & mailcore::IMAPFolderFlagSentMail) {
        names.push_back("\\Sent");
    }
    if (flags & mailcore::IMAPFolderFlagDrafts) {
        names.push_back("\\Drafts");
    }
    if (flags & mailcore::IMAPFolderFlagAll) {
        names.push_back("\\All");
    }
    if (flags & mailcore::IMAPFolderFlagTrash) {
        names.push_back("\\Trash");
    }
    if (flags & mailcore::IMAPFolderFlagSpam) {
        names.push_back("\\Junk");
    }
    if (flags & mailcore::IMAPFolderFlagArchive) {
        names.push_back("\\Archive");
    }
    if (flags & mailcore::IMAPFolderFlagImportant) {
        names.push_back("\\Important");
    }
    if (flags & mailcore::IMAPFolderFlagStarred) {
        names.push_back("\\Flagged");
    }
    return names;
}

std::string MailUtils::tokenForCapability(mailcore::IMAPCapability capability) {
    switch (capability) {
        case mailcore::IMAPCapabilityACL: return "ACL";
        case mailcore::IMAPCapabilityBinary: return "BINARY";
        case mailcore::IMAPCapabilityCatenate: return "CATENATE";
        case mailcore::IMAPCapabilityChildren: return "CHILDREN";
        case mailcore::IMAPCapabilityCompressDeflate: return "COMPRESS=DEFLATE";
        case mailcore::IMAPCapabilityCondstore: return "CONDSTORE";
        case mailcore::IMAPCapabilityEnable: return "ENABLE";
        case mailcore::IMAPCapabilityIdle: return "IDLE";
        case mailcore::IMAPCapabilityId: return "ID";
        case mailcore::IMAPCapabilityLiteralPlus: return "LITERAL+";
        case mailcore::IMAPCapabilityMove: return "MOVE";
        case mailcore::IMAPCapabilityMultiAppend: return "MULTIAPPEND";
        case mailcore::IMAPCapabilityNamespace: return "NAMESPACE";
        case mailcore::IMAPCapabilityQResync: return "QRESYNC";
        case mailcore::IMAPCapabilityQuota: return "QUOTA";
        case mailcore::IMAPCapabilitySort: return "SORT";
        case mailcore::IMAPCapabilityStartTLS: return "STARTTLS";
        case mailcore::IMAPCapabilityThreadOrderedSubject: return "THREAD=ORDEREDSUBJECT";
        case mailcore::IMAPCapabilityThreadReferences: return "THREAD=REFERENCES";
        case mailcore::IMAPCapabilityUIDPlus: return "UIDPLUS";
        case mailcore::IMAPCapabilityUnselect: return "UNSELECT";
        case mailcore::IMAPCapabilityXList: return "XLIST";
        case mailcore::IMAPCapabilityAuthAnonymous: return "AUTH=ANONYMOUS";
        case mailcore::IMAPCapabilityAuthCRAMMD5: return "AUTH=CRAM-MD5";
        case mailcore::IMAPCapabilityAuthDigestMD5: return "AUTH=DIGEST-MD5";
        case mailcore::IMAPCapabilityAuthExternal: return "AUTH=EXTERNAL";
        case mailcore::IMAPCapabilityAuthGSSAPI: return "AUTH=GSSAPI";
        case mailcore::IMAPCapabilityAuthKerberosV4: return "AUTH=KERBEROS_V4";
        case mailcore::IMAPCapabilityAuthLogin: return "AUTH=LOGIN";
        case mailcore::IMAPCapabilityAuthNTLM: return "AUTH=NTLM";
        case mailcore::IMAPCapabilityAuthOTP: return "AUTH=OTP";
        case mailcore::IMAPCapabilityAuthPlain: return "AUTH=PLAIN";
        case mailcore::IMAPCapabilityAuthSKey: return "AUTH=SKEY";
        case mailcore::IMAPCapabilityAuthSRP: return "AUTH=SRP";
        case mailcore::IMAPCapabilityXOAuth2: return "AUTH=XOAUTH2";
        case mailcore::IMAPCapabilityGmail: return "X-GM-EXT-1";
    }
    return "UNKNOWN";
}

void MailUtils::configureSessionForAccount(mailcore::IMAPSession & session, std::shared_ptr<Account> account) {
    session.setHostname(AS_MCSTR(account->IMAPHost()));
    session.setPort(account->IMAPPort());
    session.setUsername(AS_MCSTR(account->emailAddress()));
    session.setPassword(AS_MCSTR(account->password()));
    if (account->IMAPSSL()) {
        session.setConnectionType(mailcore::ConnectionTypeTLS);
    } else {
        session.setConnectionType(mailcore::ConnectionTypeClear);
    }
}

void MailUtils::enableVerboseLogging() {
    MCLogEnabled = 1;
}

bool MailUtils::deleteDirectory(const std::string & path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    std::filesystem::remove_all(path, ec);
    if (ec) {
        spdlog::get("logger")->error("Failed to delete {}: {}", path, ec.message());
        return false;
    }
    return true;
}
