/** Constants [MailArchive]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef constants_hpp
#define constants_hpp

#include <map>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#if defined(_MSC_VER)
#define FS_PATH_SEP         "\\"
#else
#define FS_PATH_SEP         "/"
#endif

#define SHARE_PATH_SEP      "\\"

static std::string RAW_MESSAGE_FILENAME = "email.raw";
static std::string DEFAULT_SUBJECT = "No Subject";
static std::string UNNAMED_ATTACHMENT = "Unnamed Attachment";
static size_t MAX_SUBJECT_LENGTH = 50;

// NAME_MAX is 255 bytes on most filesystems. The rest is room for a "_N" collision suffix.
static size_t MAX_ATTACHMENT_NAME_BYTES = 240;

static std::string DEFAULT_MAILBOX_FOLDER = "INBOX";
static std::string DEFAULT_SHARE_BASE_PATH = "/mail-archive";
static std::string DEFAULT_PROVIDER = "gmx";
static unsigned int DEFAULT_IMAP_PORT = 993;

// Markers in share errors that mean "a parent segment is missing". Some
// servers report this for a recursive create instead of creating the parents.
static std::string SHARE_NO_SUCH_FILE = "No such file";
static std::string SHARE_PATH_NOT_FOUND_STATUS = "0xc000003a";

static std::vector<std::string> PROVIDER_CONFIG_PATHS = {
    "~/.config/mail-archive/providers.json",
    "/etc/mail-archive/providers.json",
};

static std::map<mailcore::ErrorCode, std::string> ErrorCodeToTypeMap = {
    {mailcore::ErrorNone, "ErrorNone"},
    {mailcore::ErrorConnection, "ErrorConnection"},
    {mailcore::ErrorTLSNotAvailable, "ErrorTLSNotAvailable"},
    {mailcore::ErrorParse, "ErrorParse"},
    {mailcore::ErrorCertificate, "ErrorCertificate"},
    {mailcore::ErrorAuthentication, "ErrorAuthentication"},
    {mailcore::ErrorGmailIMAPNotEnabled, "ErrorGmailIMAPNotEnabled"},
    {mailcore::ErrorGmailExceededBandwidthLimit, "ErrorGmailExceededBandwidthLimit"},
    {mailcore::ErrorGmailTooManySimultaneousConnections, "ErrorGmailTooManySimultaneousConnections"},
    {mailcore::ErrorMobileMeMoved, "ErrorMobileMeMoved"},
    {mailcore::ErrorYahooUnavailable, "ErrorYahooUnavailable"},
    {mailcore::ErrorNonExistantFolder, "ErrorNonExistantFolder"},
    {mailcore::ErrorStartTLSNotAvailable, "ErrorStartTLSNotAvailable"},
    {mailcore::ErrorGmailApplicationSpecificPasswordRequired, "ErrorGmailApplicationSpecificPasswordRequired"},
    {mailcore::ErrorOutlookLoginViaWebBrowser, "ErrorOutlookLoginViaWebBrowser"},
    {mailcore::ErrorNeedsConnectToWebmail, "ErrorNeedsConnectToWebmail"},
    {mailcore::ErrorNoValidServerFound, "ErrorNoValidServerFound"},
    {mailcore::ErrorAuthenticationRequired, "ErrorAuthenticationRequired"},
    {mailcore::ErrorInvalidAccount, "ErrorInvalidAccount"},
    {mailcore::ErrorFetch, "ErrorFetch"},
    {mailcore::ErrorStore, "ErrorStore"},
    {mailcore::ErrorExpunge, "ErrorExpunge"},
    {mailcore::ErrorDelete, "ErrorDelete"},
    {mailcore::ErrorCapability, "ErrorCapability"},
    {mailcore::ErrorNamespace, "ErrorNamespace"},
    {mailcore::ErrorIdentity, "ErrorIdentity"},
    {mailcore::ErrorIdle, "ErrorIdle"},
    {mailcore::ErrorNoop, "ErrorNoop"},
    {mailcore::ErrorFile, "ErrorFile"},
};

#endif /* constants_hpp */
