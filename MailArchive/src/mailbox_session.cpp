#include "mailarchive/mailbox_session.hpp"

SearchCriteria SearchCriteria::everything() {
    return SearchCriteria{};
}

SearchCriteria SearchCriteria::receivedBefore(time_t day) {
    SearchCriteria criteria;
    criteria.all = false;
    criteria.before = day;
    return criteria;
}
