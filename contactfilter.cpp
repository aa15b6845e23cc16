#include "contactfilter.h"
#include "contactstore.h"

bool contactMatches(const Contact& c, const QString& query) {
    const QString term = query.trimmed();
    if (term.isEmpty()) return true;
    return c.name.contains(term, Qt::CaseInsensitive)
        || c.phone.contains(term, Qt::CaseInsensitive);
}

QVector<ContactEntry> filterContacts(const QVector<ContactEntry>& entries, const QString& query) {
    if (query.trimmed().isEmpty()) return entries;

    QVector<ContactEntry> out;
    for (const auto& e : entries)
        if (contactMatches(e.contact, query)) out.push_back(e);
    return out;
}

const QVector<ContactEntry>& ContactFilter::apply(const ContactStore& store, const QString& query) {
    if (valid_ && query == query_ && store.revision() == revision_)
        return result_;

    result_   = filterContacts(store.contacts(), query);
    query_    = query;
    revision_ = store.revision();
    valid_    = true;
    return result_;
}
