#include "contactstore.h"
#include "contactvalidator.h"

#include <QDebug>
#include <QSet>

ContactStore::ContactStore(const QString& file, QObject* parent)
    : QObject(parent), m_file(file) {}

/* ====================== Helpers ====================== */

bool ContactStore::noSelection(ContactError* err) const {
    return fail(err, ContactError::Kind::NoSelection,
                tr("Please select a contact from the list first."));
}

bool ContactStore::persist(ContactError* err) {
    ++m_revision;
    const bool ok = m_file.save(records(), err);
    emit contactsChanged();
    return ok;
}

/* ====================== Datos ====================== */

QVector<Contact> ContactStore::records() const {
    QVector<Contact> out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) out.push_back(e.contact);
    return out;
}

int ContactStore::indexOf(ContactId id) const {
    if (id == kNoContact) return -1;
    for (int i = 0; i < m_entries.size(); ++i)
        if (m_entries[i].id == id) return i;
    return -1;
}

const Contact* ContactStore::find(ContactId id) const {
    const int i = indexOf(id);
    return i < 0 ? nullptr : &m_entries[i].contact;
}

bool ContactStore::contains(const ContactKey& key) const {
    for (const auto& e : m_entries)
        if (naturalKey(e.contact) == key) return true;
    return false;
}

/* ====================== Persistencia ====================== */

bool ContactStore::reload(ContactError* err) {
    QString warning;
    const QVector<Contact> loaded = m_file.load(&warning);

    m_entries.clear();
    m_entries.reserve(loaded.size());
    for (const auto& c : loaded)
        m_entries.push_back(ContactEntry{ nextId(), c });
    ++m_revision;
    emit contactsChanged();

    if (!warning.isEmpty())
        return fail(err, ContactError::Kind::PersistenceError, warning);
    return true;
}

bool ContactStore::exportTo(const QString& path, ContactError* err) const {
    return ContactFile::exportTo(records(), path, err);
}

int ContactStore::importMerge(const QString& path, ContactError* err) {
    QVector<Contact> incoming;
    if (!ContactFile::readImport(path, &incoming, err)) return -1;

    // Claves ya presentes + las que van entrando (evita duplicados dentro del mismo archivo)
    QSet<ContactKey> seen;
    for (const auto& e : m_entries) seen.insert(naturalKey(e.contact));

    int added = 0;
    for (const auto& c : incoming) {
        const ContactKey key = naturalKey(c);
        if (seen.contains(key)) continue;
        seen.insert(key);
        m_entries.push_back(ContactEntry{ nextId(), c });
        ++added;
    }

    qDebug() << "[contactbook] importados" << added << "contactos de" << path;
    // Se guarda una sola vez aunque no haya nada nuevo
    if (!persist(err))
        qWarning() << "[contactbook] importación aplicada solo en memoria";
    return added;
}

/* ====================== CRUD ====================== */

bool ContactStore::add(const Contact& draft, ContactError* err, ContactId* newId) {
    if (!validateContact(draft, err)) return false;

    const Contact c = draft.trimmed();
    if (contains(naturalKey(c)))
        return fail(err, ContactError::Kind::DuplicateKey,
                    tr("A contact with the same name and phone already exists."));

    const ContactId id = nextId();
    m_entries.push_back(ContactEntry{ id, c });
    if (newId) *newId = id;
    return persist(err);
}

bool ContactStore::update(ContactId selection, const Contact& draft, ContactError* err) {
    const int row = indexOf(selection);
    if (row < 0) return noSelection(err);

    if (!validateContact(draft, err)) return false;

    m_entries[row].contact = draft.trimmed();   // misma posición, mismo id
    return persist(err);
}

bool ContactStore::removeConfirmed(ContactId selection, ContactError* err) {
    const int row = indexOf(selection);
    if (row < 0) return noSelection(err);

    m_entries.remove(row);
    return persist(err);
}

bool ContactStore::remove(ContactId selection, const ConfirmFn& confirm, ContactError* err) {
    const Contact* c = find(selection);
    if (!c) return noSelection(err);
    if (!confirm || !confirm(*c)) return false;
    return removeConfirmed(selection, err);
}
