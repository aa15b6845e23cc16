#ifndef CONTACTFILTER_H
#define CONTACTFILTER_H

#include <QString>
#include <QVector>
#include "contact.h"

class ContactStore;

// Búsqueda por nombre o teléfono (subcadena, sin distinguir mayúsculas).
// Consulta vacía o solo espacios -> todo, en el mismo orden.
bool contactMatches(const Contact& c, const QString& query);
QVector<ContactEntry> filterContacts(const QVector<ContactEntry>& entries, const QString& query);

/**
 * Vista filtrada con cache de la última consulta. Se recalcula si cambia el
 * texto o la revisión del store. No es dueña de los datos del store.
 */
class ContactFilter {
public:
    const QVector<ContactEntry>& apply(const ContactStore& store, const QString& query);

private:
    bool                  valid_    = false;
    QString               query_;
    quint64               revision_ = 0;
    QVector<ContactEntry> result_;
};

#endif // CONTACTFILTER_H
