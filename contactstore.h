#ifndef CONTACTSTORE_H
#define CONTACTSTORE_H

#include <QObject>
#include <QString>
#include <QVector>
#include <functional>

#include "contact.h"
#include "contactfile.h"

/* ========================= Núcleo de datos ========================= */
// Lista canónica de contactos (orden de inserción) respaldada por un
// ContactFile. Cada mutación exitosa se guarda al momento.
//
// Si el guardado falla, la mutación en memoria NO se revierte: la operación
// devuelve false con PersistenceError y memoria/disco quedan distintos hasta
// el próximo guardado exitoso.
class ContactStore : public QObject {
    Q_OBJECT
public:
    using ConfirmFn = std::function<bool(const Contact&)>;

    explicit ContactStore(const QString& file = QString::fromLatin1(ContactFile::kDefaultFileName),
                          QObject* parent = nullptr);

    /* ---------- Persistencia ---------- */
    // Reemplaza el contenido con lo que haya en disco. Devuelve false (y
    // PersistenceError) si el archivo existía pero no se pudo leer; el
    // store queda vacío en ese caso.
    bool reload(ContactError* err = nullptr);
    bool exportTo(const QString& path, ContactError* err = nullptr) const;
    // Devuelve cuántos se agregaron, o -1 con ImportError (store intacto).
    int  importMerge(const QString& path, ContactError* err = nullptr);

    /* ---------- Datos ---------- */
    const QVector<ContactEntry>& contacts() const { return m_entries; }
    QVector<Contact> records() const;
    int  count() const { return m_entries.size(); }
    int  indexOf(ContactId id) const;                 // -1 si no existe
    const Contact* find(ContactId id) const;          // nullptr si no existe
    bool contains(const ContactKey& key) const;

    // Sube con cada cambio en la lista (para caches de vistas filtradas)
    quint64 revision() const { return m_revision; }

    /* ---------- CRUD ---------- */
    bool add(const Contact& draft, ContactError* err = nullptr, ContactId* newId = nullptr);
    // No revisa la clave natural contra otros registros.
    bool update(ContactId selection, const Contact& draft, ContactError* err = nullptr);
    // Asume que la confirmación ya ocurrió.
    bool removeConfirmed(ContactId selection, ContactError* err = nullptr);
    // Pide confirmación (síncrona). Si se rechaza (o confirm es vacío) devuelve
    // false sin tocar err.
    bool remove(ContactId selection, const ConfirmFn& confirm, ContactError* err = nullptr);

signals:
    void contactsChanged();

private:
    Q_DISABLE_COPY(ContactStore)

    ContactId nextId() { return m_nextId++; }
    bool noSelection(ContactError* err) const;
    bool persist(ContactError* err);

    ContactFile           m_file;
    QVector<ContactEntry> m_entries;
    ContactId             m_nextId   = 1;   // nunca se reutiliza
    quint64               m_revision = 0;
};

#endif // CONTACTSTORE_H
