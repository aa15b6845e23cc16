#ifndef CONTACT_H
#define CONTACT_H

#include <QString>
#include <QPair>
#include <QVector>
#include <QtGlobal>

/* ========================= Registro ========================= */
struct Contact {
    QString name;     // requerido, parte de la clave natural (sin mayúsculas)
    QString phone;    // requerido, parte de la clave natural (exacta)
    QString email;    // opcional
    QString address;  // opcional, puede tener varias líneas

    Contact trimmed() const {
        return Contact{ name.trimmed(), phone.trimmed(), email.trimmed(), address.trimmed() };
    }
};

inline bool operator==(const Contact& a, const Contact& b) {
    return a.name == b.name && a.phone == b.phone
        && a.email == b.email && a.address == b.address;
}
inline bool operator!=(const Contact& a, const Contact& b) { return !(a == b); }

// Clave natural: (nombre en minúsculas, teléfono), ambos recortados
using ContactKey = QPair<QString, QString>;

inline ContactKey naturalKey(const Contact& c) {
    return ContactKey(c.name.trimmed().toLower(), c.phone.trimmed());
}

// Identificador estable dentro del proceso (no se persiste). -1 = sin selección
using ContactId = qint64;
constexpr ContactId kNoContact = -1;

struct ContactEntry {
    ContactId id = kNoContact;
    Contact   contact;
};

/* ========================= Errores ========================= */
struct ContactError {
    enum class Kind {
        None,
        MissingField,
        InvalidPhone,
        InvalidEmail,
        DuplicateKey,
        NoSelection,
        PersistenceError,
        ImportError
    };

    Kind    kind = Kind::None;
    QString message;

    bool isError() const { return kind != Kind::None; }
};

// Rellena err (si no es nulo) y devuelve false, para "return fail(...)"
inline bool fail(ContactError* err, ContactError::Kind kind, const QString& message) {
    if (err) { err->kind = kind; err->message = message; }
    return false;
}

#endif // CONTACT_H
