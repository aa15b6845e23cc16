#ifndef CONTACTFILE_H
#define CONTACTFILE_H

#include <QByteArray>
#include <QString>
#include <QVector>
#include "contact.h"

/**
 * Persistencia de contactos en JSON: un arreglo de objetos
 * {name, phone, email, address}, indentado a 2 espacios y en UTF-8 literal.
 * Mismo formato para el archivo de trabajo, exportar e importar.
 * API síncrona.
 */
class ContactFile {
public:
    static const char* const kDefaultFileName;   // "contacts.json" en el cwd

    explicit ContactFile(const QString& path = QString::fromLatin1(kDefaultFileName));

    const QString& path() const { return path_; }

    // Archivo inexistente -> vacío sin aviso. Ilegible/corrupto -> vacío y *warning.
    // El archivo corrupto no se toca; el próximo save lo sobreescribe.
    QVector<Contact> load(QString* warning = nullptr) const;
    bool save(const QVector<Contact>& contacts, ContactError* err = nullptr) const;

    static bool exportTo(const QVector<Contact>& contacts, const QString& path,
                         ContactError* err = nullptr);

    // Lectura laxa para importar: solo exige name y phone no vacíos (recortados).
    static bool readImport(const QString& path, QVector<Contact>* out,
                           ContactError* err = nullptr);

    static QByteArray toJson(const QVector<Contact>& contacts);

private:
    static bool writeTo(const QString& path, const QVector<Contact>& contacts, QString* why);

    QString path_;
};

#endif // CONTACTFILE_H
