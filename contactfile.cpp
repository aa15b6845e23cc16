#include "contactfile.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <QLocale>
#include <QObject>
#include <QSaveFile>
#include <cmath>

const char* const ContactFile::kDefaultFileName = "contacts.json";

ContactFile::ContactFile(const QString& path) : path_(path) {}

/* ====================== Helpers (libres) ====================== */

// QJsonDocument::Indented usa 4 espacios; el formato de archivo pide 2.
// Los strings nunca llevan '\n' literal (se escapan), así que todo espacio
// inicial de una línea es indentación.
static QByteArray halveIndentation(const QByteArray& indented) {
    QByteArray out;
    out.reserve(indented.size());
    const QList<QByteArray> lines = indented.split('\n');
    for (int i = 0; i < lines.size(); ++i) {
        const QByteArray& line = lines.at(i);
        int lead = 0;
        while (lead < line.size() && line.at(lead) == ' ') ++lead;
        out.append(QByteArray(lead / 2, ' '));
        out.append(line.mid(lead));
        if (i + 1 < lines.size()) out.append('\n');
    }
    return out;
}

static QJsonObject contactToJson(const Contact& c) {
    QJsonObject o;
    o["name"]    = c.name;
    o["phone"]   = c.phone;
    o["email"]   = c.email;
    o["address"] = c.address;
    return o;
}

// Lectura estricta (archivo de trabajo): name/phone string obligatorios,
// email/address string si vienen (null o ausente -> vacío).
static bool contactFromJson(const QJsonValue& v, Contact* out) {
    if (!v.isObject()) return false;
    const QJsonObject o = v.toObject();

    const QJsonValue name  = o.value("name");
    const QJsonValue phone = o.value("phone");
    if (!name.isString() || !phone.isString()) return false;

    Contact c;
    c.name  = name.toString();
    c.phone = phone.toString();

    const QJsonValue email   = o.value("email");
    const QJsonValue address = o.value("address");
    if (!(email.isUndefined() || email.isNull() || email.isString()))       return false;
    if (!(address.isUndefined() || address.isNull() || address.isString())) return false;
    c.email   = email.toString();
    c.address = address.toString();

    *out = c;
    return true;
}

// Importar: cualquier valor se convierte a texto
static QString coerceText(const QJsonValue& j) {
    switch (j.type()) {
    case QJsonValue::String:
        return j.toString();
    case QJsonValue::Double: {
        const double d = j.toDouble();
        if (std::floor(d) == d && std::fabs(d) < 9.0e15)
            return QString::number(static_cast<qint64>(d));
        // Enteros grandes: sin exponente, pero con los dígitos del double
        // (más allá de 2^53 no se conservan los originales)
        if (std::floor(d) == d)
            return QString::number(d, 'f', 0);
        return QString::number(d, 'g', QLocale::FloatingPointShortest);
    }
    case QJsonValue::Bool:
        return j.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Array:
        return QString::fromUtf8(QJsonDocument(j.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Object:
        return QString::fromUtf8(QJsonDocument(j.toObject()).toJson(QJsonDocument::Compact));
    default:
        return QString();   // null / undefined
    }
}

/* ====================== Serialización ====================== */

QByteArray ContactFile::toJson(const QVector<Contact>& contacts) {
    QJsonArray arr;
    for (const auto& c : contacts)
        arr.append(contactToJson(c));
    return halveIndentation(QJsonDocument(arr).toJson(QJsonDocument::Indented));
}

bool ContactFile::writeTo(const QString& path, const QVector<Contact>& contacts, QString* why) {
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        if (why) *why = f.errorString();
        return false;
    }
    const QByteArray data = toJson(contacts);
    if (f.write(data) != data.size()) {
        if (why) *why = f.errorString();
        f.cancelWriting();
        return false;
    }
    if (!f.commit()) {
        if (why) *why = f.errorString();
        return false;
    }
    return true;
}

/* ====================== Archivo de trabajo ====================== */

QVector<Contact> ContactFile::load(QString* warning) const {
    QFile f(path_);
    if (!f.exists()) {
        qDebug() << "[contactbook]" << path_ << "no existe, se inicia vacío";
        return {};
    }
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "[contactbook] no se pudo abrir" << path_ << f.errorString();
        if (warning) *warning = QObject::tr("Could not read %1, starting fresh.").arg(path_);
        return {};
    }

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "[contactbook] JSON inválido en" << path_ << pe.errorString();
        if (warning) *warning = QObject::tr("Could not read %1, starting fresh.").arg(path_);
        return {};
    }

    QVector<Contact> out;
    const QJsonArray arr = doc.array();
    out.reserve(arr.size());
    for (const auto& v : arr) {
        Contact c;
        if (!contactFromJson(v, &c)) {
            qWarning() << "[contactbook] registro con forma inválida en" << path_;
            if (warning) *warning = QObject::tr("Could not read %1, starting fresh.").arg(path_);
            return {};
        }
        out.push_back(c);
    }
    qDebug() << "[contactbook] cargados" << out.size() << "contactos de" << path_;
    return out;
}

bool ContactFile::save(const QVector<Contact>& contacts, ContactError* err) const {
    QString why;
    if (!writeTo(path_, contacts, &why)) {
        qWarning() << "[contactbook] no se pudo guardar" << path_ << why;
        return fail(err, ContactError::Kind::PersistenceError,
                    QObject::tr("Failed to save contacts:\n%1").arg(why));
    }
    return true;
}

/* ====================== Exportar / Importar ====================== */

bool ContactFile::exportTo(const QVector<Contact>& contacts, const QString& path, ContactError* err) {
    QString why;
    if (!writeTo(path, contacts, &why)) {
        qWarning() << "[contactbook] no se pudo exportar a" << path << why;
        return fail(err, ContactError::Kind::PersistenceError,
                    QObject::tr("Failed to export contacts:\n%1").arg(why));
    }
    qDebug() << "[contactbook] exportados" << contacts.size() << "contactos a" << path;
    return true;
}

bool ContactFile::readImport(const QString& path, QVector<Contact>* out, ContactError* err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return fail(err, ContactError::Kind::ImportError,
                    QObject::tr("Failed to import contacts:\n%1").arg(f.errorString()));

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError)
        return fail(err, ContactError::Kind::ImportError,
                    QObject::tr("Failed to import contacts:\n%1").arg(pe.errorString()));
    if (!doc.isArray())
        return fail(err, ContactError::Kind::ImportError,
                    QObject::tr("Failed to import contacts:\nexpected a JSON array of contacts"));

    QVector<Contact> valid;
    const QJsonArray arr = doc.array();
    for (const auto& v : arr) {
        if (!v.isObject())
            return fail(err, ContactError::Kind::ImportError,
                        QObject::tr("Failed to import contacts:\nevery entry must be a JSON object"));
        const QJsonObject o = v.toObject();
        Contact c;
        c.name    = coerceText(o.value("name")).trimmed();
        c.phone   = coerceText(o.value("phone")).trimmed();
        c.email   = coerceText(o.value("email")).trimmed();
        c.address = coerceText(o.value("address")).trimmed();
        if (c.name.isEmpty() || c.phone.isEmpty()) continue;
        valid.push_back(c);
    }

    qDebug() << "[contactbook]" << path << ":" << valid.size() << "de" << arr.size() << "entradas utilizables";
    if (out) *out = valid;
    return true;
}
