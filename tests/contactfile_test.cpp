#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "contactfile.h"

namespace {

void writeFile(const QString& path, const QByteArray& data) {
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(data);
}

QByteArray readFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return {};
    return f.readAll();
}

QVector<Contact> sample() {
    return {
        { "Acme Traders", "+1 555-0100", "ops@acme.com", "12 Market St" },
        { "Café Núñez", "(601) 555 0199", "", "Calle 7\nPiso 2" },
        { "Zeta", "5550123", "z@zeta.io", "" },
    };
}

class ContactFileTest : public ::testing::Test {
protected:
    QString path(const QString& name) const { return dir.filePath(name); }
    QTemporaryDir dir;
};

} // namespace

TEST_F(ContactFileTest, MissingFileLoadsEmptyWithoutWarning) {
    ContactFile file(path("contacts.json"));
    QString warning;
    EXPECT_TRUE(file.load(&warning).isEmpty());
    EXPECT_TRUE(warning.isEmpty());
}

TEST_F(ContactFileTest, SaveThenLoadKeepsOrderAndFields) {
    ContactFile file(path("contacts.json"));
    ASSERT_TRUE(file.save(sample()));

    QString warning;
    const QVector<Contact> loaded = file.load(&warning);
    EXPECT_TRUE(warning.isEmpty());
    EXPECT_EQ(loaded, sample());
}

TEST_F(ContactFileTest, SavesTwoSpaceIndentAndLiteralUtf8) {
    ContactFile file(path("contacts.json"));
    ASSERT_TRUE(file.save(sample()));

    const QByteArray raw = readFile(file.path());
    EXPECT_TRUE(raw.startsWith("[\n  {\n    \""));
    EXPECT_TRUE(raw.contains("    \"name\": \"Acme Traders\""));
    EXPECT_TRUE(raw.contains(QString::fromUtf8("Café Núñez").toUtf8()));
    EXPECT_FALSE(raw.contains("\\u00e9"));
    EXPECT_TRUE(raw.contains("Calle 7\\nPiso 2"));
}

TEST_F(ContactFileTest, EmptyListRoundTrips) {
    ContactFile file(path("contacts.json"));
    ASSERT_TRUE(file.save({}));
    QString warning;
    EXPECT_TRUE(file.load(&warning).isEmpty());
    EXPECT_TRUE(warning.isEmpty());
}

TEST_F(ContactFileTest, MalformedJsonLoadsEmptyWithWarningAndKeepsFile) {
    const QString p = path("contacts.json");
    writeFile(p, "[{\"name\": \"Acme\",");

    ContactFile file(p);
    QString warning;
    EXPECT_TRUE(file.load(&warning).isEmpty());
    EXPECT_FALSE(warning.isEmpty());
    EXPECT_EQ(readFile(p), QByteArray("[{\"name\": \"Acme\","));
}

TEST_F(ContactFileTest, WrongShapeLoadsEmptyWithWarning) {
    const QList<QByteArray> docs = {
        "{\"name\": \"Acme\", \"phone\": \"555-0100\"}",
        "[\"Acme\"]",
        "[{\"name\": \"Acme\"}]",
        "[{\"name\": \"Acme\", \"phone\": 5550100}]",
        "[{\"name\": \"Acme\", \"phone\": \"555-0100\", \"email\": []}]",
    };
    for (const auto& doc : docs) {
        const QString p = path("shape.json");
        writeFile(p, doc);
        QString warning;
        EXPECT_TRUE(ContactFile(p).load(&warning).isEmpty()) << doc.constData();
        EXPECT_FALSE(warning.isEmpty()) << doc.constData();
    }
}

TEST_F(ContactFileTest, LoadDefaultsAbsentOptionalFields) {
    const QString p = path("contacts.json");
    writeFile(p, "[{\"phone\": \"555-0100\", \"name\": \"Acme\"}]");

    const QVector<Contact> loaded = ContactFile(p).load();
    ASSERT_EQ(loaded.size(), 1);
    EXPECT_EQ(loaded[0], (Contact{ "Acme", "555-0100", "", "" }));
}

TEST_F(ContactFileTest, SaveIntoMissingDirectoryIsPersistenceError) {
    ContactFile file(path("no/such/dir/contacts.json"));
    ContactError err;
    EXPECT_FALSE(file.save(sample(), &err));
    EXPECT_EQ(err.kind, ContactError::Kind::PersistenceError);
    EXPECT_FALSE(err.message.isEmpty());
}

TEST_F(ContactFileTest, ExportWritesSameDocumentAsSave) {
    ContactFile file(path("contacts.json"));
    ASSERT_TRUE(file.save(sample()));
    ASSERT_TRUE(ContactFile::exportTo(sample(), path("export.json")));
    EXPECT_EQ(readFile(path("export.json")), readFile(file.path()));

    ContactError err;
    EXPECT_FALSE(ContactFile::exportTo(sample(), path("missing/export.json"), &err));
    EXPECT_EQ(err.kind, ContactError::Kind::PersistenceError);
}

TEST_F(ContactFileTest, ImportCoercesTrimsAndDropsIncomplete) {
    const QString p = path("import.json");
    writeFile(p,
        "[\n"
        "  {\"name\": \"  Acme  \", \"phone\": \" 555-0100 \", \"email\": \" ops@acme.com \"},\n"
        "  {\"name\": \"NoPhone\", \"email\": \"x@y.z\"},\n"
        "  {\"name\": \"   \", \"phone\": \"555-0101\"},\n"
        "  {\"name\": \"Numeric\", \"phone\": 5550102, \"address\": null},\n"
        "  {\"name\": \"Loose\", \"phone\": \"abc\", \"email\": \"not-an-email\"}\n"
        "]\n");

    QVector<Contact> out;
    ContactError err;
    ASSERT_TRUE(ContactFile::readImport(p, &out, &err));
    ASSERT_EQ(out.size(), 3);
    EXPECT_EQ(out[0], (Contact{ "Acme", "555-0100", "ops@acme.com", "" }));
    EXPECT_EQ(out[1], (Contact{ "Numeric", "5550102", "", "" }));
    // Importar no aplica las reglas de formato del formulario
    EXPECT_EQ(out[2], (Contact{ "Loose", "abc", "not-an-email", "" }));
}

TEST_F(ContactFileTest, ImportWritesLargeIntegersWithoutExponent) {
    const QString p = path("import.json");
    writeFile(p, "[{\"name\": \"Big\", \"phone\": 12345678901234567890}]");

    QVector<Contact> out;
    ASSERT_TRUE(ContactFile::readImport(p, &out));
    ASSERT_EQ(out.size(), 1);
    const QString phone = out[0].phone;
    EXPECT_FALSE(phone.contains('e')) << phone.toStdString();
    EXPECT_EQ(phone.size(), 20);
    // Solo se garantizan los dígitos que caben en un double
    EXPECT_TRUE(phone.startsWith("1234567890123456")) << phone.toStdString();
}

TEST_F(ContactFileTest, ImportRejectsUnreadableOrMalformedInput) {
    QVector<Contact> out;
    ContactError err;
    EXPECT_FALSE(ContactFile::readImport(path("absent.json"), &out, &err));
    EXPECT_EQ(err.kind, ContactError::Kind::ImportError);

    const QString bad = path("bad.json");
    writeFile(bad, "not json");
    err = ContactError();
    EXPECT_FALSE(ContactFile::readImport(bad, &out, &err));
    EXPECT_EQ(err.kind, ContactError::Kind::ImportError);

    writeFile(bad, "{\"name\": \"Acme\"}");
    err = ContactError();
    EXPECT_FALSE(ContactFile::readImport(bad, &out, &err));
    EXPECT_EQ(err.kind, ContactError::Kind::ImportError);

    writeFile(bad, "[{\"name\": \"Acme\", \"phone\": \"555-0100\"}, 42]");
    err = ContactError();
    EXPECT_FALSE(ContactFile::readImport(bad, &out, &err));
    EXPECT_EQ(err.kind, ContactError::Kind::ImportError);
}
