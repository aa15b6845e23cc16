#include "contactvalidator.h"

#include <QObject>
#include <QRegularExpression>

bool isValidPhone(const QString& phone) {
    static const QRegularExpression rx(
        QRegularExpression::anchoredPattern(QStringLiteral("[0-9+\\-() ]{7,20}")),
        QRegularExpression::UseUnicodePropertiesOption);
    return rx.match(phone.trimmed()).hasMatch();
}

bool isValidEmail(const QString& email) {
    static const QRegularExpression rx(
        QRegularExpression::anchoredPattern(QStringLiteral("[^@\\s]+@[^@\\s]+\\.[^@\\s]+")),
        QRegularExpression::UseUnicodePropertiesOption);   // \s también cubre U+00A0 y demás espacios Unicode
    return rx.match(email.trimmed()).hasMatch();
}

bool validateContact(const Contact& draft, ContactError* err) {
    const Contact c = draft.trimmed();

    if (c.name.isEmpty() || c.phone.isEmpty())
        return fail(err, ContactError::Kind::MissingField,
                    QObject::tr("Store Name and Phone are required."));

    if (!isValidPhone(c.phone))
        return fail(err, ContactError::Kind::InvalidPhone,
                    QObject::tr("Please enter a valid phone number (digits, +, -, (), spaces)."));

    if (!c.email.isEmpty() && !isValidEmail(c.email))
        return fail(err, ContactError::Kind::InvalidEmail,
                    QObject::tr("Please enter a valid email address."));

    return true;
}
