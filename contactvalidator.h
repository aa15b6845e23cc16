#ifndef CONTACTVALIDATOR_H
#define CONTACTVALIDATOR_H

#include "contact.h"

/* ===================== Validación de formularios ===================== */
// Reglas para registros capturados en el formulario (no se usan al importar).
// Pura: no toca el ContactStore.

bool isValidPhone(const QString& phone);   // [0-9+\-() ]{7,20} sobre el texto recortado
bool isValidEmail(const QString& email);   // local@dominio.tld, sin '@' ni espacios

// Orden de chequeo: requeridos -> teléfono -> email. Se detiene en el primer fallo.
bool validateContact(const Contact& draft, ContactError* err = nullptr);

#endif // CONTACTVALIDATOR_H
