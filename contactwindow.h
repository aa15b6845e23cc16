#ifndef CONTACTWINDOW_H
#define CONTACTWINDOW_H

#include <QWidget>
#include "contact.h"
#include "contactfilter.h"

class ContactStore;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QTableWidget;
class QTableWidgetItem;
class QLabel;

class ContactWindow : public QWidget {
    Q_OBJECT
public:
    explicit ContactWindow(ContactStore& store, QWidget* parent = nullptr);

    // Carga inicial desde disco; avisa con "Load Error" si el archivo estaba corrupto.
    void loadContacts();

public slots:
    void addContact();
    void updateContact();
    void deleteSelected();
    void clearForm();
    void importJson();
    void exportJson();

private slots:
    void onSearchChanged(const QString& text);
    void onSelectionChanged();
    void onItemDoubleClicked(QTableWidgetItem* item);
    void refreshTable();

private:
    Contact readForm() const;
    void    fillForm(const Contact& c);
    void    showError(const ContactError& e);

private:
    ContactStore& store_;
    ContactFilter filter_;
    ContactId     selected_ = kNoContact;   // id estable, no fila de la vista

    QLineEdit*      leName_    = nullptr;
    QLineEdit*      lePhone_   = nullptr;
    QLineEdit*      leEmail_   = nullptr;
    QPlainTextEdit* teAddress_ = nullptr;
    QLineEdit*      leSearch_  = nullptr;
    QTableWidget*   table_     = nullptr;
    QLabel*         lblStatus_ = nullptr;
};

#endif // CONTACTWINDOW_H
